#include <cstring>
#include <sodium.h>
#include <string>

#include "crypto/digest.hpp"
#include "util/log.hpp"

namespace integrity
{

static_assert(DIGEST_SIZE == crypto_hash_sha256_BYTES, "digest size mismatch");
static_assert(TAG_HEX_LEN == 2 * DIGEST_SIZE, "tag length mismatch");

static bool ensure_sodium_init()
{
    static int ok = (sodium_init() >= 0);  // -1 means failed
    return ok;
}

const char *scope_name(Scope s)
{
    switch (s)
    {
        case Scope::FullContent:
            return "full";
        case Scope::BodyOnly:
            return "body";
    }
    return "?";
}

std::string sha256_hex(const std::uint8_t *data, std::size_t len)
{
    ensure_sodium_init();

    unsigned char digest[crypto_hash_sha256_BYTES];
    crypto_hash_sha256(digest, data, static_cast<unsigned long long>(len));

    // bin2hex writes a trailing NUL
    char hex[TAG_HEX_LEN + 1];
    sodium_bin2hex(hex, sizeof(hex), digest, sizeof(digest));
    sodium_memzero(digest, sizeof(digest));
    return std::string(hex, TAG_HEX_LEN);
}

xfer::Error verify(const std::vector<std::uint8_t> &content, Scope scope)
{
    if (content.empty())
    {
        LOG_WARN("verify: empty content");
        return xfer::Error::EmptyContent;
    }
    if (content.size() < TAG_HEX_LEN)
    {
        LOG_WARN("verify: content too short for trailer (%zu < %zu)", content.size(), TAG_HEX_LEN);
        return xfer::Error::MalformedTrailer;
    }

    const std::size_t body_len = content.size() - TAG_HEX_LEN;
    const std::string tag(reinterpret_cast<const char *>(content.data()) + body_len, TAG_HEX_LEN);

    const std::size_t hashed_len = (scope == Scope::BodyOnly) ? body_len : content.size();
    const std::string computed   = sha256_hex(content.data(), hashed_len);

    if (computed != tag)
    {
        LOG_WARN("verify: digest mismatch (scope=%s, computed=%.16s..., tag=%.16s...)",
                 scope_name(scope), computed.c_str(), tag.c_str());
        return xfer::Error::IntegrityMismatch;
    }
    LOG_DEBUG("verify: digest ok (scope=%s, %zu bytes)", scope_name(scope), content.size());
    return xfer::Error::None;
}

}  // namespace integrity
