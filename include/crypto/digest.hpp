#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "xfer/errors.hpp"

namespace integrity
{

constexpr std::size_t DIGEST_SIZE = 32;  // crypto_hash_sha256_BYTES
constexpr std::size_t TAG_HEX_LEN = 64;  // lowercase hex of DIGEST_SIZE bytes

// Which bytes the digest is computed over.
enum class Scope
{
    // Whole content, trailer included. Matches the deployed receiver: a trailer
    // of hex(sha256(body)) never validates under this scope.
    FullContent,
    // content[0 .. len-64], the bytes the trailer was produced from.
    BodyOnly
};

const char *scope_name(Scope s);

// Lowercase hex SHA-256 of [data, data+len).
std::string sha256_hex(const std::uint8_t *data, std::size_t len);

// Check the trailing 64-byte hex tag of `content`. Returns Error::None on match,
// otherwise EmptyContent, MalformedTrailer or IntegrityMismatch.
xfer::Error verify(const std::vector<std::uint8_t> &content, Scope scope);

}  // namespace integrity
