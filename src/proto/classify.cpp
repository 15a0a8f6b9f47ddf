#include <algorithm>
#include <cstdint>

#include "crypto/digest.hpp"
#include "proto/classify.hpp"
#include "util/log.hpp"

namespace proto
{

Kind classify(const Chunk &c, bool receiving)
{
    if (c.empty())
        return Kind::Payload;
    if (!receiving && c.front() == START_MARKER)
        return Kind::Start;
    if (receiving && c.back() == END_MARKER)
        return Kind::End;
    return Kind::Payload;
}

const char *kind_name(Kind k)
{
    switch (k)
    {
        case Kind::Start:
            return "start";
        case Kind::End:
            return "end";
        case Kind::Payload:
            return "payload";
    }
    return "?";
}

static void split_into(std::vector<Chunk>              &out,
                       const std::vector<std::uint8_t> &bytes,
                       std::size_t                      mtu)
{
    for (std::size_t start = 0; start < bytes.size(); start += mtu)
    {
        std::size_t take = std::min(mtu, bytes.size() - start);
        out.emplace_back(bytes.begin() + start, bytes.begin() + start + take);
    }
}

std::vector<Chunk> make_transfer(const std::vector<std::uint8_t> &body, std::size_t mtu)
{
    if (mtu < 1)
    {
        LOG_ERROR("make_transfer: invalid mtu (%zu)", mtu);
        return {};
    }
    const std::string         hex = integrity::sha256_hex(body.data(), body.size());
    std::vector<std::uint8_t> tag(hex.begin(), hex.end());

    std::vector<Chunk> out;
    out.reserve(2 + (body.size() + tag.size()) / mtu + 2);
    out.push_back(Chunk{START_MARKER});
    split_into(out, body, mtu);
    split_into(out, tag, mtu);
    out.push_back(Chunk{END_MARKER});
    return out;
}

}  // namespace proto
