#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include "crypto/digest.hpp"

/*
Wire framing (one chunk == one GATT notification):

  [0x02]                  start marker: first byte of a chunk while idle
  [payload] ... [payload] body bytes, any split
  [64 hex chars]          SHA-256 trailer, sent as ordinary payload
  [... 0x03]              end marker: last byte of a chunk while receiving

There is no escaping or length prefix: a payload chunk ending in 0x03 while receiving is an end
marker. The start and end chunks carry no payload bytes.
*/

namespace proto
{

using Chunk = std::vector<std::uint8_t>;

inline constexpr std::uint8_t START_MARKER = 0x02;
inline constexpr std::uint8_t END_MARKER   = 0x03;

enum class Kind
{
    Start,
    End,
    Payload
};

Kind        classify(const Chunk &c, bool receiving);
const char *kind_name(Kind k);

// Sender side: frame `body` as start marker, body chunks, hex(sha256(body)) trailer, end marker.
// Returns an empty vector when mtu is 0.
std::vector<Chunk> make_transfer(const std::vector<std::uint8_t> &body, std::size_t mtu);

}  // namespace proto
