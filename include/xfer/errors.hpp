#pragma once
#include <cstdint>

namespace xfer
{

enum class Error : std::uint8_t
{
    None = 0,
    EmptyContent,       // completed content has zero length
    MalformedTrailer,   // completed content shorter than the 64-byte trailer
    IntegrityMismatch,  // computed digest disagrees with the trailer
    IoError,            // persisting or reading back failed
    ProtocolViolation,  // out-of-phase end marker (strict mode)
    Oversize,           // transfer exceeded the configured maximum
    Cancelled           // link dropped or transfer aborted
};

const char *error_name(Error e);
// Short user-facing status text.
const char *status_message(Error e);

}  // namespace xfer
