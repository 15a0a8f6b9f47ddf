#include "xfer/errors.hpp"

namespace xfer
{

const char *error_name(Error e)
{
    switch (e)
    {
        case Error::None:
            return "None";
        case Error::EmptyContent:
            return "EmptyContent";
        case Error::MalformedTrailer:
            return "MalformedTrailer";
        case Error::IntegrityMismatch:
            return "IntegrityMismatch";
        case Error::IoError:
            return "IoError";
        case Error::ProtocolViolation:
            return "ProtocolViolation";
        case Error::Oversize:
            return "Oversize";
        case Error::Cancelled:
            return "Cancelled";
    }
    return "?";
}

const char *status_message(Error e)
{
    switch (e)
    {
        case Error::None:
            return "ok";
        case Error::EmptyContent:
            return "file is empty";
        case Error::MalformedTrailer:
            return "invalid file format";
        case Error::IntegrityMismatch:
            return "file corrupted: digest mismatch";
        case Error::IoError:
            return "failed to save file";
        case Error::ProtocolViolation:
            return "unexpected end marker";
        case Error::Oversize:
            return "file too large";
        case Error::Cancelled:
            return "transfer cancelled";
    }
    return "unknown error";
}

}  // namespace xfer
