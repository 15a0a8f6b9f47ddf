#pragma once
#include <string>

#include "app/receiver_service.hpp"
#include "transport/itransport.hpp"

namespace ctl
{

// What the control commands act on; either pointer may be null.
struct Context
{
    app::ReceiverService  *rx = nullptr;
    transport::ITransport *tx = nullptr;
};

// Runs one control line (STATUS, FILES, PEERS, ABORT, CONNECT <mac>, DISCONNECT, QUIT)
// and returns the reply text, one '\n'-terminated line per item.
// Rejected commands reply with a single "ERR <reason>" line.
std::string handle_command(const std::string &line, const Context &ctx);

}  // namespace ctl
