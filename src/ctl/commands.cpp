#include <cctype>
#include <cstdio>
#include <string>

#include "ctl/commands.hpp"
#include "transport/bluez_transport.hpp"
#include "util/config.hpp"
#include "util/log.hpp"

namespace ctl
{

static std::string err_reply(const std::string &why)
{
    return "ERR " + why + "\n";
}

static std::string peer_line(const transport::PeerInfo &p)
{
    char rssi[16] = "?";
    if (p.have_rssi)
        std::snprintf(rssi, sizeof(rssi), "%d", static_cast<int>(p.rssi));
    std::string s = p.addr + " rssi=" + rssi;
    if (!p.name.empty())
        s += " name=" + p.name;
    if (p.svc_hit)
        s += " svc";
    return s;
}

static std::string cmd_status(const Context &ctx)
{
    if (!ctx.rx)
        return err_reply("receiver not running");
    const std::string st = ctx.rx->status();
    LOG_SYSTEM("[STATUS] %s", st.c_str());
    return st + "\n";
}

static std::string cmd_files(const Context &ctx)
{
    if (!ctx.rx)
        return err_reply("receiver not running");
    const auto files = ctx.rx->completed_files();
    if (files.empty())
    {
        LOG_SYSTEM("[FILES] no files received");
        return "no files received\n";
    }
    std::string out;
    for (const auto &f : files)
    {
        LOG_SYSTEM("[FILE] %s", f.c_str());
        out += f + "\n";
    }
    return out;
}

static std::string cmd_peers(const Context &ctx)
{
    if (!ctx.tx)
        return err_reply("no transport");
    const auto peers = ctx.tx->list_peers();
    if (peers.empty())
    {
        LOG_SYSTEM("[PEERS] no peers found");
        return "no peers found\n";
    }
    std::string out;
    for (const auto &p : peers)
    {
        const std::string l = peer_line(p);
        LOG_SYSTEM("[PEER] %s", l.c_str());
        out += l + "\n";
    }
    return out;
}

// CONNECT <mac> switches target, CONNECT with no MAC (or DISCONNECT) drops the link
static std::string cmd_connect(const Context &ctx, std::string mac, const char *tag)
{
    auto *bt = dynamic_cast<transport::BluezTransport *>(ctx.tx);
    if (!bt)
    {
        LOG_SYSTEM("[%s] not supported on this transport", tag);
        return err_reply("not supported on this transport");
    }
    if (!mac.empty())
    {
        mac = util::normalize_mac(mac);
        if (!util::is_valid_mac(mac))
        {
            LOG_WARN("[%s] invalid MAC address: %s", tag, mac.c_str());
            return err_reply("invalid MAC address: " + mac);
        }
    }
    if (!bt->handover_to(mac))
    {
        LOG_WARN("[%s] failed to switch to %s", tag, mac.c_str());
        return err_reply("transport refused the switch");
    }
    if (mac.empty())
    {
        LOG_SYSTEM("[%s] link dropped and target cleared", tag);
        return "ok: link dropped\n";
    }
    LOG_SYSTEM("[%s] switching to %s", tag, mac.c_str());
    return "ok: switching to " + mac + "\n";
}

// ======================================================================
// Function: handle_command
// - In: one control line, without the trailing newline
// - Out: reply text for the client
// ======================================================================
std::string handle_command(const std::string &line, const Context &ctx)
{
    if (line == "QUIT")
    {
        LOG_INFO("Received QUIT command, exiting...");
        return "bye\n";
    }
    if (line == "STATUS")
        return cmd_status(ctx);
    if (line == "FILES")
        return cmd_files(ctx);
    if (line == "PEERS")
        return cmd_peers(ctx);
    if (line == "ABORT")
    {
        if (!ctx.rx)
            return err_reply("receiver not running");
        ctx.rx->abort();
        LOG_SYSTEM("[ABORT] current transfer cancelled");
        return "ok\n";
    }
    if (line == "CONNECT" || line.rfind("CONNECT ", 0) == 0)
    {
        std::string mac = line.substr(7);
        while (!mac.empty() && std::isspace(static_cast<unsigned char>(mac.front())))
            mac.erase(mac.begin());
        return cmd_connect(ctx, mac, "CONNECT");
    }
    if (line == "DISCONNECT")
        return cmd_connect(ctx, std::string{}, "DISCONNECT");

    LOG_WARN("Unknown command: %s", line.c_str());
    return err_reply("unknown command: " + line);
}

}  // namespace ctl
