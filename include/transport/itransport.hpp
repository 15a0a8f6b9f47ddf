#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace transport
{

using Frame   = std::vector<std::uint8_t>;
using OnFrame = std::function<void(const Frame &)>;
using OnLink  = std::function<void(bool up)>;

struct Settings
{
    std::string role;  // "central" (or "loopback" for testing)
    std::string svc_uuid, notify_uuid;
    std::size_t mtu = 512;
};

// A device seen while scanning.
struct PeerInfo
{
    std::string  addr;  // AA:BB:CC:DD:EE:FF
    std::string  name;
    std::int16_t rssi      = 0;
    bool         have_rssi = false;
    bool         svc_hit   = false;  // advertises the transfer service
};

// Receive-only link: delivers each notification as one frame, in order.
struct ITransport
{
    virtual bool        start(const Settings &s, OnFrame on_rx) = 0;
    virtual void        stop()                                  = 0;
    virtual std::string name() const { return ""; }
    virtual bool        link_ready() const = 0;  // connected and subscribed

    // Called on every link_ready() edge, from the thread that caused it.
    // Set before start().
    virtual void set_link_listener(OnLink cb) = 0;

    virtual std::vector<PeerInfo> list_peers() const { return {}; }

    virtual ~ITransport() = default;
};

}  // namespace transport
