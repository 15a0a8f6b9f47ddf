#include "transport/loopback_transport.hpp"

namespace transport
{
// LoopbackTransport: a fake link to drive the pipeline (transport -> engine -> sink) without BLE.
bool LoopbackTransport::start(const Settings &s, OnFrame on_rx)
{
    on_rx_   = std::move(on_rx);
    mtu_     = s.mtu;
    started_ = true;
    return true;
}

bool LoopbackTransport::inject(const Frame &one_chunk)
{
    if (!started_.load() || !on_rx_ || !link_up_.load())
        return false;
    if (mtu_ != 0 && one_chunk.size() > mtu_)
        return false;
    on_rx_(one_chunk);
    return true;
}

void LoopbackTransport::set_link(bool up)
{
    const bool was = link_up_.exchange(up);
    if (was != up && started_.load() && on_link_)
        on_link_(up);
}

void LoopbackTransport::announce(const PeerInfo &p)
{
    peers_.note(p.addr, p.name,
                p.have_rssi ? std::optional<std::int16_t>(p.rssi) : std::nullopt, p.svc_hit,
                steady_now_ms());
}

std::vector<PeerInfo> LoopbackTransport::list_peers() const
{
    return peers_.list(steady_now_ms());
}

void LoopbackTransport::stop()
{
    started_ = false;
    on_rx_   = nullptr;
}

bool LoopbackTransport::link_ready() const
{
    return started_.load() && link_up_.load();
}

}  // namespace transport
