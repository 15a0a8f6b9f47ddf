#pragma once
#include <atomic>
#include <cstddef>

#include "transport/itransport.hpp"
#include "transport/peer_table.hpp"

namespace transport
{

class LoopbackTransport final : public ITransport
{
  public:
    bool        start(const Settings &s, OnFrame on_rx) override;
    void        stop() override;
    std::string name() const override { return "loopback"; }
    bool        link_ready() const override;
    void        set_link_listener(OnLink cb) override { on_link_ = std::move(cb); }

    std::vector<PeerInfo> list_peers() const override;

    // Deliver one frame as if notified by the peer.
    bool inject(const Frame &one_chunk);
    // Reports the edge to the link listener before returning.
    void set_link(bool up);
    // Pretend a scan saw this device.
    void announce(const PeerInfo &p);

  private:
    OnFrame          on_rx_{};
    OnLink           on_link_{};
    std::size_t      mtu_{0};
    std::atomic_bool started_{false};
    std::atomic_bool link_up_{true};
    PeerTable        peers_;
};

}  // namespace transport
