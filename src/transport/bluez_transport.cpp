/* ======================================================================
 * BlueZ Transport (facade), receive side
 *
 *  App thread                         Transport (facade)               Central impl
 *  ----------                         ------------------               ------------
 *  start(settings, on_frame)
 *    └─ store callback, create Impl ─────────────────────────────────▶ start_central()
 *                                                                       └─ spawn bus loop
 *  link_ready()
 *    └─ connected && subscribed
 *    └─ every edge is pushed to the link listener by set_connected/set_subscribed
 *
 *  stop()
 *    └─ ──────────────────────────────────────────────────────────────▶ stop_central()
 *    └─ clears state and threads
 *
 *  Threads
 *    └─ App/IPC thread calls facade APIs
 *    └─ One bus loop thread handles sd-bus I/O and delivers notifications via on_frame
 *
 *  Notes
 *    └─ All DBus calls are issued under impl_->bus_mu
 * ====================================================================== */

#include <atomic>
#include <cstdint>
#include <cstring>
#include <mutex>
#include <string>
#include <utility>

// clang-format off
#include "transport/bluez_transport.hpp"
#include "transport/bluez_transport_impl.hpp"
#include "transport/itransport.hpp"
#include "util/log.hpp"
// clang-format on

namespace transport
{
BluezTransport::BluezTransport(BluezConfig cfg) : cfg_(std::move(cfg)) {}

BluezTransport::~BluezTransport()
{
    stop();
}

// ============== Impl accessors ==============
const std::string &BluezTransport::dev_path() const
{
    static const std::string none;
    return impl_ ? impl_->dev_path : none;
}
void BluezTransport::set_dev_path(const char *path)
{
    impl_->dev_path = std::string(path);
}
bool BluezTransport::connected() const
{
    return impl_ && impl_->connected.load();
}
void BluezTransport::set_connected(bool v)
{
    impl_->connected.store(v);
    report_link();
}
bool BluezTransport::subscribed() const
{
    return impl_ && impl_->subscribed.load();
}
void BluezTransport::set_subscribed(bool v)
{
    impl_->subscribed.store(v);
    report_link();
}
void BluezTransport::set_connect_inflight(bool v)
{
    impl_->connect_inflight.store(v);
}
void BluezTransport::set_next_connect_at_ms(uint64_t new_ms)
{
    impl_->next_connect_at_ms = new_ms;
}
bool BluezTransport::services_resolved() const
{
    return impl_ ? impl_->services_resolved.load() : false;
}
void BluezTransport::set_services_resolved(bool v)
{
    if (impl_)
        impl_->services_resolved.store(v);
}
bool BluezTransport::has_uuid_discovery_filter() const
{
#if FILERX_HAVE_SDBUS
    return impl_ && impl_->uuid_filter_ok;
#else
    return false;
#endif
}
void BluezTransport::set_uuid_discovery_filter_ok(bool v)
{
#if FILERX_HAVE_SDBUS
    if (impl_)
        impl_->uuid_filter_ok = v;
#else
    (void)v;
#endif
}
// ============= End of Impl accessors =============

// Pushes a link_ready() edge to the listener, once per edge.
void BluezTransport::report_link()
{
    const bool now = impl_->connected.load() && impl_->subscribed.load();
    if (impl_->link_up.exchange(now) == now)
        return;
    LOG_DEBUG("[BLUEZ] link %s", now ? "ready" : "lost");
    if (on_link_)
        on_link_(now);
}

void BluezTransport::note_peer(const std::string &addr, const std::string &name,
                               std::optional<std::int16_t> rssi, bool svc_hit)
{
    peers_.note(addr, name, rssi, svc_hit, steady_now_ms());
}

std::vector<PeerInfo> BluezTransport::list_peers() const
{
    return peers_.list(steady_now_ms());
}

std::string BluezTransport::name() const
{
    return "bluez";
}

void BluezTransport::deliver_rx_bytes(const uint8_t *data, size_t len)
{
    // called on the bus thread, one notification per call
    if (!data || len == 0)
        return;
    if (!is_running())
        return;
    if (!on_frame_)
        return;

    Frame f(data, data + len);
    on_frame_(f);
}

// ======================================================================
// Function: BluezTransport::start
// - In: settings with UUIDs, receive callback
// - Out: true when the central bus loop is running
// ======================================================================
bool BluezTransport::start(const Settings &s, OnFrame cb)
{
    if (running_.load(std::memory_order_relaxed))
        return true;

    settings_ = s;
    on_frame_ = std::move(cb);
    if (!s.svc_uuid.empty())
        cfg_.svc_uuid = s.svc_uuid;
    if (!s.notify_uuid.empty())
        cfg_.notify_uuid = s.notify_uuid;
    if (!impl_)
        impl_ = std::make_unique<Impl>();

    LOG_DEBUG("[BLUEZ] start: adapter=%s mtu=%zu svc=%s notify=%s%s%s", cfg_.adapter.c_str(),
              settings_.mtu, cfg_.svc_uuid.c_str(), cfg_.notify_uuid.c_str(),
              cfg_.peer_addr ? " peer=" : "", cfg_.peer_addr ? cfg_.peer_addr->c_str() : "");

    bool ok = start_central();
    if (ok)
    {
        running_.store(true, std::memory_order_relaxed);
    }
    else
    {
        impl_.reset();
    }
    return ok;
}

// ======================================================================
// Function: BluezTransport::stop
// - In: can be called anytime
// - Out: bus thread joined, Impl released
// ======================================================================
void BluezTransport::stop()
{
    if (!running_.exchange(false, std::memory_order_relaxed))
        return;

    if (!impl_)
        return;

    stop_central();

    LOG_DEBUG("[BLUEZ] stopped");
    impl_.reset();
}

bool BluezTransport::link_ready() const
{
    if (!impl_)
        return false;
    return impl_->connected.load() && impl_->subscribed.load();
}

}  // namespace transport
