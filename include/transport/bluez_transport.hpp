#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "transport/itransport.hpp"
#include "transport/peer_table.hpp"
#include "util/constants.hpp"

#if FILERX_HAVE_SDBUS
#include <poll.h>
#include <systemd/sd-bus.h>
#include <unistd.h>

namespace
{
// TU-local wrapper to unref and null a slot ptr
inline void unref_slot(sd_bus_slot *&s)
{
    if (s)
    {
        sd_bus_slot_unref(s);
        s = nullptr;
    }
}
}  // namespace

#endif

namespace transport
{

struct BluezConfig
{
    std::string                adapter     = "hci0";
    std::string                svc_uuid    = std::string(constants::SVC_UUID);
    std::string                notify_uuid = std::string(constants::NOTIFY_UUID);
    std::optional<std::string> peer_addr{};  // adopt first device with svc_uuid when unset
};

// BLE central: connects to the sender and subscribes to its notify characteristic.
class BluezTransport final : public ITransport
{
  public:
    explicit BluezTransport(BluezConfig cfg);
    ~BluezTransport() override;

    bool        start(const Settings &s, OnFrame cb) override;
    void        stop() override;
    std::string name() const override;
    bool        link_ready() const override;
    void        set_link_listener(OnLink cb) override { on_link_ = std::move(cb); }

    // devices seen by InterfacesAdded, PropertiesChanged and cold scans
    std::vector<PeerInfo> list_peers() const override;
    void note_peer(const std::string &addr, const std::string &name,
                   std::optional<std::int16_t> rssi, bool svc_hit);

    const BluezConfig &config() const { return cfg_; }

    // switch to another device ("" drops the link and clears the target)
    bool handover_to(const std::string &addr);

    // accessors used by the bus callbacks
    const std::string &dev_path() const;
    void               set_dev_path(const char *path);
    bool               connected() const;
    void               set_connected(bool v);
    bool               subscribed() const;
    void               set_subscribed(bool v);
    void               set_connect_inflight(bool v);
    void               set_next_connect_at_ms(uint64_t new_ms);
    bool               services_resolved() const;
    void               set_services_resolved(bool v);
    bool               has_uuid_discovery_filter() const;
    void               set_uuid_discovery_filter_ok(bool v);
    bool is_running() const noexcept { return running_.load(std::memory_order_relaxed); }
    void deliver_rx_bytes(const uint8_t *data, size_t len);

  private:
    BluezConfig      cfg_;
    Settings         settings_{};
    OnFrame          on_frame_{};
    OnLink           on_link_{};
    std::atomic_bool running_{false};
    PeerTable        peers_;

    struct Impl;
    std::unique_ptr<Impl> impl_;

    void report_link();

    bool start_central();
    void stop_central();
    bool central_set_discovery_filter();
    bool central_start_discovery();
    bool central_cold_scan();
    bool central_connect();
    bool central_discover_services();
    bool central_find_gatt_paths();
    bool central_enable_notify();
    void central_pump();
};

}  // namespace transport
