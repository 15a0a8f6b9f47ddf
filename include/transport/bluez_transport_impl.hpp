// include/transport/bluez_transport_impl.hpp
#pragma once
#include <atomic>
#include <mutex>
#include <string>
#include <thread>

struct sd_bus;
struct sd_bus_slot;

#include "bluez_transport.hpp"

namespace transport
{
struct BluezTransport::Impl
{
#if FILERX_HAVE_SDBUS
    sd_bus *bus = nullptr;

    // serialize all sd-bus access
    std::mutex bus_mu;

    sd_bus_slot     *added_slot   = nullptr;
    sd_bus_slot     *removed_slot = nullptr;
    sd_bus_slot     *props_slot   = nullptr;
    sd_bus_slot     *connect_call_slot{nullptr};
    std::atomic_bool discovery_on{false};
    bool             uuid_filter_ok{false};
#endif
    std::thread loop;
    std::string adapter_path;  // "/org/bluez/hci0"
    std::string unique_name;   // our bus unique name (debug)

    // remote device
    std::string dev_path;
    std::string peer_svc_path;     // remote service path
    std::string peer_notify_path;  // remote notify characteristic

    // connection state flags
    std::atomic_bool connected{false};
    std::atomic_bool subscribed{false};
    std::atomic_bool connect_inflight{false};
    std::atomic_bool services_resolved{false};
    std::atomic_bool discover_submitted{false};
    std::atomic_bool link_up{false};  // last link_ready() value reported
    uint64_t         next_connect_at_ms{0};

    // throttle cold scans while no device is known
    uint64_t last_scan_ms{0};
    uint32_t scan_min_interval_ms{2000};
};
}  // namespace transport
