/* ======================================================================
 * BlueZ Central, receive path
 *
 *  Bus thread (central_pump)                        BlueZ/DBus                  Sender (Peripheral)
 *  -------------------------                        ----------                  -------------------
 *  start_central()
 *    └─ set_discovery_filter ───────────────────────▶ Adapter.SetDiscoveryFilter
 *    └─ start_discovery ────────────────────────────▶ Adapter.StartDiscovery
 *    └─ spawn bus loop
 *
 *  central_pump()
 *    └─ cold_scan (cache) ──────────────────────────▶ ObjectManager.GetManagedObjects
 *    └─ if have dev_path → connect ─────────────────▶ Device1.Connect
 *              ◀── on_connect_reply (success)
 *    └─ discover_services ──────────────────────────▶ Device1.DiscoverServices
 *              ◀── on_props_changed: ServicesResolved=true
 *    └─ find_gatt_paths (svc/notify from cache)
 *    └─ enable_notify ──────────────────────────────▶ GattCharacteristic1.StartNotify
 *
 *  Data
 *              ◀── on_props_changed: GattCharacteristic1.Value ◀──────────── notification
 *    └─ deliver_rx_bytes → on_frame (one chunk)
 *
 *  Ready condition: connected && subscribed
 * ====================================================================== */

#include <cerrno>
#include <cstring>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

// clang-format off
#include "transport/bluez_transport.hpp"
#include "transport/bluez_transport_impl.hpp"
#include "util/log.hpp"
#include "transport/bluez_dbus_util.hpp"
// clang-format on

#if FILERX_HAVE_SDBUS
#include <systemd/sd-bus.h>
#include "transport/bluez_helper_central.hpp"
namespace
{

// ======================================================================
// Function: adapter_start_discovery_locked
// - In: bus_mu locked, adapter_path valid
// - Out: true if discovery is on afterwards
// ======================================================================
static bool adapter_start_discovery_locked(sd_bus            *bus,
                                           const std::string &adapter_path,
                                           std::atomic_bool  &discovery_on)
{
    if (!bus)
        return false;
    if (discovery_on.load())
        return true;

    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    int r = sd_bus_call_method(bus, "org.bluez", adapter_path.c_str(), "org.bluez.Adapter1",
                               "StartDiscovery", &err, &rep, "");
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
    {
        if (err.name && std::string(err.name) == "org.bluez.Error.InProgress")
        {
            discovery_on.store(true);
            LOG_INFO("[BLUEZ] StartDiscovery already in progress on %s", adapter_path.c_str());
            sd_bus_error_free(&err);
            return true;
        }
        LOG_WARN("[BLUEZ] StartDiscovery failed: %s", err.message ? err.message : strerror(-r));
        sd_bus_error_free(&err);
        return false;
    }
    sd_bus_error_free(&err);
    discovery_on.store(true);
    LOG_SYSTEM("[BLUEZ] StartDiscovery OK on %s", adapter_path.c_str());
    return true;
}

// ======================================================================
// Function: adapter_stop_discovery_locked
// - In: bus_mu locked, adapter_path valid
// - Out: discovery_on is false afterwards, even if StopDiscovery failed
// ======================================================================
static void adapter_stop_discovery_locked(sd_bus            *bus,
                                          const std::string &adapter_path,
                                          std::atomic_bool  &discovery_on)
{
    if (!bus)
        return;

    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    int r = sd_bus_call_method(bus, "org.bluez", adapter_path.c_str(), "org.bluez.Adapter1",
                               "StopDiscovery", &err, &rep, "");
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
        LOG_WARN("[BLUEZ] StopDiscovery failed (treat as off): %s",
                 err.message ? err.message : strerror(-r));
    else
        LOG_SYSTEM("[BLUEZ] StopDiscovery OK");
    discovery_on.store(false);
    sd_bus_error_free(&err);
}

// ======================================================================
// Function: device_disconnect_locked
// - In: bus_mu locked
// - Out: best-effort Device1.Disconnect
// ======================================================================
static void device_disconnect_locked(sd_bus *bus, const std::string &dev_path)
{
    if (!bus || dev_path.empty())
        return;
    sd_bus_error    derr{};
    sd_bus_message *drep = nullptr;
    (void)sd_bus_call_method(bus, "org.bluez", dev_path.c_str(), "org.bluez.Device1",
                             "Disconnect", &derr, &drep, "");
    if (drep)
        sd_bus_message_unref(drep);
    sd_bus_error_free(&derr);
}

// ======================================================================
// Function: char_start_notify_locked
// - In: bus_mu locked, notify_path is the remote notify characteristic
// - Out: true if StartNotify succeeded
// ======================================================================
static bool char_start_notify_locked(sd_bus *bus, const std::string &notify_path)
{
    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    int             r   = sd_bus_call_method(bus, "org.bluez", notify_path.c_str(),
                                             "org.bluez.GattCharacteristic1", "StartNotify", &err, &rep, "");
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
    {
        const char *ename     = err.name ? err.name : "";
        const char *emsg      = err.message ? err.message : "";
        const bool  transient = std::strstr(emsg, "ATT error: 0x0e") != nullptr ||  // CCCD race
                               std::strcmp(ename, "org.freedesktop.DBus.Error.NoReply") == 0 ||
                               std::strcmp(ename, "org.bluez.Error.InProgress") == 0;
        if (transient)
            LOG_INFO("[BLUEZ] StartNotify transient failure (%s); retry on next pump",
                     *emsg ? emsg : ename);
        else
            LOG_WARN("[BLUEZ] StartNotify failed: %s", *emsg ? emsg : strerror(-r));
        sd_bus_error_free(&err);
        return false;
    }
    sd_bus_error_free(&err);
    return true;
}

}  // namespace
#endif

namespace transport
{

// ======================================================================
// Function: BluezTransport::central_set_discovery_filter
// - In: bus valid
// - Out: Adapter1.SetDiscoveryFilter(Transport=le, UUIDs=[svc_uuid]) applied
// ======================================================================
bool BluezTransport::central_set_discovery_filter()
{
#if !FILERX_HAVE_SDBUS
    return false;
#else
    if (!impl_->bus)
        return false;

    std::lock_guard<std::mutex> lk(impl_->bus_mu);

    sd_bus_message *msg = nullptr, *rep = nullptr;
    sd_bus_error    err{};
    int             r = sd_bus_message_new_method_call(impl_->bus, &msg, "org.bluez",
                                                       impl_->adapter_path.c_str(), "org.bluez.Adapter1",
                                                       "SetDiscoveryFilter");
    if (r < 0)
        goto out;

    // a{sv}
    r = sd_bus_message_open_container(msg, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        goto out;
    // Transport="le"
    r = sd_bus_message_append(msg, "{sv}", "Transport", "s", "le");
    if (r < 0)
        goto out;
    // UUIDs=["<svc_uuid>"]
    r = sd_bus_message_open_container(msg, SD_BUS_TYPE_DICT_ENTRY, "sv");
    if (r < 0)
        goto out;
    r = sd_bus_message_append(msg, "s", "UUIDs");
    if (r < 0)
        goto out;
    r = sd_bus_message_open_container(msg, SD_BUS_TYPE_VARIANT, "as");
    if (r < 0)
        goto out;
    r = sd_bus_message_append(msg, "as", 1, cfg_.svc_uuid.c_str());
    if (r < 0)
        goto out;
    r = sd_bus_message_close_container(msg);  // variant
    if (r < 0)
        goto out;
    r = sd_bus_message_close_container(msg);  // dict
    if (r < 0)
        goto out;
    r = sd_bus_message_close_container(msg);  // a{sv}
    if (r < 0)
        goto out;

    r = sd_bus_call(impl_->bus, msg, 0, &err, &rep);
out:
    if (msg)
        sd_bus_message_unref(msg);
    if (rep)
        sd_bus_message_unref(rep);

    if (r < 0)
    {
        LOG_WARN("[BLUEZ] SetDiscoveryFilter failed: %s",
                 err.message ? err.message : strerror(-r));
        sd_bus_error_free(&err);
        set_uuid_discovery_filter_ok(false);
        return false;
    }
    sd_bus_error_free(&err);
    set_uuid_discovery_filter_ok(true);
    LOG_INFO("[BLUEZ] SetDiscoveryFilter OK (Transport=le, UUID=%s)", cfg_.svc_uuid.c_str());
    return true;
#endif
}

bool BluezTransport::central_start_discovery()
{
#if !FILERX_HAVE_SDBUS
    return false;
#else
    if (!impl_ || !impl_->bus)
        return false;

    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    return adapter_start_discovery_locked(impl_->bus, impl_->adapter_path, impl_->discovery_on);
#endif
}

// ======================================================================
// Function: BluezTransport::central_cold_scan
// - In: walks the ObjectManager cache (no active discovery)
// - Out: may adopt dev_path for a device matching peer MAC or service UUID
// ======================================================================
bool BluezTransport::central_cold_scan()
{
#if !FILERX_HAVE_SDBUS
    return false;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->bus)
        return false;

    sd_bus_message *reply = nullptr;
    sd_bus_error    err{};
    int r = sd_bus_call_method(impl_->bus, "org.bluez", "/", "org.freedesktop.DBus.ObjectManager",
                               "GetManagedObjects", &err, &reply, "");
    if (r < 0)
    {
        LOG_WARN("[BLUEZ] GetManagedObjects failed: %s", err.message ? err.message : strerror(-r));
        sd_bus_error_free(&err);
        if (reply)
            sd_bus_message_unref(reply);
        return false;
    }

    // every device in the cache refreshes the peer table; the first match is adopted
    DeviceSeen dev;
    bool       is_dev = false;
    r                 = walk_managed_objects(
        reply,
        [&](const char *path, const char *iface, sd_bus_message *m) -> int {
            if (std::strcmp(iface, "org.bluez.Device1") != 0 || !bluez_is_device_path(*this, path))
                return 0;
            is_dev = true;
            return consumed(bluez_read_device(m, cfg_.svc_uuid, dev));
        },
        [&](const char *path) {
            if (is_dev)
                (void)bluez_consider_device(*this, path, std::move(dev), false, "cold-scan");
            dev    = DeviceSeen{};
            is_dev = false;
        });
    if (r < 0)
        LOG_WARN("[BLUEZ] GetManagedObjects parse failed: %s", strerror(-r));

    sd_bus_message_unref(reply);
    sd_bus_error_free(&err);
    return r >= 0;
#endif
}

// ======================================================================
// Function: BluezTransport::central_connect
// - In: dev_path set
// - Out: Device1.Connect submitted asynchronously, connect_inflight set
// ======================================================================
bool BluezTransport::central_connect()
{
#if !FILERX_HAVE_SDBUS
    return false;
#else
    if (!impl_->bus || dev_path().empty())
        return false;

    if (impl_->connect_inflight.load() || connected())
        return true;

    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        // some controllers abort Connect while scanning
        if (impl_->discovery_on.load())
            adapter_stop_discovery_locked(impl_->bus, impl_->adapter_path, impl_->discovery_on);

        unref_slot(impl_->connect_call_slot);
        int r = sd_bus_call_method_async(impl_->bus, &impl_->connect_call_slot, "org.bluez",
                                         impl_->dev_path.c_str(), "org.bluez.Device1", "Connect",
                                         bluez_on_connect_reply, this, "");
        if (r < 0)
        {
            LOG_ERROR("[BLUEZ] submit Connect() failed: %s", strerror(-r));
            return false;
        }
        impl_->connect_inflight.store(true);
    }

    LOG_DEBUG("[BLUEZ] Connect() submitted");
    return true;
#endif
}

// ======================================================================
// Function: BluezTransport::central_discover_services
// - In: connected, dev_path set
// - Out: Device1.DiscoverServices(svc_uuid) submitted once per connection
// ======================================================================
bool BluezTransport::central_discover_services()
{
#if !FILERX_HAVE_SDBUS
    return false;
#else
    if (!impl_->bus || dev_path().empty())
        return false;
    if (impl_->discover_submitted.load())
        return true;

    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    int r = sd_bus_call_method(impl_->bus, "org.bluez", impl_->dev_path.c_str(),
                               "org.bluez.Device1", "DiscoverServices", &err, &rep, "s",
                               cfg_.svc_uuid.c_str());
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
    {
        const char *ename = err.name ? err.name : "";
        if (strcmp(ename, "org.freedesktop.DBus.Error.UnknownMethod") == 0)
        {
            // older BlueZ resolves services on its own after Connect
            LOG_DEBUG("[BLUEZ] DiscoverServices not supported; rely on auto-discovery");
            impl_->discover_submitted.store(true);
            sd_bus_error_free(&err);
            return false;
        }
        LOG_WARN("[BLUEZ] DiscoverServices('%s') failed: %s", cfg_.svc_uuid.c_str(),
                 err.message ? err.message : strerror(-r));
        sd_bus_error_free(&err);
        return false;
    }
    sd_bus_error_free(&err);
    impl_->discover_submitted.store(true);
    LOG_INFO("[BLUEZ] DiscoverServices('%s') submitted", cfg_.svc_uuid.c_str());
    return true;
#endif
}

// ======================================================================
// Function: BluezTransport::central_find_gatt_paths
// - In: dev_path set, reads the ObjectManager cache
// - Out: true when peer_svc_path and peer_notify_path are both set
// ======================================================================
bool BluezTransport::central_find_gatt_paths()
{
#if !FILERX_HAVE_SDBUS
    return false;
#else
    if (!impl_->bus || dev_path().empty())
        return false;

    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    sd_bus_message *reply = nullptr;
    sd_bus_error    err{};
    int r = sd_bus_call_method(impl_->bus, "org.bluez", "/", "org.freedesktop.DBus.ObjectManager",
                               "GetManagedObjects", &err, &reply, "");
    if (r < 0)
    {
        LOG_WARN("[BLUEZ] GetManagedObjects failed: %s", err.message ? err.message : strerror(-r));
        if (reply)
            sd_bus_message_unref(reply);
        sd_bus_error_free(&err);
        return false;
    }

    const std::string dev_prefix = impl_->dev_path + "/";

    // GattService1 and GattCharacteristic1 both carry a "UUID" property
    r = walk_managed_objects(reply, [&](const char *path, const char *iface, sd_bus_message *m) {
        const bool is_svc  = std::strcmp(iface, "org.bluez.GattService1") == 0;
        const bool is_char = std::strcmp(iface, "org.bluez.GattCharacteristic1") == 0;
        if ((!is_svc && !is_char) || std::strncmp(path, dev_prefix.c_str(), dev_prefix.size()) != 0)
            return 0;

        std::string uuid;
        const int   rr = walk_props(m, [&](const char *key, sd_bus_message *v) {
            return std::strcmp(key, "UUID") == 0 ? consumed(read_var_s(v, uuid)) : 0;
        });
        if (rr < 0)
            return rr;
        if (is_svc && ieq(uuid, cfg_.svc_uuid))
            impl_->peer_svc_path = path;
        else if (is_char && ieq(uuid, cfg_.notify_uuid))
            impl_->peer_notify_path = path;
        return 1;
    });
    if (r < 0)
        LOG_WARN("[BLUEZ] GetManagedObjects parse failed: %s", strerror(-r));

    if (reply)
        sd_bus_message_unref(reply);
    sd_bus_error_free(&err);

    if (!impl_->peer_svc_path.empty() && !impl_->peer_notify_path.empty())
    {
        LOG_INFO("[BLUEZ] GATT discovered: svc=%s notify=%s", impl_->peer_svc_path.c_str(),
                 impl_->peer_notify_path.c_str());
        return true;
    }
    return false;
#endif
}

bool BluezTransport::central_enable_notify()
{
#if !FILERX_HAVE_SDBUS
    return false;
#else
    if (!impl_ || !impl_->bus || impl_->peer_notify_path.empty())
        return false;

    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!char_start_notify_locked(impl_->bus, impl_->peer_notify_path))
        return false;
    set_subscribed(true);
    return true;
#endif
}

// ======================================================================
// Function: BluezTransport::central_pump
// - In: called from the bus thread after each sd_bus_wait
// - Out: advances scan -> connect -> discover -> subscribe, one step at a time
// ======================================================================
void BluezTransport::central_pump()
{
#if FILERX_HAVE_SDBUS
    if (!connected())
    {
        impl_->peer_svc_path.clear();
        impl_->peer_notify_path.clear();
        impl_->discover_submitted.store(false);
    }

    const uint64_t now_ms = steady_now_ms();

    if (dev_path().empty() && now_ms - impl_->last_scan_ms >= impl_->scan_min_interval_ms)
    {
        impl_->last_scan_ms = now_ms;
        (void)central_cold_scan();
    }

    if (!dev_path().empty() && !connected() && !impl_->connect_inflight.load() &&
        now_ms >= impl_->next_connect_at_ms)
    {
        (void)central_connect();
    }

    if (connected() && !subscribed())
    {
        if (!services_resolved())
            (void)central_discover_services();

        // the cache may already hold the GATT objects even before ServicesResolved
        if (central_find_gatt_paths() && central_enable_notify())
            LOG_SYSTEM("[BLUEZ] Notifications enabled; ready");
    }

    // keep scanning until a device is known
    if (dev_path().empty() && !impl_->connect_inflight.load())
        (void)central_start_discovery();
#endif
}

// ======================================================================
// Function: BluezTransport::start_central
// - In: fresh Impl
// - Out: signal matches installed, discovery started, bus thread running
// ======================================================================
bool BluezTransport::start_central()
{
#if !FILERX_HAVE_SDBUS
    LOG_ERROR("[BLUEZ] sd-bus not available (FILERX_HAVE_SDBUS=0)");
    return false;
#else
    int r = sd_bus_open_system(&impl_->bus);
    if (r < 0 || !impl_->bus)
    {
        LOG_ERROR("[BLUEZ] failed to connect system bus: %s", strerror(-r));
        return false;
    }

    impl_->adapter_path = "/org/bluez/" + cfg_.adapter;
    const char *name    = nullptr;
    if (sd_bus_get_unique_name(impl_->bus, &name) >= 0 && name)
        impl_->unique_name = name;

    r = sd_bus_match_signal(impl_->bus, &impl_->added_slot, "org.bluez", "/",
                            "org.freedesktop.DBus.ObjectManager", "InterfacesAdded",
                            bluez_on_iface_added, this);
    if (r >= 0)
        r = sd_bus_match_signal(impl_->bus, &impl_->removed_slot, "org.bluez", "/",
                                "org.freedesktop.DBus.ObjectManager", "InterfacesRemoved",
                                bluez_on_iface_removed, this);
    // PropertiesChanged carries Device1.Connected and GattCharacteristic1.Value
    if (r >= 0)
        r = sd_bus_match_signal(impl_->bus, &impl_->props_slot, "org.bluez", nullptr,
                                "org.freedesktop.DBus.Properties", "PropertiesChanged",
                                bluez_on_props_changed, this);
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ] signal subscription failed: %s", strerror(-r));
        unref_slot(impl_->added_slot);
        unref_slot(impl_->removed_slot);
        unref_slot(impl_->props_slot);
        sd_bus_flush_close_unref(impl_->bus);
        impl_->bus = nullptr;
        return false;
    }
    LOG_INFO("[BLUEZ] subscribed to InterfacesAdded/PropertiesChanged, svc=%s peer=%s",
             cfg_.svc_uuid.c_str(), cfg_.peer_addr ? cfg_.peer_addr->c_str() : "(any)");

    (void)central_set_discovery_filter();
    if (!central_start_discovery())
        LOG_WARN("[BLUEZ] StartDiscovery failed (continue without scan)");

    running_.store(true, std::memory_order_relaxed);
    impl_->loop = std::thread([this] {
        while (running_.load(std::memory_order_relaxed))
        {
            {
                std::lock_guard<std::mutex> lk(impl_->bus_mu);
                while (sd_bus_process(impl_->bus, nullptr) > 0)
                {
                }
            }
            // do not hold the lock while waiting, IPC commands need it
            sd_bus_wait(impl_->bus, 100000);  // 100ms
            central_pump();
        }
    });

    return true;
#endif
}

// ======================================================================
// Function: BluezTransport::stop_central
// - In: may be called anytime
// - Out: device disconnected, discovery off, thread joined, bus released
// ======================================================================
void BluezTransport::stop_central()
{
#if FILERX_HAVE_SDBUS
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        device_disconnect_locked(impl_->bus, impl_->dev_path);
        if (impl_->bus && impl_->discovery_on.load())
            adapter_stop_discovery_locked(impl_->bus, impl_->adapter_path, impl_->discovery_on);
        // wakes the loop thread out of sd_bus_wait()
        if (impl_->bus)
            sd_bus_close(impl_->bus);
    }

    // join outside the mutex, the loop thread takes it
    if (impl_->loop.joinable())
        impl_->loop.join();

    unref_slot(impl_->added_slot);
    unref_slot(impl_->removed_slot);
    unref_slot(impl_->props_slot);
    unref_slot(impl_->connect_call_slot);

    impl_->connect_inflight.store(false);
    set_connected(false);
    set_subscribed(false);
    impl_->discover_submitted.store(false);

    if (impl_->bus)
    {
        sd_bus_flush_close_unref(impl_->bus);
        impl_->bus = nullptr;
    }
#endif
}

// ======================================================================
// Function: BluezTransport::handover_to
// - In: addr in AA:BB:CC:DD:EE:FF format, or "" to drop the link
// - Out: current device disconnected; the pump connects to the new target
// ======================================================================
bool BluezTransport::handover_to(const std::string &addr)
{
#if !FILERX_HAVE_SDBUS
    (void)addr;
    return false;
#else
    if (!impl_ || !impl_->bus)
        return false;

    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);

        if (impl_->connect_inflight.load())
        {
            unref_slot(impl_->connect_call_slot);
            impl_->connect_inflight.store(false);
        }
        device_disconnect_locked(impl_->bus, impl_->dev_path);

        impl_->peer_svc_path.clear();
        impl_->peer_notify_path.clear();
        impl_->dev_path.clear();
        set_connected(false);
        set_subscribed(false);
        impl_->services_resolved.store(false);
        impl_->discover_submitted.store(false);
        impl_->next_connect_at_ms = steady_now_ms() + 300;
        impl_->last_scan_ms       = 0;

        if (addr.empty())
            cfg_.peer_addr.reset();
        else
            cfg_.peer_addr = addr;
    }

    if (addr.empty())
    {
        // stay idle until a new target is set
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        if (impl_->discovery_on.load())
            adapter_stop_discovery_locked(impl_->bus, impl_->adapter_path, impl_->discovery_on);
    }
    else
    {
        (void)central_start_discovery();
    }

    LOG_SYSTEM("[BLUEZ][handover] target=%s", addr.empty() ? "(none)" : addr.c_str());
    return true;
#endif
}

}  // namespace transport
