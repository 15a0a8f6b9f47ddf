#include "transport/bluez_transport.hpp"
#include "transport/bluez_helper_central.hpp"
#include "transport/bluez_dbus_util.hpp"
#include "util/log.hpp"

#include <cerrno>
#include <cstring>
#include <optional>
#include <string>
#include <utility>

#if FILERX_HAVE_SDBUS
#include <systemd/sd-bus.h>

namespace transport
{

// One Device1 property; 0 when key is not one the peer table tracks.
static int read_device_prop(const char *key, sd_bus_message *v, const std::string &svc_uuid,
                            DeviceSeen &out)
{
    if (strcmp(key, "UUIDs") == 0)
    {
        bool      hit = false;
        const int r   = var_as_has_uuid(v, svc_uuid, hit);
        out.svc_hit   = out.svc_hit || hit;
        return consumed(r);
    }
    if (strcmp(key, "Address") == 0)
        return consumed(read_var_s(v, out.addr));
    if (strcmp(key, "Name") == 0 || strcmp(key, "Alias") == 0)
    {
        // Name wins over Alias, which BlueZ derives from the address when unnamed
        std::string s;
        const int   r = read_var_s(v, s);
        if (r >= 0 && (out.name.empty() || key[0] == 'N'))
            out.name = s;
        return consumed(r);
    }
    if (strcmp(key, "RSSI") == 0)
    {
        int16_t   rssi = 0;
        const int r    = read_var_i16(v, rssi);
        if (r >= 0)
            out.rssi = rssi;
        return consumed(r);
    }
    return 0;
}

int bluez_read_device(sd_bus_message *m, const std::string &svc_uuid, DeviceSeen &out)
{
    return walk_props(m, [&](const char *key, sd_bus_message *v) {
        return read_device_prop(key, v, svc_uuid, out);
    });
}

bool bluez_is_device_path(const BluezTransport &self, const std::string &path)
{
    const std::string prefix = "/org/bluez/" + self.config().adapter + "/dev_";
    return path.rfind(prefix, 0) == 0 && !mac_from_path(path).empty();
}

bool bluez_consider_device(BluezTransport &self, const std::string &path, DeviceSeen dev,
                           bool trust_filter, const char *via)
{
    if (dev.addr.empty())
        dev.addr = mac_from_path(path);
    self.note_peer(dev.addr, dev.name, dev.rssi, dev.svc_hit);

    if (!self.dev_path().empty())
        return false;

    const auto &peer = self.config().peer_addr;
    bool        ok   = false;
    if (peer && !peer->empty())
        ok = mac_eq(dev.addr, *peer);
    else  // the discovery filter only reports devices advertising our service
        ok = dev.svc_hit || (trust_filter && self.has_uuid_discovery_filter());
    if (!ok)
        return false;

    self.set_dev_path(path.c_str());
    LOG_SYSTEM("[BLUEZ] %s found %s addr=%s%s", via, path.c_str(), dev.addr.c_str(),
               dev.svc_hit ? " (svc hit)" : "");
    return true;
}

// ======================================================================
// Function: bluez_on_iface_added
// - In: ObjectManager.InterfacesAdded (o a{sa{sv}})
// - Out: peer table updated; may adopt the device as dev_path
// ======================================================================
int bluez_on_iface_added(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto *self = static_cast<transport::BluezTransport *>(userdata);

    const char *obj = nullptr;
    int         r   = sd_bus_message_read(m, "o", &obj);
    if (r < 0 || !obj)
        return r < 0 ? r : -EINVAL;
    if (!bluez_is_device_path(*self, obj))
        return 0;

    DeviceSeen dev;
    bool       is_dev = false;
    r = walk_interfaces(m, obj, [&](const char *, const char *iface, sd_bus_message *v) -> int {
        if (strcmp(iface, "org.bluez.Device1") != 0)
            return 0;
        is_dev = true;
        return consumed(bluez_read_device(v, self->config().svc_uuid, dev));
    });
    if (r < 0)
        return r;

    if (is_dev)
        (void)bluez_consider_device(*self, obj, std::move(dev), true, "InterfacesAdded");
    return 0;
}

int bluez_on_iface_removed(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto       *self = static_cast<transport::BluezTransport *>(userdata);
    const char *obj  = nullptr;
    int         r    = sd_bus_message_read(m, "o", &obj);
    if (r < 0 || !obj)
        return r < 0 ? r : -EINVAL;
    r = sd_bus_message_skip(m, "as");
    if (r < 0)
        return r;

    if (!self->dev_path().empty() && self->dev_path() == obj)
    {
        self->set_connected(false);
        self->set_subscribed(false);
        self->set_dev_path("");
        LOG_SYSTEM("[BLUEZ] InterfacesRemoved -> cleared device %s", obj);
    }
    return 0;
}

// ======================================================================
// Function: bluez_on_props_changed
// - In: org.freedesktop.DBus.Properties.PropertiesChanged (s a{sv} as)
// - Out: tracks Connected / ServicesResolved on our device, refreshes the
//        peer table, forwards GattCharacteristic1.Value as received chunks
// ======================================================================
int bluez_on_props_changed(sd_bus_message *m, void *userdata, sd_bus_error * /*ret_error*/)
{
    auto       *self  = static_cast<transport::BluezTransport *>(userdata);
    const char *iface = nullptr;
    int         r     = sd_bus_message_read(m, "s", &iface);
    if (r < 0)
        return r;

    const bool is_dev  = iface && strcmp(iface, "org.bluez.Device1") == 0;
    const bool is_char = iface && strcmp(iface, "org.bluez.GattCharacteristic1") == 0;

    std::optional<bool> services_resolved;
    std::optional<bool> connected;
    DeviceSeen          dev;
    bool                dev_hit = false;

    const void *val_buf = nullptr;
    size_t      val_len = 0;

    r = walk_props(m, [&](const char *key, sd_bus_message *v) -> int {
        if (is_char)
        {
            if (strcmp(key, "Value") != 0)
                return 0;
            int rr = sd_bus_message_enter_container(v, SD_BUS_TYPE_VARIANT, "ay");
            if (rr < 0)
                return rr;
            if ((rr = sd_bus_message_read_array(v, 'y', &val_buf, &val_len)) < 0)
                return rr;
            return consumed(sd_bus_message_exit_container(v));
        }
        if (!is_dev)
            return 0;

        if (strcmp(key, "ServicesResolved") == 0 || strcmp(key, "Connected") == 0)
        {
            bool      b  = false;
            const int rr = read_var_b(v, b);
            if (rr >= 0)
                (key[0] == 'C' ? connected : services_resolved) = b;
            return consumed(rr);
        }
        const int rr = read_device_prop(key, v, self->config().svc_uuid, dev);
        dev_hit      = dev_hit || rr != 0;
        return rr;
    });
    if (r < 0)
        return r;
    if ((r = sd_bus_message_skip(m, "as")) < 0)
        return r;

    const char *path = sd_bus_message_get_path(m);
    if (!path)
        return 0;

    // RSSI and UUIDs keep changing while scanning; UUIDs may arrive after InterfacesAdded
    if (dev_hit && bluez_is_device_path(*self, path))
        (void)bluez_consider_device(*self, path, std::move(dev), false, "PropertiesChanged");

    if (self->dev_path() == path && connected)
    {
        if (*connected && !self->connected())
        {
            self->set_connected(true);
            LOG_SYSTEM("[BLUEZ] Connected property became true (%s)", path);
        }
        else if (!*connected && self->connected())
        {
            self->set_connected(false);
            self->set_subscribed(false);
            self->set_services_resolved(false);
            LOG_SYSTEM("[BLUEZ] Disconnected (%s)", path);
        }
    }

    if (self->dev_path() == path && services_resolved)
    {
        self->set_services_resolved(*services_resolved);
        LOG_SYSTEM("[BLUEZ] ServicesResolved=%s on %s", *services_resolved ? "true" : "false",
                   path);
    }

    if (val_buf && val_len && !self->dev_path().empty())
    {
        const std::string dev_prefix = self->dev_path() + "/";
        if (std::strncmp(path, dev_prefix.c_str(), dev_prefix.size()) == 0)
        {
            LOG_DEBUG("[BLUEZ] notify on %s len=%zu", path, val_len);
            self->deliver_rx_bytes(static_cast<const uint8_t *>(val_buf), val_len);
        }
    }

    return 0;
}

int bluez_on_connect_reply(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto *self = static_cast<transport::BluezTransport *>(userdata);

    self->set_connect_inflight(false);

    if (sd_bus_message_is_method_error(m, nullptr))
    {
        const sd_bus_error *e          = sd_bus_message_get_error(m);
        const char         *ename      = (e && e->name) ? e->name : "unknown";
        const char         *emsg       = (e && e->message) ? e->message : "no message";
        uint32_t            backoff_ms = 2000;
        if (strcmp(ename, "org.freedesktop.DBus.Error.NoReply") == 0 ||
            strcmp(ename, "org.bluez.Error.InProgress") == 0 ||
            (strcmp(ename, "org.bluez.Error.Failed") == 0 && strstr(emsg, "already in progress")))
        {
            backoff_ms = 5000;
            LOG_WARN("[BLUEZ] Connect in progress/timeouts, backoff %ums: %s: %s", backoff_ms,
                     ename, emsg);
        }
        else
        {
            LOG_ERROR("[BLUEZ] Device1.Connect failed, backoff %ums: %s: %s", backoff_ms, ename,
                      emsg);
        }
        self->set_connected(false);
        self->set_subscribed(false);
        // device object vanished: let the pump scan again
        if (strcmp(ename, "org.freedesktop.DBus.Error.UnknownObject") == 0 ||
            strcmp(ename, "org.freedesktop.DBus.Error.UnknownMethod") == 0)
        {
            self->set_dev_path("");
            LOG_DEBUG("[BLUEZ] Cleared device path after UnknownObject/Method");
        }
        self->set_next_connect_at_ms(steady_now_ms() + backoff_ms);
        return 1;
    }

    self->set_connected(true);
    self->set_services_resolved(false);
    LOG_SYSTEM("[BLUEZ] Device connected: %s", self->dev_path().c_str());
    return 1;
}

}  // namespace transport

#endif
