// include/transport/bluez_helper_central.hpp
#pragma once

#if FILERX_HAVE_SDBUS
#include <cstdint>
#include <optional>
#include <string>
#include <systemd/sd-bus.h>

namespace transport
{

class BluezTransport;

// Device1 properties of one remote device, as far as they were present.
struct DeviceSeen
{
    std::string                 addr;
    std::string                 name;
    std::optional<std::int16_t> rssi;
    bool                        svc_hit = false;
};

// Reads Address, Name/Alias, RSSI and UUIDs from a Device1 a{sv}.
int bluez_read_device(sd_bus_message *m, const std::string &svc_uuid, DeviceSeen &out);

// "/org/bluez/<adapter>/dev_XX_..", without child objects
bool bluez_is_device_path(const BluezTransport &self, const std::string &path);

// Records the device as a peer; adopts it as the target when none is set and
// it matches the configured MAC (or advertises the service when no MAC is set).
bool bluez_consider_device(BluezTransport &self, const std::string &path, DeviceSeen dev,
                           bool trust_filter, const char *via);

// sd-bus callbacks, userdata is the BluezTransport
int bluez_on_iface_added(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);
int bluez_on_iface_removed(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);
int bluez_on_props_changed(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);
int bluez_on_connect_reply(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);

}  // namespace transport
#endif  // FILERX_HAVE_SDBUS
