// include/transport/bluez_dbus_util.hpp
#pragma once
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <string>

#if FILERX_HAVE_SDBUS
#include <systemd/sd-bus.h>
#endif

namespace transport
{

// ASCII case-insensitive compare, used for UUIDs and MAC addresses
inline bool ieq(const std::string &a, const std::string &b)
{
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

inline bool mac_eq(const std::string &a, const std::string &b)
{
    return ieq(a, b);
}

// "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF" -> "AA:BB:CC:DD:EE:FF"; "" for non-device paths
inline std::string mac_from_path(const std::string &obj_path)
{
    const auto pos = obj_path.rfind("/dev_");
    if (pos == std::string::npos)
        return {};
    std::string mac = obj_path.substr(pos + 5);
    if (mac.find('/') != std::string::npos)
        return {};  // child object (service, characteristic)
    std::replace(mac.begin(), mac.end(), '_', ':');
    return mac;
}

inline bool path_mac_eq(const std::string &obj_path, const std::string &mac)
{
    const std::string m = mac_from_path(obj_path);
    return !m.empty() && mac_eq(m, mac);
}

#if FILERX_HAVE_SDBUS

// Visitor convention: return 1 after consuming the value, 0 to have it skipped, <0 on error.
using PropVisitor  = std::function<int(const char *key, sd_bus_message *m)>;
using IfaceVisitor = std::function<int(const char *path, const char *iface, sd_bus_message *m)>;
using ObjectDone   = std::function<void(const char *path)>;

inline int consumed(int r)
{
    return r < 0 ? r : 1;
}

// One basic value of D-Bus type `sig` wrapped in a variant.
template <typename T> inline int read_var(sd_bus_message *m, const char *sig, T &out)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, sig);
    if (r < 0)
        return r;
    r            = sd_bus_message_read_basic(m, sig[0], &out);
    const int rx = sd_bus_message_exit_container(m);
    return r < 0 ? r : rx;
}

inline int read_var_s(sd_bus_message *m, std::string &out)
{
    const char *s = nullptr;
    const int   r = read_var(m, "s", s);
    if (r >= 0 && s)
        out = s;
    return r;
}

inline int read_var_b(sd_bus_message *m, bool &out)
{
    int       b = 0;
    const int r = read_var(m, "b", b);
    if (r >= 0)
        out = (b != 0);
    return r;
}

inline int read_var_i16(sd_bus_message *m, int16_t &out)
{
    return read_var(m, "n", out);
}

// Variant "as": sets hit when any entry equals want_uuid (case-insensitive).
inline int var_as_has_uuid(sd_bus_message *m, const std::string &want_uuid, bool &hit)
{
    hit   = false;
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "as");
    if (r < 0)
        return r;
    char **uuids = nullptr;
    r            = sd_bus_message_read_strv(m, &uuids);
    if (r >= 0 && uuids)
    {
        for (char **u = uuids; *u; ++u)
        {
            hit = hit || ieq(*u, want_uuid);
            std::free(*u);
        }
    }
    std::free(uuids);
    const int rx = sd_bus_message_exit_container(m);
    return r < 0 ? r : rx;
}

// Walks an a{sv} dictionary.
inline int walk_props(sd_bus_message *m, const PropVisitor &fn)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
    {
        const char *key = nullptr;
        if ((r = sd_bus_message_read(m, "s", &key)) < 0)
            return r;
        r = key ? fn(key, m) : 0;
        if (r == 0)
            r = sd_bus_message_skip(m, "v");
        if (r < 0)
            return r;
        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;
    }
    return r < 0 ? r : sd_bus_message_exit_container(m);
}

// Walks the a{sa{sv}} interface map of one object; fn sees each interface's a{sv}.
inline int walk_interfaces(sd_bus_message *m, const char *path, const IfaceVisitor &fn)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sa{sv}}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sa{sv}")) > 0)
    {
        const char *iface = nullptr;
        if ((r = sd_bus_message_read(m, "s", &iface)) < 0)
            return r;
        r = iface ? fn(path, iface, m) : 0;
        if (r == 0)
            r = sd_bus_message_skip(m, "a{sv}");
        if (r < 0)
            return r;
        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;
    }
    return r < 0 ? r : sd_bus_message_exit_container(m);
}

// Walks a GetManagedObjects reply (a{oa{sa{sv}}}); done(path) runs after each object.
inline int walk_managed_objects(sd_bus_message *reply, const IfaceVisitor &fn,
                                const ObjectDone &done = {})
{
    int r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{oa{sa{sv}}}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "oa{sa{sv}}")) > 0)
    {
        const char *path = nullptr;
        if ((r = sd_bus_message_read(reply, "o", &path)) < 0)
            return r;
        if (!path)
            return -EINVAL;
        if ((r = walk_interfaces(reply, path, fn)) < 0)
            return r;
        if ((r = sd_bus_message_exit_container(reply)) < 0)
            return r;
        if (done)
            done(path);
    }
    return r < 0 ? r : sd_bus_message_exit_container(reply);
}

#endif  // FILERX_HAVE_SDBUS

}  // namespace transport
