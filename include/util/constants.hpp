#pragma once
#include <cstddef>
#include <cstdlib>
#include <string>
#include <string_view>

#include "util/log.hpp"

namespace constants
{
// Nordic UART Service as exposed by the sending device
inline constexpr std::string_view SVC_UUID    = "6e400001-b5a3-f393-e0a9-e50e24dcca9e";
inline constexpr std::string_view NOTIFY_UUID = "6e400003-b5a3-f393-e0a9-e50e24dcca9e";  // Notify

// ATT MTU the sender is expected to negotiate
inline constexpr std::size_t DEFAULT_MTU = 512;

inline std::string home_or_tmp()
{
    const char *home = std::getenv("HOME");
    return home && *home ? std::string(home) : std::string("/tmp");
}

// Control socket path (Unix domain socket)
[[maybe_unused]] static std::string ctl_sock_path()
{
    if (const char *p = std::getenv("FILERX_CTL_SOCK"); p && *p)
    {
        return std::string(p);
    }
    std::string sock_path = home_or_tmp() + "/.cache/filerx/ctl.sock";
    LOG_SYSTEM("Listening on %s", sock_path.c_str());
    return sock_path;
}

// Directory receiving the reconstructed files
[[maybe_unused]] static std::string default_out_dir()
{
    return home_or_tmp() + "/.local/share/filerx";
}

}  // namespace constants
