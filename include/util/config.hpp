#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "crypto/digest.hpp"

namespace util
{

// Runtime settings, read once from FILERX_* environment variables.
struct Config
{
    std::string                transport = "loopback";  // "loopback" | "bluez"
    std::string                adapter   = "hci0";
    std::optional<std::string> peer_addr{};              // "AA:BB:CC:DD:EE:FF"
    std::string                out_dir;
    std::string                ctl_sock;
    std::size_t                max_transfer_bytes = 0;  // 0 = unbounded
    integrity::Scope           hash_scope         = integrity::Scope::FullContent;
    bool                       strict             = false;
};

Config load_config();

bool        is_valid_mac(const std::string &mac);
std::string normalize_mac(std::string mac);
std::string expand_user(const std::string &path);

}  // namespace util
