#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "transport/itransport.hpp"

namespace transport
{

// Devices seen while scanning, keyed by upper-case MAC. Entries expire after ttl_ms.
class PeerTable
{
  public:
    explicit PeerTable(std::uint64_t ttl_ms = 120000) : ttl_ms_(ttl_ms) {}

    // Empty name / missing rssi keep what is already known.
    void note(const std::string &addr, const std::string &name, std::optional<std::int16_t> rssi,
              bool svc_hit, std::uint64_t now_ms);

    // Fresh entries, service advertisers first, then strongest signal.
    std::vector<PeerInfo> list(std::uint64_t now_ms) const;
    void                  clear();

  private:
    struct Entry
    {
        PeerInfo      info;
        std::uint64_t last_seen_ms = 0;
    };

    mutable std::mutex                     mu_;
    std::uint64_t                          ttl_ms_;
    std::unordered_map<std::string, Entry> entries_;
};

std::uint64_t steady_now_ms();

}  // namespace transport
