#include <algorithm>
#include <chrono>

#include "transport/peer_table.hpp"
#include "util/config.hpp"

namespace transport
{

std::uint64_t steady_now_ms()
{
    using namespace std::chrono;
    return (std::uint64_t)duration_cast<milliseconds>(steady_clock::now().time_since_epoch())
        .count();
}

void PeerTable::note(const std::string &addr, const std::string &name,
                     std::optional<std::int16_t> rssi, bool svc_hit, std::uint64_t now_ms)
{
    const std::string key = util::normalize_mac(addr);
    if (!util::is_valid_mac(key))
        return;

    std::lock_guard<std::mutex> lk(mu_);
    Entry &e = entries_[key];
    e.info.addr = key;
    if (!name.empty())
        e.info.name = name;
    if (rssi)
    {
        e.info.rssi      = *rssi;
        e.info.have_rssi = true;
    }
    e.info.svc_hit = e.info.svc_hit || svc_hit;
    e.last_seen_ms = now_ms;
}

std::vector<PeerInfo> PeerTable::list(std::uint64_t now_ms) const
{
    std::vector<PeerInfo> out;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (const auto &kv : entries_)
        {
            if (now_ms - kv.second.last_seen_ms <= ttl_ms_)
                out.push_back(kv.second.info);
        }
    }
    std::sort(out.begin(), out.end(), [](const PeerInfo &a, const PeerInfo &b) {
        if (a.svc_hit != b.svc_hit)
            return a.svc_hit;
        if (a.have_rssi != b.have_rssi)
            return a.have_rssi;
        if (a.rssi != b.rssi)
            return a.rssi > b.rssi;
        return a.addr < b.addr;
    });
    return out;
}

void PeerTable::clear()
{
    std::lock_guard<std::mutex> lk(mu_);
    entries_.clear();
}

}  // namespace transport
