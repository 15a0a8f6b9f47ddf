#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string>

#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace util
{

// Plain decimal digits only: strtoull would accept a sign or leading blanks
// and turn "-1" into ULLONG_MAX.
static bool parse_ulong(const char *s, unsigned long long &out)
{
    if (!s || !std::isdigit(static_cast<unsigned char>(*s)))
        return false;
    char *p = nullptr;
    errno   = 0;
    unsigned long long v = std::strtoull(s, &p, 10);
    if (errno == ERANGE || !p || *p != '\0')
        return false;
    out = v;
    return true;
}

bool is_valid_mac(const std::string &mac)
{
    if (mac.size() != 17)
        return false;
    for (size_t i = 0; i < mac.size(); ++i)
    {
        if ((i % 3) == 2)
        {
            if (mac[i] != ':')
                return false;
        }
        else
        {
            unsigned char c = static_cast<unsigned char>(mac[i]);
            if (!std::isxdigit(c))
                return false;
        }
    }
    return true;
}

std::string normalize_mac(std::string mac)
{
    std::transform(mac.begin(), mac.end(), mac.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return mac;
}

std::string expand_user(const std::string &p)
{
    // expand leading '~' or '~/' to $HOME
    if (!p.empty() && p[0] == '~' && (p.size() == 1 || p[1] == '/'))
    {
        const char *home = std::getenv("HOME");
        if (home && (*home))
        {
            return (p.size() == 1) ? std::string(home) : std::string(home) + p.substr(1);
        }
    }
    return p;
}

Config load_config()
{
    Config cfg;
    cfg.out_dir  = constants::default_out_dir();
    cfg.ctl_sock = expand_user(constants::ctl_sock_path());

    if (const char *e = std::getenv("FILERX_LOG_LEVEL"))
        filerx::set_log_level_by_name(e);

    if (const char *t = std::getenv("FILERX_TRANSPORT"))
    {
        if (std::strcmp(t, "bluez") == 0 || std::strcmp(t, "loopback") == 0)
            cfg.transport = t;
        else
            LOG_WARN("Ignoring invalid FILERX_TRANSPORT='%s' (expect loopback|bluez)", t);
    }
    if (const char *a = std::getenv("FILERX_ADAPTER"); a && *a)
        cfg.adapter = a;
    if (const char *p = std::getenv("FILERX_PEER"); p && *p)
    {
        std::string mac = normalize_mac(p);
        if (is_valid_mac(mac))
            cfg.peer_addr = mac;
        else
            LOG_WARN("Ignoring invalid FILERX_PEER='%s'", p);
    }
    if (const char *d = std::getenv("FILERX_OUT_DIR"); d && *d)
        cfg.out_dir = expand_user(d);

    unsigned long long v = 0;
    if (const char *e = std::getenv("FILERX_MAX_BYTES"))
    {
        if (parse_ulong(e, v))
            cfg.max_transfer_bytes = static_cast<std::size_t>(v);
        else
            LOG_WARN("Ignoring invalid FILERX_MAX_BYTES='%s'", e);
    }
    if (const char *e = std::getenv("FILERX_HASH_SCOPE"))
    {
        if (std::strcmp(e, "full") == 0)
            cfg.hash_scope = integrity::Scope::FullContent;
        else if (std::strcmp(e, "body") == 0)
            cfg.hash_scope = integrity::Scope::BodyOnly;
        else
            LOG_WARN("Ignoring invalid FILERX_HASH_SCOPE='%s' (expect full|body)", e);
    }
    if (const char *e = std::getenv("FILERX_STRICT"))
        cfg.strict = (*e == '1');
    return cfg;
}

}  // namespace util
