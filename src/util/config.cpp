#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <string>

#include "ctl/ipc.hpp"
#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace config
{

const char *transport_name(TransportKind t)
{
    return t == TransportKind::Bluez ? "bluez" : "loopback";
}

bool parse_ulong_in_range(const char *s, unsigned long lo, unsigned long hi, unsigned long &out)
{
    if (!s || !*s || !std::isdigit(static_cast<unsigned char>(*s)))
        return false;
    char *p = nullptr;
    errno   = 0;
    unsigned long v = std::strtoul(s, &p, 10);
    if (errno != 0 || !p || *p != '\0' || v < lo || v > hi)
        return false;
    out = v;
    return true;
}

// Range-checked numeric override; keeps `cur` on a bad value.
static void env_ulong(const char *key, unsigned long lo, unsigned long hi, unsigned long &cur)
{
    const char *e = std::getenv(key);
    if (!e)
        return;
    unsigned long v = 0;
    if (parse_ulong_in_range(e, lo, hi, v))
    {
        cur = v;
        LOG_INFO("Using %s=%lu", key, v);
    }
    else
    {
        LOG_WARN("Ignoring invalid %s='%s' (expect %lu..%lu)", key, e, lo, hi);
    }
}

Config Config::from_env()
{
    Config c;

    if (const char *t = std::getenv("GATTLINK_TRANSPORT"))
    {
        std::string ts = t;
        std::transform(ts.begin(), ts.end(), ts.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        if (ts == "bluez")
            c.transport = TransportKind::Bluez;
        else if (ts == "loopback")
            c.transport = TransportKind::Loopback;
        else
            LOG_WARN("Ignoring invalid GATTLINK_TRANSPORT='%s' (expect loopback|bluez)", t);
    }
    if (const char *a = std::getenv("GATTLINK_ADAPTER"))
    {
        if (*a)
            c.adapter = a;
        else
            LOG_WARN("Ignoring empty GATTLINK_ADAPTER");
    }
    if (const char *l = std::getenv("GATTLINK_LOG_LEVEL"); l && *l)
    {
        gattlink::Level lv;
        if (gattlink::parse_level(l, lv))
            c.log_level = l;
        else
            LOG_WARN("Ignoring invalid GATTLINK_LOG_LEVEL='%s' (expect debug|info|warn|error)", l);
    }

    c.ctl_sock = ipc::expand_user(constants::ctl_sock_path());

    unsigned long scan = static_cast<unsigned long>(c.scan_window.count());
    env_ulong("GATTLINK_SCAN_SECS", 1, 120, scan);
    c.scan_window = std::chrono::seconds(scan);

    unsigned long connect_ms = static_cast<unsigned long>(c.connect_timeout.count());
    env_ulong("GATTLINK_CONNECT_TIMEOUT_MS", 100, 60000, connect_ms);
    c.connect_timeout = std::chrono::milliseconds(connect_ms);

    unsigned long probe_ms = static_cast<unsigned long>(c.probe_timeout.count());
    env_ulong("GATTLINK_PROBE_TIMEOUT_MS", 100, 60000, probe_ms);
    c.probe_timeout = std::chrono::milliseconds(probe_ms);

    unsigned long op_ms = static_cast<unsigned long>(c.op_timeout.count());
    env_ulong("GATTLINK_OP_TIMEOUT_MS", 100, 60000, op_ms);
    c.op_timeout = std::chrono::milliseconds(op_ms);

    unsigned long max_conn = c.max_connections;
    env_ulong("GATTLINK_MAX_CONNECTIONS", 1, 7, max_conn);
    c.max_connections = static_cast<std::size_t>(max_conn);

    return c;
}

}  // namespace config
