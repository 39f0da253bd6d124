#pragma once
#include <chrono>
#include <cstddef>
#include <string>

namespace config
{

enum class TransportKind
{
    Loopback,
    Bluez
};

// Daemon settings, read once from GATTLINK_* environment variables.
struct Config
{
    TransportKind             transport{TransportKind::Loopback};
    std::string               adapter{"hci0"};
    std::string               log_level{"debug"};
    std::string               ctl_sock;  // expanded path
    std::chrono::seconds      scan_window{10};
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds probe_timeout{5000};
    std::chrono::milliseconds op_timeout{10000};
    std::size_t               max_connections{1};

    // Invalid values are logged and the default is kept.
    static Config from_env();
};

const char *transport_name(TransportKind t);

// Strict decimal parse into [lo, hi]; false on junk, overflow or out of range.
bool parse_ulong_in_range(const char *s, unsigned long lo, unsigned long hi, unsigned long &out);

}  // namespace config
