#pragma once
#include <cstdlib>
#include <string>
#include <string_view>

namespace constants
{
// Nordic UART style service hosted by the loopback echo peripheral
inline constexpr std::string_view UART_SVC_UUID = "6e400001-b5a3-f393-e0a9-e50e24dcca9e";
inline constexpr std::string_view UART_RX_UUID  = "6e400002-b5a3-f393-e0a9-e50e24dcca9e";  // Write
inline constexpr std::string_view UART_TX_UUID  = "6e400003-b5a3-f393-e0a9-e50e24dcca9e";  // Notify
// Generic Access / Device Name
inline constexpr std::string_view GAP_SVC_UUID     = "00001800-0000-1000-8000-00805f9b34fb";
inline constexpr std::string_view DEVICE_NAME_UUID = "00002a00-0000-1000-8000-00805f9b34fb";

inline constexpr std::string_view DEMO_ECHO_ADDR   = "02:00:00:00:00:01";
inline constexpr std::string_view DEMO_BEACON_ADDR = "02:00:00:00:00:02";

// Control socket path (Unix domain socket)
[[maybe_unused]] static std::string ctl_sock_path()
{
    if (const char *p = std::getenv("GATTLINK_CTL_SOCK"); p && *p)
    {
        return std::string(p);
    }
    const char *home = std::getenv("HOME");
    std::string base = home && *home ? std::string(home) : "/tmp";
    return base + "/.cache/gattlink/ctl.sock";
}

}  // namespace constants
