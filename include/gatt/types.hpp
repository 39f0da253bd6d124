#pragma once
#include <cctype>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace gatt
{

using Bytes = std::vector<std::uint8_t>;

// --- Characteristic capabilities (bit set) ---
enum class Capability : std::uint8_t
{
    Read            = 1 << 0,
    Write           = 1 << 1,
    WriteNoResponse = 1 << 2,
    Notify          = 1 << 3,
    Indicate        = 1 << 4
};

using CapabilitySet = std::uint8_t;

constexpr CapabilitySet caps(Capability c)
{
    return static_cast<CapabilitySet>(c);
}

constexpr CapabilitySet operator|(Capability a, Capability b)
{
    return static_cast<CapabilitySet>(caps(a) | caps(b));
}

constexpr CapabilitySet operator|(CapabilitySet a, Capability b)
{
    return static_cast<CapabilitySet>(a | caps(b));
}

inline bool has_capability(CapabilitySet set, Capability c)
{
    return (set & caps(c)) != 0;
}

const char   *capability_name(Capability c);
std::string   capabilities_to_string(CapabilitySet set);  // "read, write, notify"
// BlueZ / bleak flag names ("read", "write-without-response", ...). Unknown flags are ignored.
CapabilitySet capabilities_from_flags(const std::vector<std::string> &flags);

// Case-insensitive UUID / address comparison.
inline bool uuid_eq(const std::string &a, const std::string &b)
{
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i]))
            return false;
    }
    return true;
}

// --- Discovery model ---
struct Advertisement
{
    std::int16_t                          rssi{0};  // dBm
    std::optional<std::int16_t>           tx_power;
    std::map<std::uint16_t, Bytes>        manufacturer_data;  // company id -> bytes
    std::map<std::string, Bytes>          service_data;       // service uuid -> bytes
    std::set<std::string>                 service_uuids;
};

struct Device
{
    std::string                           address;  // "AA:BB:CC:DD:EE:FF"
    std::optional<std::string>            name;
    std::chrono::system_clock::time_point last_seen{};
    std::optional<Advertisement>          advertisement;

    bool               has_name() const { return name.has_value() && !name->empty(); }
    const std::string &display_name() const;  // "Unknown Device" when unnamed
};

// --- GATT model ---
struct Characteristic
{
    std::string   uuid;
    CapabilitySet capabilities{0};
    std::string   service_uuid;  // non-owning back-reference to the parent service
    // Adapter-specific locator (BlueZ object path, loopback key). Unique per connection.
    std::string   handle;

    bool can(Capability c) const { return has_capability(capabilities, c); }
};

struct Service
{
    std::string                 uuid;
    std::vector<Characteristic> characteristics;
};

}  // namespace gatt
