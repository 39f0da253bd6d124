// include/transport/bluez_dbus_util.hpp
#pragma once
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#include <systemd/sd-bus.h>

#include "gatt/status.hpp"
#include "gatt/types.hpp"

namespace transport
{

// unref and null a slot ptr
static inline void unref_slot(sd_bus_slot *&s)
{
    if (s)
    {
        sd_bus_slot_unref(s);
        s = nullptr;
    }
}

// "AA:BB:CC:DD:EE:FF" -> "<prefix>AA_BB_CC_DD_EE_FF"
static inline std::string dev_path_for(const std::string &dev_prefix, const std::string &mac)
{
    std::string tail = mac;
    for (auto &c : tail)
        c = (c == ':') ? '_' : (char)std::toupper((unsigned char)c);
    return dev_prefix + tail;
}

// "/org/bluez/hci0/dev_XX_YY_ZZ" -> "XX:YY:ZZ", empty if not a device path
[[maybe_unused]] static inline std::string mac_from_path(const std::string &obj_path)
{
    auto pos = obj_path.rfind("/dev_");
    if (pos == std::string::npos)
        return std::string();
    std::string tail = obj_path.substr(pos + 5);
    if (tail.find('/') != std::string::npos)
        return std::string();
    for (auto &c : tail)
        if (c == '_')
            c = ':';
    return tail;
}

[[maybe_unused]] static inline int read_var_s(sd_bus_message *m, std::string &out)
{
    // read variant "s"
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "s");
    if (r < 0)
        return r;
    const char *s = nullptr;
    r             = sd_bus_message_read(m, "s", &s);
    if (r >= 0 && s)
        out = s;
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

[[maybe_unused]] static inline int read_var_o(sd_bus_message *m, std::string &out)
{
    // read variant "o"
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "o");
    if (r < 0)
        return r;
    const char *s = nullptr;
    r             = sd_bus_message_read(m, "o", &s);
    if (r >= 0 && s)
        out = s;
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

[[maybe_unused]] static inline int read_var_i16(sd_bus_message *m, int16_t &out)
{
    // read variant "n" (int16)
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "n");
    if (r < 0)
        return r;
    r      = sd_bus_message_read(m, "n", &out);
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

[[maybe_unused]] static inline int read_var_b(sd_bus_message *m, bool &out)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "b");
    if (r < 0)
        return r;
    int b  = 0;
    r      = sd_bus_message_read(m, "b", &b);
    out    = (b != 0);
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

// plain "ay" at the current position
[[maybe_unused]] static inline int read_ay(sd_bus_message *m, gatt::Bytes &out)
{
    const void *buf = nullptr;
    size_t      len = 0;
    int         r   = sd_bus_message_read_array(m, 'y', &buf, &len);
    if (r < 0)
        return r;
    const auto *p = static_cast<const uint8_t *>(buf);
    out.assign(p, p + len);
    return r;
}

[[maybe_unused]] static inline int read_var_ay(sd_bus_message *m, gatt::Bytes &out)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "ay");
    if (r < 0)
        return r;
    r      = read_ay(m, out);
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

[[maybe_unused]] static inline int read_var_as(sd_bus_message *m, std::vector<std::string> &out)
{
    // read variant "as"
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "as");
    if (r < 0)
        return r;
    r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "s");
    if (r < 0)
        return r;
    while (true)
    {
        const char *u  = nullptr;
        int         rr = sd_bus_message_read_basic(m, 's', &u);
        if (rr < 0)
            return rr;
        if (rr == 0)
            break;
        if (u)
            out.emplace_back(u);
    }
    int r1 = sd_bus_message_exit_container(m);
    int r2 = sd_bus_message_exit_container(m);
    return (r1 < 0 || r2 < 0) ? -EBADMSG : 0;
}

// Which Device1 properties a parse touched.
struct DeviceFields
{
    bool address{false};
    bool name{false};
    bool advert{false};  // RSSI / TxPower / ManufacturerData / ServiceData
    bool uuids{false};
    bool connected_hit{false};
    bool connected{false};
    bool resolved_hit{false};
    bool resolved{false};
};

// Parse a Device1 a{sv} (InterfacesAdded, GetManagedObjects or PropertiesChanged) into `d`,
// overwriting only the properties present. Cursor must be before the a{sv} container.
int read_device_props(sd_bus_message *m, gatt::Device &d, DeviceFields &seen);

// BlueZ / D-Bus error name + message -> error code. `fallback` is the operation's
// peer-side code (ReadError, WriteRejected, PeerRejected).
gatt::Errc classify_bluez_error(const std::string &name, const std::string &msg, gatt::Errc fallback);
// Device1.Connect error -> ConnectTimeout / ConnectRefused / AdapterError.
gatt::Errc classify_connect_error(const std::string &name, const std::string &msg);

// Append the GattCharacteristic1 options dict {"type": s, "offset": q}. type may be null.
int append_gatt_options(sd_bus_message *msg, const char *type);

}  // namespace transport
