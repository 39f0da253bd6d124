#include <chrono>
#include <cstring>
#include <string>

#include "transport/bluez_dbus_util.hpp"

namespace transport
{

static bool contains(const std::string &hay, const char *needle)
{
    return hay.find(needle) != std::string::npos;
}

// a{qv} with v = ay
static int read_manufacturer_data(sd_bus_message *m, std::map<std::uint16_t, gatt::Bytes> &out)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "a{qv}");
    if (r < 0)
        return r;
    if ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{qv}")) < 0)
        return r;
    out.clear();
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "qv")) > 0)
    {
        uint16_t company = 0;
        if ((r = sd_bus_message_read(m, "q", &company)) < 0)
            return r;
        gatt::Bytes data;
        if ((r = read_var_ay(m, data)) < 0)
            return r;
        out[company] = std::move(data);
        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;
    }
    if (r < 0)
        return r;
    if ((r = sd_bus_message_exit_container(m)) < 0)
        return r;
    return sd_bus_message_exit_container(m);
}

// a{sv} with v = ay
static int read_service_data(sd_bus_message *m, std::map<std::string, gatt::Bytes> &out)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "a{sv}");
    if (r < 0)
        return r;
    if ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}")) < 0)
        return r;
    out.clear();
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
    {
        const char *uuid = nullptr;
        if ((r = sd_bus_message_read(m, "s", &uuid)) < 0)
            return r;
        gatt::Bytes data;
        if ((r = read_var_ay(m, data)) < 0)
            return r;
        if (uuid)
            out[uuid] = std::move(data);
        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;
    }
    if (r < 0)
        return r;
    if ((r = sd_bus_message_exit_container(m)) < 0)
        return r;
    return sd_bus_message_exit_container(m);
}

int read_device_props(sd_bus_message *m, gatt::Device &d, DeviceFields &seen)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        return r;

    auto adv = [&d]() -> gatt::Advertisement & {
        if (!d.advertisement)
            d.advertisement = gatt::Advertisement{};
        return *d.advertisement;
    };

    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
    {
        const char *key = nullptr;
        if ((r = sd_bus_message_read(m, "s", &key)) < 0)
            return r;

        if (key && std::strcmp(key, "Address") == 0)
        {
            if ((r = read_var_s(m, d.address)) < 0)
                return r;
            seen.address = true;
        }
        else if (key && std::strcmp(key, "Name") == 0)
        {
            std::string name;
            if ((r = read_var_s(m, name)) < 0)
                return r;
            d.name    = name;
            seen.name = true;
        }
        else if (key && std::strcmp(key, "RSSI") == 0)
        {
            int16_t rssi = 0;
            if ((r = read_var_i16(m, rssi)) < 0)
                return r;
            adv().rssi  = rssi;
            seen.advert = true;
        }
        else if (key && std::strcmp(key, "TxPower") == 0)
        {
            int16_t tx = 0;
            if ((r = read_var_i16(m, tx)) < 0)
                return r;
            adv().tx_power = tx;
            seen.advert    = true;
        }
        else if (key && std::strcmp(key, "ManufacturerData") == 0)
        {
            if ((r = read_manufacturer_data(m, adv().manufacturer_data)) < 0)
                return r;
            seen.advert = true;
        }
        else if (key && std::strcmp(key, "ServiceData") == 0)
        {
            if ((r = read_service_data(m, adv().service_data)) < 0)
                return r;
            seen.advert = true;
        }
        else if (key && std::strcmp(key, "UUIDs") == 0)
        {
            std::vector<std::string> uuids;
            if ((r = read_var_as(m, uuids)) < 0)
                return r;
            auto &set = adv().service_uuids;
            set.clear();
            set.insert(uuids.begin(), uuids.end());
            seen.uuids = true;
        }
        else if (key && std::strcmp(key, "Connected") == 0)
        {
            if ((r = read_var_b(m, seen.connected)) < 0)
                return r;
            seen.connected_hit = true;
        }
        else if (key && std::strcmp(key, "ServicesResolved") == 0)
        {
            if ((r = read_var_b(m, seen.resolved)) < 0)
                return r;
            seen.resolved_hit = true;
        }
        else
        {
            if ((r = sd_bus_message_skip(m, "v")) < 0)
                return r;
        }
        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;  // dict-entry
    }
    if (r < 0)
        return r;
    if (seen.advert)
        d.last_seen = std::chrono::system_clock::now();
    return sd_bus_message_exit_container(m);  // a{sv}
}

gatt::Errc classify_bluez_error(const std::string &name, const std::string &msg, gatt::Errc fallback)
{
    if (name == "org.freedesktop.DBus.Error.NoReply" || name == "org.freedesktop.DBus.Error.Timeout" ||
        name == "org.freedesktop.DBus.Error.TimedOut")
        return gatt::Errc::Timeout;
    if (name == "org.freedesktop.DBus.Error.UnknownObject" ||
        name == "org.freedesktop.DBus.Error.UnknownMethod" ||
        name == "org.freedesktop.DBus.Error.ServiceUnknown" || contains(msg, "Not connected"))
        return gatt::Errc::LinkLost;
    if (name == "org.bluez.Error.NotReady" || name == "org.bluez.Error.NotAvailable")
        return gatt::Errc::AdapterError;
    // NotPermitted, NotAuthorized, NotSupported, InvalidValueLength, InProgress, Failed
    return fallback;
}

gatt::Errc classify_connect_error(const std::string &name, const std::string &msg)
{
    if (name == "org.freedesktop.DBus.Error.NoReply" || contains(msg, "Timeout") ||
        contains(msg, "timed out") || contains(msg, "page-timeout"))
        return gatt::Errc::ConnectTimeout;
    if (name == "org.bluez.Error.NotReady" || name == "org.bluez.Error.NotAvailable" ||
        name == "org.freedesktop.DBus.Error.ServiceUnknown" || contains(msg, "Resource"))
        return gatt::Errc::AdapterError;
    if (name == "org.freedesktop.DBus.Error.UnknownObject" ||
        name == "org.freedesktop.DBus.Error.UnknownMethod" || name == "org.bluez.Error.Failed" ||
        name == "org.bluez.Error.InProgress" || name == "org.bluez.Error.NotSupported")
        return gatt::Errc::ConnectRefused;
    return gatt::Errc::AdapterError;
}

int append_gatt_options(sd_bus_message *msg, const char *type)
{
    // options a{sv}: {"type": s} and {"offset": q = 0}
    int r = sd_bus_message_open_container(msg, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        return r;
    if (type)
    {
        if ((r = sd_bus_message_open_container(msg, SD_BUS_TYPE_DICT_ENTRY, "sv")) < 0)
            return r;
        if ((r = sd_bus_message_append(msg, "s", "type")) < 0)
            return r;
        if ((r = sd_bus_message_open_container(msg, SD_BUS_TYPE_VARIANT, "s")) < 0)
            return r;
        if ((r = sd_bus_message_append(msg, "s", type)) < 0)
            return r;
        if ((r = sd_bus_message_close_container(msg)) < 0)
            return r;  // variant
        if ((r = sd_bus_message_close_container(msg)) < 0)
            return r;  // dict-entry
    }
    if ((r = sd_bus_message_open_container(msg, SD_BUS_TYPE_DICT_ENTRY, "sv")) < 0)
        return r;
    if ((r = sd_bus_message_append(msg, "s", "offset")) < 0)
        return r;
    if ((r = sd_bus_message_open_container(msg, SD_BUS_TYPE_VARIANT, "q")) < 0)
        return r;
    if ((r = sd_bus_message_append(msg, "q", (uint16_t)0)) < 0)
        return r;
    if ((r = sd_bus_message_close_container(msg)) < 0)
        return r;  // variant
    if ((r = sd_bus_message_close_container(msg)) < 0)
        return r;  // dict-entry
    return sd_bus_message_close_container(msg);  // a{sv}
}

}  // namespace transport
