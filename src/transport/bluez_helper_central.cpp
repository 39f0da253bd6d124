// src/transport/bluez_helper_central.cpp
#include <cstring>
#include <string>
#include <vector>

#include <systemd/sd-bus.h>

#include "transport/bluez_adapter_impl.hpp"
#include "transport/bluez_dbus_util.hpp"
#include "transport/bluez_helper_central.hpp"
#include "util/log.hpp"

namespace transport
{

// "/org/bluez/hci0/dev_XX" but not its GATT children
static bool is_device_path(const BluezAdapter::Impl &impl, const std::string &path)
{
    return path.rfind(impl.dev_prefix, 0) == 0 &&
           path.find('/', impl.dev_prefix.size()) == std::string::npos;
}

int bluez_on_iface_added(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto *impl = static_cast<BluezAdapter::Impl *>(userdata);

    const char *obj = nullptr;
    int         r   = sd_bus_message_read(m, "o", &obj);
    if (r < 0 || !obj)
        return r < 0 ? r : -EINVAL;

    const std::string obj_path(obj);
    if (!is_device_path(*impl, obj_path))
        return 0;

    r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sa{sv}}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sa{sv}")) > 0)
    {
        const char *iface = nullptr;
        if ((r = sd_bus_message_read(m, "s", &iface)) < 0)
            return r;

        if (iface && std::strcmp(iface, "org.bluez.Device1") == 0)
        {
            gatt::Device d = impl->dev_cache[obj_path];
            DeviceFields seen;
            if ((r = read_device_props(m, d, seen)) < 0)
                return r;
            if (d.address.empty())
                d.address = mac_from_path(obj_path);
            impl->dev_cache[obj_path] = d;
            LOG_DEBUG("[BLUEZ][central] InterfacesAdded %s addr=%s", obj, d.address.c_str());
            if (seen.advert)
                impl->feed_sighting_locked(d);
        }
        else
        {
            if ((r = sd_bus_message_skip(m, "a{sv}")) < 0)
                return r;
        }

        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;
    }
    if (r < 0)
        return r;
    return sd_bus_message_exit_container(m);
}

int bluez_on_iface_removed(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto       *impl = static_cast<BluezAdapter::Impl *>(userdata);
    const char *obj  = nullptr;
    int         r    = sd_bus_message_read(m, "o", &obj);
    if (r < 0 || !obj)
        return r < 0 ? r : -EINVAL;

    bool device_gone = false;
    r                = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "s");
    if (r < 0)
        return r;
    const char *iface = nullptr;
    while ((r = sd_bus_message_read_basic(m, 's', &iface)) > 0)
    {
        if (iface && std::strcmp(iface, "org.bluez.Device1") == 0)
            device_gone = true;
    }
    if (r < 0)
        return r;
    if ((r = sd_bus_message_exit_container(m)) < 0)
        return r;

    const std::string path(obj);
    if (device_gone && is_device_path(*impl, path))
    {
        impl->dev_cache.erase(path);
        impl->link_down_locked(path, "InterfacesRemoved");
    }
    return 0;
}

int bluez_on_props_changed(sd_bus_message *m, void *userdata, sd_bus_error * /*ret_error*/)
{
    auto       *impl  = static_cast<BluezAdapter::Impl *>(userdata);
    const char *iface = nullptr;
    int         r     = sd_bus_message_read(m, "s", &iface);
    if (r < 0)
        return r;

    const char *path_c = sd_bus_message_get_path(m);
    if (!iface || !path_c)
        return 0;
    const std::string path(path_c);

    if (std::strcmp(iface, "org.bluez.Device1") == 0 && is_device_path(*impl, path))
    {
        gatt::Device d = impl->dev_cache[path];
        DeviceFields seen;
        if ((r = read_device_props(m, d, seen)) < 0)
            return r;
        if (d.address.empty())
            d.address = mac_from_path(path);
        impl->dev_cache[path] = d;

        if (seen.connected_hit && !seen.connected)
            impl->link_down_locked(path, "Connected=false");
        if (seen.resolved_hit)
            LOG_DEBUG("[BLUEZ][central] ServicesResolved=%s on %s", seen.resolved ? "true" : "false",
                      path.c_str());
        if (seen.advert)
            impl->feed_sighting_locked(d);
        return 0;
    }

    if (std::strcmp(iface, "org.bluez.GattCharacteristic1") != 0)
        return 0;

    bool        value_hit = false;
    gatt::Bytes value;

    r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
    {
        const char *key = nullptr;
        if ((r = sd_bus_message_read(m, "s", &key)) < 0)
            return r;
        if (key && std::strcmp(key, "Value") == 0)
        {
            if ((r = read_var_ay(m, value)) < 0)
                return r;
            value_hit = true;
        }
        else
        {
            if ((r = sd_bus_message_skip(m, "v")) < 0)
                return r;
        }
        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;
    }
    if (r < 0)
        return r;
    if ((r = sd_bus_message_exit_container(m)) < 0)
        return r;

    if (value_hit)
    {
        LOG_DEBUG("[BLUEZ][central] notify on %s len=%zu", path.c_str(), value.size());
        impl->value_changed_locked(path, value);
    }
    return 0;
}

int bluez_on_method_reply(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto *pc = static_cast<PendingCall *>(userdata);
    {
        std::lock_guard<std::mutex> lk(pc->mu);
        if (sd_bus_message_is_method_error(m, nullptr))
        {
            const sd_bus_error *e = sd_bus_message_get_error(m);
            pc->err_name          = (e && e->name) ? e->name : "unknown";
            pc->err_msg           = (e && e->message) ? e->message : "no message";
        }
        else if (pc->want_bytes)
        {
            int r = read_ay(m, pc->value);
            if (r < 0)
            {
                pc->err_name = "org.freedesktop.DBus.Error.InvalidArgs";
                pc->err_msg  = std::string("bad reply body: ") + std::strerror(-r);
            }
        }
        pc->done = true;
    }
    pc->cv.notify_all();
    return 1;
}

}  // namespace transport
