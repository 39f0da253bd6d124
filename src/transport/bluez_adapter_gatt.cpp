// GATT client operations of the BlueZ adapter: service resolution, read, write, notify.
#include <algorithm>
#include <chrono>
#include <cstring>
#include <map>
#include <mutex>
#include <thread>

#include <systemd/sd-bus.h>

// clang-format off
#include "transport/bluez_adapter.hpp"
#include "transport/bluez_adapter_impl.hpp"
#include "transport/bluez_dbus_util.hpp"
#include "util/log.hpp"
// clang-format on

namespace transport
{
namespace
{
using Clock = std::chrono::steady_clock;

struct CharRecord
{
    std::string   path;
    std::string   uuid;
    std::string   service_path;
    gatt::CapabilitySet caps{0};
};

// Reads a GattService1 a{sv}, keeping UUID.
static int read_service_props(sd_bus_message *m, std::string &uuid)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
    {
        const char *key = nullptr;
        if ((r = sd_bus_message_read(m, "s", &key)) < 0)
            return r;
        if (key && std::strcmp(key, "UUID") == 0)
            r = read_var_s(m, uuid);
        else
            r = sd_bus_message_skip(m, "v");
        if (r < 0)
            return r;
        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;
    }
    if (r < 0)
        return r;
    return sd_bus_message_exit_container(m);
}

// Reads a GattCharacteristic1 a{sv}: UUID, Service, Flags.
static int read_char_props(sd_bus_message *m, CharRecord &c)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
    {
        const char *key = nullptr;
        if ((r = sd_bus_message_read(m, "s", &key)) < 0)
            return r;
        if (key && std::strcmp(key, "UUID") == 0)
        {
            r = read_var_s(m, c.uuid);
        }
        else if (key && std::strcmp(key, "Service") == 0)
        {
            r = read_var_o(m, c.service_path);
        }
        else if (key && std::strcmp(key, "Flags") == 0)
        {
            std::vector<std::string> flags;
            r = read_var_as(m, flags);
            if (r >= 0)
                c.caps = gatt::capabilities_from_flags(flags);
        }
        else
        {
            r = sd_bus_message_skip(m, "v");
        }
        if (r < 0)
            return r;
        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;
    }
    if (r < 0)
        return r;
    return sd_bus_message_exit_container(m);
}

// ======================================================================
// Function: collect_gatt_locked
// - In: bus_mu locked, device object path
// - Out: services (by path) and characteristics found below dev_path
// - Note: one GetManagedObjects walk, other objects are skipped
// ======================================================================
static int collect_gatt_locked(sd_bus                             *bus,
                               const std::string                  &dev_path,
                               std::map<std::string, std::string> &services,
                               std::vector<CharRecord>            &chars,
                               std::string                        &why)
{
    sd_bus_message *reply = nullptr;
    sd_bus_error    err{};
    int r = sd_bus_call_method(bus, "org.bluez", "/", "org.freedesktop.DBus.ObjectManager",
                               "GetManagedObjects", &err, &reply, "");
    if (r < 0)
    {
        why = err.message ? err.message : std::strerror(-r);
        sd_bus_error_free(&err);
        if (reply)
            sd_bus_message_unref(reply);
        return r;
    }
    const std::string below = dev_path + "/";

    r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{oa{sa{sv}}}");
    if (r < 0)
        goto out;
    while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "oa{sa{sv}}")) > 0)
    {
        const char *obj = nullptr;
        if ((r = sd_bus_message_read(reply, "o", &obj)) < 0)
            goto out;
        const std::string path(obj ? obj : "");
        if (path.rfind(below, 0) != 0)
        {
            if ((r = sd_bus_message_skip(reply, "a{sa{sv}}")) < 0)
                goto out;
            if ((r = sd_bus_message_exit_container(reply)) < 0)
                goto out;
            continue;
        }

        if ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{sa{sv}}")) < 0)
            goto out;
        while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "sa{sv}")) > 0)
        {
            const char *iface = nullptr;
            if ((r = sd_bus_message_read(reply, "s", &iface)) < 0)
                goto out;
            if (iface && std::strcmp(iface, "org.bluez.GattService1") == 0)
            {
                std::string uuid;
                if ((r = read_service_props(reply, uuid)) < 0)
                    goto out;
                services[path] = uuid;
            }
            else if (iface && std::strcmp(iface, "org.bluez.GattCharacteristic1") == 0)
            {
                CharRecord c;
                c.path = path;
                if ((r = read_char_props(reply, c)) < 0)
                    goto out;
                chars.push_back(std::move(c));
            }
            else
            {
                if ((r = sd_bus_message_skip(reply, "a{sv}")) < 0)
                    goto out;
            }
            if ((r = sd_bus_message_exit_container(reply)) < 0)
                goto out;
        }
        if (r < 0)
            goto out;
        if ((r = sd_bus_message_exit_container(reply)) < 0)
            goto out;
        if ((r = sd_bus_message_exit_container(reply)) < 0)
            goto out;
    }

out:
    if (reply)
        sd_bus_message_unref(reply);
    sd_bus_error_free(&err);
    if (r < 0 && why.empty())
        why = std::string("GetManagedObjects walk failed: ") + std::strerror(-r);
    return r;
}

static gatt::Status from_reply(const PendingCall &pc, gatt::Errc fallback, const char *what)
{
    const auto code = classify_bluez_error(pc.err_name, pc.err_msg, fallback);
    LOG_WARN("[BLUEZ][central] %s failed: %s: %s", what, pc.err_name.c_str(), pc.err_msg.c_str());
    return {code, pc.err_name + ": " + pc.err_msg};
}

}  // namespace

// ======================================================================
// Function: BluezAdapter::resolve_services
// - In: connection handle, timeout
// - Out: services and characteristics of the connected device, in attribute order
// - Note: waits for Device1.ServicesResolved first; BlueZ object paths carry the
//         zero-padded attribute handle, so path order is attribute order
// ======================================================================
gatt::Status BluezAdapter::resolve_services(ConnectionHandle            h,
                                            std::chrono::milliseconds   timeout,
                                            std::vector<gatt::Service> &out)
{
    Impl::Link link;
    if (!impl_->link_for(h, link))
        return {gatt::Errc::LinkLost, "unknown connection"};

    const auto deadline = Clock::now() + timeout;
    while (true)
    {
        if (impl_->link_for(h, link) && link.lost)
            return {gatt::Errc::LinkLost, "link to " + link.address + " lost"};

        int         resolved = 0;
        std::string ename, emsg;
        int         r        = 0;
        {
            std::lock_guard<std::mutex> lk(impl_->bus_mu);
            sd_bus_error err{};
            r = sd_bus_get_property_trivial(impl_->bus, "org.bluez", link.dev_path.c_str(),
                                            "org.bluez.Device1", "ServicesResolved", &err, 'b',
                                            &resolved);
            if (r < 0)
            {
                ename = err.name ? err.name : "";
                emsg  = err.message ? err.message : std::strerror(-r);
            }
            sd_bus_error_free(&err);
        }
        if (r < 0)
            return {classify_bluez_error(ename, emsg, gatt::Errc::AdapterError), emsg};
        if (resolved)
            break;
        if (Clock::now() >= deadline)
            return {gatt::Errc::Timeout, "services of " + link.address + " not resolved within " +
                                             std::to_string(timeout.count()) + " ms"};
        std::this_thread::sleep_for(util::CANCEL_POLL_SLICE);
    }

    std::map<std::string, std::string> services;  // path -> uuid
    std::vector<CharRecord>            chars;
    std::string                        why;
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        if (collect_gatt_locked(impl_->bus, link.dev_path, services, chars, why) < 0)
            return {gatt::Errc::AdapterError, why};
    }
    std::sort(chars.begin(), chars.end(),
              [](const CharRecord &a, const CharRecord &b) { return a.path < b.path; });

    out.clear();
    for (const auto &kv : services)
    {
        gatt::Service svc;
        svc.uuid = kv.second;
        for (const auto &c : chars)
        {
            if (c.service_path != kv.first)
                continue;
            gatt::Characteristic ch;
            ch.uuid         = c.uuid;
            ch.capabilities = c.caps;
            ch.service_uuid = svc.uuid;
            ch.handle       = c.path;
            svc.characteristics.push_back(std::move(ch));
        }
        out.push_back(std::move(svc));
    }
    LOG_DEBUG("[BLUEZ][central] resolved %zu service(s), %zu characteristic(s) on %s", out.size(),
              chars.size(), link.address.c_str());
    return gatt::Status::Ok();
}

gatt::Status BluezAdapter::read_characteristic(ConnectionHandle            h,
                                               const gatt::Characteristic &c,
                                               std::chrono::milliseconds   timeout,
                                               const util::CancelToken    &cancel,
                                               gatt::Bytes                &out)
{
    Impl::Link link;
    if (!impl_->link_for(h, link) || link.lost)
        return {gatt::Errc::LinkLost, "connection gone"};

    sd_bus_message *msg = nullptr;
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        int r = sd_bus_message_new_method_call(impl_->bus, &msg, "org.bluez", c.handle.c_str(),
                                               "org.bluez.GattCharacteristic1", "ReadValue");
        if (r >= 0)
            r = append_gatt_options(msg, nullptr);
        if (r < 0)
        {
            if (msg)
                sd_bus_message_unref(msg);
            return {gatt::Errc::AdapterError, std::string("ReadValue build failed: ") + std::strerror(-r)};
        }
    }

    PendingCall pc;
    pc.want_bytes = true;
    auto st       = impl_->call_and_wait(msg, pc, timeout, cancel);
    if (!st)
        return st;
    if (!pc.err_name.empty())
        return from_reply(pc, gatt::Errc::ReadError, "ReadValue");
    out = std::move(pc.value);
    return gatt::Status::Ok();
}

// ======================================================================
// Function: BluezAdapter::write_characteristic
// - In: characteristic object path, bytes, write type
// - Out: Ok when BlueZ acknowledged (request) or accepted (command) the write
// - Note: WriteValue(ay, {type: "request"|"command", offset: 0})
// ======================================================================
gatt::Status BluezAdapter::write_characteristic(ConnectionHandle            h,
                                                const gatt::Characteristic &c,
                                                const gatt::Bytes          &data,
                                                bool                        with_response,
                                                std::chrono::milliseconds   timeout,
                                                const util::CancelToken    &cancel)
{
    Impl::Link link;
    if (!impl_->link_for(h, link) || link.lost)
        return {gatt::Errc::LinkLost, "connection gone"};

    sd_bus_message *msg = nullptr;
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        int r = sd_bus_message_new_method_call(impl_->bus, &msg, "org.bluez", c.handle.c_str(),
                                               "org.bluez.GattCharacteristic1", "WriteValue");
        if (r >= 0)
            r = sd_bus_message_append_array(msg, 'y', data.data(), data.size());
        if (r >= 0)
            r = append_gatt_options(msg, with_response ? "request" : "command");
        if (r < 0)
        {
            if (msg)
                sd_bus_message_unref(msg);
            return {gatt::Errc::AdapterError, std::string("WriteValue build failed: ") + std::strerror(-r)};
        }
    }

    PendingCall pc;
    auto        st = impl_->call_and_wait(msg, pc, timeout, cancel);
    if (!st)
        return st;
    if (!pc.err_name.empty())
        return from_reply(pc, gatt::Errc::WriteRejected, "WriteValue");
    LOG_DEBUG("[BLUEZ][central] WriteValue %s len=%zu (%s)", c.uuid.c_str(), data.size(),
              with_response ? "request" : "command");
    return gatt::Status::Ok();
}

gatt::Status BluezAdapter::subscribe(ConnectionHandle            h,
                                     const gatt::Characteristic &c,
                                     OnNotify                    on_notify,
                                     SubscriptionHandle         &out)
{
    Impl::Link link;
    if (!impl_->link_for(h, link) || link.lost)
        return {gatt::Errc::LinkLost, "connection gone"};

    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        sd_bus_error    err{};
        sd_bus_message *rep = nullptr;
        int r = sd_bus_call_method(impl_->bus, "org.bluez", c.handle.c_str(),
                                   "org.bluez.GattCharacteristic1", "StartNotify", &err, &rep, "");
        if (rep)
            sd_bus_message_unref(rep);
        if (r < 0)
        {
            PendingCall pc;
            pc.err_name = err.name ? err.name : "unknown";
            pc.err_msg  = err.message ? err.message : std::strerror(-r);
            sd_bus_error_free(&err);
            return from_reply(pc, gatt::Errc::PeerRejected, "StartNotify");
        }
        sd_bus_error_free(&err);

        std::lock_guard<std::mutex> sl(impl_->st_mu);
        out = impl_->next_sub++;
        impl_->subs[out] = Impl::Notify{h, c.handle, std::move(on_notify)};
    }
    LOG_DEBUG("[BLUEZ][central] StartNotify OK on %s", c.handle.c_str());
    return gatt::Status::Ok();
}

void BluezAdapter::unsubscribe(SubscriptionHandle s)
{
    std::string char_path;
    bool        still_used = false;
    bool        link_up    = false;
    {
        std::lock_guard<std::mutex> lk(impl_->st_mu);
        auto it = impl_->subs.find(s);
        if (it == impl_->subs.end())
            return;
        char_path = it->second.char_path;
        auto l    = impl_->links.find(it->second.link);
        link_up   = l != impl_->links.end() && !l->second.lost;
        impl_->subs.erase(it);
        for (const auto &kv : impl_->subs)
        {
            if (kv.second.char_path == char_path)
                still_used = true;
        }
    }
    if (still_used || !link_up)
        return;

    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    int r = sd_bus_call_method(impl_->bus, "org.bluez", char_path.c_str(),
                               "org.bluez.GattCharacteristic1", "StopNotify", &err, &rep, "");
    if (r < 0)
        LOG_DEBUG("[BLUEZ][central] StopNotify %s: %s", char_path.c_str(),
                  err.message ? err.message : std::strerror(-r));
    if (rep)
        sd_bus_message_unref(rep);
    sd_bus_error_free(&err);
}

}  // namespace transport
