/* ======================================================================
 * BlueZ central adapter
 *
 *  Caller thread                    Bus thread                 BlueZ/DBus
 *  -------------                    ----------                 ----------
 *  start()
 *    └─ match InterfacesAdded / InterfacesRemoved / PropertiesChanged
 *    └─ spawn bus loop: process (bus_mu) → dispatch callbacks → wait
 *
 *  scan(window)
 *    └─ Adapter1.Powered? ─────────────────────────────────────▶  Properties.Get
 *    └─ set_discovery_filter (le, duplicates) ─────────────────▶  Adapter1.SetDiscoveryFilter
 *    └─ start_discovery ───────────────────────────────────────▶  Adapter1.StartDiscovery
 *    └─ cold_scan (fill device cache) ─────────────────────────▶  ObjectManager.GetManagedObjects
 *                                   ◀── InterfacesAdded / PropertiesChanged(RSSI, ...) → ScanFeed
 *
 *  connect(addr, timeout)
 *    └─ Device1.Connect (async) ───────────────────────────────▶
 *                                   ◀── bluez_on_method_reply → PendingCall
 *    └─ on timeout / cancel: drop the reply slot, Device1.Disconnect
 *                                   ◀── PropertiesChanged(Connected=false) → on_link_lost
 *
 *  DBus calls on caller threads are under impl_->bus_mu
 * ====================================================================== */

#include <algorithm>
#include <chrono>
#include <cstring>
#include <mutex>
#include <thread>

#include <systemd/sd-bus.h>

// clang-format off
#include "transport/bluez_adapter.hpp"
#include "transport/bluez_adapter_impl.hpp"
#include "transport/bluez_dbus_util.hpp"
#include "transport/bluez_helper_central.hpp"
#include "util/log.hpp"
// clang-format on

namespace transport
{
namespace
{
using Clock = std::chrono::steady_clock;

// ======================================================================
// Function: adapter_start_discovery_locked
// - In: bus_mu locked, adapter_path valid
// - Out: true if StartDiscovery succeeds (or is already running)
// - Note: safe to call repeatedly, only starts when off
// ======================================================================
static bool adapter_start_discovery_locked(sd_bus            *bus,
                                           const std::string &adapter_path,
                                           std::atomic_bool  &discovery_on,
                                           std::string       &why)
{
    if (!bus)
        return false;
    if (discovery_on.load())
        return true;

    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    int r = sd_bus_call_method(bus, "org.bluez", adapter_path.c_str(), "org.bluez.Adapter1",
                               "StartDiscovery", &err, &rep, "");
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
    {
        if (err.name && std::string(err.name) == "org.bluez.Error.InProgress")
        {
            discovery_on.store(true);
            LOG_INFO("[BLUEZ][central] StartDiscovery already in progress on %s",
                     adapter_path.c_str());
            sd_bus_error_free(&err);
            return true;
        }
        why = err.message ? err.message : std::strerror(-r);
        LOG_WARN("[BLUEZ][central] StartDiscovery failed: %s", why.c_str());
        sd_bus_error_free(&err);
        return false;
    }
    sd_bus_error_free(&err);
    discovery_on.store(true);
    LOG_SYSTEM("[BLUEZ][central] StartDiscovery OK on %s", adapter_path.c_str());
    return true;
}

// ======================================================================
// Function: adapter_stop_discovery_locked
// - In: bus_mu locked, adapter_path valid
// - Out: discovery_on cleared even if StopDiscovery fails
// ======================================================================
static void adapter_stop_discovery_locked(sd_bus            *bus,
                                          const std::string &adapter_path,
                                          std::atomic_bool  &discovery_on)
{
    if (!bus || !discovery_on.load())
        return;

    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    int r = sd_bus_call_method(bus, "org.bluez", adapter_path.c_str(), "org.bluez.Adapter1",
                               "StopDiscovery", &err, &rep, "");
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
    {
        // usually "already stopped"
        LOG_WARN("[BLUEZ][central] StopDiscovery failed (treat as off): %s",
                 err.message ? err.message : std::strerror(-r));
    }
    else
    {
        LOG_SYSTEM("[BLUEZ][central] StopDiscovery OK");
    }
    discovery_on.store(false);
    sd_bus_error_free(&err);
}

// ======================================================================
// Function: adapter_set_discovery_filter_locked
// - In: bus_mu locked
// - Out: true if Adapter1.SetDiscoveryFilter(Transport=le, DuplicateData=true) succeeds
// - Note: duplicates keep RSSI / advertisement updates flowing during a window
// ======================================================================
static bool adapter_set_discovery_filter_locked(sd_bus *bus, const std::string &adapter_path)
{
    sd_bus_message *msg = nullptr, *rep = nullptr;
    sd_bus_error    err{};
    int r = sd_bus_message_new_method_call(bus, &msg, "org.bluez", adapter_path.c_str(),
                                           "org.bluez.Adapter1", "SetDiscoveryFilter");
    if (r < 0)
        goto out;

    // a{sv}
    r = sd_bus_message_open_container(msg, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        goto out;
    // Transport="le"
    r = sd_bus_message_open_container(msg, SD_BUS_TYPE_DICT_ENTRY, "sv");
    if (r < 0)
        goto out;
    r = sd_bus_message_append(msg, "s", "Transport");
    if (r < 0)
        goto out;
    r = sd_bus_message_open_container(msg, SD_BUS_TYPE_VARIANT, "s");
    if (r < 0)
        goto out;
    r = sd_bus_message_append(msg, "s", "le");
    if (r < 0)
        goto out;
    r = sd_bus_message_close_container(msg);  // variant
    if (r < 0)
        goto out;
    r = sd_bus_message_close_container(msg);  // dict
    if (r < 0)
        goto out;
    // DuplicateData=true
    r = sd_bus_message_open_container(msg, SD_BUS_TYPE_DICT_ENTRY, "sv");
    if (r < 0)
        goto out;
    r = sd_bus_message_append(msg, "s", "DuplicateData");
    if (r < 0)
        goto out;
    r = sd_bus_message_open_container(msg, SD_BUS_TYPE_VARIANT, "b");
    if (r < 0)
        goto out;
    r = sd_bus_message_append(msg, "b", 1);
    if (r < 0)
        goto out;
    r = sd_bus_message_close_container(msg);  // variant
    if (r < 0)
        goto out;
    r = sd_bus_message_close_container(msg);  // dict
    if (r < 0)
        goto out;
    r = sd_bus_message_close_container(msg);  // a{sv}
    if (r < 0)
        goto out;

    r = sd_bus_call(bus, msg, 0, &err, &rep);
out:
    if (msg)
        sd_bus_message_unref(msg);
    if (rep)
        sd_bus_message_unref(rep);

    if (r < 0)
    {
        LOG_WARN("[BLUEZ][central] SetDiscoveryFilter failed: %s",
                 err.message ? err.message : std::strerror(-r));
        sd_bus_error_free(&err);
        return false;
    }
    sd_bus_error_free(&err);
    LOG_DEBUG("[BLUEZ][central] SetDiscoveryFilter OK (Transport=le, DuplicateData=true)");
    return true;
}

// best-effort Device1.Disconnect, bus_mu locked
static void device_disconnect_locked(sd_bus *bus, const std::string &dev_path)
{
    if (!bus)
        return;
    sd_bus_error    derr{};
    sd_bus_message *drep = nullptr;
    int r = sd_bus_call_method(bus, "org.bluez", dev_path.c_str(), "org.bluez.Device1", "Disconnect",
                               &derr, &drep, "");
    if (r < 0)
        LOG_DEBUG("[BLUEZ][central] Disconnect %s: %s", dev_path.c_str(),
                  derr.message ? derr.message : std::strerror(-r));
    if (drep)
        sd_bus_message_unref(drep);
    sd_bus_error_free(&derr);
}

// One discovery window fed by the bus thread.
class BluezScanStream final : public IScanStream
{
  public:
    BluezScanStream(BluezAdapter::Impl &impl, std::shared_ptr<ScanFeed> feed, std::chrono::milliseconds window)
        : impl_(impl), feed_(std::move(feed)), end_(Clock::now() + window)
    {
    }
    ~BluezScanStream() override { finish(); }

    bool next(gatt::Device &out, const util::CancelToken &cancel) override
    {
        while (true)
        {
            {
                std::unique_lock<std::mutex> lk(feed_->mu);
                if (!feed_->q.empty())
                {
                    out = std::move(feed_->q.front());
                    feed_->q.pop_front();
                    return true;
                }
                const auto now = Clock::now();
                if (feed_->stopped.load() || cancel.cancelled() || now >= end_)
                    break;
                const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(end_ - now);
                feed_->cv.wait_for(lk, std::min(left, util::CANCEL_POLL_SLICE));
            }
        }
        finish();
        return false;
    }

    void stop() override
    {
        feed_->stopped.store(true);
        feed_->cv.notify_all();
    }

  private:
    void finish()
    {
        if (ended_.exchange(true))
            return;
        feed_->stopped.store(true);
        impl_.end_scan(feed_);
    }

    BluezAdapter::Impl       &impl_;
    std::shared_ptr<ScanFeed> feed_;
    Clock::time_point         end_;
    std::atomic_bool          ended_{false};
};

}  // namespace

// ---------------- Impl helpers ----------------
void BluezAdapter::Impl::feed_sighting_locked(const gatt::Device &d)
{
    std::lock_guard<std::mutex> lk(st_mu);
    for (auto &feed : scans)
    {
        {
            std::lock_guard<std::mutex> fl(feed->mu);
            feed->q.push_back(d);
        }
        feed->cv.notify_one();
    }
}

void BluezAdapter::Impl::link_down_locked(const std::string &dev_path, const char *why)
{
    std::lock_guard<std::mutex> lk(st_mu);
    for (auto &kv : links)
    {
        auto &l = kv.second;
        if (l.dev_path != dev_path || l.lost)
            continue;
        l.lost = true;
        LOG_SYSTEM("[BLUEZ][central] link to %s lost (%s)", l.address.c_str(), why);
        if (l.on_link_lost)
            post(l.on_link_lost);
    }
}

void BluezAdapter::Impl::value_changed_locked(const std::string &char_path, const gatt::Bytes &v)
{
    std::lock_guard<std::mutex> lk(st_mu);
    for (auto &kv : subs)
    {
        if (kv.second.char_path != char_path || !kv.second.on_notify)
            continue;
        OnNotify cb = kv.second.on_notify;
        post([cb, v] { cb(v); });
    }
}

bool BluezAdapter::Impl::link_for(ConnectionHandle h, Link &out)
{
    std::lock_guard<std::mutex> lk(st_mu);
    auto it = links.find(h);
    if (it == links.end())
        return false;
    out = it->second;
    return true;
}

void BluezAdapter::Impl::end_scan(const std::shared_ptr<ScanFeed> &feed)
{
    bool last = false;
    {
        std::lock_guard<std::mutex> lk(st_mu);
        scans.erase(std::remove(scans.begin(), scans.end(), feed), scans.end());
        last = scans.empty();
    }
    if (!last)
        return;
    std::lock_guard<std::mutex> lk(bus_mu);
    adapter_stop_discovery_locked(bus, adapter_path, discovery_on);
}

// ======================================================================
// Function: BluezAdapter::Impl::call_and_wait
// - In: msg (ownership taken), pending call record, local deadline, cancel token
// - Out: Ok once a reply (success or D-Bus error) arrived, else Timeout / Cancelled
// - Note: the reply slot is always released under bus_mu before returning,
//         so the handler never touches `pc` afterwards
// ======================================================================
gatt::Status BluezAdapter::Impl::call_and_wait(sd_bus_message           *msg,
                                               PendingCall              &pc,
                                               std::chrono::milliseconds timeout,
                                               const util::CancelToken  &cancel)
{
    {
        std::lock_guard<std::mutex> lk(bus_mu);
        int r = bus ? sd_bus_call_async(bus, &pc.slot, msg, bluez_on_method_reply, &pc, 0) : -ENOTCONN;
        sd_bus_message_unref(msg);
        if (r < 0)
            return {gatt::Errc::AdapterError, std::string("submit failed: ") + std::strerror(-r)};
    }

    const auto   deadline = Clock::now() + timeout;
    gatt::Status st;
    bool         done = false;
    {
        std::unique_lock<std::mutex> lk(pc.mu);
        while (!pc.done)
        {
            if (cancel.cancelled())
            {
                st = {gatt::Errc::Cancelled, "cancelled while waiting for BlueZ"};
                break;
            }
            const auto now = Clock::now();
            if (now >= deadline)
            {
                st = {gatt::Errc::Timeout,
                      "no reply within " + std::to_string(timeout.count()) + " ms"};
                break;
            }
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            pc.cv.wait_for(lk, std::min(left, util::CANCEL_POLL_SLICE));
        }
        done = pc.done;
    }
    {
        std::lock_guard<std::mutex> lk(bus_mu);
        unref_slot(pc.slot);
    }
    return done ? gatt::Status::Ok() : st;
}

// ======================================================================
// Function: BluezAdapter::Impl::cold_scan
// - In: calls GetManagedObjects
// - Out: dev_cache filled with every Device1 below our adapter
// - Note: nothing is yielded; sightings come from the signals
// ======================================================================
bool BluezAdapter::Impl::cold_scan()
{
    std::lock_guard<std::mutex> lk(bus_mu);
    if (!bus)
        return false;

    sd_bus_message *reply = nullptr;
    sd_bus_error    err{};
    int r = sd_bus_call_method(bus, "org.bluez", "/", "org.freedesktop.DBus.ObjectManager",
                               "GetManagedObjects", &err, &reply, "");
    if (r < 0)
    {
        LOG_WARN("[BLUEZ][central] GetManagedObjects failed: %s",
                 err.message ? err.message : std::strerror(-r));
        sd_bus_error_free(&err);
        if (reply)
            sd_bus_message_unref(reply);
        return false;
    }

    // Walk a{oa{sa{sv}}}
    r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{oa{sa{sv}}}");
    if (r < 0)
        goto out;
    while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "oa{sa{sv}}")) > 0)
    {
        const char *obj = nullptr;
        if ((r = sd_bus_message_read(reply, "o", &obj)) < 0)
            goto out;
        const std::string path(obj ? obj : "");
        const bool is_dev = path.rfind(dev_prefix, 0) == 0 &&
                            path.find('/', dev_prefix.size()) == std::string::npos;
        if (!is_dev)
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
            if (iface && std::strcmp(iface, "org.bluez.Device1") == 0)
            {
                gatt::Device d;
                DeviceFields seen;
                if ((r = read_device_props(reply, d, seen)) < 0)
                    goto out;
                if (d.address.empty())
                    d.address = mac_from_path(path);
                dev_cache[path] = d;
            }
            else
            {
                if ((r = sd_bus_message_skip(reply, "a{sv}")) < 0)
                    goto out;
            }
            if ((r = sd_bus_message_exit_container(reply)) < 0)
                goto out;  // {sa{sv}} dict-entry
        }
        if (r < 0)
            goto out;
        if ((r = sd_bus_message_exit_container(reply)) < 0)
            goto out;  // a{sa{sv}}
        if ((r = sd_bus_message_exit_container(reply)) < 0)
            goto out;  // {oa{sa{sv}}}
    }

out:
    if (reply)
        sd_bus_message_unref(reply);
    sd_bus_error_free(&err);
    if (r < 0)
        LOG_WARN("[BLUEZ][central] GetManagedObjects walk failed: %s", std::strerror(-r));
    return r >= 0;
}

// ---------------- lifecycle ----------------
BluezAdapter::BluezAdapter(BluezConfig cfg) : cfg_(std::move(cfg)), impl_(std::make_unique<Impl>())
{
    if (cfg_.max_connections == 0)
        cfg_.max_connections = 1;
    impl_->cfg          = cfg_;
    impl_->adapter_path = "/org/bluez/" + cfg_.adapter;
    impl_->dev_prefix   = impl_->adapter_path + "/dev_";
}

BluezAdapter::~BluezAdapter()
{
    stop();
}

bool BluezAdapter::is_running() const noexcept
{
    return impl_->running.load(std::memory_order_relaxed);
}

std::size_t BluezAdapter::max_connections() const
{
    return cfg_.max_connections;
}

// ======================================================================
// Function: BluezAdapter::start
// - In: adapter name from config
// - Out: system bus connected, signal matches installed, bus thread running
// ======================================================================
bool BluezAdapter::start()
{
    if (is_running())
        return true;

    int r = sd_bus_open_system(&impl_->bus);
    if (r < 0 || !impl_->bus)
    {
        LOG_ERROR("[BLUEZ][central] failed to connect system bus: %s", std::strerror(-r));
        impl_->bus = nullptr;
        return false;
    }

    r = sd_bus_match_signal(impl_->bus, &impl_->added_slot, "org.bluez", "/",
                            "org.freedesktop.DBus.ObjectManager", "InterfacesAdded",
                            bluez_on_iface_added, impl_.get());
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ][central] subscribe to InterfacesAdded failed: %d", r);
        stop();
        return false;
    }
    r = sd_bus_match_signal(impl_->bus, &impl_->removed_slot, "org.bluez", "/",
                            "org.freedesktop.DBus.ObjectManager", "InterfacesRemoved",
                            bluez_on_iface_removed, impl_.get());
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ][central] subscribe to InterfacesRemoved failed: %d", r);
        stop();
        return false;
    }
    // PropertiesChanged (Device1 RSSI / Connected, GattCharacteristic1.Value)
    r = sd_bus_match_signal(impl_->bus, &impl_->props_slot, "org.bluez", nullptr,
                            "org.freedesktop.DBus.Properties", "PropertiesChanged",
                            bluez_on_props_changed, impl_.get());
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ][central] subscribe to PropertiesChanged failed: %d", r);
        stop();
        return false;
    }
    LOG_INFO("[BLUEZ][central] subscribed to InterfacesAdded/Removed/PropertiesChanged on %s",
             impl_->adapter_path.c_str());

    impl_->running.store(true, std::memory_order_relaxed);
    Impl *impl  = impl_.get();
    impl_->loop = std::thread([impl] {
        while (impl->running.load(std::memory_order_relaxed))
        {
            {
                std::lock_guard<std::mutex> lk(impl->bus_mu);
                while (1)
                {
                    int pr = sd_bus_process(impl->bus, nullptr);
                    if (pr <= 0)
                        break;
                }
            }
            // user callbacks run here, with no adapter lock held
            impl->dispatch();
            // do not hold the lock while waiting, callers would stall behind us
            {
                const uint64_t WAIT_USEC = 100000;  // 100ms
                sd_bus_wait(impl->bus, WAIT_USEC);
            }
        }
    });
    return true;
}

// ======================================================================
// Function: BluezAdapter::stop
// - In: may be called anytime
// - Out: discovery off, held links disconnected, bus thread joined, bus released
// - Note: joins the bus loop thread outside of locks
// ======================================================================
void BluezAdapter::stop()
{
    const bool was_running = impl_->running.exchange(false);

    std::vector<std::string>               dev_paths;
    std::vector<std::shared_ptr<ScanFeed>> feeds;
    {
        std::lock_guard<std::mutex> lk(impl_->st_mu);
        for (const auto &kv : impl_->links)
        {
            if (!kv.second.lost)
                dev_paths.push_back(kv.second.dev_path);
        }
        impl_->links.clear();
        impl_->subs.clear();
        feeds = impl_->scans;
    }
    for (auto &f : feeds)
    {
        f->stopped.store(true);
        f->cv.notify_all();
    }

    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        for (const auto &p : dev_paths)
            device_disconnect_locked(impl_->bus, p);
        adapter_stop_discovery_locked(impl_->bus, impl_->adapter_path, impl_->discovery_on);
        // Wake the event loop thread if it's in sd_bus_wait()
        if (impl_->bus)
            sd_bus_close(impl_->bus);
    }

    // Join OUTSIDE of the mutex to avoid deadlocks with the loop thread.
    if (impl_->loop.joinable())
        impl_->loop.join();

    unref_slot(impl_->added_slot);
    unref_slot(impl_->removed_slot);
    unref_slot(impl_->props_slot);
    if (impl_->bus)
    {
        sd_bus_flush_close_unref(impl_->bus);
        impl_->bus = nullptr;
    }
    if (was_running)
        LOG_INFO("[BLUEZ][central] stopped");
}

// ---------------- discovery ----------------
gatt::Status BluezAdapter::scan(std::chrono::milliseconds window, std::unique_ptr<IScanStream> &out)
{
    if (!is_running())
        return {gatt::Errc::DiscoveryUnavailable, "BlueZ adapter not started"};

    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        sd_bus_error err{};
        int          powered = 0;
        int r = sd_bus_get_property_trivial(impl_->bus, "org.bluez", impl_->adapter_path.c_str(),
                                            "org.bluez.Adapter1", "Powered", &err, 'b', &powered);
        if (r < 0)
        {
            std::string why = err.message ? err.message : std::strerror(-r);
            sd_bus_error_free(&err);
            return {gatt::Errc::DiscoveryUnavailable,
                    "adapter " + cfg_.adapter + " unavailable: " + why};
        }
        sd_bus_error_free(&err);
        if (!powered)
            return {gatt::Errc::DiscoveryUnavailable, "adapter " + cfg_.adapter + " is powered off"};
    }

    auto feed = std::make_shared<ScanFeed>();
    {
        std::lock_guard<std::mutex> lk(impl_->st_mu);
        impl_->scans.push_back(feed);
    }
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        (void)adapter_set_discovery_filter_locked(impl_->bus, impl_->adapter_path);
        std::string why;
        if (!adapter_start_discovery_locked(impl_->bus, impl_->adapter_path, impl_->discovery_on,
                                            why))
        {
            std::lock_guard<std::mutex> sl(impl_->st_mu);
            impl_->scans.erase(std::remove(impl_->scans.begin(), impl_->scans.end(), feed),
                               impl_->scans.end());
            return {gatt::Errc::DiscoveryUnavailable, "StartDiscovery failed: " + why};
        }
    }
    (void)impl_->cold_scan();

    LOG_DEBUG("[BLUEZ][central] scanning for %lld ms", (long long)window.count());
    out = std::make_unique<BluezScanStream>(*impl_, std::move(feed), window);
    return gatt::Status::Ok();
}

// ---------------- connections ----------------

// ======================================================================
// Function: BluezAdapter::connect
// - In: address AA:BB:CC:DD:EE:FF, timeout, cancel, link-loss callback
// - Out: a connection handle once Device1.Connect replied successfully
// - Note: a slot is reserved up front, so the capacity check is exact under concurrency.
//         On local timeout / cancel the reply is abandoned and Disconnect issued.
// ======================================================================
gatt::Status BluezAdapter::connect(const std::string        &address,
                                   std::chrono::milliseconds timeout,
                                   const util::CancelToken  &cancel,
                                   OnLinkLost                on_link_lost,
                                   ConnectionHandle         &out)
{
    if (!is_running())
        return {gatt::Errc::AdapterError, "BlueZ adapter not started"};
    {
        std::lock_guard<std::mutex> lk(impl_->st_mu);
        if (impl_->links.size() + impl_->connecting >= cfg_.max_connections)
            return {gatt::Errc::AdapterCapacityExceeded,
                    "adapter " + cfg_.adapter + " supports " + std::to_string(cfg_.max_connections) +
                        " simultaneous connection(s)"};
        ++impl_->connecting;
    }
    auto release_slot = [this] {
        std::lock_guard<std::mutex> lk(impl_->st_mu);
        --impl_->connecting;
    };

    if (cancel.cancelled())
    {
        release_slot();
        return {gatt::Errc::Cancelled, "connect cancelled"};
    }

    const std::string dev_path = dev_path_for(impl_->dev_prefix, address);
    sd_bus_message   *msg      = nullptr;
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        // some controllers abort a connection attempt while scanning
        bool scanning = false;
        {
            std::lock_guard<std::mutex> sl(impl_->st_mu);
            scanning = !impl_->scans.empty();
        }
        if (!scanning)
            adapter_stop_discovery_locked(impl_->bus, impl_->adapter_path, impl_->discovery_on);

        int r = sd_bus_message_new_method_call(impl_->bus, &msg, "org.bluez", dev_path.c_str(),
                                               "org.bluez.Device1", "Connect");
        if (r < 0)
        {
            release_slot();
            return {gatt::Errc::AdapterError,
                    std::string("Connect new_method_call failed: ") + std::strerror(-r)};
        }
    }

    LOG_DEBUG("[BLUEZ][central] Connect(%s) submitted", dev_path.c_str());
    PendingCall pc;
    auto        st = impl_->call_and_wait(msg, pc, timeout, cancel);
    if (!st)
    {
        {
            std::lock_guard<std::mutex> lk(impl_->bus_mu);
            device_disconnect_locked(impl_->bus, dev_path);
        }
        release_slot();
        if (st.code == gatt::Errc::Timeout)
            st.code = gatt::Errc::ConnectTimeout;
        return st;
    }
    if (!pc.err_name.empty() && pc.err_name != "org.bluez.Error.AlreadyConnected")
    {
        release_slot();
        const auto code = classify_connect_error(pc.err_name, pc.err_msg);
        LOG_WARN("[BLUEZ][central] Device1.Connect %s failed: %s: %s", address.c_str(),
                 pc.err_name.c_str(), pc.err_msg.c_str());
        return {code, pc.err_name + ": " + pc.err_msg};
    }

    std::lock_guard<std::mutex> lk(impl_->st_mu);
    --impl_->connecting;
    out = impl_->next_link++;
    impl_->links[out] = Impl::Link{address, dev_path, std::move(on_link_lost), false};
    LOG_SYSTEM("[BLUEZ][central] connected %s (handle=%llu)", address.c_str(), (unsigned long long)out);
    return gatt::Status::Ok();
}

void BluezAdapter::disconnect(ConnectionHandle h)
{
    Impl::Link               link;
    std::vector<std::string> notifying;
    {
        std::lock_guard<std::mutex> lk(impl_->st_mu);
        auto it = impl_->links.find(h);
        if (it == impl_->links.end())
            return;
        link = std::move(it->second);
        impl_->links.erase(it);
        for (auto s = impl_->subs.begin(); s != impl_->subs.end();)
        {
            if (s->second.link == h)
            {
                notifying.push_back(s->second.char_path);
                s = impl_->subs.erase(s);
            }
            else
            {
                ++s;
            }
        }
    }
    if (link.lost)
        return;  // nothing left to tear down on the peer

    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    for (const auto &p : notifying)
    {
        sd_bus_error    err{};
        sd_bus_message *rep = nullptr;
        (void)sd_bus_call_method(impl_->bus, "org.bluez", p.c_str(), "org.bluez.GattCharacteristic1",
                                 "StopNotify", &err, &rep, "");
        if (rep)
            sd_bus_message_unref(rep);
        sd_bus_error_free(&err);
    }
    device_disconnect_locked(impl_->bus, link.dev_path);
    LOG_SYSTEM("[BLUEZ][central] disconnected %s", link.address.c_str());
}

}  // namespace transport
