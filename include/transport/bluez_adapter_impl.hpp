// include/transport/bluez_adapter_impl.hpp
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <systemd/sd-bus.h>

#include "transport/bluez_adapter.hpp"

namespace transport
{

// Sightings fed by the bus thread into one open scan.
struct ScanFeed
{
    std::mutex               mu;
    std::condition_variable  cv;
    std::deque<gatt::Device> q;
    std::atomic_bool         stopped{false};
};

// One in-flight async method call. The reply handler fills it under bus_mu.
struct PendingCall
{
    std::mutex              mu;
    std::condition_variable cv;
    bool                    done{false};
    std::string             err_name;  // empty on success
    std::string             err_msg;
    bool                    want_bytes{false};  // reply body is "ay"
    gatt::Bytes             value;
    sd_bus_slot            *slot{nullptr};  // guarded by bus_mu
};

struct BluezAdapter::Impl
{
    BluezConfig cfg;

    sd_bus     *bus = nullptr;
    // serialize all sd-bus access
    std::mutex  bus_mu;
    std::thread loop;
    std::atomic_bool running{false};

    std::string adapter_path;  // "/org/bluez/hci0"
    std::string dev_prefix;    // "/org/bluez/hci0/dev_"

    sd_bus_slot     *added_slot   = nullptr;
    sd_bus_slot     *removed_slot = nullptr;
    sd_bus_slot     *props_slot   = nullptr;
    std::atomic_bool discovery_on{false};

    // Device1 properties seen so far, by object path. Guarded by bus_mu.
    std::map<std::string, gatt::Device> dev_cache;

    // ---- connection state, guarded by st_mu (taken after bus_mu, never before) ----
    struct Link
    {
        std::string address;
        std::string dev_path;
        OnLinkLost  on_link_lost;
        bool        lost{false};
    };
    struct Notify
    {
        ConnectionHandle link;
        std::string      char_path;
        OnNotify         on_notify;
    };
    std::mutex                               st_mu;
    std::vector<std::shared_ptr<ScanFeed>>   scans;
    std::map<ConnectionHandle, Link>         links;
    std::map<SubscriptionHandle, Notify>     subs;
    std::size_t                              connecting{0};  // reserved slots
    ConnectionHandle                         next_link{1};
    SubscriptionHandle                       next_sub{1};

    // ---- user callbacks posted by signal handlers, run on the bus thread without locks ----
    std::mutex                         cb_mu;
    std::vector<std::function<void()>> deferred;

    void post(std::function<void()> fn)
    {
        std::lock_guard<std::mutex> lk(cb_mu);
        deferred.push_back(std::move(fn));
    }

    void dispatch()
    {
        std::vector<std::function<void()>> run;
        {
            std::lock_guard<std::mutex> lk(cb_mu);
            run.swap(deferred);
        }
        for (auto &fn : run)
            fn();
    }

    // requires bus_mu
    void feed_sighting_locked(const gatt::Device &d);
    // requires bus_mu. Marks every link on dev_path lost and posts its callback.
    void link_down_locked(const std::string &dev_path, const char *why);
    // requires bus_mu. Posts a notification to every subscriber of char_path.
    void value_changed_locked(const std::string &char_path, const gatt::Bytes &v);

    // Submit msg asynchronously and wait for the reply, the deadline or the token.
    // Timeout / Cancelled on the local side, otherwise err_name carries the D-Bus error.
    gatt::Status call_and_wait(sd_bus_message           *msg,
                               PendingCall              &pc,
                               std::chrono::milliseconds timeout,
                               const util::CancelToken  &cancel);

    bool link_for(ConnectionHandle h, Link &out);
    void end_scan(const std::shared_ptr<ScanFeed> &feed);
    bool cold_scan();
};

}  // namespace transport
