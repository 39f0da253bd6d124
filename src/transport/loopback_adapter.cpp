#include <algorithm>
#include <chrono>
#include <string>
#include <thread>
#include <utility>

#include "transport/loopback_adapter.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace transport
{
namespace
{
using Clock = std::chrono::steady_clock;

// Sleep until `deadline` in cancellable slices. false if cancelled or stopped first.
bool sleep_until(Clock::time_point              deadline,
                 const util::CancelToken       &cancel,
                 const std::atomic_bool        *stopped = nullptr)
{
    while (Clock::now() < deadline)
    {
        if (cancel.cancelled() || (stopped && stopped->load()))
            return false;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        std::this_thread::sleep_for(std::min(left, util::CANCEL_POLL_SLICE));
    }
    return !cancel.cancelled() && !(stopped && stopped->load());
}

class LoopbackScanStream final : public IScanStream
{
  public:
    LoopbackScanStream(std::vector<ScanEvent> events, std::chrono::milliseconds window)
        : events_(std::move(events)), start_(Clock::now()), end_(start_ + window)
    {
        std::stable_sort(events_.begin(), events_.end(),
                         [](const ScanEvent &a, const ScanEvent &b) { return a.at < b.at; });
    }

    bool next(gatt::Device &out, const util::CancelToken &cancel) override
    {
        if (stopped_.load())
            return false;
        if (idx_ >= events_.size())
        {
            // radio keeps listening until the window closes
            (void)sleep_until(end_, cancel, &stopped_);
            return false;
        }
        const auto due = start_ + events_[idx_].at;
        if (due >= end_)
        {
            (void)sleep_until(end_, cancel, &stopped_);
            return false;
        }
        if (!sleep_until(due, cancel, &stopped_))
            return false;

        out           = events_[idx_++].device;
        out.last_seen = std::chrono::system_clock::now();
        return true;
    }

    void stop() override { stopped_.store(true); }

  private:
    std::vector<ScanEvent> events_;
    std::size_t            idx_{0};
    Clock::time_point      start_;
    Clock::time_point      end_;
    std::atomic_bool       stopped_{false};
};

gatt::Characteristic make_char(std::string uuid, gatt::CapabilitySet caps)
{
    gatt::Characteristic c;
    c.uuid         = std::move(uuid);
    c.capabilities = caps;
    return c;
}
}  // namespace

LoopbackAdapter::LoopbackAdapter(std::size_t max_connections)
    : max_connections_(max_connections == 0 ? 1 : max_connections)
{
}

// ---------------- simulation controls ----------------
void LoopbackAdapter::add_peripheral(SimPeripheral p)
{
    // assign locators and parent back-references
    for (std::size_t i = 0; i < p.services.size(); ++i)
    {
        auto &svc = p.services[i];
        for (std::size_t j = 0; j < svc.characteristics.size(); ++j)
        {
            auto &c        = svc.characteristics[j];
            c.service_uuid = svc.uuid;
            c.handle       = "svc" + std::to_string(i) + "/char" + std::to_string(j);
        }
    }
    std::lock_guard<std::mutex> lk(mu_);
    auto it = std::find_if(peripherals_.begin(), peripherals_.end(), [&](const Peripheral &e) {
        return gatt::uuid_eq(e.sim.device.address, p.device.address);
    });
    if (it != peripherals_.end())
        it->sim = std::move(p);
    else
        peripherals_.push_back(Peripheral{std::move(p), {}, false, {}});
}

void LoopbackAdapter::script_scan(std::vector<ScanEvent> events)
{
    std::lock_guard<std::mutex> lk(mu_);
    scan_script_ = std::move(events);
    scripted_    = true;
}

void LoopbackAdapter::set_scan_available(bool on)
{
    std::lock_guard<std::mutex> lk(mu_);
    scan_available_ = on;
}

void LoopbackAdapter::set_connect_behavior(const std::string &address, ConnectBehavior b)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (auto *p = find_peripheral_locked(address))
        p->sim.connect = b;
}

void LoopbackAdapter::set_write_rejected(const std::string &address, bool on)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (auto *p = find_peripheral_locked(address))
        p->reject_writes = on;
}

void LoopbackAdapter::set_op_delay(std::chrono::milliseconds d)
{
    std::lock_guard<std::mutex> lk(mu_);
    op_delay_ = d;
}

void LoopbackAdapter::set_value(const std::string &address,
                                const std::string &char_uuid,
                                gatt::Bytes        v)
{
    std::lock_guard<std::mutex> lk(mu_);
    auto *p = find_peripheral_locked(address);
    if (!p)
        return;
    for (const auto &svc : p->sim.services)
    {
        for (const auto &c : svc.characteristics)
        {
            if (gatt::uuid_eq(c.uuid, char_uuid))
            {
                p->values[c.handle] = std::move(v);
                return;
            }
        }
    }
}

void LoopbackAdapter::drop_link(const std::string &address)
{
    std::vector<OnLinkLost> to_call;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto it = conns_.begin(); it != conns_.end();)
        {
            if (!gatt::uuid_eq(it->second.address, address))
            {
                ++it;
                continue;
            }
            const ConnectionHandle h = it->first;
            if (it->second.on_link_lost)
                to_call.push_back(it->second.on_link_lost);
            it = conns_.erase(it);
            for (auto s = subs_.begin(); s != subs_.end();)
                s = (s->second.conn == h) ? subs_.erase(s) : std::next(s);
        }
    }
    LOG_DEBUG("[LOOPBACK] link dropped for %s (%zu connection(s))", address.c_str(),
              to_call.size());
    for (auto &cb : to_call)
        cb();
}

bool LoopbackAdapter::push_notification(const std::string &address,
                                        const std::string &char_uuid,
                                        const gatt::Bytes &value)
{
    std::vector<OnNotify> targets;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto *p = find_peripheral_locked(address);
        if (!p)
            return false;
        for (const auto &svc : p->sim.services)
        {
            for (const auto &c : svc.characteristics)
            {
                if (!gatt::uuid_eq(c.uuid, char_uuid))
                    continue;
                auto subs = subscribers_locked(p->sim.device.address, c.handle);
                targets.insert(targets.end(), subs.begin(), subs.end());
            }
        }
    }
    for (auto &cb : targets)
        cb(value);
    return !targets.empty();
}

// ---------------- counters ----------------
std::size_t LoopbackAdapter::connect_calls() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return connect_calls_;
}

std::size_t LoopbackAdapter::disconnect_calls() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return disconnect_calls_;
}

std::size_t LoopbackAdapter::open_connections() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return conns_.size();
}

std::size_t LoopbackAdapter::resolve_calls() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return resolve_calls_;
}

std::size_t LoopbackAdapter::active_subscriptions() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return subs_.size();
}

std::vector<gatt::Bytes> LoopbackAdapter::writes_to(const std::string &address) const
{
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto &p : peripherals_)
    {
        if (gatt::uuid_eq(p.sim.device.address, address))
            return p.writes;
    }
    return {};
}

// ---------------- helpers ----------------
LoopbackAdapter::Peripheral *LoopbackAdapter::find_peripheral_locked(const std::string &address)
{
    for (auto &p : peripherals_)
    {
        if (gatt::uuid_eq(p.sim.device.address, address))
            return &p;
    }
    return nullptr;
}

const gatt::Characteristic *LoopbackAdapter::find_char_locked(const Peripheral  &p,
                                                              const std::string &handle) const
{
    for (const auto &svc : p.sim.services)
    {
        for (const auto &c : svc.characteristics)
        {
            if (c.handle == handle)
                return &c;
        }
    }
    return nullptr;
}

std::vector<OnNotify> LoopbackAdapter::subscribers_locked(const std::string &address,
                                                          const std::string &char_handle) const
{
    std::vector<OnNotify> out;
    for (const auto &kv : subs_)
    {
        const auto &s = kv.second;
        if (gatt::uuid_eq(s.address, address) && (char_handle.empty() || s.char_handle == char_handle))
            out.push_back(s.on_notify);
    }
    return out;
}

gatt::Status LoopbackAdapter::simulate_round_trip(ConnectionHandle          h,
                                                  std::chrono::milliseconds timeout,
                                                  const util::CancelToken  &cancel) const
{
    std::chrono::milliseconds delay;
    {
        std::lock_guard<std::mutex> lk(mu_);
        delay = op_delay_;
    }
    const bool times_out = delay > timeout;
    const auto wait      = times_out ? timeout : delay;
    const auto deadline  = Clock::now() + wait;
    while (Clock::now() < deadline)
    {
        if (cancel.cancelled())
            return {gatt::Errc::Cancelled, "operation cancelled"};
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (conns_.find(h) == conns_.end())
                return {gatt::Errc::LinkLost, "link lost during operation"};
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        std::this_thread::sleep_for(std::min(left, util::CANCEL_POLL_SLICE));
    }
    if (cancel.cancelled())
        return {gatt::Errc::Cancelled, "operation cancelled"};
    if (times_out)
        return {gatt::Errc::Timeout,
                "no response within " + std::to_string(timeout.count()) + " ms"};
    return gatt::Status::Ok();
}

// ---------------- IRadioAdapter ----------------
gatt::Status LoopbackAdapter::scan(std::chrono::milliseconds window, std::unique_ptr<IScanStream> &out)
{
    std::vector<ScanEvent> events;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!scan_available_)
            return {gatt::Errc::DiscoveryUnavailable, "loopback radio is disabled"};
        if (scripted_)
            events = scan_script_;
        else
        {
            for (const auto &p : peripherals_)
                events.push_back(ScanEvent{p.sim.device, std::chrono::milliseconds(0)});
        }
    }
    LOG_DEBUG("[LOOPBACK] scan window=%lld ms events=%zu", (long long)window.count(),
              events.size());
    out = std::make_unique<LoopbackScanStream>(std::move(events), window);
    return gatt::Status::Ok();
}

gatt::Status LoopbackAdapter::connect(const std::string        &address,
                                      std::chrono::milliseconds timeout,
                                      const util::CancelToken  &cancel,
                                      OnLinkLost                on_link_lost,
                                      ConnectionHandle         &out)
{
    ConnectBehavior behavior;
    {
        std::lock_guard<std::mutex> lk(mu_);
        ++connect_calls_;
        if (cancel.cancelled())
            return {gatt::Errc::Cancelled, "connect cancelled"};
        if (conns_.size() >= max_connections_)
            return {gatt::Errc::AdapterCapacityExceeded,
                    "adapter supports " + std::to_string(max_connections_) +
                        " simultaneous connection(s)"};
        auto *p = find_peripheral_locked(address);
        if (!p)
            return {gatt::Errc::ConnectRefused, "device " + address + " not in range"};
        behavior = p->sim.connect;
    }

    switch (behavior)
    {
        case ConnectBehavior::Refuse:
            return {gatt::Errc::ConnectRefused, "peer " + address + " refused the connection"};
        case ConnectBehavior::Unavailable:
            return {gatt::Errc::AdapterError, "loopback controller unavailable"};
        case ConnectBehavior::NoAnswer:
            if (!sleep_until(Clock::now() + timeout, cancel))
                return {gatt::Errc::Cancelled, "connect cancelled"};
            return {gatt::Errc::ConnectTimeout,
                    "no connection to " + address + " within " + std::to_string(timeout.count()) +
                        " ms"};
        case ConnectBehavior::Accept:
            break;
    }

    std::lock_guard<std::mutex> lk(mu_);
    if (conns_.size() >= max_connections_)
        return {gatt::Errc::AdapterCapacityExceeded, "adapter connection slots exhausted"};
    out         = next_conn_++;
    conns_[out] = Connection{address, std::move(on_link_lost)};
    LOG_DEBUG("[LOOPBACK] connected %s handle=%llu", address.c_str(), (unsigned long long)out);
    return gatt::Status::Ok();
}

void LoopbackAdapter::disconnect(ConnectionHandle h)
{
    std::lock_guard<std::mutex> lk(mu_);
    ++disconnect_calls_;
    auto it = conns_.find(h);
    if (it == conns_.end())
        return;
    LOG_DEBUG("[LOOPBACK] disconnect %s handle=%llu", it->second.address.c_str(),
              (unsigned long long)h);
    conns_.erase(it);
    for (auto s = subs_.begin(); s != subs_.end();)
        s = (s->second.conn == h) ? subs_.erase(s) : std::next(s);
}

gatt::Status LoopbackAdapter::resolve_services(ConnectionHandle h,
                                               std::chrono::milliseconds /*timeout*/,
                                               std::vector<gatt::Service> &out)
{
    std::lock_guard<std::mutex> lk(mu_);
    ++resolve_calls_;
    auto it = conns_.find(h);
    if (it == conns_.end())
        return {gatt::Errc::LinkLost, "connection is gone"};
    auto *p = find_peripheral_locked(it->second.address);
    if (!p)
        return {gatt::Errc::LinkLost, "peripheral vanished"};
    out = p->sim.services;
    return gatt::Status::Ok();
}

gatt::Status LoopbackAdapter::read_characteristic(ConnectionHandle            h,
                                                  const gatt::Characteristic &c,
                                                  std::chrono::milliseconds   timeout,
                                                  const util::CancelToken    &cancel,
                                                  gatt::Bytes                &out)
{
    auto st = simulate_round_trip(h, timeout, cancel);
    if (!st)
        return st;

    std::lock_guard<std::mutex> lk(mu_);
    auto it = conns_.find(h);
    if (it == conns_.end())
        return {gatt::Errc::LinkLost, "connection is gone"};
    auto *p  = find_peripheral_locked(it->second.address);
    auto *ch = p ? find_char_locked(*p, c.handle) : nullptr;
    if (!ch)
        return {gatt::Errc::ReadError, "no characteristic " + c.uuid};
    if (!ch->can(gatt::Capability::Read))
        return {gatt::Errc::ReadError, "ATT error 0x02: read not permitted on " + c.uuid};
    auto v = p->values.find(c.handle);
    out    = (v == p->values.end()) ? gatt::Bytes{} : v->second;
    return gatt::Status::Ok();
}

gatt::Status LoopbackAdapter::write_characteristic(ConnectionHandle            h,
                                                   const gatt::Characteristic &c,
                                                   const gatt::Bytes          &data,
                                                   bool                        with_response,
                                                   std::chrono::milliseconds   timeout,
                                                   const util::CancelToken    &cancel)
{
    // write-without-response returns on submission, no round trip
    if (with_response)
    {
        auto st = simulate_round_trip(h, timeout, cancel);
        if (!st)
            return st;
    }

    std::vector<OnNotify> echo_to;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = conns_.find(h);
        if (it == conns_.end())
            return {gatt::Errc::LinkLost, "connection is gone"};
        auto *p  = find_peripheral_locked(it->second.address);
        auto *ch = p ? find_char_locked(*p, c.handle) : nullptr;
        if (!ch)
            return {gatt::Errc::WriteRejected, "no characteristic " + c.uuid};
        const auto need =
            with_response ? gatt::Capability::Write : gatt::Capability::WriteNoResponse;
        if (!ch->can(need))
            return {gatt::Errc::WriteRejected,
                    "ATT error 0x03: " + std::string(gatt::capability_name(need)) +
                        " not permitted on " + c.uuid};
        if (p->reject_writes)
            return {gatt::Errc::WriteRejected, "ATT error 0x0e: peer rejected the write"};

        p->values[c.handle] = data;
        p->writes.push_back(data);
        echo_to = subscribers_locked(p->sim.device.address, std::string());
    }
    for (auto &cb : echo_to)
        cb(data);
    return gatt::Status::Ok();
}

gatt::Status LoopbackAdapter::subscribe(ConnectionHandle            h,
                                        const gatt::Characteristic &c,
                                        OnNotify                    on_notify,
                                        SubscriptionHandle         &out)
{
    std::lock_guard<std::mutex> lk(mu_);
    auto it = conns_.find(h);
    if (it == conns_.end())
        return {gatt::Errc::LinkLost, "connection is gone"};
    auto *p  = find_peripheral_locked(it->second.address);
    auto *ch = p ? find_char_locked(*p, c.handle) : nullptr;
    if (!ch)
        return {gatt::Errc::PeerRejected, "no characteristic " + c.uuid};
    if (!ch->can(gatt::Capability::Notify) && !ch->can(gatt::Capability::Indicate))
        return {gatt::Errc::PeerRejected, "characteristic " + c.uuid + " cannot notify"};
    out        = next_sub_++;
    subs_[out] = Subscription{h, it->second.address, c.handle, std::move(on_notify)};
    return gatt::Status::Ok();
}

void LoopbackAdapter::unsubscribe(SubscriptionHandle s)
{
    std::lock_guard<std::mutex> lk(mu_);
    subs_.erase(s);
}

std::unique_ptr<LoopbackAdapter> LoopbackAdapter::with_demo_peripherals(std::size_t max_connections)
{
    auto a = std::make_unique<LoopbackAdapter>(max_connections);

    SimPeripheral echo;
    echo.device.address = std::string(constants::DEMO_ECHO_ADDR);
    echo.device.name    = "gattlink-echo";
    gatt::Advertisement adv;
    adv.rssi     = -42;
    adv.tx_power = 4;
    adv.manufacturer_data[0xFFFF] = {0x67, 0x6c};
    adv.service_uuids.insert(std::string(constants::UART_SVC_UUID));
    echo.device.advertisement = adv;

    gatt::Service gap;
    gap.uuid = std::string(constants::GAP_SVC_UUID);
    gap.characteristics.push_back(
        make_char(std::string(constants::DEVICE_NAME_UUID), gatt::caps(gatt::Capability::Read)));

    gatt::Service uart;
    uart.uuid = std::string(constants::UART_SVC_UUID);
    uart.characteristics.push_back(make_char(std::string(constants::UART_RX_UUID),
                                             gatt::Capability::Write |
                                                 gatt::Capability::WriteNoResponse));
    uart.characteristics.push_back(
        make_char(std::string(constants::UART_TX_UUID), gatt::caps(gatt::Capability::Notify)));
    echo.services = {gap, uart};
    a->add_peripheral(echo);
    a->set_value(echo.device.address, std::string(constants::DEVICE_NAME_UUID),
                 gatt::Bytes{'g', 'a', 't', 't', 'l', 'i', 'n', 'k', '-', 'e', 'c', 'h', 'o'});

    SimPeripheral beacon;
    beacon.device.address = std::string(constants::DEMO_BEACON_ADDR);
    beacon.device.name    = "gattlink-beacon";
    gatt::Advertisement badv;
    badv.rssi                       = -77;
    badv.manufacturer_data[0x004C] = {0x02, 0x15};
    beacon.device.advertisement     = badv;
    beacon.connect                  = ConnectBehavior::Refuse;
    a->add_peripheral(beacon);
    return a;
}

}  // namespace transport
