#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "transport/radio_adapter.hpp"

namespace transport
{

enum class ConnectBehavior
{
    Accept,
    Refuse,       // ConnectRefused
    NoAnswer,     // waits the whole timeout, ConnectTimeout
    Unavailable   // AdapterError
};

struct SimPeripheral
{
    gatt::Device               device;
    std::vector<gatt::Service> services;
    ConnectBehavior            connect = ConnectBehavior::Accept;
};

// Scripted advertisement: delivered `at` after the scan started.
struct ScanEvent
{
    gatt::Device              device;
    std::chrono::milliseconds at{0};
};

// LoopbackAdapter: a simulated radio hosting echo peripherals, used by the tests and as the
// daemon's default transport. A write stores the value (returned by later reads) and is echoed
// to every active subscription on the same peripheral.
class LoopbackAdapter final : public IRadioAdapter
{
  public:
    explicit LoopbackAdapter(std::size_t max_connections = 1);

    gatt::Status scan(std::chrono::milliseconds window, std::unique_ptr<IScanStream> &out) override;
    gatt::Status connect(const std::string        &address,
                         std::chrono::milliseconds timeout,
                         const util::CancelToken  &cancel,
                         OnLinkLost                on_link_lost,
                         ConnectionHandle         &out) override;
    void         disconnect(ConnectionHandle h) override;
    gatt::Status resolve_services(ConnectionHandle            h,
                                  std::chrono::milliseconds   timeout,
                                  std::vector<gatt::Service> &out) override;
    gatt::Status read_characteristic(ConnectionHandle            h,
                                     const gatt::Characteristic &c,
                                     std::chrono::milliseconds   timeout,
                                     const util::CancelToken    &cancel,
                                     gatt::Bytes                &out) override;
    gatt::Status write_characteristic(ConnectionHandle            h,
                                      const gatt::Characteristic &c,
                                      const gatt::Bytes          &data,
                                      bool                        with_response,
                                      std::chrono::milliseconds   timeout,
                                      const util::CancelToken    &cancel) override;
    gatt::Status subscribe(ConnectionHandle            h,
                           const gatt::Characteristic &c,
                           OnNotify                    on_notify,
                           SubscriptionHandle         &out) override;
    void         unsubscribe(SubscriptionHandle s) override;
    std::size_t  max_connections() const override { return max_connections_; }
    std::string  name() const override { return "loopback"; }

    // ---- simulation controls ----
    void add_peripheral(SimPeripheral p);
    void script_scan(std::vector<ScanEvent> events);  // replaces the default one-shot listing
    void set_scan_available(bool on);
    void set_connect_behavior(const std::string &address, ConnectBehavior b);
    void set_write_rejected(const std::string &address, bool on);
    void set_op_delay(std::chrono::milliseconds d);
    void set_value(const std::string &address, const std::string &char_uuid, gatt::Bytes v);
    // Peripheral-initiated link loss for every connection to `address`.
    void drop_link(const std::string &address);
    // Peripheral-initiated notification; true if at least one subscriber received it.
    bool push_notification(const std::string &address,
                           const std::string &char_uuid,
                           const gatt::Bytes &value);

    // ---- counters ----
    std::size_t              connect_calls() const;
    std::size_t              disconnect_calls() const;
    std::size_t              open_connections() const;
    std::size_t              resolve_calls() const;
    std::size_t              active_subscriptions() const;
    std::vector<gatt::Bytes> writes_to(const std::string &address) const;

    // One echo peripheral with a UART-style service plus one non-connectable beacon.
    static std::unique_ptr<LoopbackAdapter> with_demo_peripherals(std::size_t max_connections = 1);

  private:
    struct Peripheral
    {
        SimPeripheral                      sim;
        std::map<std::string, gatt::Bytes> values;  // by characteristic handle
        bool                               reject_writes{false};
        std::vector<gatt::Bytes>           writes;
    };
    struct Connection
    {
        std::string address;
        OnLinkLost  on_link_lost;
    };
    struct Subscription
    {
        ConnectionHandle conn;
        std::string      address;
        std::string      char_handle;
        OnNotify         on_notify;
    };

    // requires mu_
    Peripheral                 *find_peripheral_locked(const std::string &address);
    const gatt::Characteristic *find_char_locked(const Peripheral &p, const std::string &handle) const;
    std::vector<OnNotify>       subscribers_locked(const std::string &address,
                                                   const std::string &char_handle) const;
    // Simulated round trip: honours op_delay_, the timeout, cancellation and link loss.
    gatt::Status simulate_round_trip(ConnectionHandle          h,
                                     std::chrono::milliseconds timeout,
                                     const util::CancelToken  &cancel) const;

    const std::size_t max_connections_;

    mutable std::mutex                             mu_;
    std::vector<Peripheral>                        peripherals_;
    std::vector<ScanEvent>                         scan_script_;
    bool                                           scripted_{false};
    bool                                           scan_available_{true};
    std::chrono::milliseconds                      op_delay_{0};
    std::map<ConnectionHandle, Connection>         conns_;
    std::map<SubscriptionHandle, Subscription>     subs_;
    ConnectionHandle                               next_conn_{1};
    SubscriptionHandle                             next_sub_{1};
    std::size_t                                    connect_calls_{0};
    std::size_t                                    disconnect_calls_{0};
    std::size_t                                    resolve_calls_{0};
};

}  // namespace transport
