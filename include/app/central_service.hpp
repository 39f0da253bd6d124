#pragma once
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "central/device_registry.hpp"
#include "central/exchange.hpp"
#include "central/prober.hpp"
#include "central/selector.hpp"
#include "central/session.hpp"
#include "gatt/status.hpp"
#include "gatt/types.hpp"
#include "proto/payload.hpp"
#include "transport/radio_adapter.hpp"
#include "util/cancel.hpp"

namespace app
{

struct ServiceOptions
{
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds probe_timeout{5000};
    std::chrono::milliseconds op_timeout{10000};
    bool                      parallel_probe{false};
};

struct SendReadResult
{
    gatt::Characteristic written;
    bool                 read_back{false};  // the written characteristic was readable
    gatt::Bytes          response;
};

struct BroadcastResult
{
    gatt::Device         device;
    gatt::Status         status;
    gatt::Characteristic written;  // valid when status is Ok
};

struct BroadcastReport
{
    gatt::Status                 status;   // discovery outcome; not Ok means nothing was attempted
    std::vector<BroadcastResult> results;  // discovery snapshot order
    std::size_t                  succeeded{0};
};

// Characteristic target for write/read/subscribe: a UUID, or "auto" (also empty) for the
// selector's first-candidate policy.
inline bool is_auto_target(const std::string &t)
{
    return t.empty() || t == "auto" || t == "AUTO";
}

// CentralService: one adapter, one registry, one interactive session.
class CentralService
{
  public:
    explicit CentralService(transport::IRadioAdapter &adapter, ServiceOptions opts = {});
    ~CentralService();

    gatt::Status         discover(std::chrono::milliseconds  window,
                                  const util::CancelToken   &cancel,
                                  std::vector<gatt::Device> &out);
    central::ProbeReport probe_connectable(const std::vector<gatt::Device> &devices,
                                           const util::CancelToken         &cancel = {});

    gatt::Status open_session(const std::string &address, const util::CancelToken &cancel = {});
    gatt::Status resolve(std::vector<gatt::Service> &out);
    // Write fallback: Write then WriteNoResponse. Read: Read. Subscribe: Notify then Indicate.
    gatt::Status select_characteristic(const std::string                   &target,
                                       const std::vector<gatt::Capability> &fallback,
                                       gatt::Characteristic                &out);

    gatt::Status write(const std::string       &target,
                       const payload::Payload  &p,
                       bool                     with_response,
                       gatt::Characteristic    &used,
                       const util::CancelToken &cancel = {});
    gatt::Status read(const std::string       &target,
                      gatt::Bytes             &out,
                      gatt::Characteristic    &used,
                      const util::CancelToken &cancel = {});
    // Replaces (and ends) any previous subscription of this service.
    gatt::Status subscribe(const std::string                      &target,
                           std::shared_ptr<central::Subscription> &out);
    void         unsubscribe();
    void         close_session();

    // open -> resolve -> auto-select writable -> write -> read back if readable -> close
    gatt::Status send_and_read_back(const std::string       &address,
                                    const payload::Payload  &p,
                                    SendReadResult          &out,
                                    const util::CancelToken &cancel = {});
    // discover, then one short session per device; failures stay per device
    BroadcastReport broadcast(const payload::Payload  &p,
                              std::chrono::milliseconds window,
                              const util::CancelToken  &cancel = {});

    static std::string describe(const std::vector<gatt::Service> &services);
    // Address, name and every advertisement field: RSSI, TX power, manufacturer data per
    // company id, service UUIDs, service data.
    static std::string describe_device(const gatt::Device &d);

    central::DeviceRegistry &registry() { return registry_; }
    central::Session        &session() { return session_; }
    const ServiceOptions    &options() const { return opts_; }

  private:
    gatt::Status resolve_target(const std::string                   &target,
                                const std::vector<gatt::Capability> &fallback,
                                gatt::Characteristic                &out);
    // Single write on an already resolved session.
    gatt::Status write_on(central::Session        &s,
                          const std::string       &target,
                          const payload::Payload  &p,
                          bool                     with_response,
                          gatt::Characteristic    &used,
                          const util::CancelToken &cancel);

    transport::IRadioAdapter      &adapter_;
    ServiceOptions                 opts_;
    central::DeviceRegistry        registry_;
    central::ConnectabilityProber  prober_;
    central::Session               session_;
    central::ExchangeEngine        engine_;

    std::mutex                             sub_mu_;
    std::shared_ptr<central::Subscription> sub_;
};

}  // namespace app
