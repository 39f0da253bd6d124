#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "central/notify_queue.hpp"
#include "gatt/status.hpp"
#include "gatt/types.hpp"
#include "transport/radio_adapter.hpp"
#include "util/cancel.hpp"

/*
Idle ──open──> Connecting ──ok──> Connected ──resolve_services──> ServicesResolved <──> Busy
                    │                                                   │
                    └──error──> Failed            close / link loss ────┴──> Disconnected

close() from any state, Idle included, ends in Disconnected.
Failed and Disconnected accept a fresh open(). Every successful open is paired with
exactly one adapter disconnect, made by close(), by the destructor, or when a link
loss is observed.
*/

namespace central
{

enum class SessionState
{
    Idle,
    Connecting,
    Connected,
    ServicesResolved,
    Busy,
    Disconnected,
    Failed
};

const char *state_name(SessionState s);

inline constexpr std::chrono::milliseconds DEFAULT_RESOLVE_TIMEOUT{10000};

class Session
{
  public:
    explicit Session(transport::IRadioAdapter &adapter) : adapter_(adapter) {}
    ~Session();
    Session(const Session &)            = delete;
    Session &operator=(const Session &) = delete;

    // InvalidState while a connection is held or being made. Never retries.
    gatt::Status open(const std::string        &address,
                      std::chrono::milliseconds timeout,
                      const util::CancelToken  &cancel = {});

    // Queries the adapter once per connection, later calls return the cached result.
    gatt::Status resolve_services(std::vector<gatt::Service> &out,
                                  std::chrono::milliseconds   timeout = DEFAULT_RESOLVE_TIMEOUT);

    // Idempotent; always releases the connection handle.
    void close();

    SessionState               state();
    std::string                address() const;
    // Empty unless ServicesResolved or Busy.
    std::vector<gatt::Service> services();
    transport::IRadioAdapter  &adapter() { return adapter_; }

  private:
    friend class ExchangeEngine;

    struct Lease
    {
        transport::ConnectionHandle conn{0};
        std::uint64_t               epoch{0};
        gatt::Characteristic        target;  // resolved copy of the requested characteristic
        std::shared_ptr<LinkFlag>   link;
    };

    // ServicesResolved -> Busy for one exchange.
    gatt::Status begin_exchange(const gatt::Characteristic &requested, Lease &out);
    // Busy -> ServicesResolved, or Disconnected on LinkLost / Cancelled.
    void         end_exchange(const Lease &lease, const gatt::Status &result);
    // Ends the queue together with this connection.
    void         track(const std::shared_ptr<NotifyQueue> &q);

    // requires mu_. Returns the handle the caller must disconnect after unlocking (0 if none).
    transport::ConnectionHandle release_locked(SessionState next,
                                               gatt::Errc   reason,
                                               std::vector<std::shared_ptr<NotifyQueue>> &to_close);
    // requires mu_. Observes an adapter-reported link loss.
    transport::ConnectionHandle sync_link_locked(std::vector<std::shared_ptr<NotifyQueue>> &to_close);
    void                        finish_release(transport::ConnectionHandle h,
                                               std::vector<std::shared_ptr<NotifyQueue>> &to_close,
                                               gatt::Errc reason);
    void                        set_state_locked(SessionState s);

    transport::IRadioAdapter &adapter_;

    mutable std::mutex                       mu_;
    std::mutex                               resolve_mu_;  // serialises adapter resolve calls
    SessionState                             state_{SessionState::Idle};
    std::string                              address_;
    bool                                     has_conn_{false};
    transport::ConnectionHandle              conn_{0};
    std::uint64_t                            epoch_{0};
    std::shared_ptr<LinkFlag>                link_;
    std::vector<gatt::Service>               services_;
    std::vector<std::weak_ptr<NotifyQueue>>  queues_;
};

}  // namespace central
