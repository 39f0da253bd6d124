#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <utility>
#include <variant>

#include "central/notify_queue.hpp"
#include "central/session.hpp"
#include "gatt/status.hpp"
#include "gatt/types.hpp"
#include "proto/payload.hpp"
#include "transport/radio_adapter.hpp"
#include "util/cancel.hpp"

namespace central
{

// ---- operation kinds ----
struct WriteOp
{
    payload::Payload payload;
    bool             with_response{true};  // false: WriteNoResponse
};
struct ReadOp
{
};
struct SubscribeOp
{
};

using Operation = std::variant<ReadOp, WriteOp, SubscribeOp>;

const char *operation_name(const Operation &op);

struct ExchangeRequest
{
    gatt::Characteristic characteristic;
    Operation            op;

    static ExchangeRequest write(const gatt::Characteristic &c, payload::Payload p)
    {
        return {c, WriteOp{std::move(p), true}};
    }
    static ExchangeRequest write_no_response(const gatt::Characteristic &c, payload::Payload p)
    {
        return {c, WriteOp{std::move(p), false}};
    }
    static ExchangeRequest read(const gatt::Characteristic &c) { return {c, ReadOp{}}; }
    static ExchangeRequest subscribe(const gatt::Characteristic &c) { return {c, SubscribeOp{}}; }
};

struct Notification
{
    gatt::Characteristic source;
    gatt::Bytes          value;
};

// Live notification sequence. Values arrive in adapter order, nothing is coalesced.
class Subscription
{
  public:
    Subscription(transport::IRadioAdapter     &adapter,
                 gatt::Characteristic          source,
                 std::shared_ptr<NotifyQueue>  queue,
                 std::shared_ptr<LinkFlag>     link);
    ~Subscription();
    Subscription(const Subscription &)            = delete;
    Subscription &operator=(const Subscription &) = delete;

    // Blocks for the next notification. false once the sequence has ended: unsubscribed,
    // link lost, session closed, or the token was raised (which also unsubscribes).
    bool next(Notification &out, const util::CancelToken &cancel = {});
    // Like next() but gives up after `wait`; false with active() still true on a plain timeout.
    bool next_for(Notification &out, std::chrono::milliseconds wait, const util::CancelToken &cancel = {});

    // Idempotent.
    void unsubscribe();
    bool active() const;
    // Ok while active, otherwise why the sequence ended.
    gatt::Errc                  end_reason() const;
    const gatt::Characteristic &source() const { return source_; }

  private:
    friend class ExchangeEngine;
    void bind(transport::SubscriptionHandle h);
    bool next_until(Notification                         &out,
                    std::chrono::steady_clock::time_point deadline,
                    const util::CancelToken              &cancel);

    transport::IRadioAdapter    &adapter_;
    gatt::Characteristic         source_;
    std::shared_ptr<NotifyQueue> queue_;
    std::shared_ptr<LinkFlag>    link_;

    mutable std::mutex           mu_;
    bool                         bound_{false};
    transport::SubscriptionHandle handle_{0};
};

struct ExchangeResult
{
    gatt::Bytes                   data;          // Read
    std::shared_ptr<Subscription> subscription;  // SubscribeNotify
};

// Runs one operation on a ServicesResolved session, holding it Busy for the duration.
class ExchangeEngine
{
  public:
    explicit ExchangeEngine(std::chrono::milliseconds op_timeout = std::chrono::milliseconds(10000))
        : op_timeout_(op_timeout)
    {
    }

    gatt::Status execute(Session                 &session,
                         const ExchangeRequest   &req,
                         ExchangeResult          &out,
                         const util::CancelToken &cancel = {});

    std::chrono::milliseconds op_timeout() const { return op_timeout_; }

  private:
    gatt::Status run(Session                 &session,
                     const Session::Lease    &lease,
                     const ExchangeRequest   &req,
                     ExchangeResult          &out,
                     const util::CancelToken &cancel);

    std::chrono::milliseconds op_timeout_;
};

}  // namespace central
