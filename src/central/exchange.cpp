#include <algorithm>
#include <utility>

#include "central/exchange.hpp"
#include "util/log.hpp"

namespace central
{

const char *operation_name(const Operation &op)
{
    if (const auto *w = std::get_if<WriteOp>(&op))
        return w->with_response ? "write" : "write-without-response";
    if (std::holds_alternative<ReadOp>(op))
        return "read";
    return "subscribe";
}

// ---------------- Subscription ----------------
Subscription::Subscription(transport::IRadioAdapter    &adapter,
                           gatt::Characteristic         source,
                           std::shared_ptr<NotifyQueue> queue,
                           std::shared_ptr<LinkFlag>    link)
    : adapter_(adapter), source_(std::move(source)), queue_(std::move(queue)), link_(std::move(link))
{
}

Subscription::~Subscription()
{
    unsubscribe();
}

void Subscription::bind(transport::SubscriptionHandle h)
{
    std::lock_guard<std::mutex> lk(mu_);
    handle_ = h;
    bound_  = true;
}

bool Subscription::next(Notification &out, const util::CancelToken &cancel)
{
    return next_until(out, std::chrono::steady_clock::time_point::max(), cancel);
}

bool Subscription::next_for(Notification             &out,
                            std::chrono::milliseconds wait,
                            const util::CancelToken  &cancel)
{
    return next_until(out, std::chrono::steady_clock::now() + wait, cancel);
}

bool Subscription::next_until(Notification                         &out,
                              std::chrono::steady_clock::time_point deadline,
                              const util::CancelToken              &cancel)
{
    for (;;)
    {
        const auto now   = std::chrono::steady_clock::now();
        auto       slice = util::CANCEL_POLL_SLICE;
        if (deadline != std::chrono::steady_clock::time_point::max())
        {
            if (now >= deadline)
                slice = std::chrono::milliseconds(0);
            else
                slice = std::min(slice, std::chrono::duration_cast<std::chrono::milliseconds>(
                                            deadline - now));
        }

        gatt::Bytes v;
        if (queue_->pop_for(v, slice))
        {
            out.source = source_;
            out.value  = std::move(v);
            return true;
        }
        if (queue_->closed())
            return false;
        if (link_ && link_->lost.load())
        {
            // hand out what arrived before the drop, then end
            queue_->close(gatt::Errc::LinkLost);
            continue;
        }
        if (cancel.cancelled())
        {
            LOG_DEBUG("[NOTIFY] subscription to %s cancelled", source_.uuid.c_str());
            std::lock_guard<std::mutex> lk(mu_);
            if (bound_)
            {
                adapter_.unsubscribe(handle_);
                bound_ = false;
            }
            queue_->close(gatt::Errc::Cancelled, true);
            return false;
        }
        if (std::chrono::steady_clock::now() >= deadline)
            return false;
    }
}

void Subscription::unsubscribe()
{
    std::lock_guard<std::mutex> lk(mu_);
    if (bound_)
    {
        adapter_.unsubscribe(handle_);
        bound_ = false;
        LOG_DEBUG("[NOTIFY] unsubscribed from %s", source_.uuid.c_str());
    }
    queue_->close(gatt::Errc::Cancelled, true);
}

bool Subscription::active() const
{
    return !queue_->closed();
}

gatt::Errc Subscription::end_reason() const
{
    return queue_->closed() ? queue_->reason() : gatt::Errc::Ok;
}

// ---------------- ExchangeEngine ----------------

// ====
// Function: ExchangeEngine::execute
// - In: session in ServicesResolved, request (characteristic + operation)
// - Out: read bytes or a live subscription in `out`
// - Note: SessionBusy while another exchange holds the session; nothing is queued.
//         LinkLost and Cancelled leave the session Disconnected, every other error
//         leaves it ServicesResolved.
// ====
gatt::Status ExchangeEngine::execute(Session                 &session,
                                     const ExchangeRequest   &req,
                                     ExchangeResult          &out,
                                     const util::CancelToken &cancel)
{
    Session::Lease lease;
    auto           st = session.begin_exchange(req.characteristic, lease);
    if (!st)
    {
        LOG_DEBUG("[EXCHANGE] %s on %s refused: %s", operation_name(req.op),
                  req.characteristic.uuid.c_str(), st.to_string().c_str());
        return st;
    }

    st = run(session, lease, req, out, cancel);
    session.end_exchange(lease, st);
    if (!st)
        LOG_WARN("[EXCHANGE] %s on %s failed: %s", operation_name(req.op), lease.target.uuid.c_str(),
                 st.to_string().c_str());
    else
        LOG_DEBUG("[EXCHANGE] %s on %s ok", operation_name(req.op), lease.target.uuid.c_str());
    return st;
}

gatt::Status ExchangeEngine::run(Session                 &session,
                                 const Session::Lease    &lease,
                                 const ExchangeRequest   &req,
                                 ExchangeResult          &out,
                                 const util::CancelToken &cancel)
{
    auto &adapter = session.adapter();

    if (const auto *w = std::get_if<WriteOp>(&req.op))
    {
        gatt::Bytes bytes;
        auto        st = payload::encode(w->payload, bytes);
        if (!st)
            return st;  // caller error, nothing sent
        if (cancel.cancelled())
            return {gatt::Errc::Cancelled, "write cancelled before submission"};
        LOG_DEBUG("[EXCHANGE] %s %zu byte(s) (%s) to %s", operation_name(req.op), bytes.size(),
                  payload::encoding_name(w->payload.encoding()), lease.target.uuid.c_str());
        return adapter.write_characteristic(lease.conn, lease.target, bytes, w->with_response,
                                            op_timeout_, cancel);
    }

    if (std::holds_alternative<ReadOp>(req.op))
    {
        if (cancel.cancelled())
            return {gatt::Errc::Cancelled, "read cancelled before submission"};
        gatt::Bytes data;
        auto        st = adapter.read_characteristic(lease.conn, lease.target, op_timeout_, cancel, data);
        if (st)
            out.data = std::move(data);
        return st;
    }

    // SubscribeOp
    if (cancel.cancelled())
        return {gatt::Errc::Cancelled, "subscribe cancelled before submission"};
    auto queue = std::make_shared<NotifyQueue>();
    auto sub   = std::make_shared<Subscription>(adapter, lease.target, queue, lease.link);
    std::weak_ptr<NotifyQueue> weak_q = queue;
    transport::SubscriptionHandle h   = 0;
    auto st = adapter.subscribe(lease.conn, lease.target,
                                [weak_q](const gatt::Bytes &v) {
                                    if (auto q = weak_q.lock())
                                        q->push(v);
                                },
                                h);
    if (!st)
    {
        queue->close(st.code, true);
        return st;
    }
    sub->bind(h);
    session.track(queue);
    out.subscription = std::move(sub);
    return gatt::Status::Ok();
}

}  // namespace central
