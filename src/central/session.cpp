#include <algorithm>
#include <utility>

#include "central/session.hpp"
#include "util/log.hpp"

namespace central
{

const char *state_name(SessionState s)
{
    switch (s)
    {
        case SessionState::Idle:
            return "Idle";
        case SessionState::Connecting:
            return "Connecting";
        case SessionState::Connected:
            return "Connected";
        case SessionState::ServicesResolved:
            return "ServicesResolved";
        case SessionState::Busy:
            return "Busy";
        case SessionState::Disconnected:
            return "Disconnected";
        case SessionState::Failed:
            return "Failed";
    }
    return "?";
}

// Adapter connect failures collapse onto the connect taxonomy.
static gatt::Status classify_connect_error(gatt::Status st)
{
    switch (st.code)
    {
        case gatt::Errc::ConnectTimeout:
        case gatt::Errc::ConnectRefused:
        case gatt::Errc::AdapterError:
        case gatt::Errc::AdapterCapacityExceeded:
        case gatt::Errc::Cancelled:
            break;
        case gatt::Errc::Timeout:
            st.code = gatt::Errc::ConnectTimeout;
            break;
        case gatt::Errc::PeerRejected:
        case gatt::Errc::LinkLost:
            st.code = gatt::Errc::ConnectRefused;
            break;
        default:
            st.code = gatt::Errc::AdapterError;
            break;
    }
    return st;
}

Session::~Session()
{
    close();
}

void Session::set_state_locked(SessionState s)
{
    if (state_ == s)
        return;
    LOG_DEBUG("[SESSION] %s: %s -> %s", address_.empty() ? "-" : address_.c_str(),
              state_name(state_), state_name(s));
    state_ = s;
}

// ====
// Function: Session::open
// - In: peer address, connect timeout, cancellation token
// - Out: Ok with state Connected, or a connect error with state Failed
//        (Disconnected when the token was raised)
// - Note: the adapter call runs without mu_ held; state stays Connecting
// ====
gatt::Status Session::open(const std::string        &address,
                           std::chrono::milliseconds timeout,
                           const util::CancelToken  &cancel)
{
    std::shared_ptr<LinkFlag> link;
    std::uint64_t             epoch = 0;
    {
        std::vector<std::shared_ptr<NotifyQueue>> to_close;
        std::unique_lock<std::mutex>              lk(mu_);
        auto                                      lost = sync_link_locked(to_close);
        if (lost)
        {
            lk.unlock();
            finish_release(lost, to_close, gatt::Errc::LinkLost);
            lk.lock();
        }
        switch (state_)
        {
            case SessionState::Idle:
            case SessionState::Failed:
            case SessionState::Disconnected:
                break;
            default:
                return {gatt::Errc::InvalidState,
                        std::string("session already ") + state_name(state_) + " to " + address_};
        }
        address_ = address;
        services_.clear();
        link  = std::make_shared<LinkFlag>();
        link_ = link;
        epoch = ++epoch_;
        set_state_locked(SessionState::Connecting);
    }

    transport::ConnectionHandle h = 0;
    std::weak_ptr<LinkFlag>     weak_link = link;
    auto st = adapter_.connect(address, timeout, cancel,
                               [weak_link] {
                                   if (auto l = weak_link.lock())
                                       l->lost.store(true);
                               },
                               h);

    std::unique_lock<std::mutex> lk(mu_);
    if (epoch != epoch_ || state_ != SessionState::Connecting)
    {
        // closed while connecting: hand the fresh link straight back
        lk.unlock();
        if (st.ok())
            adapter_.disconnect(h);
        return {gatt::Errc::Cancelled, "session closed while connecting"};
    }
    if (!st)
    {
        st = classify_connect_error(std::move(st));
        set_state_locked(st.code == gatt::Errc::Cancelled ? SessionState::Disconnected
                                                          : SessionState::Failed);
        link_.reset();
        LOG_WARN("[SESSION] connect %s failed: %s", address.c_str(), st.to_string().c_str());
        return st;
    }
    has_conn_ = true;
    conn_     = h;
    set_state_locked(SessionState::Connected);
    return gatt::Status::Ok();
}

// ====
// Function: Session::resolve_services
// - In: timeout for the adapter's service discovery
// - Out: ordered services with their characteristics
// - Note: one adapter query per connection. Characteristics get their parent back-reference.
// ====
gatt::Status Session::resolve_services(std::vector<gatt::Service> &out,
                                       std::chrono::milliseconds   timeout)
{
    std::lock_guard<std::mutex> rlk(resolve_mu_);

    transport::ConnectionHandle h     = 0;
    std::uint64_t               epoch = 0;
    {
        std::vector<std::shared_ptr<NotifyQueue>> to_close;
        std::unique_lock<std::mutex>              lk(mu_);
        auto                                      lost = sync_link_locked(to_close);
        if (lost)
        {
            lk.unlock();
            finish_release(lost, to_close, gatt::Errc::LinkLost);
            return {gatt::Errc::LinkLost, "link lost before service resolution"};
        }
        if (state_ == SessionState::ServicesResolved || state_ == SessionState::Busy)
        {
            out = services_;
            return gatt::Status::Ok();
        }
        if (state_ != SessionState::Connected)
            return {gatt::Errc::InvalidState,
                    std::string("cannot resolve services while ") + state_name(state_)};
        h     = conn_;
        epoch = epoch_;
    }

    std::vector<gatt::Service> svcs;
    auto                       st = adapter_.resolve_services(h, timeout, svcs);

    std::vector<std::shared_ptr<NotifyQueue>> to_close;
    std::unique_lock<std::mutex>              lk(mu_);
    if (epoch != epoch_ || state_ != SessionState::Connected)
        return {gatt::Errc::LinkLost, "session closed during service resolution"};
    if (!st)
    {
        LOG_WARN("[SESSION] resolve %s failed: %s", address_.c_str(), st.to_string().c_str());
        if (st.code == gatt::Errc::LinkLost)
        {
            auto rel = release_locked(SessionState::Disconnected, gatt::Errc::LinkLost, to_close);
            lk.unlock();
            finish_release(rel, to_close, gatt::Errc::LinkLost);
        }
        return st;
    }
    for (auto &svc : svcs)
    {
        for (auto &c : svc.characteristics)
            c.service_uuid = svc.uuid;
    }
    services_ = std::move(svcs);
    set_state_locked(SessionState::ServicesResolved);
    out = services_;
    return gatt::Status::Ok();
}

void Session::close()
{
    std::vector<std::shared_ptr<NotifyQueue>> to_close;
    transport::ConnectionHandle               h = 0;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (state_ == SessionState::Disconnected && !has_conn_)
            return;
        h = release_locked(SessionState::Disconnected, gatt::Errc::Cancelled, to_close);
    }
    finish_release(h, to_close, gatt::Errc::Cancelled);
}

SessionState Session::state()
{
    std::vector<std::shared_ptr<NotifyQueue>> to_close;
    std::unique_lock<std::mutex>              lk(mu_);
    auto                                      lost = sync_link_locked(to_close);
    const SessionState                        s    = state_;
    lk.unlock();
    if (lost)
        finish_release(lost, to_close, gatt::Errc::LinkLost);
    return s;
}

std::string Session::address() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return address_;
}

std::vector<gatt::Service> Session::services()
{
    std::lock_guard<std::mutex> lk(mu_);
    if (state_ == SessionState::ServicesResolved || state_ == SessionState::Busy)
        return services_;
    return {};
}

gatt::Status Session::begin_exchange(const gatt::Characteristic &requested, Lease &out)
{
    std::vector<std::shared_ptr<NotifyQueue>> to_close;
    std::unique_lock<std::mutex>              lk(mu_);
    auto                                      lost = sync_link_locked(to_close);
    if (lost)
    {
        lk.unlock();
        finish_release(lost, to_close, gatt::Errc::LinkLost);
        return {gatt::Errc::LinkLost, "link to the peer was lost"};
    }
    if (state_ == SessionState::Busy)
        return {gatt::Errc::SessionBusy, "an exchange is already in flight"};
    if (state_ != SessionState::ServicesResolved)
        return {gatt::Errc::InvalidState,
                std::string("exchange needs ServicesResolved, session is ") + state_name(state_)};

    // the request must name one of this connection's characteristics
    const gatt::Characteristic *found = nullptr;
    for (const auto &svc : services_)
    {
        for (const auto &c : svc.characteristics)
        {
            const bool same = !requested.handle.empty()
                                  ? c.handle == requested.handle
                                  : gatt::uuid_eq(c.uuid, requested.uuid) &&
                                        (requested.service_uuid.empty() ||
                                         gatt::uuid_eq(c.service_uuid, requested.service_uuid));
            if (same)
            {
                found = &c;
                break;
            }
        }
        if (found)
            break;
    }
    if (!found)
        return {gatt::Errc::UnknownCharacteristic,
                "characteristic " + requested.uuid + " is not part of the resolved services"};

    out.conn   = conn_;
    out.epoch  = epoch_;
    out.target = *found;
    out.link   = link_;
    set_state_locked(SessionState::Busy);
    return gatt::Status::Ok();
}

void Session::end_exchange(const Lease &lease, const gatt::Status &result)
{
    std::vector<std::shared_ptr<NotifyQueue>> to_close;
    transport::ConnectionHandle               h = 0;
    gatt::Errc                                reason = gatt::Errc::LinkLost;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (lease.epoch != epoch_ || state_ != SessionState::Busy)
            return;  // closed underneath the exchange
        const bool lost = result.code == gatt::Errc::LinkLost || (link_ && link_->lost.load());
        if (lost || result.code == gatt::Errc::Cancelled)
        {
            reason = lost ? gatt::Errc::LinkLost : gatt::Errc::Cancelled;
            h      = release_locked(SessionState::Disconnected, reason, to_close);
        }
        else
        {
            set_state_locked(SessionState::ServicesResolved);
            return;
        }
    }
    finish_release(h, to_close, reason);
}

void Session::track(const std::shared_ptr<NotifyQueue> &q)
{
    std::lock_guard<std::mutex> lk(mu_);
    queues_.erase(std::remove_if(queues_.begin(), queues_.end(),
                                 [](const std::weak_ptr<NotifyQueue> &w) { return w.expired(); }),
                  queues_.end());
    queues_.push_back(q);
}

transport::ConnectionHandle Session::release_locked(SessionState next,
                                                    gatt::Errc   reason,
                                                    std::vector<std::shared_ptr<NotifyQueue>> &to_close)
{
    transport::ConnectionHandle h = 0;
    if (has_conn_)
    {
        h         = conn_;
        has_conn_ = false;
        conn_     = 0;
        LOG_DEBUG("[SESSION] releasing %s (%s)", address_.c_str(), gatt::errc_name(reason));
    }
    for (auto &w : queues_)
    {
        if (auto q = w.lock())
            to_close.push_back(std::move(q));
    }
    queues_.clear();
    services_.clear();
    link_.reset();
    ++epoch_;  // invalidates in-flight connects and exchanges
    set_state_locked(next);
    return h;
}

transport::ConnectionHandle Session::sync_link_locked(std::vector<std::shared_ptr<NotifyQueue>> &to_close)
{
    if (!has_conn_ || !link_ || !link_->lost.load())
        return 0;
    LOG_WARN("[SESSION] link to %s lost", address_.c_str());
    return release_locked(SessionState::Disconnected, gatt::Errc::LinkLost, to_close);
}

void Session::finish_release(transport::ConnectionHandle                h,
                             std::vector<std::shared_ptr<NotifyQueue>> &to_close,
                             gatt::Errc                                 reason)
{
    for (auto &q : to_close)
        q->close(reason);
    if (h)
        adapter_.disconnect(h);
}

}  // namespace central
