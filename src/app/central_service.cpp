#include <cstdio>
#include <sstream>
#include <utility>

#include "app/central_service.hpp"
#include "util/log.hpp"

namespace app
{

static const std::vector<gatt::Capability> WRITE_FALLBACK   = {gatt::Capability::Write,
                                                               gatt::Capability::WriteNoResponse};
static const std::vector<gatt::Capability> WRITENR_FALLBACK = {gatt::Capability::WriteNoResponse,
                                                               gatt::Capability::Write};
static const std::vector<gatt::Capability> READ_FALLBACK    = {gatt::Capability::Read};
static const std::vector<gatt::Capability> NOTIFY_FALLBACK  = {gatt::Capability::Notify,
                                                               gatt::Capability::Indicate};

// Pick from resolved services: by UUID, or by the first-candidate policy.
static gatt::Status pick_from(const std::vector<gatt::Service>     &services,
                              const std::string                    &target,
                              const std::vector<gatt::Capability> &fallback,
                              gatt::Characteristic                 &out)
{
    if (is_auto_target(target))
        return central::CharacteristicSelector::pick(services, fallback, out);
    return central::CharacteristicSelector::find_by_uuid(services, target, out);
}

CentralService::CentralService(transport::IRadioAdapter &adapter, ServiceOptions opts)
    : adapter_(adapter),
      opts_(opts),
      registry_(adapter),
      prober_(adapter),
      session_(adapter),
      engine_(opts.op_timeout)
{
}

CentralService::~CentralService()
{
    unsubscribe();
    close_session();
}

gatt::Status CentralService::discover(std::chrono::milliseconds  window,
                                      const util::CancelToken   &cancel,
                                      std::vector<gatt::Device> &out)
{
    return registry_.discover(window, cancel, out);
}

central::ProbeReport CentralService::probe_connectable(const std::vector<gatt::Device> &devices,
                                                       const util::CancelToken         &cancel)
{
    return prober_.probe(devices, opts_.probe_timeout, cancel, opts_.parallel_probe);
}

gatt::Status CentralService::open_session(const std::string &address, const util::CancelToken &cancel)
{
    return session_.open(address, opts_.connect_timeout, cancel);
}

gatt::Status CentralService::resolve(std::vector<gatt::Service> &out)
{
    return session_.resolve_services(out);
}

gatt::Status CentralService::resolve_target(const std::string                   &target,
                                            const std::vector<gatt::Capability> &fallback,
                                            gatt::Characteristic                &out)
{
    std::vector<gatt::Service> svcs;
    auto                       st = session_.resolve_services(svcs);
    if (!st)
        return st;
    return pick_from(svcs, target, fallback, out);
}

gatt::Status CentralService::select_characteristic(const std::string                   &target,
                                                   const std::vector<gatt::Capability> &fallback,
                                                   gatt::Characteristic                &out)
{
    return resolve_target(target, fallback, out);
}

gatt::Status CentralService::write_on(central::Session        &s,
                                      const std::string       &target,
                                      const payload::Payload  &p,
                                      bool                     with_response,
                                      gatt::Characteristic    &used,
                                      const util::CancelToken &cancel)
{
    std::vector<gatt::Service> svcs;
    auto                       st = s.resolve_services(svcs);
    if (!st)
        return st;
    const bool auto_pick = is_auto_target(target);
    st = pick_from(svcs, target, with_response ? WRITE_FALLBACK : WRITENR_FALLBACK, used);
    if (!st)
        return st;
    if (auto_pick)
    {
        // honour what the chosen characteristic actually supports
        if (with_response && !used.can(gatt::Capability::Write))
            with_response = false;
        else if (!with_response && !used.can(gatt::Capability::WriteNoResponse))
            with_response = true;
    }
    auto                   req = with_response ? central::ExchangeRequest::write(used, p)
                                               : central::ExchangeRequest::write_no_response(used, p);
    central::ExchangeResult res;
    return engine_.execute(s, req, res, cancel);
}

gatt::Status CentralService::write(const std::string       &target,
                                   const payload::Payload  &p,
                                   bool                     with_response,
                                   gatt::Characteristic    &used,
                                   const util::CancelToken &cancel)
{
    return write_on(session_, target, p, with_response, used, cancel);
}

gatt::Status CentralService::read(const std::string       &target,
                                  gatt::Bytes             &out,
                                  gatt::Characteristic    &used,
                                  const util::CancelToken &cancel)
{
    auto st = resolve_target(target, READ_FALLBACK, used);
    if (!st)
        return st;
    central::ExchangeResult res;
    st = engine_.execute(session_, central::ExchangeRequest::read(used), res, cancel);
    if (st)
        out = std::move(res.data);
    return st;
}

gatt::Status CentralService::subscribe(const std::string                      &target,
                                       std::shared_ptr<central::Subscription> &out)
{
    gatt::Characteristic c;
    auto                 st = resolve_target(target, NOTIFY_FALLBACK, c);
    if (!st)
        return st;
    central::ExchangeResult res;
    st = engine_.execute(session_, central::ExchangeRequest::subscribe(c), res);
    if (!st)
        return st;

    std::shared_ptr<central::Subscription> old;
    {
        std::lock_guard<std::mutex> lk(sub_mu_);
        old  = std::move(sub_);
        sub_ = res.subscription;
    }
    if (old)
        old->unsubscribe();
    out = std::move(res.subscription);
    return gatt::Status::Ok();
}

void CentralService::unsubscribe()
{
    std::shared_ptr<central::Subscription> s;
    {
        std::lock_guard<std::mutex> lk(sub_mu_);
        s = std::move(sub_);
    }
    if (s)
        s->unsubscribe();
}

void CentralService::close_session()
{
    unsubscribe();
    session_.close();
}

// ====
// Function: CentralService::send_and_read_back
// - In: peer address, payload
// - Out: the characteristic written and, when it is readable, the value read back
// - Note: runs on its own short-lived session, so it needs a free adapter slot
// ====
gatt::Status CentralService::send_and_read_back(const std::string       &address,
                                                const payload::Payload  &p,
                                                SendReadResult          &out,
                                                const util::CancelToken &cancel)
{
    central::Session s(adapter_);
    auto             st = s.open(address, opts_.connect_timeout, cancel);
    if (!st)
        return st;

    st = write_on(s, "auto", p, true, out.written, cancel);
    if (!st)
        return st;  // Session dtor disconnects

    out.read_back = out.written.can(gatt::Capability::Read);
    if (out.read_back)
    {
        central::ExchangeResult res;
        st = engine_.execute(s, central::ExchangeRequest::read(out.written), res, cancel);
        if (!st)
            return st;
        out.response = std::move(res.data);
    }
    s.close();
    return gatt::Status::Ok();
}

BroadcastReport CentralService::broadcast(const payload::Payload  &p,
                                          std::chrono::milliseconds window,
                                          const util::CancelToken  &cancel)
{
    BroadcastReport           rep;
    std::vector<gatt::Device> devices;
    rep.status = registry_.discover(window, cancel, devices);
    if (!rep.status)
    {
        LOG_WARN("[BROADCAST] discovery failed: %s", rep.status.to_string().c_str());
        return rep;
    }

    for (const auto &d : devices)
    {
        BroadcastResult r;
        r.device = d;
        if (cancel.cancelled())
        {
            r.status = {gatt::Errc::Cancelled, "broadcast cancelled"};
            rep.results.push_back(std::move(r));
            continue;
        }
        central::Session s(adapter_);
        r.status = s.open(d.address, opts_.connect_timeout, cancel);
        if (r.status)
            r.status = write_on(s, "auto", p, true, r.written, cancel);
        s.close();
        if (r.status)
            ++rep.succeeded;
        else
            LOG_DEBUG("[BROADCAST] %s: %s", d.address.c_str(), r.status.to_string().c_str());
        rep.results.push_back(std::move(r));
    }
    LOG_INFO("[BROADCAST] delivered to %zu of %zu device(s)", rep.succeeded, rep.results.size());
    return rep;
}

std::string CentralService::describe(const std::vector<gatt::Service> &services)
{
    std::ostringstream os;
    for (const auto &svc : services)
    {
        os << "[Service] " << svc.uuid << "\n";
        for (const auto &c : svc.characteristics)
            os << "  [Characteristic] " << c.uuid << " (" << gatt::capabilities_to_string(c.capabilities)
               << ")\n";
    }
    return os.str();
}

std::string CentralService::describe_device(const gatt::Device &d)
{
    std::ostringstream os;
    os << "[Device] " << d.address << " " << d.display_name() << "\n";
    if (!d.advertisement)
        return os.str();

    const auto &adv = *d.advertisement;
    os << "  RSSI: " << adv.rssi << " dBm\n";
    if (adv.tx_power)
        os << "  TX power: " << *adv.tx_power << " dBm\n";
    for (const auto &kv : adv.manufacturer_data)
    {
        char id[8];
        std::snprintf(id, sizeof(id), "0x%04X", (unsigned)kv.first);
        os << "  Manufacturer " << id << ": " << payload::to_hex(kv.second) << "\n";
    }
    for (const auto &uuid : adv.service_uuids)
        os << "  Service UUID: " << uuid << "\n";
    for (const auto &kv : adv.service_data)
        os << "  Service data " << kv.first << ": " << payload::to_hex(kv.second) << "\n";
    return os.str();
}

}  // namespace app
