#include <algorithm>
#include <atomic>
#include <thread>

#include "central/prober.hpp"
#include "util/log.hpp"

namespace central
{

gatt::Status ConnectabilityProber::probe_one(const gatt::Device       &d,
                                             std::chrono::milliseconds timeout,
                                             const util::CancelToken  &cancel)
{
    if (cancel.cancelled())
        return {gatt::Errc::Cancelled, "probe cancelled"};

    transport::ConnectionHandle h  = 0;
    auto                        st = adapter_.connect(d.address, timeout, cancel, nullptr, h);
    if (!st)
    {
        LOG_DEBUG("[PROBE] %s not connectable: %s", d.address.c_str(), st.to_string().c_str());
        return st;
    }
    adapter_.disconnect(h);
    LOG_DEBUG("[PROBE] %s connectable", d.address.c_str());
    return gatt::Status::Ok();
}

ProbeReport ConnectabilityProber::probe(const std::vector<gatt::Device> &devices,
                                        std::chrono::milliseconds        per_device_timeout,
                                        const util::CancelToken         &cancel,
                                        bool                             parallel)
{
    std::vector<gatt::Status> results(devices.size());

    const std::size_t slots   = adapter_.max_connections();
    const std::size_t workers = std::min(slots, devices.size());
    if (parallel && slots > 1 && workers > 1)
    {
        // each worker pulls the next index; results land in their input slot
        std::atomic<std::size_t> next{0};
        std::vector<std::thread> pool;
        pool.reserve(workers);
        for (std::size_t w = 0; w < workers; ++w)
        {
            pool.emplace_back([&] {
                for (std::size_t i = next++; i < devices.size(); i = next++)
                    results[i] = probe_one(devices[i], per_device_timeout, cancel);
            });
        }
        for (auto &t : pool)
            t.join();
    }
    else
    {
        for (std::size_t i = 0; i < devices.size(); ++i)
            results[i] = probe_one(devices[i], per_device_timeout, cancel);
    }

    ProbeReport rep;
    for (std::size_t i = 0; i < devices.size(); ++i)
    {
        if (results[i].ok())
            rep.connectable.push_back(devices[i]);
        else
            rep.failures.push_back(ProbeFailure{devices[i], results[i]});
    }
    LOG_INFO("[PROBE] %zu of %zu device(s) connectable", rep.connectable.size(), devices.size());
    return rep;
}

}  // namespace central
