#include <algorithm>
#include <cctype>
#include <utility>

#include "central/device_registry.hpp"
#include "util/log.hpp"

namespace central
{

DiscoveryScan::DiscoveryScan(DeviceRegistry &reg, std::unique_ptr<transport::IScanStream> s)
    : reg_(reg), stream_(std::move(s))
{
}

DiscoveryScan::~DiscoveryScan()
{
    stop();
}

bool DiscoveryScan::next(gatt::Device &out, const util::CancelToken &cancel)
{
    gatt::Device d;
    while (stream_ && stream_->next(d, cancel))
    {
        if (d.address.empty())
            continue;
        reg_.record(d);
        // address comparison is case-insensitive, normalise the key
        std::string key = d.address;
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return (char)std::toupper(c); });
        if (!yielded_.insert(key).second)
            continue;
        out = std::move(d);
        return true;
    }
    return false;
}

void DiscoveryScan::stop()
{
    if (stream_)
        stream_->stop();
}

gatt::Status DeviceRegistry::start_discovery(std::chrono::milliseconds       window,
                                             std::unique_ptr<DiscoveryScan> &out)
{
    std::unique_ptr<transport::IScanStream> stream;
    auto st = adapter_.scan(window, stream);
    if (!st)
    {
        LOG_WARN("[REGISTRY] scan could not start: %s", st.to_string().c_str());
        if (st.code != gatt::Errc::DiscoveryUnavailable)
            st.code = gatt::Errc::DiscoveryUnavailable;
        return st;
    }
    {
        std::lock_guard<std::mutex> lk(mu_);
        devices_.clear();
    }
    out.reset(new DiscoveryScan(*this, std::move(stream)));
    return gatt::Status::Ok();
}

gatt::Status DeviceRegistry::discover(std::chrono::milliseconds  window,
                                      const util::CancelToken   &cancel,
                                      std::vector<gatt::Device> &out)
{
    std::unique_ptr<DiscoveryScan> scan;
    auto                           st = start_discovery(window, scan);
    if (!st)
        return st;

    LOG_DEBUG("[REGISTRY] discovering for %lld ms", (long long)window.count());
    gatt::Device d;
    while (scan->next(d, cancel))
        LOG_DEBUG("[REGISTRY] found %s (%s)", d.address.c_str(), d.display_name().c_str());
    scan->stop();

    if (cancel.cancelled())
        LOG_DEBUG("[REGISTRY] discovery cancelled, returning partial snapshot");
    out = snapshot();
    return gatt::Status::Ok();
}

void DeviceRegistry::record(const gatt::Device &d)
{
    std::lock_guard<std::mutex> lk(mu_);
    auto it = std::find_if(devices_.begin(), devices_.end(), [&](const gatt::Device &e) {
        return gatt::uuid_eq(e.address, d.address);
    });
    if (it != devices_.end())
        *it = d;  // replace, never merge
    else
        devices_.push_back(d);
}

std::vector<gatt::Device> DeviceRegistry::snapshot() const
{
    std::vector<gatt::Device> out;
    {
        std::lock_guard<std::mutex> lk(mu_);
        out = devices_;
    }
    std::sort(out.begin(), out.end(), [](const gatt::Device &a, const gatt::Device &b) {
        if (a.has_name() != b.has_name())
            return a.has_name();
        if (a.has_name() && *a.name != *b.name)
            return *a.name < *b.name;
        return a.address < b.address;
    });
    return out;
}

bool DeviceRegistry::find(const std::string &address, gatt::Device &out) const
{
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto &d : devices_)
    {
        if (gatt::uuid_eq(d.address, address))
        {
            out = d;
            return true;
        }
    }
    return false;
}

std::size_t DeviceRegistry::size() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return devices_.size();
}

}  // namespace central
