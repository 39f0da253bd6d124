#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "gatt/status.hpp"
#include "gatt/types.hpp"
#include "transport/radio_adapter.hpp"
#include "util/cancel.hpp"

namespace central
{

class DeviceRegistry;

// One discovery pass. Yields each address once (its first sighting); later sightings of the
// same address replace the registry entry without being yielded again.
class DiscoveryScan
{
  public:
    ~DiscoveryScan();
    DiscoveryScan(const DiscoveryScan &)            = delete;
    DiscoveryScan &operator=(const DiscoveryScan &) = delete;

    // false once the window has elapsed, the scan was stopped or the token was raised.
    bool next(gatt::Device &out, const util::CancelToken &cancel = {});
    void stop();

  private:
    friend class DeviceRegistry;
    DiscoveryScan(DeviceRegistry &reg, std::unique_ptr<transport::IScanStream> s);

    DeviceRegistry                         &reg_;
    std::unique_ptr<transport::IScanStream> stream_;
    std::set<std::string>                   yielded_;
};

class DeviceRegistry
{
  public:
    explicit DeviceRegistry(transport::IRadioAdapter &adapter) : adapter_(adapter) {}

    // Opens an independent scan and clears the catalog. DiscoveryUnavailable if the radio
    // cannot scan.
    gatt::Status start_discovery(std::chrono::milliseconds window, std::unique_ptr<DiscoveryScan> &out);

    // Runs a whole window and returns the snapshot. A raised token ends the window early and
    // still returns Ok with whatever was gathered.
    gatt::Status discover(std::chrono::milliseconds  window,
                          const util::CancelToken   &cancel,
                          std::vector<gatt::Device> &out);

    // Named devices first (case-sensitive ascending), unnamed after, ties by address.
    std::vector<gatt::Device> snapshot() const;
    bool                      find(const std::string &address, gatt::Device &out) const;
    std::size_t               size() const;

  private:
    friend class DiscoveryScan;
    void record(const gatt::Device &d);

    transport::IRadioAdapter &adapter_;
    mutable std::mutex        mu_;
    std::vector<gatt::Device> devices_;
};

}  // namespace central
