#pragma once
#include <chrono>
#include <vector>

#include "gatt/status.hpp"
#include "gatt/types.hpp"
#include "transport/radio_adapter.hpp"
#include "util/cancel.hpp"

namespace central
{

struct ProbeFailure
{
    gatt::Device device;
    gatt::Status reason;
};

struct ProbeReport
{
    std::vector<gatt::Device> connectable;  // input order preserved
    std::vector<ProbeFailure> failures;     // input order preserved
};

// Connect-then-disconnect check per device. A device's failure never aborts the others.
class ConnectabilityProber
{
  public:
    explicit ConnectabilityProber(transport::IRadioAdapter &adapter) : adapter_(adapter) {}

    // parallel is honoured only when the adapter advertises more than one connection slot.
    // A raised token stops probing; unprobed devices are reported as Cancelled failures.
    ProbeReport probe(const std::vector<gatt::Device> &devices,
                      std::chrono::milliseconds        per_device_timeout,
                      const util::CancelToken         &cancel   = {},
                      bool                             parallel = false);

  private:
    gatt::Status probe_one(const gatt::Device       &d,
                           std::chrono::milliseconds timeout,
                           const util::CancelToken  &cancel);

    transport::IRadioAdapter &adapter_;
};

}  // namespace central
