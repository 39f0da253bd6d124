#pragma once
#include <string>
#include <vector>

#include "gatt/status.hpp"
#include "gatt/types.hpp"

namespace central
{

// Deterministic characteristic selection over resolved services. Candidates keep service
// enumeration order, then characteristic order within each service.
class CharacteristicSelector
{
  public:
    // NoCapableCharacteristic when nothing qualifies.
    static gatt::Status select(const std::vector<gatt::Service>  &services,
                               gatt::Capability                   required,
                               std::vector<gatt::Characteristic> &out);

    // First candidate of the first capability in `fallback` that has any.
    // Broadening happens only through the list the caller passes.
    static gatt::Status pick(const std::vector<gatt::Service>     &services,
                             const std::vector<gatt::Capability> &fallback,
                             gatt::Characteristic                 &out);

    // Case-insensitive UUID lookup; the first match in enumeration order.
    static gatt::Status find_by_uuid(const std::vector<gatt::Service> &services,
                                     const std::string                &uuid,
                                     gatt::Characteristic             &out);
};

}  // namespace central
