#include "central/selector.hpp"
#include "util/log.hpp"

namespace central
{

gatt::Status CharacteristicSelector::select(const std::vector<gatt::Service>  &services,
                                            gatt::Capability                   required,
                                            std::vector<gatt::Characteristic> &out)
{
    out.clear();
    for (const auto &svc : services)
    {
        for (const auto &c : svc.characteristics)
        {
            if (c.can(required))
                out.push_back(c);
        }
    }
    if (out.empty())
        return {gatt::Errc::NoCapableCharacteristic,
                std::string("no characteristic supports ") + gatt::capability_name(required)};
    return gatt::Status::Ok();
}

gatt::Status CharacteristicSelector::pick(const std::vector<gatt::Service>     &services,
                                          const std::vector<gatt::Capability> &fallback,
                                          gatt::Characteristic                 &out)
{
    std::string tried;
    for (auto cap : fallback)
    {
        std::vector<gatt::Characteristic> cands;
        if (select(services, cap, cands).ok())
        {
            if (cands.size() > 1)
                LOG_DEBUG("[SELECT] %zu %s candidates, taking %s", cands.size(),
                          gatt::capability_name(cap), cands.front().uuid.c_str());
            out = cands.front();
            return gatt::Status::Ok();
        }
        if (!tried.empty())
            tried += ", ";
        tried += gatt::capability_name(cap);
    }
    return {gatt::Errc::NoCapableCharacteristic,
            "no characteristic supports any of: " + (tried.empty() ? std::string("(none)") : tried)};
}

gatt::Status CharacteristicSelector::find_by_uuid(const std::vector<gatt::Service> &services,
                                                  const std::string                &uuid,
                                                  gatt::Characteristic             &out)
{
    for (const auto &svc : services)
    {
        for (const auto &c : svc.characteristics)
        {
            if (gatt::uuid_eq(c.uuid, uuid))
            {
                out = c;
                return gatt::Status::Ok();
            }
        }
    }
    return {gatt::Errc::UnknownCharacteristic, "no characteristic " + uuid};
}

}  // namespace central
