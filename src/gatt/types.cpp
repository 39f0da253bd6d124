#include <string>
#include <vector>

#include "gatt/types.hpp"

namespace gatt
{

namespace
{
struct FlagName
{
    Capability  cap;
    const char *name;
};

// Enumeration order of capability names in listings.
constexpr FlagName FLAG_NAMES[] = {
    {Capability::Read, "read"},
    {Capability::Write, "write"},
    {Capability::WriteNoResponse, "write-without-response"},
    {Capability::Notify, "notify"},
    {Capability::Indicate, "indicate"},
};
}  // namespace

const char *capability_name(Capability c)
{
    for (const auto &f : FLAG_NAMES)
    {
        if (f.cap == c)
            return f.name;
    }
    return "?";
}

std::string capabilities_to_string(CapabilitySet set)
{
    std::string out;
    for (const auto &f : FLAG_NAMES)
    {
        if (!has_capability(set, f.cap))
            continue;
        if (!out.empty())
            out += ", ";
        out += f.name;
    }
    return out.empty() ? std::string("none") : out;
}

CapabilitySet capabilities_from_flags(const std::vector<std::string> &flags)
{
    CapabilitySet set = 0;
    for (const auto &flag : flags)
    {
        for (const auto &f : FLAG_NAMES)
        {
            if (uuid_eq(flag, f.name))
                set = set | f.cap;
        }
    }
    return set;
}

const std::string &Device::display_name() const
{
    static const std::string unknown = "Unknown Device";
    return has_name() ? *name : unknown;
}

}  // namespace gatt
