#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

#ifndef GATTLINK_SOURCE_DIR
#error "GATTLINK_SOURCE_DIR must be defined by CMake to the project source root"
#endif

struct Check
{
    const char              *label;
    const char              *rel_path;
    std::vector<std::string> needles;  // all substrings must appear in the SAME line
    bool                     allow_prev_line_macro = true;  // sometimes macro is on prev line
};

static std::string read_file(const std::string &path)
{
    std::ifstream      ifs(path);
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

static bool line_has_all(const std::string &line, const std::vector<std::string> &needles)
{
    for (const auto &n : needles)
    {
        if (line.find(n) == std::string::npos)
            return false;
    }
    return true;
}

static bool has_system_macro_near(const std::string              &content,
                                  const std::vector<std::string> &needles,
                                  bool                            allow_prev)
{
    std::istringstream iss(content);
    std::string        line, prev;
    while (std::getline(iss, line))
    {
        if (line_has_all(line, needles))
        {
            const bool on_same = line.find("LOG_SYSTEM(") != std::string::npos;
            const bool on_prev = allow_prev && prev.find("LOG_SYSTEM(") != std::string::npos;
            return on_same || on_prev;
        }
        prev = line;
    }
    // message not found => fail
    return false;
}

// Operator-facing output of the daemon goes through LOG_SYSTEM so it survives any log level.
TEST(SystemLogs, AllSystemLevel)
{
    const std::vector<Check> checks = {
        // clang-format off
        {"scan window", "src/daemon/main.cpp", {"[SCAN]", "scanning for"}},
        {"scan empty", "src/daemon/main.cpp", {"[SCAN]", "no devices found"}},
        {"device line", "src/daemon/main.cpp", {"[DEVICE]", "rssi="}},
        {"probe ok", "src/daemon/main.cpp", {"[PROBE]", "connectable %s"}},
        {"probe failed", "src/daemon/main.cpp", {"[PROBE]", "failed %s"}},
        {"connect", "src/daemon/main.cpp", {"[CONNECT]", "connected to"}},
        {"services", "src/daemon/main.cpp", {"[SERVICES]", "resolved"}},
        {"read", "src/daemon/main.cpp", {"[READ]"}},
        {"subscribe", "src/daemon/main.cpp", {"[SUBSCRIBE]", "listening on"}},
        {"notify ended", "src/daemon/main.cpp", {"[NOTIFY]", "ended"}},
        {"sendread", "src/daemon/main.cpp", {"[SENDREAD]", "wrote to"}},
        {"broadcast", "src/daemon/main.cpp", {"[BROADCAST]", "written"}},
        {"disconnect", "src/daemon/main.cpp", {"[DISCONNECT]", "session closed"}},
        {"config", "src/daemon/main.cpp", {"Config: transport="}},

        {"StartDiscovery OK", "src/transport/bluez_adapter.cpp", {"StartDiscovery OK"}},
        {"StopDiscovery OK", "src/transport/bluez_adapter.cpp", {"StopDiscovery OK"}},
        {"Device connected", "src/transport/bluez_adapter.cpp", {"connected %s (handle="}},
        {"Device disconnected", "src/transport/bluez_adapter.cpp", {"disconnected %s"}},
        {"Link lost", "src/transport/bluez_adapter.cpp", {"link to %s lost"}}
        // clang-format on
    };

    for (const auto &c : checks)
    {
        const std::string path    = std::string(GATTLINK_SOURCE_DIR) + "/" + c.rel_path;
        const std::string content = read_file(path);
        ASSERT_FALSE(content.empty()) << "Missing file: " << path;
        const bool ok = has_system_macro_near(content, c.needles, c.allow_prev_line_macro);
        if (!ok)
        {
            std::ostringstream err;
            err << "Log for [" << c.label << "] is not LOG_SYSTEM near message in " << path
                << " (needles: ";
            for (size_t i = 0; i < c.needles.size(); ++i)
            {
                if (i)
                    err << ", ";
                err << '"' << c.needles[i] << '"';
            }
            err << ")";
            ADD_FAILURE() << err.str();
        }
    }
}
