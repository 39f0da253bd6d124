#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "ctl/ipc.hpp"
#include "proto/payload.hpp"
#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{

static bool is_valid_mac(const std::string &mac)
{
    if (mac.size() != 17)
        return false;
    for (size_t i = 0; i < mac.size(); ++i)
    {
        if ((i % 3) == 2)
        {
            if (mac[i] != ':')
                return false;
        }
        else if (!std::isxdigit(static_cast<unsigned char>(mac[i])))
        {
            return false;
        }
    }
    return true;
}

static std::string to_upper(std::string s)
{
    for (auto &c : s)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

static std::string to_lower(std::string s)
{
    for (auto &c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

static std::string join(const std::vector<std::string> &args, size_t from)
{
    std::string out;
    for (size_t i = from; i < args.size(); ++i)
    {
        if (i > from)
            out.push_back(' ');
        out += args[i];
    }
    return out;
}

// --------------------------------------------------------------------
// CLI usage
// --------------------------------------------------------------------
static void print_usage()
{
    std::fprintf(stderr, "Usage:\n"
                         "  gattlinkctl [--sock <path>] <command> [args]\n"
                         "\n"
                         "Commands:\n"
                         "  scan [secs]                          discover for 1..120 s\n"
                         "  probe [timeout_ms]                   connect-test scanned devices (100..60000)\n"
                         "  devices                              last discovery with advertisement details\n"
                         "  connect AA:BB:CC:DD:EE:FF            open the session and resolve services\n"
                         "  services                             print services and characteristics\n"
                         "  write <uuid|auto> <text|hex|raw> <payload...>\n"
                         "  writenr <uuid|auto> <text|hex|raw> <payload...>\n"
                         "  read [uuid|auto]\n"
                         "  subscribe [uuid|auto]\n"
                         "  unsubscribe\n"
                         "  sendread AA:BB:CC:DD:EE:FF <text|hex|raw> <payload...>\n"
                         "  broadcast <text|hex|raw> <payload...>\n"
                         "  disconnect\n"
                         "  quit\n");
}

static int send_one_line(const std::string &sock, const std::string &line)
{
    if (line.empty() || line.find('\n') != std::string::npos)
    {
        print_usage();
        if (line.empty())
            std::fprintf(stderr, "error: empty command line to daemon\n");
        else
            std::fprintf(stderr, "error: command line must not contain newline characters\n");
        return exitc::bad_args;
    }
    if (line.size() >= ipc::MAX_LINE)
    {
        std::fprintf(stderr, "error: command longer than %zu bytes\n", ipc::MAX_LINE - 1);
        return exitc::bad_args;
    }
    if (!ipc::send_line(sock, line))
    {
        std::fprintf(stderr, "error: cannot reach daemon at %s\n", sock.c_str());
        return exitc::no_server;
    }
    return exitc::ok;
}

// "<enc> <payload...>" starting at args[at]; appends "ENC payload" to `line`.
static bool take_payload(const std::vector<std::string> &args, size_t at, std::string &line)
{
    if (args.size() < at + 2)
    {
        print_usage();
        return false;
    }
    payload::Encoding e;
    if (!payload::parse_encoding(to_lower(args[at]), e))
    {
        std::fprintf(stderr, "error: unknown encoding '%s' (expect text|hex|raw)\n", args[at].c_str());
        return false;
    }
    const std::string text = join(args, at + 1);
    if (e == payload::Encoding::Hex)
    {
        gatt::Bytes probe;
        auto        st = payload::hex_to_bytes(text, probe);
        if (!st)
        {
            std::fprintf(stderr, "error: %s\n", st.to_string().c_str());
            return false;
        }
    }
    line += std::string(" ") + payload::encoding_name(e) + " " + text;
    return true;
}

// Optional numeric argument in [lo, hi] at args[1].
static bool take_number(const std::vector<std::string> &args, unsigned long lo, unsigned long hi,
                        const char *what, std::string &line)
{
    if (args.size() == 1)
        return true;
    unsigned long v = 0;
    if (args.size() != 2 || !config::parse_ulong_in_range(args[1].c_str(), lo, hi, v))
    {
        std::fprintf(stderr, "error: %s must be %lu..%lu\n", what, lo, hi);
        return false;
    }
    line += " " + std::to_string(v);
    return true;
}

static bool take_mac(const std::string &arg, std::string &line)
{
    std::string mac = to_upper(arg);
    if (!is_valid_mac(mac))
    {
        std::fprintf(stderr, "error: invalid MAC address: %s\n", arg.c_str());
        return false;
    }
    line += " " + mac;
    return true;
}

static int run_cmd(const std::string                             &cmd,
                   const std::vector<std::string>                &args,
                   const std::function<int(const std::string &)> &send_line)
{
    auto write_cmd = [&](const char *verb) -> int {
        if (args.size() < 4)
        {
            print_usage();
            return exitc::bad_args;
        }
        std::string line = std::string(verb) + " " + args[1];
        if (!take_payload(args, 2, line))
            return exitc::bad_args;
        return send_line(line);
    };
    auto target_cmd = [&](const char *verb) -> int {
        if (args.size() > 2)
        {
            print_usage();
            return exitc::bad_args;
        }
        return send_line(std::string(verb) + " " + (args.size() == 2 ? args[1] : "auto"));
    };

    std::unordered_map<std::string, std::function<int()>> cmd_map = {
        {"scan",
         [&]() -> int {
             std::string line = "SCAN";
             if (!take_number(args, 1, 120, "scan window (seconds)", line))
                 return exitc::bad_args;
             return send_line(line);
         }},
        {"probe",
         [&]() -> int {
             std::string line = "PROBE";
             if (!take_number(args, 100, 60000, "probe timeout (ms)", line))
                 return exitc::bad_args;
             return send_line(line);
         }},
        {"devices", [&]() -> int { return send_line("DEVICES"); }},
        {"connect",
         [&]() -> int {
             if (args.size() != 2)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             std::string line = "CONNECT";
             if (!take_mac(args[1], line))
                 return exitc::bad_args;
             return send_line(line);
         }},
        {"services", [&]() -> int { return send_line("SERVICES"); }},
        {"write", [&]() -> int { return write_cmd("WRITE"); }},
        {"writenr", [&]() -> int { return write_cmd("WRITENR"); }},
        {"read", [&]() -> int { return target_cmd("READ"); }},
        {"subscribe", [&]() -> int { return target_cmd("SUBSCRIBE"); }},
        {"unsubscribe", [&]() -> int { return send_line("UNSUBSCRIBE"); }},
        {"sendread",
         [&]() -> int {
             if (args.size() < 4)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             std::string line = "SENDREAD";
             if (!take_mac(args[1], line) || !take_payload(args, 2, line))
                 return exitc::bad_args;
             return send_line(line);
         }},
        {"broadcast",
         [&]() -> int {
             std::string line = "BROADCAST";
             if (!take_payload(args, 1, line))
                 return exitc::bad_args;
             return send_line(line);
         }},
        {"disconnect", [&]() -> int { return send_line("DISCONNECT"); }},
        {"quit", [&]() -> int { return send_line("QUIT"); }},
    };

    auto it = cmd_map.find(to_lower(cmd));
    if (it == cmd_map.end())
    {
        std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
        print_usage();
        return exitc::bad_args;
    }
    LOG_DEBUG("Running command: %s", cmd.c_str());
    return it->second();
}
}  // namespace

int main(int argc, char **argv)
{
    if (const char *l = std::getenv("GATTLINK_LOG_LEVEL"); l && *l)
        gattlink::set_log_level_by_name(l);
    else
        gattlink::set_log_level(gattlink::Level::Warning);

    if (argc < 2)
    {
        print_usage();
        return exitc::bad_args;
    }

    // GATTLINK_CTL_SOCK (or the default), then --sock overrides it
    std::string sock = ipc::expand_user(constants::ctl_sock_path());

    std::vector<std::string> args;
    args.reserve(argc - 1);
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (args.empty() && (a == "--help" || a == "-h"))
        {
            print_usage();
            return exitc::ok;
        }
        if (args.empty() && a == "--sock")
        {
            if (i + 1 >= argc)
            {
                std::fprintf(stderr, "error: --sock needs a path\n");
                return exitc::bad_args;
            }
            sock = ipc::expand_user(argv[++i]);
        }
        else
        {
            args.push_back(std::move(a));
        }
    }
    if (args.empty())
    {
        print_usage();
        return exitc::bad_args;
    }

    auto sender = [&](const std::string &line) -> int { return send_one_line(sock, line); };
    return run_cmd(args[0], args, sender);
}
