#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstring>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "app/central_service.hpp"
#include "ctl/ipc.hpp"
#include "proto/payload.hpp"
#include "transport/bluez_adapter.hpp"
#include "transport/loopback_adapter.hpp"
#include "util/config.hpp"
#include "util/log.hpp"

static config::Config        g_cfg;
static app::CentralService  *g_svc = nullptr;

// Notification listener of the active subscription
static std::mutex                             g_sub_mu;
static std::shared_ptr<central::Subscription> g_sub;
static std::thread                            g_listener;

// ---------------- helpers ----------------
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

static std::string upper(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

// Split off the first `n` blank-separated words; `rest` keeps the remainder verbatim
// (leading blanks removed) so payload text keeps its inner spacing.
static bool split_words(const std::string &line, size_t n, std::vector<std::string> &words, std::string &rest)
{
    words.clear();
    size_t pos = 0;
    for (size_t i = 0; i < n; ++i)
    {
        pos = line.find_first_not_of(" \t", pos);
        if (pos == std::string::npos)
            return false;
        size_t end = line.find_first_of(" \t", pos);
        words.push_back(line.substr(pos, end == std::string::npos ? std::string::npos : end - pos));
        pos = end == std::string::npos ? line.size() : end;
    }
    pos  = line.find_first_not_of(" \t", pos);
    rest = pos == std::string::npos ? std::string() : line.substr(pos);
    return true;
}

static void print_result(const char *tag, const gatt::Status &st)
{
    if (st)
        LOG_SYSTEM("[%s] ok", tag);
    else
        LOG_SYSTEM("[%s] failed: %s", tag, st.to_string().c_str());
}

static void print_device(const gatt::Device &d)
{
    if (d.advertisement)
        LOG_SYSTEM("[DEVICE] %s %s rssi=%d", d.address.c_str(), d.display_name().c_str(),
                   (int)d.advertisement->rssi);
    else
        LOG_SYSTEM("[DEVICE] %s %s", d.address.c_str(), d.display_name().c_str());
}

static void print_value(const char *tag, const gatt::Bytes &v)
{
    LOG_SYSTEM("[%s] %s '%s'", tag, payload::to_hex(v).c_str(), payload::to_printable(v).c_str());
}

// Parse "<enc> <payload...>" into a Payload; logs and returns false on bad input.
static bool parse_payload(const std::string &tag, const std::string &enc, const std::string &text,
                          payload::Payload &out)
{
    payload::Encoding e;
    if (!payload::parse_encoding(enc, e))
    {
        LOG_WARN("[%s] unknown encoding '%s' (expect text|hex|raw)", tag.c_str(), enc.c_str());
        return false;
    }
    if (text.empty())
    {
        LOG_WARN("[%s] ignored (empty payload)", tag.c_str());
        return false;
    }
    out = payload::from_text(e, text);
    return true;
}

// ---------------- subscription listener ----------------
static void stop_listener()
{
    std::shared_ptr<central::Subscription> sub;
    {
        std::lock_guard<std::mutex> lk(g_sub_mu);
        sub.swap(g_sub);
    }
    if (sub)
        sub->unsubscribe();
    if (g_listener.joinable())
        g_listener.join();
}

static void start_listener(std::shared_ptr<central::Subscription> sub)
{
    stop_listener();
    {
        std::lock_guard<std::mutex> lk(g_sub_mu);
        g_sub = sub;
    }
    g_listener = std::thread([sub] {
        central::Notification n;
        while (sub->next(n))
            print_value("NOTIFY", n.value);
        LOG_SYSTEM("[NOTIFY] subscription on %s ended (%s)", sub->source().uuid.c_str(),
                   gatt::errc_name(sub->end_reason()));
    });
}

// ---------------- command handlers ----------------
static void cmd_scan(const std::vector<std::string> &w)
{
    auto window = std::chrono::duration_cast<std::chrono::milliseconds>(g_cfg.scan_window);
    if (w.size() > 1)
    {
        unsigned long secs = 0;
        if (!config::parse_ulong_in_range(w[1].c_str(), 1, 120, secs))
        {
            LOG_WARN("[SCAN] invalid window '%s' (expect 1..120 seconds)", w[1].c_str());
            return;
        }
        window = std::chrono::seconds(secs);
    }
    LOG_SYSTEM("[SCAN] scanning for %lld ms", (long long)window.count());
    std::vector<gatt::Device> found;
    auto                      st = g_svc->discover(window, {}, found);
    if (!st)
    {
        print_result("SCAN", st);
        return;
    }
    if (found.empty())
    {
        LOG_SYSTEM("[SCAN] no devices found");
        return;
    }
    for (const auto &d : found)
        print_device(d);
    LOG_SYSTEM("[SCAN] %zu device(s)", found.size());
}

static void print_probe(const central::ProbeReport &rep)
{
    for (const auto &d : rep.connectable)
        LOG_SYSTEM("[PROBE] connectable %s %s", d.address.c_str(), d.display_name().c_str());
    for (const auto &f : rep.failures)
        LOG_SYSTEM("[PROBE] failed %s: %s", f.device.address.c_str(), f.reason.to_string().c_str());
    LOG_SYSTEM("[PROBE] %zu connectable, %zu failed", rep.connectable.size(), rep.failures.size());
}

static void cmd_probe(const std::vector<std::string> &w)
{
    auto devices = g_svc->registry().snapshot();
    if (devices.empty())
    {
        LOG_SYSTEM("[PROBE] nothing to probe, run SCAN first");
        return;
    }
    if (w.size() < 2)
        return print_probe(g_svc->probe_connectable(devices));

    unsigned long ms = 0;
    if (!config::parse_ulong_in_range(w[1].c_str(), 100, 60000, ms))
    {
        LOG_WARN("[PROBE] invalid timeout '%s' (expect 100..60000 ms)", w[1].c_str());
        return;
    }
    central::ConnectabilityProber prober(g_svc->session().adapter());
    print_probe(prober.probe(devices, std::chrono::milliseconds(ms), {}, g_svc->options().parallel_probe));
}

static void cmd_connect(const std::vector<std::string> &w)
{
    if (w.size() != 2 || !is_valid_mac(w[1]))
    {
        LOG_WARN("[CONNECT] invalid MAC address: %s", w.size() > 1 ? w[1].c_str() : "(none)");
        return;
    }
    stop_listener();
    g_svc->close_session();  // one interactive session at a time
    const std::string mac = upper(w[1]);
    auto              st  = g_svc->open_session(mac);
    if (!st)
    {
        print_result("CONNECT", st);
        return;
    }
    LOG_SYSTEM("[CONNECT] connected to %s", mac.c_str());
    std::vector<gatt::Service> services;
    st = g_svc->resolve(services);
    if (!st)
    {
        print_result("SERVICES", st);
        return;
    }
    LOG_SYSTEM("[SERVICES] %zu service(s) resolved", services.size());
}

static void cmd_services()
{
    std::vector<gatt::Service> services;
    auto                       st = g_svc->resolve(services);
    if (!st)
    {
        print_result("SERVICES", st);
        return;
    }
    std::istringstream iss(app::CentralService::describe(services));
    std::string        line;
    while (std::getline(iss, line))
        LOG_SYSTEM("%s", line.c_str());
}

static void cmd_write(const std::string &line, bool with_response)
{
    const char *tag = with_response ? "WRITE" : "WRITENR";
    std::vector<std::string> w;
    std::string              text;
    if (!split_words(line, 3, w, text))
    {
        LOG_WARN("[%s] usage: %s <uuid|auto> <text|hex|raw> <payload>", tag, tag);
        return;
    }
    payload::Payload p = payload::Payload::text("");
    if (!parse_payload(tag, w[2], text, p))
        return;
    gatt::Characteristic used;
    auto                 st = g_svc->write(w[1], p, with_response, used);
    if (st)
        LOG_SYSTEM("[%s] wrote to %s", tag, used.uuid.c_str());
    else
        print_result(tag, st);
}

static void cmd_read(const std::vector<std::string> &w)
{
    const std::string    target = w.size() > 1 ? w[1] : "auto";
    gatt::Bytes          value;
    gatt::Characteristic used;
    auto                 st = g_svc->read(target, value, used);
    if (!st)
    {
        print_result("READ", st);
        return;
    }
    LOG_SYSTEM("[READ] %s", used.uuid.c_str());
    print_value("READ", value);
}

static void cmd_subscribe(const std::vector<std::string> &w)
{
    const std::string                      target = w.size() > 1 ? w[1] : "auto";
    std::shared_ptr<central::Subscription> sub;
    auto                                   st = g_svc->subscribe(target, sub);
    if (!st)
    {
        print_result("SUBSCRIBE", st);
        return;
    }
    LOG_SYSTEM("[SUBSCRIBE] listening on %s", sub->source().uuid.c_str());
    start_listener(std::move(sub));
}

static void cmd_sendread(const std::string &line)
{
    std::vector<std::string> w;
    std::string              text;
    if (!split_words(line, 3, w, text) || !is_valid_mac(w[1]))
    {
        LOG_WARN("[SENDREAD] usage: SENDREAD <mac> <text|hex|raw> <payload>");
        return;
    }
    payload::Payload p = payload::Payload::text("");
    if (!parse_payload("SENDREAD", w[2], text, p))
        return;
    app::SendReadResult res;
    auto                st = g_svc->send_and_read_back(upper(w[1]), p, res);
    if (!st)
    {
        print_result("SENDREAD", st);
        return;
    }
    LOG_SYSTEM("[SENDREAD] wrote to %s", res.written.uuid.c_str());
    if (res.read_back)
        print_value("SENDREAD", res.response);
    else
        LOG_SYSTEM("[SENDREAD] %s is not readable, nothing read back", res.written.uuid.c_str());
}

static void cmd_broadcast(const std::string &line)
{
    std::vector<std::string> w;
    std::string              text;
    if (!split_words(line, 2, w, text))
    {
        LOG_WARN("[BROADCAST] usage: BROADCAST <text|hex|raw> <payload>");
        return;
    }
    payload::Payload p = payload::Payload::text("");
    if (!parse_payload("BROADCAST", w[1], text, p))
        return;
    auto window = std::chrono::duration_cast<std::chrono::milliseconds>(g_cfg.scan_window);
    auto rep    = g_svc->broadcast(p, window);
    if (!rep.status)
    {
        print_result("BROADCAST", rep.status);
        return;
    }
    for (const auto &r : rep.results)
    {
        if (r.status)
            LOG_SYSTEM("[BROADCAST] %s ok (%s)", r.device.address.c_str(), r.written.uuid.c_str());
        else
            LOG_SYSTEM("[BROADCAST] %s failed: %s", r.device.address.c_str(),
                       r.status.to_string().c_str());
    }
    LOG_SYSTEM("[BROADCAST] %zu/%zu device(s) written", rep.succeeded, rep.results.size());
}

static void on_line(const std::string &line)
{
    std::vector<std::string> w;
    std::string              rest;
    if (!split_words(line, 1, w, rest))
        return;
    std::vector<std::string> args{w[0]};
    {
        std::istringstream iss(rest);
        std::string        a;
        while (iss >> a)
            args.push_back(a);
    }
    const std::string cmd = upper(w[0]);
    LOG_DEBUG("IPC command: %s", cmd.c_str());

    if (cmd == "QUIT")
    {
        LOG_INFO("Received QUIT command, exiting...");
        stop_listener();
        g_svc->close_session();
        return;
    }
    if (cmd == "SCAN")
        return cmd_scan(args);
    if (cmd == "PROBE")
        return cmd_probe(args);
    if (cmd == "DEVICES")
    {
        auto devices = g_svc->registry().snapshot();
        if (devices.empty())
            LOG_SYSTEM("[DEVICES] none");
        for (const auto &d : devices)
        {
            std::istringstream iss(app::CentralService::describe_device(d));
            std::string        l;
            while (std::getline(iss, l))
                LOG_SYSTEM("%s", l.c_str());
        }
        return;
    }
    if (cmd == "CONNECT")
        return cmd_connect(args);
    if (cmd == "SERVICES")
        return cmd_services();
    if (cmd == "WRITE")
        return cmd_write(line, true);
    if (cmd == "WRITENR")
        return cmd_write(line, false);
    if (cmd == "READ")
        return cmd_read(args);
    if (cmd == "SUBSCRIBE")
        return cmd_subscribe(args);
    if (cmd == "UNSUBSCRIBE")
    {
        stop_listener();
        g_svc->unsubscribe();
        LOG_SYSTEM("[UNSUBSCRIBE] ok");
        return;
    }
    if (cmd == "SENDREAD")
        return cmd_sendread(line);
    if (cmd == "BROADCAST")
        return cmd_broadcast(line);
    if (cmd == "DISCONNECT")
    {
        stop_listener();
        g_svc->close_session();
        LOG_SYSTEM("[DISCONNECT] session closed");
        return;
    }
    LOG_WARN("Unknown command: %s", w[0].c_str());
}

int main()
{
    g_cfg = config::Config::from_env();
    gattlink::set_log_level_by_name(g_cfg.log_level.c_str());

    LOG_SYSTEM("Config: transport=%s adapter=%s max_connections=%zu sock=%s",
               config::transport_name(g_cfg.transport), g_cfg.adapter.c_str(), g_cfg.max_connections,
               g_cfg.ctl_sock.c_str());

    std::unique_ptr<transport::IRadioAdapter> adapter;
    if (g_cfg.transport == config::TransportKind::Bluez)
    {
        transport::BluezConfig bc;
        bc.adapter         = g_cfg.adapter;
        bc.max_connections = g_cfg.max_connections;
        auto bluez         = std::make_unique<transport::BluezAdapter>(bc);
        if (!bluez->start())
        {
            LOG_ERROR("BlueZ adapter %s failed to start", g_cfg.adapter.c_str());
            return 1;
        }
        adapter = std::move(bluez);
    }
    else
    {
        adapter = transport::LoopbackAdapter::with_demo_peripherals(g_cfg.max_connections);
    }

    app::ServiceOptions opts;
    opts.connect_timeout = g_cfg.connect_timeout;
    opts.probe_timeout   = g_cfg.probe_timeout;
    opts.op_timeout      = g_cfg.op_timeout;
    opts.parallel_probe  = g_cfg.max_connections > 1;

    int rc = 0;
    {
        app::CentralService svc(*adapter, opts);
        g_svc = &svc;
        if (!ipc::start_server(g_cfg.ctl_sock, &on_line))
        {
            LOG_ERROR("start_server failed");
            rc = 1;
        }
        stop_listener();
        g_svc = nullptr;
    }
    return rc;
}
