#pragma once
#include <string>
#include <utility>

namespace gatt
{

enum class Errc
{
    Ok = 0,
    DiscoveryUnavailable,     // scan could not start (adapter off / missing)
    ConnectTimeout,           // no connection before the deadline
    ConnectRefused,           // peer or stack refused the connection
    AdapterError,             // host stack failure not attributable to the peer
    AdapterCapacityExceeded,  // all simultaneous-connection slots in use
    InvalidState,             // call not permitted in the current session state
    SessionBusy,              // an exchange is already in flight
    NoCapableCharacteristic,  // selector found no candidate
    UnknownCharacteristic,    // characteristic not part of resolved services
    MalformedPayload,         // caller error, nothing sent
    WriteRejected,            // peer declined the write
    ReadError,                // peer or stack failed the read
    PeerRejected,             // peer-level GATT error (e.g. subscribe refused)
    Timeout,                  // operation round trip timed out, link kept
    LinkLost,                 // link dropped, session is Disconnected
    Cancelled                 // caller raised the cancellation signal
};

inline const char *errc_name(Errc c)
{
    switch (c)
    {
        case Errc::Ok:
            return "Ok";
        case Errc::DiscoveryUnavailable:
            return "DiscoveryUnavailable";
        case Errc::ConnectTimeout:
            return "ConnectTimeout";
        case Errc::ConnectRefused:
            return "ConnectRefused";
        case Errc::AdapterError:
            return "AdapterError";
        case Errc::AdapterCapacityExceeded:
            return "AdapterCapacityExceeded";
        case Errc::InvalidState:
            return "InvalidState";
        case Errc::SessionBusy:
            return "SessionBusy";
        case Errc::NoCapableCharacteristic:
            return "NoCapableCharacteristic";
        case Errc::UnknownCharacteristic:
            return "UnknownCharacteristic";
        case Errc::MalformedPayload:
            return "MalformedPayload";
        case Errc::WriteRejected:
            return "WriteRejected";
        case Errc::ReadError:
            return "ReadError";
        case Errc::PeerRejected:
            return "PeerRejected";
        case Errc::Timeout:
            return "Timeout";
        case Errc::LinkLost:
            return "LinkLost";
        case Errc::Cancelled:
            return "Cancelled";
    }
    return "?";
}

// Result of every fallible core operation: one typed code plus a detail string.
struct Status
{
    Errc        code{Errc::Ok};
    std::string detail;

    Status() = default;
    Status(Errc c, std::string d) : code(c), detail(std::move(d)) {}

    static Status Ok() { return Status{}; }

    bool     ok() const noexcept { return code == Errc::Ok; }
    explicit operator bool() const noexcept { return ok(); }

    std::string to_string() const
    {
        if (ok())
            return "Ok";
        std::string s = errc_name(code);
        if (!detail.empty())
        {
            s += ": ";
            s += detail;
        }
        return s;
    }
};

}  // namespace gatt
