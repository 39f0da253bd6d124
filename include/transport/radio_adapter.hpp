#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "gatt/status.hpp"
#include "gatt/types.hpp"
#include "util/cancel.hpp"

namespace transport
{

using ConnectionHandle   = std::uint64_t;
using SubscriptionHandle = std::uint64_t;

using OnLinkLost = std::function<void()>;
using OnNotify   = std::function<void(const gatt::Bytes &)>;

// One discovery window. Each IRadioAdapter::scan() call returns an independent stream.
struct IScanStream
{
    // Blocks until the next sighting. Returns false when the window has elapsed,
    // the stream was stopped, or the token was raised.
    virtual bool next(gatt::Device &out, const util::CancelToken &cancel) = 0;
    virtual void stop()                                                  = 0;
    virtual ~IScanStream() = default;
};

// Narrow view of the host BLE stack used by the central core.
// Callbacks (OnLinkLost / OnNotify) never run while the adapter holds its own locks,
// and may run on an adapter-owned thread.
struct IRadioAdapter
{
    virtual gatt::Status scan(std::chrono::milliseconds window, std::unique_ptr<IScanStream> &out) = 0;

    // Fails with ConnectTimeout / ConnectRefused / AdapterError /
    // AdapterCapacityExceeded / Cancelled. No connection is held on failure.
    virtual gatt::Status connect(const std::string        &address,
                                 std::chrono::milliseconds timeout,
                                 const util::CancelToken  &cancel,
                                 OnLinkLost                on_link_lost,
                                 ConnectionHandle         &out) = 0;

    // Idempotent, unknown handles are ignored.
    virtual void disconnect(ConnectionHandle h) = 0;

    virtual gatt::Status resolve_services(ConnectionHandle            h,
                                          std::chrono::milliseconds   timeout,
                                          std::vector<gatt::Service> &out) = 0;

    virtual gatt::Status read_characteristic(ConnectionHandle            h,
                                             const gatt::Characteristic &c,
                                             std::chrono::milliseconds   timeout,
                                             const util::CancelToken    &cancel,
                                             gatt::Bytes                &out) = 0;

    virtual gatt::Status write_characteristic(ConnectionHandle            h,
                                              const gatt::Characteristic &c,
                                              const gatt::Bytes          &data,
                                              bool                        with_response,
                                              std::chrono::milliseconds   timeout,
                                              const util::CancelToken    &cancel) = 0;

    virtual gatt::Status subscribe(ConnectionHandle            h,
                                   const gatt::Characteristic &c,
                                   OnNotify                    on_notify,
                                   SubscriptionHandle         &out) = 0;

    // Idempotent, unknown handles are ignored.
    virtual void unsubscribe(SubscriptionHandle s) = 0;

    // Simultaneous outbound connections this adapter supports (>= 1).
    virtual std::size_t max_connections() const = 0;
    virtual std::string name() const { return ""; }
    virtual ~IRadioAdapter() = default;
};

}  // namespace transport
