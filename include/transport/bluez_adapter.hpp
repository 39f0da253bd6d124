#pragma once
#include <cstddef>
#include <memory>
#include <string>

#include "transport/radio_adapter.hpp"

namespace transport
{

struct BluezConfig
{
    std::string adapter         = "hci0";
    std::size_t max_connections = 1;
};

// IRadioAdapter over BlueZ (org.bluez on the system bus, via sd-bus).
// A bus thread processes signals and async replies; link-loss and notification callbacks
// are dispatched from that thread after the bus lock is released.
class BluezAdapter final : public IRadioAdapter
{
  public:
    explicit BluezAdapter(BluezConfig cfg);
    ~BluezAdapter() override;

    // Connects the system bus, installs signal matches and spawns the bus thread.
    bool start();
    void stop();
    bool is_running() const noexcept;

    gatt::Status scan(std::chrono::milliseconds window, std::unique_ptr<IScanStream> &out) override;
    gatt::Status connect(const std::string        &address,
                         std::chrono::milliseconds timeout,
                         const util::CancelToken  &cancel,
                         OnLinkLost                on_link_lost,
                         ConnectionHandle         &out) override;
    void         disconnect(ConnectionHandle h) override;
    gatt::Status resolve_services(ConnectionHandle            h,
                                  std::chrono::milliseconds   timeout,
                                  std::vector<gatt::Service> &out) override;
    gatt::Status read_characteristic(ConnectionHandle            h,
                                     const gatt::Characteristic &c,
                                     std::chrono::milliseconds   timeout,
                                     const util::CancelToken    &cancel,
                                     gatt::Bytes                &out) override;
    gatt::Status write_characteristic(ConnectionHandle            h,
                                      const gatt::Characteristic &c,
                                      const gatt::Bytes          &data,
                                      bool                        with_response,
                                      std::chrono::milliseconds   timeout,
                                      const util::CancelToken    &cancel) override;
    gatt::Status subscribe(ConnectionHandle            h,
                           const gatt::Characteristic &c,
                           OnNotify                    on_notify,
                           SubscriptionHandle         &out) override;
    void         unsubscribe(SubscriptionHandle s) override;
    std::size_t  max_connections() const override;
    std::string  name() const override { return "bluez"; }

    const BluezConfig &config() const { return cfg_; }

    struct Impl;

  private:
    BluezConfig           cfg_;
    std::unique_ptr<Impl> impl_;
};

}  // namespace transport
