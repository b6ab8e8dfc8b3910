#pragma once

#include <optional>
#include <vector>

#include "common/config.hpp"
#include "common/protocol.hpp"
#include "common/response.hpp"
#include "common/types.hpp"
#include "devices/query_engine.hpp"
#include "transport/hid_device.hpp"

namespace hyperheadset {

class AstroA50
{
public:
    explicit AstroA50(HidBackend& backend, const ClientConfig& config = {}, Sleeper sleeper = default_sleeper());

    AstroA50(const AstroA50&) = delete;
    AstroA50& operator=(const AstroA50&) = delete;

    // Falls back to the last good reading when the device keeps answering garbage.
    Result<BatteryStatus> get_battery_status();
    Result<HeadsetStatus> get_headset_status();
    Result<int> get_slider_value(SliderType slider, bool saved = false);
    Result<int> get_active_eq_preset();
    Result<int> get_balance();
    Result<int> get_default_balance(bool saved = false);
    Result<int> get_alert_volume(bool saved = false);
    Result<int> get_mic_eq(bool saved = false);
    Result<int> get_noise_gate_mode(bool saved = false);

    Result<Snapshot> get_snapshot(const SnapshotOptions& options = {});

    std::vector<HidDeviceInfo> list_devices() { return engine_.list_devices(); }
    const std::optional<BatteryStatus>& last_good_battery() const { return last_good_battery_; }
    const ClientConfig& config() const { return config_; }

    void set_log_callback(LogCallback cb);

private:
    ClientConfig config_;
    QueryEngine engine_;
    std::optional<BatteryStatus> last_good_battery_;
    LogCallback log_callback_;

    Result<int> query_value(Command command, const std::vector<uint8_t>& payload = {});
    void log(const std::string& msg);
};

} // namespace hyperheadset
