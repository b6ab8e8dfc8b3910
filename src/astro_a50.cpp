#include "devices/astro_a50.hpp"
#include "devices/status_decoder.hpp"

namespace hyperheadset {

AstroA50::AstroA50(HidBackend& backend, const ClientConfig& config, Sleeper sleeper)
    : config_(config), engine_(backend, config, std::move(sleeper))
{
}

void AstroA50::set_log_callback(LogCallback cb)
{
    log_callback_ = cb;
    engine_.set_log_callback(std::move(cb));
}

Result<BatteryStatus> AstroA50::get_battery_status()
{
    std::optional<Error> last_cause;

    for (int attempt = 0; attempt < config_.battery_retries; ++attempt) {
        auto payload = engine_.query(Command::BatteryStatus);
        if (!payload.ok()) {
            if (payload.error() == Error::DEVICE_NOT_FOUND) {
                return Result<BatteryStatus>::failure(payload.failure_info());
            }
            last_cause = payload.error();
            log("battery read " + std::to_string(attempt + 1) + ": " + payload.failure_info().message);
        } else {
            auto status = decode::battery(payload.value());
            if (status.ok() && decode::is_sane(status.value())) {
                last_good_battery_ = status.value();
                return status;
            }
            last_cause = status.ok() ? Error::INVALID_RESPONSE : status.error();
            log("battery read " + std::to_string(attempt + 1) + ": implausible value discarded");
        }

        engine_.sleep(std::chrono::milliseconds(Protocol::BATTERY_RETRY_PAUSE_MS));
    }

    if (last_good_battery_) {
        log("battery: using last good reading");
        return Result<BatteryStatus>::success(*last_good_battery_);
    }

    return Result<BatteryStatus>::failure(
        Failure{Error::NO_SANE_BATTERY, "Could not read a sane battery value", last_cause, {}});
}

Result<HeadsetStatus> AstroA50::get_headset_status()
{
    auto payload = engine_.query(Command::HeadsetStatus);
    if (!payload.ok()) {
        return Result<HeadsetStatus>::failure(payload.failure_info());
    }
    return decode::headset(payload.value());
}

Result<int> AstroA50::get_slider_value(SliderType slider, bool saved)
{
    auto payload = engine_.query(Command::SliderValue, {static_cast<uint8_t>(slider)});
    if (!payload.ok()) {
        return Result<int>::failure(payload.failure_info());
    }
    return decode::slider(payload.value(), slider, saved);
}

Result<int> AstroA50::get_active_eq_preset()
{
    return query_value(Command::ActiveEqPreset);
}

Result<int> AstroA50::get_balance()
{
    return query_value(Command::Balance);
}

Result<int> AstroA50::get_default_balance(bool saved)
{
    return query_value(Command::DefaultBalance, {static_cast<uint8_t>(saved ? 1 : 0)});
}

Result<int> AstroA50::get_alert_volume(bool saved)
{
    return query_value(Command::AlertVolume, {static_cast<uint8_t>(saved ? 1 : 0)});
}

Result<int> AstroA50::get_mic_eq(bool saved)
{
    return query_value(Command::MicEq, {static_cast<uint8_t>(saved ? 1 : 0)});
}

Result<int> AstroA50::get_noise_gate_mode(bool saved)
{
    // Both modes come back in one answer, the request carries no selector.
    auto payload = engine_.query(Command::NoiseGateMode);
    if (!payload.ok()) {
        return Result<int>::failure(payload.failure_info());
    }
    return decode::noise_gate(payload.value(), saved);
}

Result<Snapshot> AstroA50::get_snapshot(const SnapshotOptions& options)
{
    Snapshot snapshot;

    if (options.timestamp) {
        snapshot.timestamp = std::chrono::system_clock::now();
    }

    if (options.battery) {
        auto battery = get_battery_status();
        if (!battery.ok()) {
            return Result<Snapshot>::failure(battery.failure_info());
        }
        snapshot.battery = battery.value();
    }

    if (options.headset) {
        auto headset = get_headset_status();
        if (!headset.ok()) {
            return Result<Snapshot>::failure(headset.failure_info());
        }
        snapshot.headset = headset.value();
    }

    if (options.sidetone) {
        auto active = get_slider_value(SliderType::Sidetone, false);
        if (!active.ok()) {
            return Result<Snapshot>::failure(active.failure_info());
        }
        auto saved = get_slider_value(SliderType::Sidetone, true);
        if (!saved.ok()) {
            return Result<Snapshot>::failure(saved.failure_info());
        }
        snapshot.sidetone = SidetoneLevels{active.value(), saved.value()};
    }

    return Result<Snapshot>::success(std::move(snapshot));
}

Result<int> AstroA50::query_value(Command command, const std::vector<uint8_t>& payload)
{
    auto response = engine_.query(command, payload);
    if (!response.ok()) {
        return Result<int>::failure(response.failure_info());
    }
    return decode::single_byte(response.value(), command);
}

void AstroA50::log(const std::string& msg)
{
    if (log_callback_) {
        log_callback_(msg);
    }
}

} // namespace hyperheadset
