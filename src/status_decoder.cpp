#include "devices/status_decoder.hpp"
#include "common/helpers.hpp"
#include <string>

namespace hyperheadset::decode {

namespace {

template<typename T>
Result<T> unexpected(Command command, const std::vector<uint8_t>& payload)
{
    Failure failure;
    failure.code = Error::UNEXPECTED_PAYLOAD;
    failure.message = "Unexpected " + std::string(to_string(command)) + " payload: [" + bytesToHex(payload) + "]";
    failure.raw = payload;
    return Result<T>::failure(std::move(failure));
}

} // anonymous namespace

size_t minimum_length(Command command)
{
    switch (command) {
        case Command::SliderValue: return 4;
        case Command::NoiseGateMode: return 3;
        case Command::HeadsetStatus:
        case Command::ActiveEqPreset:
        case Command::Balance:
        case Command::DefaultBalance:
        case Command::AlertVolume:
        case Command::MicEq:
        case Command::BatteryStatus:
            return 1;
    }
    return 1;
}

Result<BatteryStatus> battery(const std::vector<uint8_t>& payload)
{
    if (payload.size() < minimum_length(Command::BatteryStatus)) {
        return unexpected<BatteryStatus>(Command::BatteryStatus, payload);
    }

    BatteryStatus status;
    status.is_charging = (payload[0] & Protocol::BATTERY_CHARGING_BIT) != 0;
    status.charge_percent = payload[0] & Protocol::BATTERY_PERCENT_MASK;
    return Result<BatteryStatus>::success(status);
}

Result<HeadsetStatus> headset(const std::vector<uint8_t>& payload)
{
    if (payload.size() < minimum_length(Command::HeadsetStatus)) {
        return unexpected<HeadsetStatus>(Command::HeadsetStatus, payload);
    }

    HeadsetStatus status;
    status.is_docked = (payload[0] & Protocol::HEADSET_DOCKED_BIT) != 0;
    status.is_on = (payload[0] & Protocol::HEADSET_ON_BIT) != 0;
    return Result<HeadsetStatus>::success(status);
}

Result<int> slider(const std::vector<uint8_t>& payload, SliderType slider, bool saved)
{
    if (payload.size() < minimum_length(Command::SliderValue)
        || payload[0] != static_cast<uint8_t>(Command::SliderValue)
        || payload[1] != static_cast<uint8_t>(slider)) {
        return unexpected<int>(Command::SliderValue, payload);
    }

    return Result<int>::success(payload[2 + (saved ? 1 : 0)]);
}

Result<int> noise_gate(const std::vector<uint8_t>& payload, bool saved)
{
    if (payload.size() < minimum_length(Command::NoiseGateMode)
        || payload[0] != static_cast<uint8_t>(Command::NoiseGateMode)) {
        return unexpected<int>(Command::NoiseGateMode, payload);
    }

    return Result<int>::success(payload[1 + (saved ? 1 : 0)]);
}

Result<int> single_byte(const std::vector<uint8_t>& payload, Command command)
{
    if (payload.size() < minimum_length(command)) {
        return unexpected<int>(command, payload);
    }
    return Result<int>::success(payload[0]);
}

bool is_sane(const BatteryStatus& status)
{
    return status.charge_percent >= 0 && status.charge_percent <= 100;
}

} // namespace hyperheadset::decode
