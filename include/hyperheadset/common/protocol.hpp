#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace hyperheadset {

namespace Protocol
{
    // Astro A50 base station
    constexpr uint16_t DEFAULT_VENDOR_ID = 0x9886;

    // Frame bytes
    constexpr uint8_t FRAME_MARKER = 0x02;
    constexpr uint8_t STATUS_OK = 0x02;
    constexpr uint8_t REPORT_ID = 0x00;
    constexpr size_t HEADER_SIZE = 3;

    // Report lengths
    constexpr int REPORT_LENGTH = 64;
    constexpr int REPORT_LENGTH_WITH_ID = 65;

    // Timings (ms)
    constexpr int FEATURE_SETTLE_MS = 30;
    constexpr int INTERRUPT_TIMEOUT_MS = 250;
    constexpr int RETRY_BACKOFF_MS = 60;
    constexpr int COMMAND_DELAY_MS = 80;
    constexpr int BATTERY_RETRY_PAUSE_MS = 50;

    constexpr int DEFAULT_RETRIES = 4;
    constexpr int BATTERY_RETRIES = 6;

    // Battery byte
    constexpr uint8_t BATTERY_CHARGING_BIT = 0x80;
    constexpr uint8_t BATTERY_PERCENT_MASK = 0x7F;

    // Headset byte
    constexpr uint8_t HEADSET_DOCKED_BIT = 0x01;
    constexpr uint8_t HEADSET_ON_BIT = 0x02;
}

enum class Command : uint8_t
{
    HeadsetStatus    = 0x54,
    SliderValue      = 0x68,
    NoiseGateMode    = 0x6A,
    ActiveEqPreset   = 0x6C,
    Balance          = 0x72,
    DefaultBalance   = 0x77,
    AlertVolume      = 0x7A,
    MicEq            = 0x7B,
    BatteryStatus    = 0x7C
};

enum class SliderType : uint8_t
{
    StreamMic  = 0x00,
    StreamChat = 0x01,
    StreamGame = 0x02,
    StreamAux  = 0x03,
    Mic        = 0x04,
    Sidetone   = 0x05
};

std::string_view to_string(Command command);
std::string_view to_string(SliderType slider);

} // namespace hyperheadset
