#include "common/protocol.hpp"

namespace hyperheadset {

std::string_view to_string(Command command)
{
    switch (command) {
        case Command::HeadsetStatus: return "headset status";
        case Command::SliderValue: return "slider value";
        case Command::NoiseGateMode: return "noise gate mode";
        case Command::ActiveEqPreset: return "active EQ preset";
        case Command::Balance: return "balance";
        case Command::DefaultBalance: return "default balance";
        case Command::AlertVolume: return "alert volume";
        case Command::MicEq: return "mic EQ";
        case Command::BatteryStatus: return "battery status";
    }
    return "unknown";
}

std::string_view to_string(SliderType slider)
{
    switch (slider) {
        case SliderType::StreamMic: return "stream_mic";
        case SliderType::StreamChat: return "stream_chat";
        case SliderType::StreamGame: return "stream_game";
        case SliderType::StreamAux: return "stream_aux";
        case SliderType::Mic: return "mic";
        case SliderType::Sidetone: return "sidetone";
    }
    return "unknown";
}

} // namespace hyperheadset
