#pragma once

#include <cstddef>
#include <stdint.h>
#include <vector>

#include "common/protocol.hpp"
#include "common/response.hpp"
#include "common/types.hpp"

namespace hyperheadset::decode {

// Shortest payload each command can be decoded from.
size_t minimum_length(Command command);

Result<BatteryStatus> battery(const std::vector<uint8_t>& payload);
Result<HeadsetStatus> headset(const std::vector<uint8_t>& payload);

// [0x68, slider, active, saved]
Result<int> slider(const std::vector<uint8_t>& payload, SliderType slider, bool saved);

// [0x6A, active, saved]
Result<int> noise_gate(const std::vector<uint8_t>& payload, bool saved);

// EQ preset, balance, default balance, alert volume, mic EQ: byte 0.
Result<int> single_byte(const std::vector<uint8_t>& payload, Command command);

bool is_sane(const BatteryStatus& status);

} // namespace hyperheadset::decode
