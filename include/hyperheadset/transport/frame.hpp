#pragma once

#include <optional>
#include <stdint.h>
#include <vector>

#include "common/protocol.hpp"

namespace hyperheadset {

// [0x02, command, length, payload..., zero padding]
class HeadsetFrame
{
public:
    static std::vector<uint8_t> build_request(uint8_t command, const std::vector<uint8_t>& payload, int report_length);
    static std::vector<uint8_t> normalize(const std::vector<uint8_t>& raw);
    static std::optional<std::vector<uint8_t>> extract_payload(const std::vector<uint8_t>& frame);
};

} // namespace hyperheadset
