#pragma once

#include <chrono>
#include <cstdint>
#include <vector>

#include "common/protocol.hpp"

namespace hyperheadset {

struct ClientConfig
{
    uint16_t vendor_id = Protocol::DEFAULT_VENDOR_ID;
    std::vector<int> report_lengths{Protocol::REPORT_LENGTH, Protocol::REPORT_LENGTH_WITH_ID};
    std::chrono::milliseconds command_delay{Protocol::COMMAND_DELAY_MS};
    int retries = Protocol::DEFAULT_RETRIES;
    int battery_retries = Protocol::BATTERY_RETRIES;
};

} // namespace hyperheadset
