#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hyperheadset {

std::string bytesToHex(const std::vector<uint8_t>& data);
std::optional<unsigned long> parseInteger(std::string_view text);

} // namespace hyperheadset
