#pragma once

#include <string>

#include "common/response.hpp"

namespace hyperheadset::format {

std::string human(const Snapshot& snapshot);

// Keys sorted; pretty uses a two-space indent.
std::string json(const Snapshot& snapshot, bool pretty = false);

std::string csv_header();
std::string csv_row(const Snapshot& snapshot);

// Compact JSON without the timestamp; equal signatures mean nothing changed.
std::string signature(const Snapshot& snapshot);

} // namespace hyperheadset::format
