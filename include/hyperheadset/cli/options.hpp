#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "common/protocol.hpp"
#include "common/response.hpp"
#include "common/types.hpp"

namespace hyperheadset::cli {

constexpr int EXIT_USAGE = 2;
constexpr double MIN_INTERVAL_SEC = 0.25;

struct Options
{
    bool version = false;
    bool help = false;
    bool device_list = false;
    bool verbose = false;
    uint16_t vendor_id = Protocol::DEFAULT_VENDOR_ID;

    SnapshotOptions fields;

    // csv wins over json
    bool json = false;
    bool pretty = false;
    bool csv = false;

    bool watch = false;
    bool changes_only = false;
    std::chrono::milliseconds interval{2000};
    unsigned long count = 0;
};

// Parses argv[1..] and resolves field selection, output mode and interval.
Result<Options> parse_args(const std::vector<std::string>& args);

// Process exit status for a parse result: 0 when usable, EXIT_USAGE otherwise.
int exit_status(const Result<Options>& parsed);

std::string usage();

} // namespace hyperheadset::cli
