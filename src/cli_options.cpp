#include "cli/options.hpp"
#include "common/helpers.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>
#include <sstream>

namespace hyperheadset::cli {

namespace {

Result<Options> usage_error(const std::string& msg)
{
    return Result<Options>::failure(Failure{Error::INVALID_ARGUMENT, msg, std::nullopt, {}});
}

std::string trim_lower(const std::string& item)
{
    auto first = item.find_first_not_of(' ');
    if (first == std::string::npos) {
        return "";
    }
    std::string out = item.substr(first, item.find_last_not_of(' ') - first + 1);
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

} // anonymous namespace

std::string usage()
{
    return "usage: hyperheadset [--version] [--device-list] [--vendor-id N]\n"
           "                    [--battery] [--headset] [--sidetone] [--fields a,b]\n"
           "                    [--json] [--p] [--csv] [--no-timestamp]\n"
           "                    [--watch] [--changes-only] [--interval S] [--count N] [--verbose]\n";
}

Result<Options> parse_args(const std::vector<std::string>& args)
{
    Options opts;
    bool battery = false;
    bool headset = false;
    bool sidetone = false;
    bool timestamp = true;
    std::string fields;
    double interval_sec = 2.0;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        auto needs_value = [&]() { return i + 1 >= args.size(); };

        if (arg == "--version") opts.version = true;
        else if (arg == "-h" || arg == "--help") opts.help = true;
        else if (arg == "--device-list") opts.device_list = true;
        else if (arg == "--verbose") opts.verbose = true;
        else if (arg == "--battery") battery = true;
        else if (arg == "--headset") headset = true;
        else if (arg == "--sidetone") sidetone = true;
        else if (arg == "--json") opts.json = true;
        else if (arg == "--p") opts.pretty = true;
        else if (arg == "--csv") opts.csv = true;
        else if (arg == "--no-timestamp") timestamp = false;
        else if (arg == "--watch") opts.watch = true;
        else if (arg == "--changes-only") opts.changes_only = true;
        else if (arg == "--fields" || arg == "--vendor-id" || arg == "--interval" || arg == "--count") {
            if (needs_value()) {
                return usage_error(arg + " expects a value");
            }
            const std::string& value = args[++i];

            if (arg == "--fields") {
                fields = value;
            } else if (arg == "--vendor-id") {
                auto id = parseInteger(value);
                if (!id || *id > 0xFFFF) {
                    return usage_error("invalid --vendor-id " + value);
                }
                opts.vendor_id = static_cast<uint16_t>(*id);
            } else if (arg == "--interval") {
                std::istringstream iss(value);
                if (!(iss >> interval_sec) || !iss.eof()) {
                    return usage_error("invalid --interval " + value);
                }
            } else {
                auto count = parseInteger(value);
                if (!count) {
                    return usage_error("invalid --count " + value);
                }
                opts.count = *count;
            }
        }
        else {
            return usage_error("unknown argument " + arg);
        }
    }

    if (opts.version || opts.help || opts.device_list) {
        return Result<Options>::success(opts);
    }

    if (!std::isfinite(interval_sec) || interval_sec <= 0) {
        return usage_error("--interval must be > 0");
    }
    interval_sec = std::max(interval_sec, MIN_INTERVAL_SEC);
    opts.interval = std::chrono::milliseconds(static_cast<long>(interval_sec * 1000));

    // --fields replaces the individual flags.
    if (fields.find_first_not_of(" ,") != std::string::npos) {
        static const std::set<std::string> allowed = {"battery", "headset", "sidetone"};
        std::set<std::string> requested;
        std::set<std::string> unknown;

        std::istringstream iss(fields);
        std::string item;
        while (std::getline(iss, item, ',')) {
            item = trim_lower(item);
            if (item.empty()) continue;
            if (allowed.count(item)) requested.insert(item);
            else unknown.insert(item);
        }

        if (!unknown.empty()) {
            std::string msg = "unknown fields:";
            for (const auto& f : unknown) msg += " " + f;
            return usage_error(msg);
        }

        battery = requested.count("battery") > 0;
        headset = requested.count("headset") > 0;
        sidetone = requested.count("sidetone") > 0;
    } else if (!(battery || headset || sidetone)) {
        battery = true;
        headset = true;
    }

    opts.fields.battery = battery;
    opts.fields.headset = headset;
    opts.fields.sidetone = sidetone;
    opts.fields.timestamp = timestamp;

    if (opts.csv) {
        opts.json = false;
    }

    return Result<Options>::success(opts);
}

int exit_status(const Result<Options>& parsed)
{
    return parsed.ok() ? 0 : EXIT_USAGE;
}

} // namespace hyperheadset::cli
