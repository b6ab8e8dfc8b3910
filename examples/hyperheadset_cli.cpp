#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <chrono>
#include <thread>
#include <signal.h>

#include "cli/options.hpp"
#include "devices/astro_a50.hpp"
#include "output/snapshot_format.hpp"
#include "transport/hidapi_device.hpp"

using namespace hyperheadset;

namespace {

volatile sig_atomic_t running = 1;
void sig_handler(int) { running = 0; }

int print_device_list(AstroA50& client, uint16_t vendor_id)
{
    auto devices = client.list_devices();

    std::cout << std::uppercase << std::hex << std::setfill('0');
    if (devices.empty()) {
        std::cout << "No HID devices found for vendor_id=0x" << std::setw(4) << vendor_id << "\n";
        return 1;
    }

    for (size_t i = 0; i < devices.size(); ++i) {
        const auto& d = devices[i];
        std::cout << std::dec << "[" << (i + 1) << "] " << std::hex
                  << "vendor=0x" << std::setw(4) << vendor_id
                  << " product=0x" << std::setw(4) << d.product_id
                  << " mfg='" << d.manufacturer << "'"
                  << " product='" << d.product << "'"
                  << " path='" << d.path << "'\n";
    }
    std::cout << std::dec;
    return 0;
}

} // anonymous namespace

int main(int argc, char** argv)
{
    auto parsed = cli::parse_args(std::vector<std::string>(argv + 1, argv + argc));
    if (!parsed.ok()) {
        std::cerr << "hyperheadset: " << parsed.failure_info().message << "\n" << cli::usage();
        return cli::exit_status(parsed);
    }
    const cli::Options& opts = parsed.value();

    if (opts.help) {
        std::cout << cli::usage();
        return 0;
    }

    if (opts.version) {
        std::cout << HYPERHEADSET_VERSION << "\n";
        return 0;
    }

    HidapiBackend backend;
    if (!backend.is_initialized()) {
        std::cerr << "hyperheadset: hidapi initialisation failed\n";
        return 1;
    }

    ClientConfig config;
    config.vendor_id = opts.vendor_id;
    AstroA50 client(backend, config);

    if (opts.verbose) {
        client.set_log_callback([](const std::string& msg) {
            std::cerr << "[hyperheadset] " << msg << "\n";
        });
    }

    if (opts.device_list) {
        return print_device_list(client, opts.vendor_id);
    }

    const bool as_csv = opts.csv;
    const auto interval = opts.interval;

    if (as_csv) {
        std::cout << format::csv_header() << std::endl;
    }

    std::string last_signature;
    bool have_signature = false;

    auto emit_once = [&]() -> Result<bool> {
        auto snapshot = client.get_snapshot(opts.fields);
        if (!snapshot.ok()) {
            return Result<bool>::failure(snapshot.failure_info());
        }

        if (opts.watch && opts.changes_only) {
            auto sig = format::signature(snapshot.value());
            if (have_signature && sig == last_signature) {
                return Result<bool>::success(false);
            }
            last_signature = sig;
            have_signature = true;
        }

        if (as_csv) {
            std::cout << format::csv_row(snapshot.value()) << std::endl;
        } else if (opts.json) {
            std::cout << format::json(snapshot.value(), opts.pretty) << std::endl;
        } else {
            std::cout << format::human(snapshot.value()) << std::flush;
        }
        return Result<bool>::success(true);
    };

    auto report = [](const Failure& failure) {
        std::cerr << "hyperheadset: " << (failure.message.empty() ? to_string(failure.code) : failure.message);
        if (failure.cause) {
            std::cerr << " (last error: " << to_string(*failure.cause) << ")";
        }
        std::cerr << "\n";
        return 1;
    };

    if (!opts.watch) {
        auto r = emit_once();
        return r.ok() ? 0 : report(r.failure_info());
    }

    signal(SIGINT, sig_handler);

    unsigned long emitted = 0;
    while (running) {
        auto r = emit_once();
        if (!r.ok()) {
            return report(r.failure_info());
        }
        if (r.value()) {
            ++emitted;
            if (opts.count && emitted >= opts.count) {
                return 0;
            }
        }

        // Sleep in slices so Ctrl+C is noticed promptly.
        auto deadline = std::chrono::steady_clock::now() + interval;
        while (running && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }

    if (!as_csv) {
        std::cout << "\nStopped." << std::endl;
    }
    return 0;
}
