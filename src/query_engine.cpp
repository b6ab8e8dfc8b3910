#include "devices/query_engine.hpp"
#include "transport/frame.hpp"
#include <iomanip>
#include <sstream>

namespace hyperheadset {

namespace {

std::string command_hex(Command command)
{
    std::ostringstream oss;
    oss << "0x" << std::uppercase << std::hex << std::setw(2) << std::setfill('0')
        << static_cast<int>(command);
    return oss.str();
}

} // anonymous namespace

QueryEngine::QueryEngine(HidBackend& backend, const ClientConfig& config, Sleeper sleeper)
    : backend_(backend),
      config_(config),
      sleeper_(std::move(sleeper)),
      channel_(backend, config.report_lengths, sleeper_)
{
}

void QueryEngine::set_log_callback(LogCallback cb)
{
    log_callback_ = cb;
    channel_.set_log_callback(std::move(cb));
}

std::vector<HidDeviceInfo> QueryEngine::list_devices()
{
    return backend_.enumerate(config_.vendor_id);
}

Result<std::string> QueryEngine::find_device_path()
{
    auto devices = list_devices();
    if (devices.empty()) {
        std::ostringstream oss;
        oss << "Astro A50 HID interface not found (vendor_id=0x" << std::uppercase << std::hex
            << std::setw(4) << std::setfill('0') << config_.vendor_id << ")";
        return Result<std::string>::failure(Failure{Error::DEVICE_NOT_FOUND, oss.str(), std::nullopt, {}});
    }
    return Result<std::string>::success(devices.front().path);
}

Result<std::vector<uint8_t>> QueryEngine::query(Command command, const std::vector<uint8_t>& payload)
{
    return query(command, payload, config_.retries);
}

Result<std::vector<uint8_t>> QueryEngine::query(Command command, const std::vector<uint8_t>& payload, int retries)
{
    auto path = find_device_path();
    if (!path.ok()) {
        return Result<std::vector<uint8_t>>::failure(path.failure_info());
    }

    std::optional<Failure> last_error;

    for (int attempt = 0; attempt < retries; ++attempt) {
        auto response = channel_.exchange(path.value(), static_cast<uint8_t>(command), payload);

        if (!response.ok()) {
            last_error = response.failure_info();
            log("cmd " + command_hex(command) + " attempt " + std::to_string(attempt + 1) + ": "
                + to_string(response.error()));
        } else if (!response.value().empty()) {
            auto extracted = HeadsetFrame::extract_payload(response.value());
            if (extracted) {
                sleeper_(config_.command_delay);
                return Result<std::vector<uint8_t>>::success(std::move(*extracted));
            }
            log("cmd " + command_hex(command) + " attempt " + std::to_string(attempt + 1) + ": rejected frame");
        }

        sleeper_(std::chrono::milliseconds(Protocol::RETRY_BACKOFF_MS));
    }

    Failure failure;
    failure.code = Error::COMMUNICATION_ERROR;
    failure.message = "No valid response for cmd " + command_hex(command);
    if (last_error) {
        failure.cause = last_error->code;
        if (!last_error->message.empty()) {
            failure.message += ": " + last_error->message;
        }
    }
    log(failure.message);
    return Result<std::vector<uint8_t>>::failure(std::move(failure));
}

void QueryEngine::log(const std::string& msg)
{
    if (log_callback_) {
        log_callback_(msg);
    }
}

} // namespace hyperheadset
