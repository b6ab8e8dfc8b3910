#include "transport/channel.hpp"
#include "transport/frame.hpp"
#include "common/helpers.hpp"
#include "common/protocol.hpp"
#include <algorithm>
#include <thread>

namespace hyperheadset {

Sleeper default_sleeper()
{
    return [](std::chrono::milliseconds duration) {
        std::this_thread::sleep_for(duration);
    };
}

TransportStrategy feature_report_strategy(Sleeper sleeper)
{
    return TransportStrategy{
        "feature",
        [sleeper](HidDevice& device, const std::vector<uint8_t>& frame, int report_length)
            -> Result<std::vector<uint8_t>> {
            auto sent = device.send_feature_report(frame);
            if (!sent.ok()) {
                return Result<std::vector<uint8_t>>::failure(sent.failure_info());
            }

            sleeper(std::chrono::milliseconds(Protocol::FEATURE_SETTLE_MS));
            return device.get_feature_report(Protocol::REPORT_ID, static_cast<size_t>(report_length));
        }};
}

TransportStrategy interrupt_strategy()
{
    return TransportStrategy{
        "interrupt",
        [](HidDevice& device, const std::vector<uint8_t>& frame, int report_length)
            -> Result<std::vector<uint8_t>> {
            auto written = device.write(frame);
            if (!written.ok()) {
                return Result<std::vector<uint8_t>>::failure(written.failure_info());
            }

            return device.read(static_cast<size_t>(report_length), Protocol::INTERRUPT_TIMEOUT_MS);
        }};
}

TransportChannel::TransportChannel(HidBackend& backend, std::vector<int> report_lengths, Sleeper sleeper)
    : backend_(backend), report_lengths_(std::move(report_lengths))
{
    strategies_.push_back(feature_report_strategy(std::move(sleeper)));
    strategies_.push_back(interrupt_strategy());
}

Result<std::vector<uint8_t>> TransportChannel::exchange(const std::string& path, uint8_t command, const std::vector<uint8_t>& payload)
{
    for (int report_length : report_lengths_) {
        std::vector<uint8_t> frame = HeadsetFrame::build_request(command, payload, report_length);

        for (const auto& strategy : strategies_) {
            ScopedHidHandle handle(backend_.create_device());

            auto opened = handle.open(path);
            if (!opened.ok()) {
                return Result<std::vector<uint8_t>>::failure(opened.failure_info());
            }

            auto response = strategy.exchange(handle.device(), frame, report_length);
            if (!response.ok()) {
                std::vector<uint8_t> head(frame.begin(), frame.begin() + std::min<size_t>(frame.size(), 4));
                log(std::string(strategy.name) + "/" + std::to_string(report_length) + " failed ("
                    + to_string(response.error()) + ") for " + bytesToHex(head));
                continue;
            }

            if (!response.value().empty()) {
                return Result<std::vector<uint8_t>>::success(HeadsetFrame::normalize(response.value()));
            }
        }
    }

    return Result<std::vector<uint8_t>>::success({});
}

void TransportChannel::log(const std::string& msg)
{
    if (log_callback_) {
        log_callback_(msg);
    }
}

} // namespace hyperheadset
