#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include "common/types.hpp"
#include "transport/hid_device.hpp"

namespace hyperheadset {

using Sleeper = std::function<void(std::chrono::milliseconds)>;

Sleeper default_sleeper();

// One delivery mechanism: push the frame out, return whatever came back.
struct TransportStrategy
{
    const char* name;
    std::function<Result<std::vector<uint8_t>>(HidDevice&, const std::vector<uint8_t>& frame, int report_length)> exchange;
};

TransportStrategy feature_report_strategy(Sleeper sleeper);
TransportStrategy interrupt_strategy();

class TransportChannel
{
public:
    TransportChannel(HidBackend& backend, std::vector<int> report_lengths, Sleeper sleeper);

    // Tries every report length with every strategy, in order. An empty frame
    // means no mechanism produced data; a failure means the device could not
    // be opened.
    Result<std::vector<uint8_t>> exchange(const std::string& path, uint8_t command, const std::vector<uint8_t>& payload);

    const std::vector<int>& report_lengths() const { return report_lengths_; }
    void set_log_callback(LogCallback cb) { log_callback_ = std::move(cb); }

private:
    HidBackend& backend_;
    std::vector<int> report_lengths_;
    std::vector<TransportStrategy> strategies_;
    LogCallback log_callback_;

    void log(const std::string& msg);
};

} // namespace hyperheadset
