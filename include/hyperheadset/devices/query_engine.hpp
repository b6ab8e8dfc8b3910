#pragma once

#include <string>
#include <vector>

#include "common/config.hpp"
#include "common/protocol.hpp"
#include "common/types.hpp"
#include "transport/channel.hpp"
#include "transport/hid_device.hpp"

namespace hyperheadset {

class QueryEngine
{
public:
    QueryEngine(HidBackend& backend, const ClientConfig& config, Sleeper sleeper = default_sleeper());

    QueryEngine(const QueryEngine&) = delete;
    QueryEngine& operator=(const QueryEngine&) = delete;

    Result<std::vector<uint8_t>> query(Command command, const std::vector<uint8_t>& payload = {});
    Result<std::vector<uint8_t>> query(Command command, const std::vector<uint8_t>& payload, int retries);

    Result<std::string> find_device_path();
    std::vector<HidDeviceInfo> list_devices();

    void set_log_callback(LogCallback cb);
    void sleep(std::chrono::milliseconds duration) { sleeper_(duration); }

private:
    HidBackend& backend_;
    ClientConfig config_;
    Sleeper sleeper_;
    TransportChannel channel_;
    LogCallback log_callback_;

    void log(const std::string& msg);
};

} // namespace hyperheadset
