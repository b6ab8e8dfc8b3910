#pragma once

#include <memory>
#include <string>
#include <vector>

#include <hidapi/hidapi.h>

#include "transport/hid_device.hpp"

namespace hyperheadset {

class HidapiDevice : public HidDevice
{
public:
    HidapiDevice() = default;
    ~HidapiDevice() override { close(); }

    HidapiDevice(const HidapiDevice&) = delete;
    HidapiDevice& operator=(const HidapiDevice&) = delete;

    Result<bool> open(const std::string& path) override;
    void close() override;
    Result<bool> set_blocking(bool blocking) override;

    Result<size_t> send_feature_report(const std::vector<uint8_t>& data) override;
    Result<std::vector<uint8_t>> get_feature_report(uint8_t report_id, size_t length) override;

    Result<size_t> write(const std::vector<uint8_t>& data) override;
    Result<std::vector<uint8_t>> read(size_t length, int timeout_ms) override;

    bool is_open() const { return handle_ != nullptr; }
    std::string get_path() const { return path_; }
    std::string get_last_error() const { return last_error_; }

private:
    struct HidDeleter {
        void operator()(hid_device* device) const noexcept;
    };

    std::unique_ptr<hid_device, HidDeleter> handle_;
    std::string path_;
    std::string last_error_;

    void capture_error();
};

// hid_init() for the lifetime of the backend, hid_exit() on destruction.
class HidapiBackend : public HidBackend
{
public:
    HidapiBackend();
    ~HidapiBackend() override;

    HidapiBackend(const HidapiBackend&) = delete;
    HidapiBackend& operator=(const HidapiBackend&) = delete;

    [[nodiscard]] bool is_initialized() const { return initialized_; }

    std::vector<HidDeviceInfo> enumerate(uint16_t vendor_id) override;
    std::unique_ptr<HidDevice> create_device() override;

private:
    bool initialized_ = false;
};

} // namespace hyperheadset
