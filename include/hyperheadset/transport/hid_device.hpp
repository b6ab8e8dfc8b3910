#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "common/types.hpp"
#include "common/response.hpp"

namespace hyperheadset {

// One HID interface, opened by path. Every call may fail with an I/O error.
class HidDevice
{
public:
    virtual ~HidDevice() = default;

    virtual Result<bool> open(const std::string& path) = 0;
    virtual void close() = 0;
    virtual Result<bool> set_blocking(bool blocking) = 0;

    virtual Result<size_t> send_feature_report(const std::vector<uint8_t>& data) = 0;
    virtual Result<std::vector<uint8_t>> get_feature_report(uint8_t report_id, size_t length) = 0;

    virtual Result<size_t> write(const std::vector<uint8_t>& data) = 0;
    // Empty vector when nothing arrived within timeout_ms.
    virtual Result<std::vector<uint8_t>> read(size_t length, int timeout_ms) = 0;
};

class HidBackend
{
public:
    virtual ~HidBackend() = default;

    virtual std::vector<HidDeviceInfo> enumerate(uint16_t vendor_id) = 0;
    virtual std::unique_ptr<HidDevice> create_device() = 0;
};

// Owns a device for the span of one exchange; closes it on every exit path.
class ScopedHidHandle
{
public:
    explicit ScopedHidHandle(std::unique_ptr<HidDevice> device) : device_(std::move(device)) {}
    ~ScopedHidHandle()
    {
        if (device_) {
            device_->close();
        }
    }

    ScopedHidHandle(const ScopedHidHandle&) = delete;
    ScopedHidHandle& operator=(const ScopedHidHandle&) = delete;

    // Opens the path and switches the handle to blocking reads.
    Result<bool> open(const std::string& path);

    HidDevice& device() { return *device_; }

private:
    std::unique_ptr<HidDevice> device_;
};

} // namespace hyperheadset
