#include "transport/hidapi_device.hpp"
#include <cwchar>

namespace hyperheadset {

namespace {

// hidapi hands out wide strings; vendor strings are plain ASCII in practice.
std::string narrow(const wchar_t* text)
{
    std::string out;
    if (!text) {
        return out;
    }
    for (const wchar_t* p = text; *p != L'\0'; ++p) {
        out.push_back(*p > 0 && *p < 0x80 ? static_cast<char>(*p) : '?');
    }
    return out;
}

} // anonymous namespace

void HidapiDevice::HidDeleter::operator()(hid_device* device) const noexcept
{
    if (device) {
        hid_close(device);
    }
}

Result<bool> HidapiDevice::open(const std::string& path)
{
    close();
    path_ = path;

    hid_device* device = hid_open_path(path_.c_str());
    if (!device) {
        last_error_ = "Unable to open " + path_ + ": " + narrow(hid_error(nullptr));
        return Result<bool>::failure(Failure{Error::PORT_ERROR, last_error_, std::nullopt, {}});
    }

    handle_.reset(device);
    return Result<bool>::success(true);
}

void HidapiDevice::close()
{
    handle_.reset();
}

Result<bool> HidapiDevice::set_blocking(bool blocking)
{
    if (!handle_) {
        return Result<bool>::failure(Error::PORT_ERROR);
    }

    if (hid_set_nonblocking(handle_.get(), blocking ? 0 : 1) != 0) {
        capture_error();
        return Result<bool>::failure(Failure{Error::PORT_ERROR, last_error_, std::nullopt, {}});
    }
    return Result<bool>::success(true);
}

Result<size_t> HidapiDevice::send_feature_report(const std::vector<uint8_t>& data)
{
    if (!handle_) {
        return Result<size_t>::failure(Error::PORT_ERROR);
    }

    int sent = hid_send_feature_report(handle_.get(), data.data(), data.size());
    if (sent < 0) {
        capture_error();
        return Result<size_t>::failure(Failure{Error::WRITE_ERROR, last_error_, std::nullopt, {}});
    }
    return Result<size_t>::success(static_cast<size_t>(sent));
}

Result<std::vector<uint8_t>> HidapiDevice::get_feature_report(uint8_t report_id, size_t length)
{
    if (!handle_) {
        return Result<std::vector<uint8_t>>::failure(Error::PORT_ERROR);
    }

    std::vector<uint8_t> buffer(length, 0x00);
    if (!buffer.empty()) {
        buffer[0] = report_id;
    }

    int received = hid_get_feature_report(handle_.get(), buffer.data(), buffer.size());
    if (received < 0) {
        capture_error();
        return Result<std::vector<uint8_t>>::failure(Failure{Error::READ_ERROR, last_error_, std::nullopt, {}});
    }

    buffer.resize(static_cast<size_t>(received));
    return Result<std::vector<uint8_t>>::success(std::move(buffer));
}

Result<size_t> HidapiDevice::write(const std::vector<uint8_t>& data)
{
    if (!handle_) {
        return Result<size_t>::failure(Error::PORT_ERROR);
    }

    int written = hid_write(handle_.get(), data.data(), data.size());
    if (written < 0) {
        capture_error();
        return Result<size_t>::failure(Failure{Error::WRITE_ERROR, last_error_, std::nullopt, {}});
    }
    return Result<size_t>::success(static_cast<size_t>(written));
}

Result<std::vector<uint8_t>> HidapiDevice::read(size_t length, int timeout_ms)
{
    if (!handle_) {
        return Result<std::vector<uint8_t>>::failure(Error::PORT_ERROR);
    }

    std::vector<uint8_t> buffer(length, 0x00);
    int received = hid_read_timeout(handle_.get(), buffer.data(), buffer.size(), timeout_ms);
    if (received < 0) {
        capture_error();
        return Result<std::vector<uint8_t>>::failure(Failure{Error::READ_ERROR, last_error_, std::nullopt, {}});
    }

    buffer.resize(static_cast<size_t>(received));
    return Result<std::vector<uint8_t>>::success(std::move(buffer));
}

void HidapiDevice::capture_error()
{
    last_error_ = narrow(hid_error(handle_.get()));
}

HidapiBackend::HidapiBackend()
{
    initialized_ = hid_init() == 0;
}

HidapiBackend::~HidapiBackend()
{
    if (initialized_) {
        hid_exit();
    }
}

std::vector<HidDeviceInfo> HidapiBackend::enumerate(uint16_t vendor_id)
{
    std::vector<HidDeviceInfo> devices;
    if (!initialized_) {
        return devices;
    }

    hid_device_info* list = hid_enumerate(vendor_id, 0x0000);
    for (hid_device_info* cur = list; cur != nullptr; cur = cur->next) {
        if (cur->vendor_id != vendor_id) {
            continue;
        }

        HidDeviceInfo info;
        info.vendor_id = cur->vendor_id;
        info.product_id = cur->product_id;
        info.manufacturer = narrow(cur->manufacturer_string);
        info.product = narrow(cur->product_string);
        info.path = cur->path ? cur->path : "";
        info.interface_number = cur->interface_number;
        devices.push_back(std::move(info));
    }
    hid_free_enumeration(list);

    return devices;
}

std::unique_ptr<HidDevice> HidapiBackend::create_device()
{
    return std::make_unique<HidapiDevice>();
}

} // namespace hyperheadset
