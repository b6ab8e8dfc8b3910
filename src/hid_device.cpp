#include "transport/hid_device.hpp"

namespace hyperheadset {

Result<bool> ScopedHidHandle::open(const std::string& path)
{
    if (!device_) {
        return Result<bool>::failure(Error::PORT_ERROR);
    }

    auto open_result = device_->open(path);
    if (!open_result.ok()) {
        return open_result;
    }

    return device_->set_blocking(true);
}

} // namespace hyperheadset
