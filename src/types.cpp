#include "common/types.hpp"

namespace hyperheadset {

const char* to_string(Error error)
{
    switch (error) {
        case Error::TIMEOUT: return "timeout";
        case Error::INVALID_RESPONSE: return "invalid response";
        case Error::PORT_ERROR: return "port error";
        case Error::READ_ERROR: return "read error";
        case Error::WRITE_ERROR: return "write error";
        case Error::DEVICE_NOT_FOUND: return "device not found";
        case Error::COMMUNICATION_ERROR: return "communication error";
        case Error::UNEXPECTED_PAYLOAD: return "unexpected payload";
        case Error::NO_SANE_BATTERY: return "no sane battery value";
        case Error::INVALID_ARGUMENT: return "invalid argument";
    }
    return "unknown error";
}

} // namespace hyperheadset
