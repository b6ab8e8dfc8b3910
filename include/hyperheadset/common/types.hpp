#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace hyperheadset {

enum class Error
{
    TIMEOUT,
    INVALID_RESPONSE,
    PORT_ERROR,
    READ_ERROR,
    WRITE_ERROR,
    DEVICE_NOT_FOUND,
    COMMUNICATION_ERROR,
    UNEXPECTED_PAYLOAD,
    NO_SANE_BATTERY,
    INVALID_ARGUMENT
};

const char* to_string(Error error);

// Error code plus whatever the failing layer knew about it.
struct Failure
{
    Error code = Error::INVALID_RESPONSE;
    std::string message;
    std::optional<Error> cause;
    std::vector<uint8_t> raw;
};

template<typename T>
class Result
{
public:
    bool ok() const
    {
        return std::holds_alternative<T>(data_);
    }

    const T& value() const
    {
        return std::get<T>(data_);
    }

    const T* value_if() const
    {
        return std::get_if<T>(&data_);
    }

    Error error() const
    {
        return std::get<Failure>(data_).code;
    }

    const Failure& failure_info() const
    {
        return std::get<Failure>(data_);
    }

    static Result success(T value)
    {
        return Result(std::move(value));
    }

    static Result failure(Error error)
    {
        return Result(Failure{error, {}, std::nullopt, {}});
    }

    static Result failure(Failure failure)
    {
        return Result(std::move(failure));
    }

private:
    std::variant<T, Failure> data_;

    explicit Result(T value) : data_(std::move(value)) {}
    explicit Result(Failure failure) : data_(std::move(failure)) {}
};

using LogCallback = std::function<void(const std::string&)>;

} // namespace hyperheadset
