#pragma once
#include <string>
#include <utility>
#include <variant>

namespace hostext {
namespace utils {

/**
 * @brief Error alternative of a Result, carrying a human readable message.
 */
struct Error {
    std::string message;
};

// Generic Result<T> template
// Holds either a value of type T or an Error

template <typename T>
class Result {
public:
    // Success constructor
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}
    // Error constructor
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const { return std::holds_alternative<T>(data_); }
    bool has_error() const { return std::holds_alternative<Error>(data_); }
    explicit operator bool() const { return has_value(); }

    const T& value() const { return std::get<T>(data_); }
    T& value() { return std::get<T>(data_); }
    const std::string& error() const { return std::get<Error>(data_).message; }

private:
    std::variant<T, Error> data_;
};

} // namespace utils
} // namespace hostext

namespace hostext {
using utils::Error;
using utils::Result;
}
