#pragma once

#include <string>
#include <variant>
#include <optional>

namespace vmm::core {

/**
 * Result type for operations that can fail with a human readable reason.
 * Used where the failure is reported to a person (configuration checks),
 * not on the allocation hot path.
 */
template<typename T>
class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(std::string error) : data_(std::move(error)) {}

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_error() const { return std::holds_alternative<std::string>(data_); }

    // Access value (only call if is_ok())
    const T& value() const { return std::get<T>(data_); }
    T& value() { return std::get<T>(data_); }

    // Access error message (only call if is_error())
    const std::string& error() const { return std::get<std::string>(data_); }

    std::optional<T> try_value() const {
        if (is_ok()) {
            return value();
        }
        return std::nullopt;
    }

private:
    std::variant<T, std::string> data_;
};

template<typename T>
Result<T> Error(std::string message) {
    return Result<T>(std::move(message));
}

// Void result type for operations that don't return values
using VoidResult = Result<bool>;

inline VoidResult Ok() {
    return VoidResult(true);
}

inline VoidResult Fail(std::string message) {
    return VoidResult(std::move(message));
}

} // namespace vmm::core
