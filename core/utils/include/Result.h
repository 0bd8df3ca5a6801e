#pragma once

#include <variant>
#include <string>
#include <vector>
#include <stdexcept>
#include <functional>
#include <utility>

namespace SettleFS {

/**
 * @brief Error type for Result pattern
 */
struct Error {
    std::string message;
    int code{0};
    std::string component;

    Error() = default;
    Error(std::string msg, int c = 0, std::string comp = "")
        : message(std::move(msg)), code(c), component(std::move(comp)) {}

    std::string toString() const {
        std::string result = message;
        if (!component.empty()) {
            result = "[" + component + "] " + result;
        }
        if (code != 0) {
            result += " (code: " + std::to_string(code) + ")";
        }
        return result;
    }
};

inline std::string describe(const Error& error) {
    return error.toString();
}

inline std::string describe(const std::vector<Error>& errors) {
    std::string result = std::to_string(errors.size()) + " error(s)";
    for (const auto& error : errors) {
        result += "; " + error.toString();
    }
    return result;
}

/**
 * @brief Result type for explicit error handling
 *
 * Holds either a value or an error, never both. Accessing the wrong side
 * throws std::runtime_error.
 *
 * Usage:
 *   Result<Duration> tick = settings.resolveTick();
 *   if (!tick) {
 *       Logger::instance().error(tick.error().toString());
 *   }
 *
 * E only needs a describe() overload; both Error and std::vector<Error>
 * have one, so a batch of errors can sit on the error side.
 */
template<typename T, typename E = Error>
class Result {
public:
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}
    Result(const E& error) : data_(error) {}
    Result(E&& error) : data_(std::move(error)) {}

    bool isOk() const { return std::holds_alternative<T>(data_); }
    bool isError() const { return std::holds_alternative<E>(data_); }

    explicit operator bool() const { return isOk(); }

    // Access value (throws if error)
    T& value() {
        if (isError()) {
            throw std::runtime_error("Called value() on Error result: " +
                describe(std::get<E>(data_)));
        }
        return std::get<T>(data_);
    }

    const T& value() const {
        if (isError()) {
            throw std::runtime_error("Called value() on Error result: " +
                describe(std::get<E>(data_)));
        }
        return std::get<T>(data_);
    }

    // Access error (throws if ok)
    E& error() {
        if (isOk()) {
            throw std::runtime_error("Called error() on Ok result");
        }
        return std::get<E>(data_);
    }

    const E& error() const {
        if (isOk()) {
            throw std::runtime_error("Called error() on Ok result");
        }
        return std::get<E>(data_);
    }

    T valueOr(const T& defaultValue) const {
        return isOk() ? std::get<T>(data_) : defaultValue;
    }

    Result& onError(std::function<void(const E&)> callback) {
        if (isError()) {
            callback(error());
        }
        return *this;
    }

private:
    std::variant<T, E> data_;
};

// Specialization for void (no value, only success/error)
template<typename E>
class Result<void, E> {
public:
    Result() : data_(OkType{}) {}
    Result(const E& error) : data_(error) {}
    Result(E&& error) : data_(std::move(error)) {}

    bool isOk() const { return std::holds_alternative<OkType>(data_); }
    bool isError() const { return std::holds_alternative<E>(data_); }

    explicit operator bool() const { return isOk(); }

    E& error() {
        if (isOk()) {
            throw std::runtime_error("Called error() on Ok result");
        }
        return std::get<E>(data_);
    }

    const E& error() const {
        if (isOk()) {
            throw std::runtime_error("Called error() on Ok result");
        }
        return std::get<E>(data_);
    }

    Result& onError(std::function<void(const E&)> callback) {
        if (isError()) {
            callback(error());
        }
        return *this;
    }

private:
    struct OkType {};
    std::variant<OkType, E> data_;
};

using VoidResult = Result<void, Error>;

inline VoidResult Ok() {
    return VoidResult();
}

} // namespace SettleFS
