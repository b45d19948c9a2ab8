#pragma once

#include <expected>
#include <memory>
#include <string>
#include <utility>

namespace yoverlay {

//=============================================================================
// Error — message with an optional chained cause
//=============================================================================
class Error {
public:
    Error() = default;
    explicit Error(std::string message) : _message(std::move(message)) {}
    Error(std::string message, Error cause)
        : _message(std::move(message)), _cause(std::make_shared<Error>(std::move(cause))) {}

    const std::string& message() const { return _message; }
    const Error* cause() const { return _cause.get(); }

    // "outer: inner: innermost"
    std::string fullMessage() const {
        if (!_cause) return _message;
        return _message + ": " + _cause->fullMessage();
    }

private:
    std::string _message;
    std::shared_ptr<Error> _cause;
};

template<typename T>
using Result = std::expected<T, Error>;

inline Result<void> Ok() { return {}; }

template<typename T>
Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

template<typename T = void>
Result<T> Err(std::string message) {
    return std::unexpected(Error(std::move(message)));
}

// Wrap the error of a failed result as the cause of a new one
template<typename T = void, typename U>
Result<T> Err(std::string message, const Result<U>& previous) {
    if (previous) return std::unexpected(Error(std::move(message)));
    return std::unexpected(Error(std::move(message), previous.error()));
}

template<typename T>
std::string error_msg(const Result<T>& result) {
    if (result) return {};
    return result.error().fullMessage();
}

} // namespace yoverlay
