#pragma once

#include <expected>
#include <string>
#include <utility>

namespace richsdf {

//=============================================================================
// Error codes. Only GlyphTooLarge and AtlasFull abort a text update, the rest
// degrade at the call site.
//=============================================================================
enum class ErrorCode {
    Generic,
    InvalidArgument,
    Config,
    Font,
    Raster,
    Shaping,
    GlyphTooLarge,
    AtlasFull,
};

class Error {
public:
    Error() = default;

    explicit Error(std::string message, ErrorCode code = ErrorCode::Generic)
        : _message(std::move(message)), _code(code) {}

    // Chains the cause into the message and inherits its code
    Error(std::string message, const Error& cause)
        : _message(std::move(message) + ": " + cause._message), _code(cause._code) {}

    const std::string& message() const { return _message; }
    ErrorCode code() const { return _code; }

    bool isFatal() const {
        return _code == ErrorCode::GlyphTooLarge || _code == ErrorCode::AtlasFull;
    }

private:
    std::string _message;
    ErrorCode _code = ErrorCode::Generic;
};

template<typename T>
using Result = std::expected<T, Error>;

inline Result<void> Ok() { return {}; }

template<typename T>
Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

// Err<T>(...) returns an unexpected that converts to any Result; T only
// documents the intended Result type at the call site.
template<typename T = void>
std::unexpected<Error> Err(std::string message, ErrorCode code = ErrorCode::Generic) {
    return std::unexpected(Error(std::move(message), code));
}

template<typename T = void, typename U>
std::unexpected<Error> Err(std::string message, const Result<U>& cause) {
    return std::unexpected(Error(std::move(message), cause.error()));
}

template<typename T = void>
std::unexpected<Error> Err(std::string message, const Error& cause) {
    return std::unexpected(Error(std::move(message), cause));
}

template<typename U>
const std::string& error_msg(const Result<U>& result) {
    static const std::string none;
    return result ? none : result.error().message();
}

} // namespace richsdf
