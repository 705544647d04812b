// =============================================================================
// recdock - Result Type for Unified Error Handling
// =============================================================================
// A Result<T, E> type that encapsulates either a success value or an error.
// Protocol operations never throw across the session API; they return
// Result<T, ProtocolError>.
//
// Usage:
//   Result<uint32_t, ProtocolError> count = session.get_file_count();
//   if (count.is_ok()) {
//       use(count.value());
//   } else if (count.error().kind == ProtocolError::Kind::Timeout) {
//       retry();
//   }
// =============================================================================

#pragma once

#include <variant>
#include <string>
#include <optional>
#include <stdexcept>
#include <type_traits>

namespace recdock {

// =============================================================================
// Error Types
// =============================================================================

// Generic error with message
struct Error {
    std::string message;
    int code = 0;

    Error() = default;
    explicit Error(std::string msg, int c = 0) : message(std::move(msg)), code(c) {}
    explicit Error(const char* msg, int c = 0) : message(msg), code(c) {}

    bool operator==(const Error& other) const {
        return code == other.code && message == other.message;
    }
};

// Protocol engine error. `code` carries the underlying transport/device code
// where one exists (libusb error, device status byte).
struct ProtocolError : Error {
    enum class Kind {
        Transport,          // write/read failure, device gone
        InvalidFrame,       // sync marker mismatch, stream resynced
        Timeout,            // no response within the requested window
        Unsupported,        // capability-gated for this model/firmware
        MalformedResponse,  // body shorter/other than the decoder expects
        Cancelled,          // session closed before resolution
        InvalidArgument,    // rejected locally before sending
        NotConnected
    };
    Kind kind = Kind::Transport;

    ProtocolError() = default;
    explicit ProtocolError(Kind k, std::string msg, int c = 0)
        : Error(std::move(msg), c), kind(k) {}
};

inline const char* kindName(ProtocolError::Kind k) {
    switch (k) {
        case ProtocolError::Kind::Transport:         return "transport";
        case ProtocolError::Kind::InvalidFrame:      return "invalid-frame";
        case ProtocolError::Kind::Timeout:           return "timeout";
        case ProtocolError::Kind::Unsupported:       return "unsupported";
        case ProtocolError::Kind::MalformedResponse: return "malformed-response";
        case ProtocolError::Kind::Cancelled:         return "cancelled";
        case ProtocolError::Kind::InvalidArgument:   return "invalid-argument";
        case ProtocolError::Kind::NotConnected:      return "not-connected";
    }
    return "unknown";
}

// =============================================================================
// Result<T, E> Type
// =============================================================================

template<typename T, typename E = Error>
class Result {
public:
    // Success constructor
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}

    // Error constructor (from E or derived)
    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : data_(std::in_place_index<1>, E(std::move(error))) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return data_.index() == 1; }

    explicit operator bool() const { return is_ok(); }

    // Access value (throws if error)
    T& value() & {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(data_);
    }

    const T& value() const& {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(data_);
    }

    T&& value() && {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(std::move(data_));
    }

    // Access error (throws if success)
    E& error() & {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<1>(data_);
    }

    const E& error() const& {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<1>(data_);
    }

    T value_or(T default_value) const& {
        return is_ok() ? std::get<0>(data_) : std::move(default_value);
    }

    T value_or(T default_value) && {
        return is_ok() ? std::get<0>(std::move(data_)) : std::move(default_value);
    }

    std::optional<T> ok() const& {
        if (is_ok()) return std::get<0>(data_);
        return std::nullopt;
    }

    std::optional<E> err() const& {
        if (is_err()) return std::get<1>(data_);
        return std::nullopt;
    }

    // Map success value
    template<typename F>
    auto map(F&& f) const& -> Result<decltype(f(std::declval<T>())), E> {
        using U = decltype(f(std::declval<T>()));
        if (is_ok()) return Result<U, E>(f(std::get<0>(data_)));
        return Result<U, E>(std::get<1>(data_));
    }

    // Map error
    template<typename F>
    auto map_err(F&& f) const& -> Result<T, decltype(f(std::declval<E>()))> {
        using U = decltype(f(std::declval<E>()));
        if (is_err()) return Result<T, U>(f(std::get<1>(data_)));
        return Result<T, U>(std::get<0>(data_));
    }

    // Unwrap with custom error message
    T expect(const char* msg) const& {
        if (is_err()) throw std::runtime_error(std::string(msg) + ": " + error().message);
        return std::get<0>(data_);
    }

private:
    std::variant<T, E> data_;
};

// =============================================================================
// Result<void, E> Specialization
// =============================================================================

template<typename E>
class Result<void, E> {
public:
    Result() : data_(std::monostate{}) {}

    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : data_(E(std::move(error))) {}

    bool is_ok() const { return std::holds_alternative<std::monostate>(data_); }
    bool is_err() const { return std::holds_alternative<E>(data_); }
    explicit operator bool() const { return is_ok(); }

    void value() const {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
    }

    E& error() & {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<E>(data_);
    }

    const E& error() const& {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<E>(data_);
    }

    std::optional<E> err() const& {
        if (is_err()) return std::get<E>(data_);
        return std::nullopt;
    }

private:
    std::variant<std::monostate, E> data_;
};

// =============================================================================
// Helper Functions
// =============================================================================

template<typename T>
Result<std::decay_t<T>, Error> Ok(T&& value) {
    return Result<std::decay_t<T>, Error>(std::forward<T>(value));
}

inline Result<void, Error> Ok() {
    return Result<void, Error>();
}

template<typename T, typename E = Error>
Result<T, E> Err(E error) {
    return Result<T, E>(std::move(error));
}

template<typename T>
Result<T, Error> Err(std::string message, int code = 0) {
    return Result<T, Error>(Error(std::move(message), code));
}

template<typename T>
Result<T, Error> Err(const char* message, int code = 0) {
    return Result<T, Error>(Error(message, code));
}

// Shorthand for the protocol error path: return protocolError(Kind::Timeout, "...")
inline ProtocolError protocolError(ProtocolError::Kind kind, std::string message, int code = 0) {
    return ProtocolError(kind, std::move(message), code);
}

} // namespace recdock
