#pragma once

/// @file error.hpp
/// @brief Error handling types for onca_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <vector>
#include <stdexcept>

namespace onca_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    AlreadyExists,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    ValidationError,
    DependencyMissing,
    Timeout,
    OutOfMemory,
    NotSupported,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::ValidationError: return "ValidationError";
        case ErrorCode::DependencyMissing: return "DependencyMissing";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::OutOfMemory: return "OutOfMemory";
        case ErrorCode::NotSupported: return "NotSupported";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Dynamic library errors
struct LibraryError {
    enum class Kind : std::uint8_t {
        DynLib,        // Library could not be opened
        LoadFunction,  // Library is missing a required symbol
    };

    Kind kind;
    std::string message;
    std::string library;
    std::string symbol;  // For LoadFunction

    [[nodiscard]] static LibraryError dyn_lib(const std::string& lib, const std::string& reason) {
        return LibraryError{Kind::DynLib, "Failed to load dynamic library '" + lib + "': " + reason, lib, {}};
    }

    [[nodiscard]] static LibraryError load_function(const std::string& lib, const std::string& sym) {
        return LibraryError{Kind::LoadFunction,
            "Dynamic library '" + lib + "' does not export '" + sym + "'", lib, sym};
    }
};

/// Render abstraction layer errors
struct RalError {
    enum class Kind : std::uint8_t {
        InvalidParameter,             // Caller-supplied value violates a precondition
        NotImplemented,               // Backend lacks an optional capability
        UseAfterDeviceDropped,        // Owning device no longer exists
        UnsupportedSwapChainFormats,  // None of the requested swap-chain formats is supported
        MissingFeature,               // Required device feature is unsupported
        UnmetRequirement,             // Hardware does not meet a structural requirement
        Timeout,                      // Native wait timed out
        DeviceLost,                   // Native device was lost
        OutOfHostMemory,
        OutOfDeviceMemory,
        Other,                        // Backend-reported native error
    };

    Kind kind;
    std::string message;
    std::vector<std::string> formats;  // For UnsupportedSwapChainFormats

    [[nodiscard]] static RalError invalid_parameter(const std::string& what) {
        return RalError{Kind::InvalidParameter, "Invalid parameter: " + what, {}};
    }

    [[nodiscard]] static RalError not_implemented(const std::string& what) {
        return RalError{Kind::NotImplemented, "Not implemented: " + what, {}};
    }

    [[nodiscard]] static RalError use_after_device_dropped() {
        return RalError{Kind::UseAfterDeviceDropped, "Device was dropped while a dependent resource was still in use", {}};
    }

    [[nodiscard]] static RalError unsupported_swap_chain_formats(std::vector<std::string> requested) {
        std::string msg = "None of the requested swap-chain formats are supported:";
        for (const auto& f : requested) {
            msg += " " + f;
        }
        return RalError{Kind::UnsupportedSwapChainFormats, msg, std::move(requested)};
    }

    [[nodiscard]] static RalError missing_feature(const std::string& feature) {
        return RalError{Kind::MissingFeature, "Missing required feature: " + feature, {}};
    }

    [[nodiscard]] static RalError unmet_requirement(const std::string& what) {
        return RalError{Kind::UnmetRequirement, "Unmet requirement: " + what, {}};
    }

    [[nodiscard]] static RalError timeout() {
        return RalError{Kind::Timeout, "Operation timed out", {}};
    }

    [[nodiscard]] static RalError device_lost() {
        return RalError{Kind::DeviceLost, "Device lost", {}};
    }

    [[nodiscard]] static RalError out_of_host_memory() {
        return RalError{Kind::OutOfHostMemory, "Out of host memory", {}};
    }

    [[nodiscard]] static RalError out_of_device_memory() {
        return RalError{Kind::OutOfDeviceMemory, "Out of device memory", {}};
    }

    [[nodiscard]] static RalError other(const std::string& what) {
        return RalError{Kind::Other, what, {}};
    }
};

/// Handle errors
struct HandleError {
    enum class Kind : std::uint8_t {
        Null,     // Handle is null
        Expired,  // Weak handle could not be upgraded
    };

    Kind kind;
    std::string message;

    [[nodiscard]] static HandleError null() {
        return HandleError{Kind::Null, "Handle is null"};
    }

    [[nodiscard]] static HandleError expired() {
        return HandleError{Kind::Expired, "Handle has expired (no strong references left)"};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        LibraryError,
        RalError,
        HandleError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(LibraryError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(RalError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(HandleError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}
    Error(ErrorCode code, const char* msg) : m_code(code), m_error(std::string(msg)) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// Check for a specific RAL error kind
    [[nodiscard]] bool is_ral(RalError::Kind kind) const {
        const auto* err = as<RalError>();
        return err && err->kind == kind;
    }

    /// Check for a specific library error kind
    [[nodiscard]] bool is_library(LibraryError::Kind kind) const {
        const auto* err = as<LibraryError>();
        return err && err->kind == kind;
    }

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// Get context value
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    /// All context entries
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

private:
    static ErrorCode to_error_code(LibraryError::Kind kind) {
        switch (kind) {
            case LibraryError::Kind::DynLib: return ErrorCode::NotFound;
            case LibraryError::Kind::LoadFunction: return ErrorCode::DependencyMissing;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(RalError::Kind kind) {
        switch (kind) {
            case RalError::Kind::InvalidParameter: return ErrorCode::InvalidArgument;
            case RalError::Kind::NotImplemented: return ErrorCode::NotSupported;
            case RalError::Kind::MissingFeature: return ErrorCode::NotSupported;
            case RalError::Kind::UnsupportedSwapChainFormats: return ErrorCode::NotSupported;
            case RalError::Kind::UseAfterDeviceDropped: return ErrorCode::InvalidState;
            case RalError::Kind::DeviceLost: return ErrorCode::InvalidState;
            case RalError::Kind::Timeout: return ErrorCode::Timeout;
            case RalError::Kind::OutOfHostMemory: return ErrorCode::OutOfMemory;
            case RalError::Kind::OutOfDeviceMemory: return ErrorCode::OutOfMemory;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(HandleError::Kind kind) {
        switch (kind) {
            case HandleError::Kind::Null: return ErrorCode::InvalidArgument;
            case HandleError::Kind::Expired: return ErrorCode::InvalidState;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type holding either a value or an error
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Success constructor
    Result(T value) : m_value(std::move(value)) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)) {}

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Get value or default
    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    /// Operator bool (true if ok)
    explicit operator bool() const noexcept { return m_value.has_value(); }

    /// Dereference operator (returns value)
    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    /// Arrow operator
    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error: " + error_message());
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error: " + error_message());
        }
        return std::move(*m_value);
    }

    /// Map success value
    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
        using U = decltype(func(std::declval<T>()));
        if (m_value.has_value()) {
            return Result<U, E>(func(std::move(*m_value)));
        }
        return Result<U, E>(std::move(m_error));
    }

    /// Chain operations
    template<typename F>
    auto and_then(F&& func) -> decltype(func(std::declval<T>())) {
        if (m_value.has_value()) {
            return func(std::move(*m_value));
        }
        using ResultType = decltype(func(std::declval<T>()));
        return ResultType(std::move(m_error));
    }

    /// Handle error case
    template<typename F>
    auto or_else(F&& func) -> Result<T, E> {
        if (m_value.has_value()) {
            return Result<T, E>(std::move(*m_value));
        }
        return func(m_error);
    }

private:
    std::string error_message() const {
        if constexpr (std::is_same_v<E, Error>) {
            return m_error.message();
        } else {
            return "<error>";
        }
    }

    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    /// Success constructor
    Result() : m_has_value(true) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    /// Static factory for success
    [[nodiscard]] static Result ok() { return Result(); }

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    /// Get error
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Operator bool
    explicit operator bool() const noexcept { return m_has_value; }

    /// Unwrap
    void unwrap() const {
        if (!m_has_value) {
            throw std::runtime_error("Result contains error");
        }
    }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with code, kind details and context
std::string build_error_chain(const Error& error);

} // namespace onca_core
