/// @file error.cpp
/// @brief Error handling implementation for onca_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Error formatting utilities
/// - Explicit template instantiations for common Result types

#include <onca_engine/core/error.hpp>
#include <sstream>

namespace onca_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

std::string format_library_error(const LibraryError& err) {
    std::ostringstream oss;
    oss << "[LibraryError] " << err.message;

    if (!err.symbol.empty()) {
        oss << " (symbol: " << err.symbol << ")";
    }

    return oss.str();
}

const char* ral_error_kind_name(RalError::Kind kind) {
    switch (kind) {
        case RalError::Kind::InvalidParameter: return "InvalidParameter";
        case RalError::Kind::NotImplemented: return "NotImplemented";
        case RalError::Kind::UseAfterDeviceDropped: return "UseAfterDeviceDropped";
        case RalError::Kind::UnsupportedSwapChainFormats: return "UnsupportedSwapChainFormats";
        case RalError::Kind::MissingFeature: return "MissingFeature";
        case RalError::Kind::UnmetRequirement: return "UnmetRequirement";
        case RalError::Kind::Timeout: return "Timeout";
        case RalError::Kind::DeviceLost: return "DeviceLost";
        case RalError::Kind::OutOfHostMemory: return "OutOfHostMemory";
        case RalError::Kind::OutOfDeviceMemory: return "OutOfDeviceMemory";
        case RalError::Kind::Other: return "Other";
        default: return "Unknown";
    }
}

std::string format_ral_error(const RalError& err) {
    std::ostringstream oss;
    oss << "[RalError::" << ral_error_kind_name(err.kind) << "] " << err.message;
    return oss.str();
}

std::string format_handle_error(const HandleError& err) {
    std::ostringstream oss;
    oss << "[HandleError] " << err.message;
    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, LibraryError>) {
            oss << detail::format_library_error(err);
        } else if constexpr (std::is_same_v<T, RalError>) {
            oss << detail::format_ral_error(err);
        } else if constexpr (std::is_same_v<T, HandleError>) {
            oss << detail::format_handle_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << "\n  " << key << ": " << value;
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::uint8_t, Error>;
template class Result<std::uint64_t, Error>;

} // namespace onca_core
