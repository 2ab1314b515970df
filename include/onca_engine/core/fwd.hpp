#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for onca_core module

#include <cstdint>

namespace onca_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Version
// =============================================================================

struct Version;

// =============================================================================
// Handle Types
// =============================================================================

template<typename T>
class Handle;

template<typename T>
class WeakHandle;

// =============================================================================
// Dynamic Libraries
// =============================================================================

class DynamicLibrary;

} // namespace onca_core
