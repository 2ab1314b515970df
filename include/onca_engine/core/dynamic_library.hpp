#pragma once

/// @file dynamic_library.hpp
/// @brief Cross-platform dynamic library loading

#include "fwd.hpp"
#include "error.hpp"

#include <filesystem>
#include <string>

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#else
#include <dlfcn.h>
#endif

/// Platform-specific export macro for module entry points
#if defined(_WIN32)
    #define ONCA_EXPORT __declspec(dllexport)
#else
    #define ONCA_EXPORT __attribute__((visibility("default")))
#endif

namespace onca_core {

/// @brief Cross-platform dynamic library loader
class DynamicLibrary {
public:
    DynamicLibrary() = default;
    ~DynamicLibrary() { unload(); }

    // Non-copyable
    DynamicLibrary(const DynamicLibrary&) = delete;
    DynamicLibrary& operator=(const DynamicLibrary&) = delete;

    // Movable
    DynamicLibrary(DynamicLibrary&& other) noexcept
        : m_handle(other.m_handle)
        , m_path(std::move(other.m_path))
        , m_error(std::move(other.m_error)) {
        other.m_handle = nullptr;
    }

    DynamicLibrary& operator=(DynamicLibrary&& other) noexcept {
        if (this != &other) {
            unload();
            m_handle = other.m_handle;
            m_path = std::move(other.m_path);
            m_error = std::move(other.m_error);
            other.m_handle = nullptr;
        }
        return *this;
    }

    /// @brief File extension of dynamic libraries on this platform, including the dot
    [[nodiscard]] static const char* extension() noexcept {
#if defined(_WIN32)
        return ".dll";
#elif defined(__APPLE__)
        return ".dylib";
#else
        return ".so";
#endif
    }

    /// @brief Load a dynamic library from path
    Result<void> load(const std::filesystem::path& path) {
        unload();
        m_path = path;
        m_error.clear();

#ifdef _WIN32
        m_handle = LoadLibraryW(path.wstring().c_str());
        if (!m_handle) {
            DWORD err = GetLastError();
            m_error = "LoadLibrary failed with error " + std::to_string(err);
        }
#else
        m_handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
        if (!m_handle) {
            const char* err = dlerror();
            m_error = err ? err : "Unknown dlopen error";
        }
#endif
        if (!m_handle) {
            return Error(LibraryError::dyn_lib(path.string(), m_error));
        }
        return Ok();
    }

    /// @brief Unload the library
    void unload() {
        if (m_handle) {
#ifdef _WIN32
            FreeLibrary(static_cast<HMODULE>(m_handle));
#else
            dlclose(m_handle);
#endif
            m_handle = nullptr;
        }
        m_path.clear();
    }

    /// @brief Check if library is loaded
    [[nodiscard]] bool is_loaded() const { return m_handle != nullptr; }

    /// @brief Get a function pointer by name, nullptr if the symbol is missing
    template<typename FuncType>
    FuncType get_function(const char* name) const {
        if (!m_handle) return nullptr;

#ifdef _WIN32
        return reinterpret_cast<FuncType>(
            GetProcAddress(static_cast<HMODULE>(m_handle), name));
#else
        return reinterpret_cast<FuncType>(dlsym(m_handle, name));
#endif
    }

    /// @brief Get a function pointer by name, failing with LoadFunction if the symbol is missing
    template<typename FuncType>
    Result<FuncType> require_function(const char* name) const {
        FuncType func = get_function<FuncType>(name);
        if (!func) {
            return Error(LibraryError::load_function(m_path.string(), name));
        }
        return func;
    }

    /// @brief Get last error message
    [[nodiscard]] const std::string& error() const { return m_error; }

    /// @brief Get library path
    [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

private:
    void* m_handle{nullptr};
    std::filesystem::path m_path;
    std::string m_error;
};

} // namespace onca_core
