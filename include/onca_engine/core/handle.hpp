#pragma once

/// @file handle.hpp
/// @brief Reference-counted strong/weak handles for onca_core
///
/// Every Handle<T> points at a heap control block holding an atomic strong count,
/// an atomic weak count and the payload. The payload is destroyed in place when the
/// last strong reference is dropped; the block itself is freed once no weak
/// references remain either. All live strong references together hold one weak
/// reference, so the block outlives the payload for as long as any WeakHandle exists.

#include "fwd.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <new>
#include <optional>
#include <ostream>
#include <type_traits>
#include <utility>

namespace onca_core {

namespace detail {

/// Control block shared by Handle<T> and WeakHandle<T>
template<typename T>
struct HandleBlock {
    std::atomic<std::uint32_t> strong{0};
    std::atomic<std::uint32_t> weak{1};
    alignas(T) unsigned char storage[sizeof(T)];

    [[nodiscard]] T* payload() noexcept {
        return std::launder(reinterpret_cast<T*>(storage));
    }

    /// Drop one weak reference, freeing the block at zero
    void release_weak() noexcept {
        if (weak.fetch_sub(1, std::memory_order_release) == 1) {
            std::atomic_thread_fence(std::memory_order_acquire);
            delete this;
        }
    }
};

} // namespace detail

// =============================================================================
// Handle<T>
// =============================================================================

/// Strong reference to a shared payload
template<typename T>
class Handle {
public:
    using element_type = T;

    /// Null handle
    Handle() noexcept = default;

    /// Construct a new payload in a fresh control block
    template<typename... Args>
    [[nodiscard]] static Handle create(Args&&... args) {
        auto* block = new detail::HandleBlock<T>();
        try {
            ::new (static_cast<void*>(block->storage)) T(std::forward<Args>(args)...);
        } catch (...) {
            delete block;
            throw;
        }
        block->strong.store(1, std::memory_order_relaxed);
        return Handle(block);
    }

    /// Construct a payload that needs a weak reference to itself during construction.
    /// @param func Called with a WeakHandle<T> that cannot be upgraded until construction finishes; returns the payload
    template<typename F>
    [[nodiscard]] static Handle create_cyclic(F&& func) {
        auto* block = new detail::HandleBlock<T>();
        try {
            WeakHandle<T> weak = WeakHandle<T>::from_block(block);
            ::new (static_cast<void*>(block->storage)) T(func(weak));
        } catch (...) {
            block->release_weak();
            throw;
        }
        block->strong.store(1, std::memory_order_release);
        return Handle(block);
    }

    Handle(const Handle& other) noexcept : m_block(other.m_block) {
        if (m_block) {
            m_block->strong.fetch_add(1, std::memory_order_relaxed);
        }
    }

    Handle(Handle&& other) noexcept : m_block(std::exchange(other.m_block, nullptr)) {}

    Handle& operator=(const Handle& other) noexcept {
        if (this != &other) {
            Handle tmp(other);
            swap(tmp);
        }
        return *this;
    }

    Handle& operator=(Handle&& other) noexcept {
        if (this != &other) {
            reset();
            m_block = std::exchange(other.m_block, nullptr);
        }
        return *this;
    }

    ~Handle() { reset(); }

    /// Drop this reference, destroying the payload if it was the last strong one
    void reset() noexcept {
        auto* block = std::exchange(m_block, nullptr);
        if (!block) {
            return;
        }
        if (block->strong.fetch_sub(1, std::memory_order_release) == 1) {
            std::atomic_thread_fence(std::memory_order_acquire);
            block->payload()->~T();
            block->release_weak();
        }
    }

    void swap(Handle& other) noexcept { std::swap(m_block, other.m_block); }

    /// Create a weak reference to the same payload
    [[nodiscard]] WeakHandle<T> downgrade() const noexcept {
        return m_block ? WeakHandle<T>::from_block(m_block) : WeakHandle<T>{};
    }

    /// Check if null
    [[nodiscard]] bool is_null() const noexcept { return m_block == nullptr; }

    /// Check if valid
    [[nodiscard]] bool is_valid() const noexcept { return m_block != nullptr; }

    explicit operator bool() const noexcept { return m_block != nullptr; }

    [[nodiscard]] T* get() const noexcept { return m_block ? m_block->payload() : nullptr; }
    T* operator->() const noexcept { return m_block->payload(); }
    T& operator*() const noexcept { return *m_block->payload(); }

    /// Number of strong references
    [[nodiscard]] std::uint32_t strong_count() const noexcept {
        return m_block ? m_block->strong.load(std::memory_order_acquire) : 0;
    }

    /// Number of weak references, excluding the one held on behalf of the strong references
    [[nodiscard]] std::uint32_t weak_count() const noexcept {
        return m_block ? m_block->weak.load(std::memory_order_acquire) - 1 : 0;
    }

    /// Identity comparison
    [[nodiscard]] bool ptr_eq(const Handle& other) const noexcept { return m_block == other.m_block; }

    bool operator==(const Handle& other) const noexcept { return m_block == other.m_block; }
    bool operator!=(const Handle& other) const noexcept { return m_block != other.m_block; }

    /// Opaque identity, stable for the lifetime of the control block
    [[nodiscard]] const void* identity() const noexcept { return m_block; }

private:
    friend class WeakHandle<T>;

    /// Adopts one strong reference already counted in the block
    explicit Handle(detail::HandleBlock<T>* block) noexcept : m_block(block) {}

    detail::HandleBlock<T>* m_block = nullptr;
};

// =============================================================================
// WeakHandle<T>
// =============================================================================

/// Weak reference that can be upgraded while a strong reference exists
template<typename T>
class WeakHandle {
public:
    /// Null weak handle, never upgrades
    WeakHandle() noexcept = default;

    WeakHandle(const WeakHandle& other) noexcept : m_block(other.m_block) {
        if (m_block) {
            m_block->weak.fetch_add(1, std::memory_order_relaxed);
        }
    }

    WeakHandle(WeakHandle&& other) noexcept : m_block(std::exchange(other.m_block, nullptr)) {}

    WeakHandle& operator=(const WeakHandle& other) noexcept {
        if (this != &other) {
            WeakHandle tmp(other);
            std::swap(m_block, tmp.m_block);
        }
        return *this;
    }

    WeakHandle& operator=(WeakHandle&& other) noexcept {
        if (this != &other) {
            reset();
            m_block = std::exchange(other.m_block, nullptr);
        }
        return *this;
    }

    ~WeakHandle() { reset(); }

    void reset() noexcept {
        if (auto* block = std::exchange(m_block, nullptr)) {
            block->release_weak();
        }
    }

    /// Try to obtain a strong reference; empty once the payload has been destroyed
    [[nodiscard]] std::optional<Handle<T>> upgrade() const noexcept {
        if (!m_block) {
            return std::nullopt;
        }
        std::uint32_t count = m_block->strong.load(std::memory_order_relaxed);
        while (count != 0) {
            if (m_block->strong.compare_exchange_weak(count, count + 1,
                    std::memory_order_acquire, std::memory_order_relaxed)) {
                return Handle<T>(m_block);
            }
        }
        return std::nullopt;
    }

    /// Check if the payload has been destroyed (or this handle is null)
    [[nodiscard]] bool expired() const noexcept { return strong_count() == 0; }

    [[nodiscard]] bool is_null() const noexcept { return m_block == nullptr; }

    [[nodiscard]] std::uint32_t strong_count() const noexcept {
        return m_block ? m_block->strong.load(std::memory_order_acquire) : 0;
    }

    /// Check if this weak handle refers to the same block as a strong handle
    [[nodiscard]] bool ptr_eq(const Handle<T>& handle) const noexcept { return m_block == handle.m_block; }

    bool operator==(const WeakHandle& other) const noexcept { return m_block == other.m_block; }
    bool operator!=(const WeakHandle& other) const noexcept { return m_block != other.m_block; }

private:
    friend class Handle<T>;

    /// Takes a new weak reference on the block
    [[nodiscard]] static WeakHandle from_block(detail::HandleBlock<T>* block) noexcept {
        WeakHandle weak;
        block->weak.fetch_add(1, std::memory_order_relaxed);
        weak.m_block = block;
        return weak;
    }

    detail::HandleBlock<T>* m_block = nullptr;
};

/// Output stream operator
template<typename T>
std::ostream& operator<<(std::ostream& os, const Handle<T>& h) {
    if (h.is_null()) {
        return os << "Handle(null)";
    }
    return os << "Handle(" << h.identity() << ", strong=" << h.strong_count() << ")";
}

} // namespace onca_core

// =============================================================================
// Hash Specialization
// =============================================================================

template<typename T>
struct std::hash<onca_core::Handle<T>> {
    std::size_t operator()(const onca_core::Handle<T>& h) const noexcept {
        return std::hash<const void*>{}(h.identity());
    }
};
