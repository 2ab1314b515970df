#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for onca_ral module

#include <cstdint>

namespace onca_ral {

// Formats
enum class Format : std::uint8_t;
enum class FormatComponents : std::uint8_t;
enum class FormatDataType : std::uint8_t;
enum class VertexFormat : std::uint8_t;

// Settings
struct Settings;

// Resources
struct PhysicalDevice;
class Device;
class CommandQueue;
class CommandPool;
class Fence;
class MemoryHeap;
class Buffer;
class Texture;
class RenderTargetView;
class SwapChain;

// Memory
struct GpuAllocation;
class GpuAllocator;
class GpuAllocatorImpl;
class MappedMemory;

// Loader
class Ral;

// Backend interfaces
class RalInterface;
class PhysicalDeviceInterface;
class DeviceInterface;
class CommandQueueInterface;
class CommandPoolInterface;
class FenceInterface;
class MemoryHeapInterface;
class BufferInterface;
class TextureInterface;
class RenderTargetViewInterface;
class SwapChainInterface;

} // namespace onca_ral
