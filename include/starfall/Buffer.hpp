#pragma once

#include <starfall/Commands.hpp>
#include <starfall/VulkanContext.hpp>
#include <cstddef>
#include <expected>
#include <span>

namespace starfall {

enum class MemoryUsage : uint8_t {
    HostVisible, ///< Host-coherent, persistently mapped
    DeviceLocal  ///< Written through a staging copy
};

/**
 * @brief RAII wrapper for a buffer and the memory bound to it
 *
 * Usage flags and memory properties are fixed at creation. Host-visible
 * buffers stay mapped until destruction.
 */
class Buffer
{
public:
    /**
     * @brief Create a buffer
     *
     * @param context Vulkan context
     * @param size Size in bytes, must be non-zero
     * @param usage Buffer usage flags; DeviceLocal buffers get TRANSFER_DST added
     * @param memory Memory placement
     * @return Buffer, or NoSuitableMemoryType / OutOfDeviceMemory
     */
    static std::expected<Buffer, Error> create(
        const VulkanContext& context,
        vk::DeviceSize size,
        vk::BufferUsageFlags usage,
        MemoryUsage memory
    );

    /**
     * @brief Device-local buffer filled from bytes through a staging copy
     */
    static std::expected<Buffer, Error> create_with_data(
        const VulkanContext& context,
        const OneTimeCommands& commands,
        std::span<const std::byte> bytes,
        vk::BufferUsageFlags usage
    );

    ~Buffer();

    Buffer(const Buffer&) = delete;
    Buffer& operator=(const Buffer&) = delete;
    Buffer(Buffer&& other) noexcept;
    Buffer& operator=(Buffer&& other) noexcept;

    [[nodiscard]] vk::Buffer buffer() const { return m_buffer; }
    [[nodiscard]] vk::DeviceSize size() const { return m_size; }
    [[nodiscard]] MemoryUsage memory_usage() const { return m_memory_usage; }
    [[nodiscard]] void* mapped() const { return m_mapped; }

    /**
     * @brief Copy bytes into a host-visible buffer
     */
    std::expected<void, Error> write(std::span<const std::byte> bytes, vk::DeviceSize offset = 0);

    template<class T>
    std::expected<void, Error> write_object(const T& value, vk::DeviceSize offset = 0)
    {
        return write(std::as_bytes(std::span{&value, 1}), offset);
    }

    /**
     * @brief Copy bytes into a device-local buffer via a temporary staging buffer
     */
    std::expected<void, Error> upload_via_staging(
        const VulkanContext& context,
        const OneTimeCommands& commands,
        std::span<const std::byte> bytes,
        vk::DeviceSize offset = 0
    );

    [[nodiscard]] vk::DescriptorBufferInfo descriptor_info(
        vk::DeviceSize offset = 0,
        vk::DeviceSize range = VK_WHOLE_SIZE
    ) const {
        return vk::DescriptorBufferInfo()
            .setBuffer(m_buffer)
            .setOffset(offset)
            .setRange(range);
    }

private:
    Buffer(vk::Device device, vk::Buffer buffer, vk::DeviceMemory memory, vk::DeviceSize size, MemoryUsage usage, void* mapped);

    void destroy();

    vk::Device m_device;
    vk::Buffer m_buffer;
    vk::DeviceMemory m_memory;
    vk::DeviceSize m_size = 0;
    MemoryUsage m_memory_usage = MemoryUsage::HostVisible;
    void* m_mapped = nullptr;
};

} // namespace starfall
