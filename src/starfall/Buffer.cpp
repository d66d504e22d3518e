#include <starfall/Buffer.hpp>
#include <starfall/Logger.hpp>
#include <starfall/Memory.hpp>
#include <cstring>

namespace starfall {

Buffer::Buffer(vk::Device device, vk::Buffer buffer, vk::DeviceMemory memory, vk::DeviceSize size, MemoryUsage usage, void* mapped)
    : m_device(device)
    , m_buffer(buffer)
    , m_memory(memory)
    , m_size(size)
    , m_memory_usage(usage)
    , m_mapped(mapped)
{}

std::expected<Buffer, Error> Buffer::create(
    const VulkanContext& context,
    vk::DeviceSize size,
    vk::BufferUsageFlags usage,
    MemoryUsage memory
) {
    if (size == 0) {
        return std::unexpected(Error::make(ErrorCode::VulkanCallFailed, "Refusing to create an empty buffer"));
    }

    auto device = context.device();
    if (memory == MemoryUsage::DeviceLocal) {
        usage |= vk::BufferUsageFlagBits::eTransferDst;
    }

    auto buffer_info = vk::BufferCreateInfo()
        .setSize(size)
        .setUsage(usage)
        .setSharingMode(vk::SharingMode::eExclusive);

    auto buffer_res = device.createBuffer(buffer_info);
    STARFALL_CHECK_VK_RESULT(buffer_res, VulkanCallFailed, "Failed to create buffer {}");
    auto buffer = buffer_res.value;

    auto mem_reqs = device.getBufferMemoryRequirements(buffer);
    auto flags = memory == MemoryUsage::HostVisible
        ? vk::MemoryPropertyFlagBits::eHostVisible | vk::MemoryPropertyFlagBits::eHostCoherent
        : vk::MemoryPropertyFlags(vk::MemoryPropertyFlagBits::eDeviceLocal);

    auto memory_type = find_memory_type(context.limits().memory_properties, mem_reqs.memoryTypeBits, flags);
    if (!memory_type) {
        device.destroyBuffer(buffer);
        return std::unexpected(memory_type.error());
    }

    auto alloc_info = vk::MemoryAllocateInfo()
        .setAllocationSize(mem_reqs.size)
        .setMemoryTypeIndex(*memory_type);

    auto memory_res = device.allocateMemory(alloc_info);
    if (memory_res.result != vk::Result::eSuccess) {
        device.destroyBuffer(buffer);
        return std::unexpected(error_from_vk_result(memory_res.result, ErrorCode::OutOfDeviceMemory,
            std::format("Failed to allocate {} bytes of buffer memory {}", mem_reqs.size, vk::to_string(memory_res.result))));
    }
    auto device_memory = memory_res.value;

    // From here on the Buffer owns both handles
    Buffer result(device, buffer, device_memory, size, memory, nullptr);

    auto bind_res = device.bindBufferMemory(buffer, device_memory, 0);
    STARFALL_CHECK_VK_RESULT_VOID(bind_res, VulkanCallFailed, "Failed to bind buffer memory {}");

    if (memory == MemoryUsage::HostVisible) {
        auto map_res = device.mapMemory(device_memory, 0, size);
        STARFALL_CHECK_VK_RESULT(map_res, VulkanCallFailed, "Failed to map buffer memory {}");
        result.m_mapped = map_res.value;
    }

    Logger::instance().trace("Created {} buffer of {} bytes",
        memory == MemoryUsage::HostVisible ? "host-visible" : "device-local", size);
    return result;
}

std::expected<Buffer, Error> Buffer::create_with_data(
    const VulkanContext& context,
    const OneTimeCommands& commands,
    std::span<const std::byte> bytes,
    vk::BufferUsageFlags usage
) {
    auto buffer = create(context, bytes.size(), usage, MemoryUsage::DeviceLocal);
    if (!buffer) {
        return std::unexpected(buffer.error());
    }
    if (auto result = buffer->upload_via_staging(context, commands, bytes); !result) {
        return std::unexpected(result.error());
    }
    return std::move(*buffer);
}

std::expected<void, Error> Buffer::write(std::span<const std::byte> bytes, vk::DeviceSize offset)
{
    if (!m_mapped) {
        return std::unexpected(Error::make(ErrorCode::VulkanCallFailed, "Buffer is not host-visible"));
    }
    if (offset + bytes.size() > m_size) {
        return std::unexpected(Error::make(ErrorCode::VulkanCallFailed,
            std::format("Write of {} bytes at {} exceeds buffer size {}", bytes.size(), offset, m_size)));
    }
    std::memcpy(static_cast<std::byte*>(m_mapped) + offset, bytes.data(), bytes.size());
    return {};
}

std::expected<void, Error> Buffer::upload_via_staging(
    const VulkanContext& context,
    const OneTimeCommands& commands,
    std::span<const std::byte> bytes,
    vk::DeviceSize offset
) {
    if (offset + bytes.size() > m_size) {
        return std::unexpected(Error::make(ErrorCode::VulkanCallFailed,
            std::format("Upload of {} bytes at {} exceeds buffer size {}", bytes.size(), offset, m_size)));
    }

    auto staging = create(context, bytes.size(), vk::BufferUsageFlagBits::eTransferSrc, MemoryUsage::HostVisible);
    if (!staging) {
        return std::unexpected(staging.error());
    }
    if (auto result = staging->write(bytes); !result) {
        return result;
    }

    auto copy_region = vk::BufferCopy()
        .setSrcOffset(0)
        .setDstOffset(offset)
        .setSize(bytes.size());

    return commands.submit([&](vk::CommandBuffer cmd) {
        cmd.copyBuffer(staging->buffer(), m_buffer, copy_region);
    });
}

void Buffer::destroy()
{
    if (m_mapped) {
        m_device.unmapMemory(m_memory);
        m_mapped = nullptr;
    }
    if (m_buffer) {
        m_device.destroyBuffer(m_buffer);
        m_buffer = nullptr;
    }
    if (m_memory) {
        m_device.freeMemory(m_memory);
        m_memory = nullptr;
    }
}

Buffer::~Buffer()
{
    destroy();
}

Buffer::Buffer(Buffer&& other) noexcept
    : m_device(other.m_device)
    , m_buffer(std::exchange(other.m_buffer, nullptr))
    , m_memory(std::exchange(other.m_memory, nullptr))
    , m_size(std::exchange(other.m_size, 0))
    , m_memory_usage(other.m_memory_usage)
    , m_mapped(std::exchange(other.m_mapped, nullptr))
{}

Buffer& Buffer::operator=(Buffer&& other) noexcept
{
    if (this != &other) {
        destroy();
        m_device = other.m_device;
        m_buffer = std::exchange(other.m_buffer, nullptr);
        m_memory = std::exchange(other.m_memory, nullptr);
        m_size = std::exchange(other.m_size, 0);
        m_memory_usage = other.m_memory_usage;
        m_mapped = std::exchange(other.m_mapped, nullptr);
    }
    return *this;
}

} // namespace starfall
