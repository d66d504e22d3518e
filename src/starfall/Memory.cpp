#include <starfall/Memory.hpp>

namespace starfall {

std::expected<uint32_t, Error> find_memory_type(
    const vk::PhysicalDeviceMemoryProperties& properties,
    uint32_t type_bits,
    vk::MemoryPropertyFlags flags
) {
    for (uint32_t i = 0; i < properties.memoryTypeCount; i++) {
        if ((type_bits & (1u << i)) &&
            (properties.memoryTypes[i].propertyFlags & flags) == flags) {
            return i;
        }
    }
    return std::unexpected(Error::make(ErrorCode::NoSuitableMemoryType,
        std::format("No memory type in mask {:#x} with {}", type_bits, vk::to_string(flags))));
}

} // namespace starfall
