#pragma once

#include <starfall/Common.hpp>
#include <starfall/Error.hpp>
#include <expected>

namespace starfall {

/**
 * @brief Pick the first memory type allowed by type_bits that has every requested property
 *
 * @return Memory type index, or NoSuitableMemoryType
 */
[[nodiscard]] std::expected<uint32_t, Error> find_memory_type(
    const vk::PhysicalDeviceMemoryProperties& properties,
    uint32_t type_bits,
    vk::MemoryPropertyFlags flags
);

} // namespace starfall
