#pragma once

#include <starfall/Error.hpp>
#include <starfall/Handle.hpp>
#include <vulkan/vulkan.hpp>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace starfall {

/**
 * @brief A pool ran out of slots; the rest of its instances were skipped this frame
 */
struct InstancesDropped {
    MeshTypeId mesh_type;
    uint32_t dropped;
    uint64_t frame;
};

struct SwapchainRecreated {
    vk::Extent2D extent;
};

/**
 * @brief An asset defect was replaced by a fallback
 */
struct AssetFallbackUsed {
    ErrorCode code;
    std::string message;
};

using RendererEvent = std::variant<InstancesDropped, SwapchainRecreated, AssetFallbackUsed>;

/**
 * @brief Events produced during frames, drained by the application between frames
 */
class EventQueue
{
public:
    void push(RendererEvent event) { m_events.push_back(std::move(event)); }

    [[nodiscard]] std::vector<RendererEvent> drain() { return std::exchange(m_events, {}); }

    [[nodiscard]] std::size_t size() const { return m_events.size(); }

private:
    std::vector<RendererEvent> m_events;
};

} // namespace starfall
