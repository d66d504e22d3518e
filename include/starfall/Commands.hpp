#pragma once

#include <starfall/VulkanContext.hpp>
#include <expected>
#include <functional>

namespace starfall {

/**
 * @brief Short-lived command buffers for uploads and layout transitions
 *
 * Every submit blocks on its own fence, so recorded resources can be freed as
 * soon as submit() returns.
 */
class OneTimeCommands
{
public:
    static std::expected<OneTimeCommands, Error> create(const VulkanContext& context);

    ~OneTimeCommands();

    OneTimeCommands(const OneTimeCommands&) = delete;
    OneTimeCommands& operator=(const OneTimeCommands&) = delete;
    OneTimeCommands(OneTimeCommands&& other) noexcept;
    OneTimeCommands& operator=(OneTimeCommands&& other) noexcept;

    /**
     * @brief Record through the callback, submit on the graphics queue and wait
     */
    std::expected<void, Error> submit(const std::function<void(vk::CommandBuffer)>& record) const;

private:
    OneTimeCommands(vk::Device device, vk::Queue queue, vk::CommandPool pool, vk::Fence fence);
    void destroy();

    vk::Device m_device;
    vk::Queue m_queue;
    vk::CommandPool m_pool;
    vk::Fence m_fence;
};

} // namespace starfall
