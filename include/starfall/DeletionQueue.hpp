#pragma once

#include <cstdint>
#include <deque>
#include <functional>

namespace starfall {

/**
 * @brief Deferred destruction keyed by the last frame that used a resource
 *
 * Tasks run in enqueue order once their frame number has completed on the GPU.
 */
class DeletionQueue
{
public:
    using Task = std::move_only_function<void()>;

    void enqueue(uint64_t last_used_frame, Task task);

    /**
     * @brief Run every task whose frame is <= completed_frame
     *
     * @return Number of tasks run
     */
    std::size_t collect(uint64_t completed_frame);

    /**
     * @brief Run everything; only valid once the device is idle
     */
    std::size_t flush();

    [[nodiscard]] std::size_t size() const { return m_items.size(); }
    [[nodiscard]] bool empty() const { return m_items.empty(); }

private:
    struct Item {
        uint64_t frame;
        Task task;
    };

    std::deque<Item> m_items;
};

} // namespace starfall
