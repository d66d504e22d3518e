#pragma once

#include <cstdint>
#include <deque>
#include <optional>
#include <vector>

namespace starfall {

/**
 * @brief FIFO free-list of instance slots with fence-deferred reuse
 *
 * Released slots wait in a pending list tagged with the frame that last used
 * them. reclaim() returns them to the back of the free list, in release order,
 * once that frame has completed on the GPU.
 */
class SlotAllocator
{
public:
    explicit SlotAllocator(uint32_t capacity);

    /**
     * @brief Oldest free slot, or nullopt when the pool is exhausted
     */
    [[nodiscard]] std::optional<uint32_t> allocate();

    /**
     * @brief Retire a live slot; it becomes reusable after frame_number completes
     *
     * Slots that are not live are ignored with a warning.
     */
    void release(uint32_t slot, uint64_t frame_number);

    /**
     * @brief Move pending slots whose frame is <= completed_frame back to the free list
     *
     * @return Number of slots reclaimed
     */
    std::size_t reclaim(uint64_t completed_frame);

    [[nodiscard]] bool is_live(uint32_t slot) const { return slot < m_live.size() && m_live[slot]; }
    [[nodiscard]] uint32_t capacity() const { return static_cast<uint32_t>(m_live.size()); }
    [[nodiscard]] uint32_t live_count() const { return m_live_count; }
    [[nodiscard]] std::size_t free_count() const { return m_free.size(); }
    [[nodiscard]] std::size_t pending_count() const { return m_pending.size(); }
    [[nodiscard]] const std::deque<uint32_t>& free_list() const { return m_free; }

private:
    struct Pending {
        uint32_t slot;
        uint64_t frame;
    };

    std::deque<uint32_t> m_free;
    std::deque<Pending> m_pending;
    std::vector<bool> m_live;
    uint32_t m_live_count = 0;
};

} // namespace starfall
