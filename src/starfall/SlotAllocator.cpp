#include <starfall/SlotAllocator.hpp>
#include <starfall/Logger.hpp>

namespace starfall {

SlotAllocator::SlotAllocator(uint32_t capacity)
    : m_live(capacity, false)
{
    for (uint32_t i = 0; i < capacity; ++i) {
        m_free.push_back(i);
    }
}

std::optional<uint32_t> SlotAllocator::allocate()
{
    if (m_free.empty()) {
        return std::nullopt;
    }
    uint32_t slot = m_free.front();
    m_free.pop_front();
    m_live[slot] = true;
    ++m_live_count;
    return slot;
}

void SlotAllocator::release(uint32_t slot, uint64_t frame_number)
{
    if (!is_live(slot)) {
        Logger::instance().warn("Ignoring release of slot {} which is not live", slot);
        return;
    }
    m_live[slot] = false;
    --m_live_count;
    m_pending.push_back(Pending{slot, frame_number});
}

std::size_t SlotAllocator::reclaim(uint64_t completed_frame)
{
    std::size_t reclaimed = 0;
    std::deque<Pending> still_pending;
    for (const auto& entry : m_pending) {
        if (entry.frame <= completed_frame) {
            m_free.push_back(entry.slot);
            ++reclaimed;
        } else {
            still_pending.push_back(entry);
        }
    }
    m_pending = std::move(still_pending);
    return reclaimed;
}

} // namespace starfall
