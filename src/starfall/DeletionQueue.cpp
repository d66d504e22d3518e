#include <starfall/DeletionQueue.hpp>
#include <starfall/Logger.hpp>
#include <utility>

namespace starfall {

void DeletionQueue::enqueue(uint64_t last_used_frame, Task task)
{
    m_items.push_back(Item{last_used_frame, std::move(task)});
}

std::size_t DeletionQueue::collect(uint64_t completed_frame)
{
    std::size_t executed = 0;
    std::deque<Item> kept;
    for (auto& item : m_items) {
        if (item.frame <= completed_frame) {
            item.task();
            ++executed;
        } else {
            kept.push_back(std::move(item));
        }
    }
    m_items = std::move(kept);

    if (executed > 0) {
        Logger::instance().trace("Deletion queue: ran {} tasks up to frame {}, {} pending", executed, completed_frame, m_items.size());
    }
    return executed;
}

std::size_t DeletionQueue::flush()
{
    std::size_t executed = m_items.size();
    for (auto& item : m_items) {
        item.task();
    }
    m_items.clear();
    return executed;
}

} // namespace starfall
