#pragma once

#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

namespace starfall {

/**
 * @brief Generational index into a SlotMap
 *
 * A handle stays valid until its entry is erased. Erasing bumps the slot's
 * generation so stale copies resolve to nothing instead of a newer entry.
 */
template<class Tag>
struct Handle {
    static constexpr uint32_t INVALID_INDEX = UINT32_MAX;

    uint32_t index = INVALID_INDEX;
    uint32_t generation = 0;

    [[nodiscard]] bool valid() const { return index != INVALID_INDEX; }

    auto operator<=>(const Handle&) const = default;
};

struct MeshTypeTag;
struct MaterialTag;
struct TextureTag;

using MeshTypeId = Handle<MeshTypeTag>;
using MaterialId = Handle<MaterialTag>;
using TextureId = Handle<TextureTag>;

template<class T, class Tag>
class SlotMap {
public:
    using handle_type = Handle<Tag>;

    handle_type insert(T value) {
        if (!m_free.empty()) {
            uint32_t index = m_free.back();
            m_free.pop_back();
            auto& slot = m_slots[index];
            slot.value.emplace(std::move(value));
            ++m_size;
            return {index, slot.generation};
        }
        m_slots.push_back(Slot{std::optional<T>(std::move(value)), 0});
        ++m_size;
        return {static_cast<uint32_t>(m_slots.size() - 1), 0};
    }

    [[nodiscard]] T* get(handle_type handle) {
        if (!contains(handle)) return nullptr;
        return &*m_slots[handle.index].value;
    }

    [[nodiscard]] const T* get(handle_type handle) const {
        if (!contains(handle)) return nullptr;
        return &*m_slots[handle.index].value;
    }

    [[nodiscard]] bool contains(handle_type handle) const {
        return handle.index < m_slots.size() &&
               m_slots[handle.index].generation == handle.generation &&
               m_slots[handle.index].value.has_value();
    }

    /**
     * @brief Remove an entry and return it; invalidates every copy of the handle
     */
    std::optional<T> erase(handle_type handle) {
        if (!contains(handle)) return std::nullopt;
        auto& slot = m_slots[handle.index];
        std::optional<T> out = std::move(slot.value);
        slot.value.reset();
        ++slot.generation;
        m_free.push_back(handle.index);
        --m_size;
        return out;
    }

    void for_each(const std::function<void(handle_type, T&)>& fn) {
        for (uint32_t i = 0; i < m_slots.size(); ++i) {
            if (m_slots[i].value) {
                fn(handle_type{i, m_slots[i].generation}, *m_slots[i].value);
            }
        }
    }

    void clear() {
        for (uint32_t i = 0; i < m_slots.size(); ++i) {
            if (m_slots[i].value) {
                m_slots[i].value.reset();
                ++m_slots[i].generation;
                m_free.push_back(i);
            }
        }
        m_size = 0;
    }

    [[nodiscard]] std::size_t size() const { return m_size; }
    [[nodiscard]] bool empty() const { return m_size == 0; }

private:
    struct Slot {
        std::optional<T> value;
        uint32_t generation;
    };

    std::vector<Slot> m_slots;
    std::vector<uint32_t> m_free;
    std::size_t m_size = 0;
};

} // namespace starfall

template<class Tag>
struct std::hash<starfall::Handle<Tag>> {
    std::size_t operator()(const starfall::Handle<Tag>& handle) const noexcept {
        return std::hash<uint64_t>{}((static_cast<uint64_t>(handle.generation) << 32) | handle.index);
    }
};
