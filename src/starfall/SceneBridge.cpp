#include <starfall/SceneBridge.hpp>
#include <algorithm>
#include <tuple>
#include <unordered_map>

namespace starfall {

uint32_t FramePlan::instance_count() const
{
    uint32_t count = 0;
    for (const auto& batch : batches) {
        count += static_cast<uint32_t>(batch.instances.size());
    }
    return count;
}

InstanceData make_instance(
    const glm::mat4& transform,
    const InstanceAppearance& appearance,
    std::optional<glm::vec4> tint,
    uint32_t texture_flags,
    uint32_t material_index
) {
    InstanceData instance;
    instance.model = transform;
    auto normal = normal_matrix_columns(transform);
    instance.normal_matrix = {normal[0], normal[1], normal[2], glm::vec4(0.0f)};
    instance.material_color = appearance.color * tint.value_or(glm::vec4(1.0f));
    instance.emission_color = appearance.emission;
    instance.texture_flags = glm::uvec4(texture_flags, 0u, 0u, 0u);
    instance.material_index = material_index;
    return instance;
}

RenderStage classify(const DrawItem& item)
{
    return describe_variant(resolve_pipeline(item.material_variant, item.pool_kind, 1, item.blend)).stage;
}

float view_depth(const glm::mat4& view, const glm::mat4& model)
{
    return -(view * model[3]).z;
}

namespace {

struct Keyed {
    const DrawItem* item;
    float depth;
};

auto sort_key(const Keyed& k)
{
    return std::tuple(k.item->material_variant, k.item->pool, k.item->material);
}

void append_batches(std::vector<DrawBatch>& out, const std::vector<Keyed>& sorted, RenderStage stage)
{
    std::unordered_map<MeshTypeId, std::size_t> batch_of_pool;
    std::vector<const DrawItem*> first_items;
    std::size_t first = out.size();
    for (const auto& k : sorted) {
        auto [it, inserted] = batch_of_pool.try_emplace(k.item->pool, out.size());
        if (inserted) {
            DrawBatch batch;
            batch.pool = k.item->pool;
            batch.material = k.item->material;
            batch.stage = stage;
            out.push_back(std::move(batch));
            first_items.push_back(k.item);
        }
        out[it->second].instances.push_back(k.item->instance);
    }

    // The variant depends on how many instances the pool ends up with
    for (std::size_t i = 0; i < first_items.size(); ++i) {
        const auto& item = *first_items[i];
        auto& batch = out[first + i];
        batch.variant = resolve_pipeline(item.material_variant, item.pool_kind,
            static_cast<uint32_t>(batch.instances.size()), item.blend);
    }
}

} // anonymous namespace

FramePlan plan_frame(std::span<const DrawItem> items, const glm::mat4& view)
{
    std::vector<Keyed> opaque;
    std::vector<Keyed> transparent;
    std::vector<Keyed> ui;

    for (std::size_t i = 0; i < items.size(); ++i) {
        Keyed keyed{&items[i], view_depth(view, items[i].instance.model)};
        switch (classify(items[i])) {
            case RenderStage::Opaque: opaque.push_back(keyed); break;
            case RenderStage::Transparent: transparent.push_back(keyed); break;
            case RenderStage::Ui: ui.push_back(keyed); break;
        }
    }

    std::stable_sort(opaque.begin(), opaque.end(), [](const Keyed& a, const Keyed& b) {
        auto ka = sort_key(a);
        auto kb = sort_key(b);
        if (ka != kb) {
            return ka < kb;
        }
        return a.depth < b.depth;
    });

    std::stable_sort(transparent.begin(), transparent.end(), [](const Keyed& a, const Keyed& b) {
        if (a.depth != b.depth) {
            return a.depth > b.depth;
        }
        return sort_key(a) < sort_key(b);
    });

    FramePlan plan;
    append_batches(plan.batches, opaque, RenderStage::Opaque);
    append_batches(plan.batches, transparent, RenderStage::Transparent);
    append_batches(plan.batches, ui, RenderStage::Ui);

    for (std::size_t i = 1; i < plan.batches.size(); ++i) {
        auto& batch = plan.batches[i];
        const auto& previous = plan.batches[i - 1];
        batch.bind_pipeline = previous.variant != batch.variant;
        batch.bind_material = previous.material != batch.material;
    }
    return plan;
}

} // namespace starfall
