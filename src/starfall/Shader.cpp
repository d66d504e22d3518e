#include <starfall/Logger.hpp>
#include <starfall/Shader.hpp>
#include <algorithm>
#include <array>
#include <format>
#include <map>
#include <slang-com-ptr.h>
#include <utility>

namespace starfall {

namespace {

Error compile_error(std::string message)
{
    return Error::make(ErrorCode::ShaderCompilationFailed, std::move(message));
}

std::optional<std::string> diagnostics_text(slang::IBlob* blob)
{
    if (!blob || blob->getBufferSize() == 0) {
        return std::nullopt;
    }
    return std::string(static_cast<const char*>(blob->getBufferPointer()), blob->getBufferSize());
}

/// Owns the process-wide Slang sessions; one SPIR-V target rooted at the shader directory
class SlangCompiler
{
public:
    static SlangCompiler& get()
    {
        static SlangCompiler compiler;
        return compiler;
    }

    std::expected<Slang::ComPtr<slang::IComponentType>, Error> link(std::string_view name, std::string_view entry_point)
    {
        if (!m_session) {
            return std::unexpected(compile_error("Slang session unavailable"));
        }

        Slang::ComPtr<slang::IBlob> diagnostics;
        std::string module_name(name);
        Slang::ComPtr<slang::IModule> module(m_session->loadModule(module_name.c_str(), diagnostics.writeRef()));
        if (!module) {
            auto text = diagnostics_text(diagnostics.get()).value_or(std::format("Module '{}' not found", name));
            Logger::instance().error("Loading '{}' failed: {}", name, text);
            return std::unexpected(compile_error(std::move(text)));
        }
        if (auto warnings = diagnostics_text(diagnostics.get())) {
            Logger::instance().warn("'{}': {}", name, *warnings);
        }

        std::string entry_name(entry_point);
        Slang::ComPtr<slang::IEntryPoint> entry;
        module->findEntryPointByName(entry_name.c_str(), entry.writeRef());
        if (!entry) {
            Logger::instance().error("'{}' has no entry point '{}'", name, entry_point);
            return std::unexpected(compile_error(std::format("Entry point '{}' not found in '{}'", entry_point, name)));
        }

        std::array<slang::IComponentType*, 2> parts{module.get(), entry.get()};
        Slang::ComPtr<slang::IComponentType> composite;
        m_session->createCompositeComponentType(parts.data(), static_cast<SlangInt>(parts.size()), composite.writeRef(), diagnostics.writeRef());
        if (!composite) {
            return std::unexpected(fail("compose", name, diagnostics.get()));
        }

        Slang::ComPtr<slang::IComponentType> linked;
        composite->link(linked.writeRef(), diagnostics.writeRef());
        if (!linked) {
            return std::unexpected(fail("link", name, diagnostics.get()));
        }
        return linked;
    }

private:
    SlangCompiler()
    {
        SlangGlobalSessionDesc global_desc = {};
        if (SLANG_FAILED(slang::createGlobalSession(&global_desc, m_global.writeRef()))) {
            Logger::instance().error("Slang global session could not be created");
            return;
        }

        slang::TargetDesc target = {};
        target.format = SLANG_SPIRV;
        target.profile = m_global->findProfile("spirv_1_5");

        const char* search_paths[] = {STARFALL_SHADER_DIR};

        slang::SessionDesc desc = {};
        desc.targets = &target;
        desc.targetCount = 1;
        desc.defaultMatrixLayoutMode = SLANG_MATRIX_LAYOUT_COLUMN_MAJOR;
        desc.searchPaths = search_paths;
        desc.searchPathCount = 1;

        if (SLANG_FAILED(m_global->createSession(desc, m_session.writeRef()))) {
            Logger::instance().error("Slang SPIR-V session could not be created");
            return;
        }
        Logger::instance().debug("Slang compiling to SPIR-V 1.5 from {}", STARFALL_SHADER_DIR);
    }

    static Error fail(std::string_view step, std::string_view name, slang::IBlob* diagnostics)
    {
        auto text = diagnostics_text(diagnostics).value_or(std::format("Could not {} '{}'", step, name));
        Logger::instance().error("Could not {} '{}': {}", step, name, text);
        return compile_error(std::move(text));
    }

    Slang::ComPtr<slang::IGlobalSession> m_global;
    Slang::ComPtr<slang::ISession> m_session;
};

struct FormatEntry {
    slang::TypeReflection::ScalarType scalar;
    uint32_t components;
    vk::Format format;
    uint32_t bytes;
};

using Scalar = slang::TypeReflection::ScalarType;

constexpr std::array FORMAT_TABLE{
    FormatEntry{Scalar::Float32, 1, vk::Format::eR32Sfloat, 4},
    FormatEntry{Scalar::Float32, 2, vk::Format::eR32G32Sfloat, 8},
    FormatEntry{Scalar::Float32, 3, vk::Format::eR32G32B32Sfloat, 12},
    FormatEntry{Scalar::Float32, 4, vk::Format::eR32G32B32A32Sfloat, 16},
    FormatEntry{Scalar::Int32, 1, vk::Format::eR32Sint, 4},
    FormatEntry{Scalar::Int32, 2, vk::Format::eR32G32Sint, 8},
    FormatEntry{Scalar::Int32, 3, vk::Format::eR32G32B32Sint, 12},
    FormatEntry{Scalar::Int32, 4, vk::Format::eR32G32B32A32Sint, 16},
    FormatEntry{Scalar::UInt32, 1, vk::Format::eR32Uint, 4},
    FormatEntry{Scalar::UInt32, 2, vk::Format::eR32G32Uint, 8},
    FormatEntry{Scalar::UInt32, 3, vk::Format::eR32G32B32Uint, 12},
    FormatEntry{Scalar::UInt32, 4, vk::Format::eR32G32B32A32Uint, 16},
};

/// Falls back to a float4 slot for anything wider or unsupported
const FormatEntry& format_of(slang::TypeReflection* type)
{
    uint32_t components = std::max<uint32_t>(1, static_cast<uint32_t>(type->getElementCount()));
    Scalar scalar = type->getScalarType();
    for (const auto& entry : FORMAT_TABLE) {
        if (entry.scalar == scalar && entry.components == components) {
            return entry;
        }
    }
    Logger::instance().warn("Varying '{}' has no 32-bit format, using RGBA32F", type->getName() ? type->getName() : "?");
    return FORMAT_TABLE[3];
}

std::optional<vk::DescriptorType> descriptor_type_of(slang::BindingType binding)
{
    using enum slang::BindingType;
    auto raw = static_cast<uint32_t>(binding);
    auto base = static_cast<slang::BindingType>(raw & static_cast<uint32_t>(BaseMask));
    bool writable = (raw & static_cast<uint32_t>(MutableFlag)) != 0;

    switch (base) {
    case Sampler: return vk::DescriptorType::eSampler;
    case Texture: return writable ? vk::DescriptorType::eStorageImage : vk::DescriptorType::eSampledImage;
    case CombinedTextureSampler: return vk::DescriptorType::eCombinedImageSampler;
    case ConstantBuffer: return vk::DescriptorType::eUniformBuffer;
    case RawBuffer: return vk::DescriptorType::eStorageBuffer;
    case TypedBuffer: return writable ? vk::DescriptorType::eStorageTexelBuffer : vk::DescriptorType::eUniformTexelBuffer;
    default: return std::nullopt;
    }
}

std::size_t byte_size(slang::TypeLayoutReflection* layout)
{
    while (layout) {
        if (auto size = layout->getSize(); size > 0) {
            return size;
        }
        auto* element = layout->getElementTypeLayout();
        layout = element != layout ? element : nullptr;
    }
    return 0;
}

slang::TypeLayoutReflection* struct_layout(slang::TypeLayoutReflection* layout)
{
    while (layout && layout->getKind() != slang::TypeReflection::Kind::Struct) {
        auto* element = layout->getElementTypeLayout();
        layout = element != layout ? element : nullptr;
    }
    return layout;
}

bool is_builtin(slang::VariableLayoutReflection* field)
{
    const char* semantic = field->getSemanticName();
    return semantic && std::string_view(semantic).starts_with("SV_");
}

/**
 * @brief Walks the layout of one linked entry point
 */
class Reflector
{
public:
    explicit Reflector(slang::IComponentType* linked)
        : m_program(linked->getLayout())
        , m_entry(m_program->getEntryPointCount() > 0 ? m_program->getEntryPointByIndex(0) : nullptr)
    {
    }

    std::expected<ShaderDetails, Error> details() const
    {
        if (!m_entry) {
            return std::unexpected(compile_error("Linked program has no entry point"));
        }
        switch (m_entry->getStage()) {
        case SLANG_STAGE_VERTEX: return vertex_details();
        case SLANG_STAGE_FRAGMENT: return fragment_details();
        default:
            return std::unexpected(compile_error(std::format("Stage {} is not supported", static_cast<int>(m_entry->getStage()))));
        }
    }

    std::vector<ReflectedDescriptor> descriptors() const
    {
        std::vector<ReflectedDescriptor> found;
        for (unsigned i = 0; i < m_program->getParameterCount(); ++i) {
            auto* param = m_program->getParameterByIndex(i);
            auto* layout = param->getTypeLayout();
            for (SlangInt range = 0; range < layout->getBindingRangeCount(); ++range) {
                auto type = descriptor_type_of(layout->getBindingRangeType(range));
                if (!type) {
                    continue;
                }
                auto* leaf = layout->getBindingRangeLeafTypeLayout(range);
                found.push_back(ReflectedDescriptor{
                    .name = param->getName(),
                    .set = param->getBindingSpace(),
                    .binding = param->getBindingIndex() + static_cast<uint32_t>(range),
                    .count = static_cast<uint32_t>(layout->getBindingRangeBindingCount(range)),
                    .type = *type,
                    .size = leaf ? byte_size(leaf) : 0,
                });
                Logger::instance().trace("  {} set={} binding={} {}", found.back().name, found.back().set, found.back().binding, vk::to_string(*type));
            }
        }
        return found;
    }

    std::optional<ReflectedPushBlock> push_block() const
    {
        for (unsigned i = 0; i < m_program->getParameterCount(); ++i) {
            auto* param = m_program->getParameterByIndex(i);
            auto* layout = param->getTypeLayout();
            for (SlangInt range = 0; range < layout->getBindingRangeCount(); ++range) {
                if (layout->getBindingRangeType(range) == slang::BindingType::PushConstant) {
                    return ReflectedPushBlock{
                        .name = param->getName(),
                        .offset = static_cast<uint32_t>(param->getOffset()),
                        .size = static_cast<uint32_t>(byte_size(layout)),
                    };
                }
            }
        }
        return std::nullopt;
    }

private:
    static std::vector<StageVariable> varyings(slang::TypeLayoutReflection* layout)
    {
        std::vector<StageVariable> vars;
        if (!layout) {
            return vars;
        }
        for (unsigned f = 0; f < layout->getFieldCount(); ++f) {
            auto* field = layout->getFieldByIndex(f);
            if (is_builtin(field)) {
                continue;
            }
            vars.push_back(StageVariable{field->getName(), field->getBindingIndex(), format_of(field->getTypeLayout()->getType()).format});
        }
        return vars;
    }

    std::vector<StageVariable> result_varyings() const
    {
        auto* result = m_entry->getResultVarLayout();
        return result ? varyings(struct_layout(result->getTypeLayout())) : std::vector<StageVariable>{};
    }

    // Every struct parameter is its own vertex buffer binding, tightly packed
    VertexDetails vertex_details() const
    {
        VertexDetails details;
        for (unsigned p = 0; p < m_entry->getParameterCount(); ++p) {
            auto* layout = m_entry->getParameterByIndex(p)->getTypeLayout();
            if (layout->getKind() != slang::TypeReflection::Kind::Struct) {
                continue;
            }

            auto binding = static_cast<uint32_t>(details.bindings.size());
            uint32_t offset = 0;
            for (unsigned f = 0; f < layout->getFieldCount(); ++f) {
                auto* field = layout->getFieldByIndex(f);
                const auto& format = format_of(field->getTypeLayout()->getType());
                details.inputs.push_back(VertexAttribute{field->getName(), field->getBindingIndex(), binding, offset, format.format});
                offset += format.bytes;
            }

            const char* type_name = layout->getType()->getName();
            details.bindings.push_back(VertexBinding{binding, offset, type_name ? type_name : ""});
        }
        details.outputs = result_varyings();

        Logger::instance().debug("Vertex stage: {} attributes in {} bindings, {} varyings out", details.inputs.size(), details.bindings.size(), details.outputs.size());
        return details;
    }

    FragmentDetails fragment_details() const
    {
        FragmentDetails details;
        for (unsigned p = 0; p < m_entry->getParameterCount(); ++p) {
            details.inputs.append_range(varyings(struct_layout(m_entry->getParameterByIndex(p)->getTypeLayout())));
        }
        details.outputs = result_varyings();

        Logger::instance().debug("Fragment stage: {} varyings in, {} targets", details.inputs.size(), details.outputs.size());
        return details;
    }

    slang::ProgramLayout* m_program;
    slang::EntryPointReflection* m_entry;
};

} // anonymous namespace

std::vector<std::string> interface_mismatches(std::span<const StageVariable> producer_outputs, std::span<const StageVariable> consumer_inputs)
{
    std::map<uint32_t, const StageVariable*> by_location;
    for (const auto& output : producer_outputs) {
        by_location.emplace(output.location, &output);
    }

    std::vector<std::string> problems;
    for (const auto& input : consumer_inputs) {
        auto it = by_location.find(input.location);
        if (it == by_location.end()) {
            problems.push_back(std::format("input '{}' at location {} is never written", input.name, input.location));
        } else if (it->second->format != input.format) {
            problems.push_back(std::format("location {} is written as {} but read as {}", input.location,
                vk::to_string(it->second->format), vk::to_string(input.format)));
        }
    }
    return problems;
}

bool ShaderDetails::matches(const ShaderDetails& next) const
{
    const auto* vertex = std::get_if<VertexDetails>(this);
    const auto* fragment = std::get_if<FragmentDetails>(&next);
    if (!vertex || !fragment) {
        Logger::instance().error("Only a vertex stage can feed a fragment stage");
        return false;
    }

    auto problems = interface_mismatches(vertex->outputs, fragment->inputs);
    for (const auto& problem : problems) {
        Logger::instance().error("Vertex/fragment interface: {}", problem);
    }
    return problems.empty();
}

vk::ShaderStageFlagBits ShaderDetails::stage() const
{
    return std::holds_alternative<VertexDetails>(*this) ? vk::ShaderStageFlagBits::eVertex : vk::ShaderStageFlagBits::eFragment;
}

std::expected<Shader, Error> Shader::compile(vk::Device device, std::string_view name, std::string_view entry_point)
{
    Logger::instance().info("Compiling shader '{}' ({})", name, entry_point);

    auto linked = SlangCompiler::get().link(name, entry_point);
    if (!linked) {
        return std::unexpected(linked.error());
    }

    Slang::ComPtr<slang::IBlob> spirv;
    Slang::ComPtr<slang::IBlob> diagnostics;
    (*linked)->getEntryPointCode(0, 0, spirv.writeRef(), diagnostics.writeRef());
    if (!spirv) {
        auto text = diagnostics_text(diagnostics.get()).value_or("No SPIR-V was generated");
        Logger::instance().error("SPIR-V generation for '{}' failed: {}", name, text);
        return std::unexpected(compile_error(std::move(text)));
    }

    Reflector reflector(linked->get());
    auto details = reflector.details();
    if (!details) {
        return std::unexpected(details.error());
    }

    auto module_res = device.createShaderModule(vk::ShaderModuleCreateInfo()
        .setCodeSize(spirv->getBufferSize())
        .setPCode(static_cast<const uint32_t*>(spirv->getBufferPointer())));
    STARFALL_CHECK_VK_RESULT(module_res, ShaderCompilationFailed, "Shader module creation failed: {}");

    auto descriptors = reflector.descriptors();
    Logger::instance().debug("Shader '{}': {} bytes of SPIR-V, {} descriptors", name, spirv->getBufferSize(), descriptors.size());

    return Shader(device, module_res.value, std::string(name), std::string(entry_point), std::move(*details), std::move(descriptors), reflector.push_block());
}

Shader::Shader(vk::Device device, vk::ShaderModule module, std::string name, std::string entry_point, ShaderDetails details,
    std::vector<ReflectedDescriptor> descriptors, std::optional<ReflectedPushBlock> push_block)
    : m_device(device)
    , m_module(module)
    , m_name(std::move(name))
    , m_entry_point(std::move(entry_point))
    , m_details(std::move(details))
    , m_descriptors(std::move(descriptors))
    , m_push_block(std::move(push_block))
{
}

Shader::~Shader()
{
    destroy();
}

Shader::Shader(Shader&& other) noexcept
    : m_device(other.m_device)
    , m_module(std::exchange(other.m_module, nullptr))
    , m_name(std::move(other.m_name))
    , m_entry_point(std::move(other.m_entry_point))
    , m_details(std::move(other.m_details))
    , m_descriptors(std::move(other.m_descriptors))
    , m_push_block(std::move(other.m_push_block))
{
}

Shader& Shader::operator=(Shader&& other) noexcept
{
    if (this != &other) {
        destroy();
        m_device = other.m_device;
        m_module = std::exchange(other.m_module, nullptr);
        m_name = std::move(other.m_name);
        m_entry_point = std::move(other.m_entry_point);
        m_details = std::move(other.m_details);
        m_descriptors = std::move(other.m_descriptors);
        m_push_block = std::move(other.m_push_block);
    }
    return *this;
}

vk::PipelineShaderStageCreateInfo Shader::stage_info() const
{
    return vk::PipelineShaderStageCreateInfo()
        .setStage(stage())
        .setModule(m_module)
        .setPName(m_entry_point.c_str());
}

void Shader::destroy()
{
    if (m_device && m_module) {
        m_device.destroyShaderModule(m_module);
        m_module = nullptr;
    }
}

} // namespace starfall
