#ifndef STARFALL_SHADER_HPP
#define STARFALL_SHADER_HPP

#include <starfall/Common.hpp>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace starfall {

/**
 * @brief A descriptor binding declared by a shader
 */
struct ReflectedDescriptor {
    std::string name;
    uint32_t set;
    uint32_t binding;
    uint32_t count; ///< 1 unless arrayed
    vk::DescriptorType type;
    std::size_t size; ///< Uniform block size; 0 for images and samplers
};

struct ReflectedPushBlock {
    std::string name;
    uint32_t offset;
    uint32_t size;

    [[nodiscard]] uint32_t end() const { return offset + size; }
};

/**
 * @brief A user varying; builtins (SV_*) are never listed
 */
struct StageVariable {
    std::string name;
    uint32_t location;
    vk::Format format;
};

struct VertexAttribute {
    std::string name;
    uint32_t location;
    uint32_t binding; ///< Index of the struct parameter that declares it
    uint32_t offset;  ///< Tightly packed within the struct
    vk::Format format;
};

struct VertexBinding {
    uint32_t binding;
    uint32_t stride;  ///< Tightly packed size of the struct
    std::string name; ///< Struct type name, e.g. "PerVertex"
};

struct VertexDetails {
    std::vector<VertexAttribute> inputs;
    std::vector<VertexBinding> bindings;
    std::vector<StageVariable> outputs;
};

struct FragmentDetails {
    std::vector<StageVariable> inputs;
    std::vector<StageVariable> outputs; ///< Only struct results are listed
};

/**
 * @brief Stage interface of one entry point
 */
struct ShaderDetails : std::variant<VertexDetails, FragmentDetails>
{
    using variant::variant;

    /**
     * @brief Whether this stage feeds next
     *
     * Only vertex -> fragment is a valid link. Every fragment input needs a
     * vertex output at the same location with the same format; problems are
     * logged one per line.
     */
    [[nodiscard]] bool matches(const ShaderDetails& next) const;
    [[nodiscard]] vk::ShaderStageFlagBits stage() const;
};

/**
 * @brief One message per consumer input without a matching producer output
 */
[[nodiscard]] std::vector<std::string> interface_mismatches(
    std::span<const StageVariable> producer_outputs,
    std::span<const StageVariable> consumer_inputs
);

/**
 * @brief Slang entry point compiled to SPIR-V 1.5, with its reflection
 *
 * Modules are looked up on STARFALL_SHADER_DIR. Matrices default to
 * column-major so glm data uploads unchanged.
 */
class Shader
{
public:
    /**
     * @brief Compile a vertex or fragment entry point
     *
     * @param device Device that owns the shader module
     * @param name Module path relative to the shader directory, e.g. "starfall/mesh.vert.slang"
     * @return Shader, or ShaderCompilationFailed carrying the Slang diagnostics
     */
    static std::expected<Shader, Error> compile(vk::Device device, std::string_view name, std::string_view entry_point = "main");

    ~Shader();

    Shader(const Shader&) = delete;
    Shader& operator=(const Shader&) = delete;
    Shader(Shader&& other) noexcept;
    Shader& operator=(Shader&& other) noexcept;

    [[nodiscard]] const std::string& name() const { return m_name; }
    [[nodiscard]] vk::ShaderModule module() const { return m_module; }
    [[nodiscard]] vk::ShaderStageFlagBits stage() const { return m_details.stage(); }
    [[nodiscard]] const ShaderDetails& details() const { return m_details; }
    [[nodiscard]] const std::vector<ReflectedDescriptor>& descriptors() const { return m_descriptors; }
    [[nodiscard]] const std::optional<ReflectedPushBlock>& push_block() const { return m_push_block; }

    [[nodiscard]] vk::PipelineShaderStageCreateInfo stage_info() const;

private:
    Shader(vk::Device device, vk::ShaderModule module, std::string name, std::string entry_point, ShaderDetails details,
        std::vector<ReflectedDescriptor> descriptors, std::optional<ReflectedPushBlock> push_block);
    void destroy();

    vk::Device m_device;
    vk::ShaderModule m_module;
    std::string m_name;
    std::string m_entry_point;
    ShaderDetails m_details;
    std::vector<ReflectedDescriptor> m_descriptors;
    std::optional<ReflectedPushBlock> m_push_block;
};

} // namespace starfall

#endif // STARFALL_SHADER_HPP
