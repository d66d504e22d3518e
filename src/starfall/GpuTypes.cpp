#include <starfall/GpuTypes.hpp>

namespace starfall {

std::array<glm::vec4, 3> normal_matrix_columns(const glm::mat4& model)
{
    glm::mat3 upper(model);
    glm::mat3 normal = glm::abs(glm::determinant(upper)) > 1e-12f
        ? glm::transpose(glm::inverse(upper))
        : glm::mat3(1.0f);
    return {glm::vec4(normal[0], 0.0f), glm::vec4(normal[1], 0.0f), glm::vec4(normal[2], 0.0f)};
}

PushConstants make_push_constants(const glm::mat4& model)
{
    PushConstants constants;
    constants.model = model;
    constants.normal_matrix = normal_matrix_columns(model);
    return constants;
}

} // namespace starfall
