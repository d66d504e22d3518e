#ifndef STARFALL_COMMON_HPP
#define STARFALL_COMMON_HPP

#ifndef GLM_FORCE_DEPTH_ZERO_TO_ONE
#define GLM_FORCE_DEPTH_ZERO_TO_ONE
#endif
#ifndef GLM_FORCE_RADIANS
#define GLM_FORCE_RADIANS
#endif
#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <vulkan/vulkan.hpp>
#include "Error.hpp"
#include <format>
#include <string_view>
#include <utility>

namespace starfall {

template<class... Fs>
struct overloaded : Fs...
{
	using Fs::operator()...;
};

template<class... Fs>
overloaded(Fs...) -> overloaded<Fs...>;

} // namespace starfall

// res is a vk::ResultValue<T>; code an ErrorCode enumerator. fmt receives the vk::Result string.
#define STARFALL_CHECK_VK_RESULT(res, code, msg) \
if (res.result != vk::Result::eSuccess) \
{ \
	return std::unexpected(::starfall::error_from_vk_result(res.result, ::starfall::ErrorCode::code, std::format(msg, vk::to_string(res.result)))); \
} \

// res is a plain vk::Result.
#define STARFALL_CHECK_VK_RESULT_VOID(res, code, msg) \
if (res != vk::Result::eSuccess) \
{ \
	return std::unexpected(::starfall::error_from_vk_result(res, ::starfall::ErrorCode::code, std::format(msg, vk::to_string(res)))); \
} \

#endif // STARFALL_COMMON_HPP
