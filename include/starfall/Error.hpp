#pragma once

#include <vulkan/vulkan.hpp>
#include <cstdint>
#include <string>
#include <string_view>

namespace starfall {

/**
 * @brief Coarse error taxonomy. Decides how the caller reacts and which exit code the process uses.
 */
enum class ErrorKind : uint8_t {
    InitializationFailure,
    ResourceExhaustion,
    TransientPresent,
    FatalDevice,
    AssetDefect,
    Unknown
};

enum class ErrorCode : uint8_t {
    NoSuitableGpu,
    MissingExtension,
    DeviceLimitTooLow,
    InstanceCreationFailed,
    DeviceCreationFailed,
    SurfaceCreationFailed,
    NoSuitableMemoryType,
    OutOfDeviceMemory,
    DescriptorPoolExhausted,
    MeshPoolExhausted,
    SwapchainCreationFailed,
    SwapchainOutOfDate,
    DeviceLost,
    FenceTimeout,
    ShaderCompilationFailed,
    PipelineCreationFailed,
    InvalidHandle,
    InvalidMesh,
    InvalidImage,
    InvalidMaterial,
    FontLoadFailed,
    InvalidConfig,
    VulkanCallFailed
};

struct Error {
    ErrorKind kind;
    ErrorCode code;
    std::string message;

    /**
     * @brief Build an error whose kind is the default kind of its code
     */
    static Error make(ErrorCode code, std::string message);

    /**
     * @brief "[Kind/Code] message", used for log lines
     */
    [[nodiscard]] std::string describe() const;
};

[[nodiscard]] std::string_view to_string(ErrorKind kind);
[[nodiscard]] std::string_view to_string(ErrorCode code);

/**
 * @brief Kind an error code falls into unless a Vulkan result says otherwise
 */
[[nodiscard]] ErrorKind default_kind(ErrorCode code);

/**
 * @brief Translate a failing Vulkan result into an Error
 *
 * Memory, pool, device-lost and out-of-date results map to their own codes;
 * anything else keeps the caller's code.
 */
[[nodiscard]] Error error_from_vk_result(vk::Result result, ErrorCode fallback, std::string message);

/**
 * @brief Process exit code: InitializationFailure 1, FatalDevice 2, everything else 3
 */
[[nodiscard]] int exit_code(ErrorKind kind);

} // namespace starfall
