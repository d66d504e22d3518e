#include <starfall/Error.hpp>
#include <format>

namespace starfall {

Error Error::make(ErrorCode code, std::string message) {
    return Error{default_kind(code), code, std::move(message)};
}

std::string Error::describe() const {
    return std::format("[{}/{}] {}", to_string(kind), to_string(code), message);
}

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InitializationFailure: return "InitializationFailure";
        case ErrorKind::ResourceExhaustion: return "ResourceExhaustion";
        case ErrorKind::TransientPresent: return "TransientPresent";
        case ErrorKind::FatalDevice: return "FatalDevice";
        case ErrorKind::AssetDefect: return "AssetDefect";
        case ErrorKind::Unknown: return "Unknown";
    }
    return "Unknown";
}

std::string_view to_string(ErrorCode code) {
    using enum ErrorCode;
    switch (code) {
        case NoSuitableGpu: return "NoSuitableGpu";
        case MissingExtension: return "MissingExtension";
        case DeviceLimitTooLow: return "DeviceLimitTooLow";
        case InstanceCreationFailed: return "InstanceCreationFailed";
        case DeviceCreationFailed: return "DeviceCreationFailed";
        case SurfaceCreationFailed: return "SurfaceCreationFailed";
        case NoSuitableMemoryType: return "NoSuitableMemoryType";
        case OutOfDeviceMemory: return "OutOfDeviceMemory";
        case DescriptorPoolExhausted: return "DescriptorPoolExhausted";
        case MeshPoolExhausted: return "MeshPoolExhausted";
        case SwapchainCreationFailed: return "SwapchainCreationFailed";
        case SwapchainOutOfDate: return "SwapchainOutOfDate";
        case DeviceLost: return "DeviceLost";
        case FenceTimeout: return "FenceTimeout";
        case ShaderCompilationFailed: return "ShaderCompilationFailed";
        case PipelineCreationFailed: return "PipelineCreationFailed";
        case InvalidHandle: return "InvalidHandle";
        case InvalidMesh: return "InvalidMesh";
        case InvalidImage: return "InvalidImage";
        case InvalidMaterial: return "InvalidMaterial";
        case FontLoadFailed: return "FontLoadFailed";
        case InvalidConfig: return "InvalidConfig";
        case VulkanCallFailed: return "VulkanCallFailed";
    }
    return "Unknown";
}

ErrorKind default_kind(ErrorCode code) {
    using enum ErrorCode;
    switch (code) {
        case NoSuitableGpu:
        case MissingExtension:
        case DeviceLimitTooLow:
        case InstanceCreationFailed:
        case DeviceCreationFailed:
        case SurfaceCreationFailed:
        case ShaderCompilationFailed:
        case PipelineCreationFailed:
        case InvalidConfig:
        case SwapchainCreationFailed:
            return ErrorKind::InitializationFailure;
        case NoSuitableMemoryType:
        case OutOfDeviceMemory:
        case DescriptorPoolExhausted:
        case MeshPoolExhausted:
            return ErrorKind::ResourceExhaustion;
        case SwapchainOutOfDate:
            return ErrorKind::TransientPresent;
        case DeviceLost:
        case FenceTimeout:
            return ErrorKind::FatalDevice;
        case InvalidMesh:
        case InvalidImage:
        case InvalidMaterial:
        case FontLoadFailed:
            return ErrorKind::AssetDefect;
        case InvalidHandle:
        case VulkanCallFailed:
            return ErrorKind::Unknown;
    }
    return ErrorKind::Unknown;
}

Error error_from_vk_result(vk::Result result, ErrorCode fallback, std::string message) {
    switch (result) {
        case vk::Result::eErrorOutOfHostMemory:
        case vk::Result::eErrorOutOfDeviceMemory:
            return Error::make(ErrorCode::OutOfDeviceMemory, std::move(message));
        case vk::Result::eErrorOutOfPoolMemory:
        case vk::Result::eErrorFragmentedPool:
            return Error::make(ErrorCode::DescriptorPoolExhausted, std::move(message));
        case vk::Result::eErrorDeviceLost:
            return Error::make(ErrorCode::DeviceLost, std::move(message));
        case vk::Result::eErrorOutOfDateKHR:
        case vk::Result::eSuboptimalKHR:
            return Error::make(ErrorCode::SwapchainOutOfDate, std::move(message));
        default:
            return Error::make(fallback, std::move(message));
    }
}

int exit_code(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InitializationFailure: return 1;
        case ErrorKind::FatalDevice: return 2;
        default: return 3;
    }
}

} // namespace starfall
