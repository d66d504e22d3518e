#include <starfall/Texture.hpp>
#include <starfall/Buffer.hpp>
#include <starfall/Logger.hpp>
#include <starfall/Memory.hpp>

namespace starfall {

namespace {

void transition_image(
    vk::CommandBuffer cmd,
    vk::Image image,
    vk::ImageLayout old_layout,
    vk::ImageLayout new_layout,
    vk::AccessFlags src_access,
    vk::AccessFlags dst_access,
    vk::PipelineStageFlags src_stage,
    vk::PipelineStageFlags dst_stage
) {
    auto barrier = vk::ImageMemoryBarrier()
        .setOldLayout(old_layout)
        .setNewLayout(new_layout)
        .setSrcQueueFamilyIndex(VK_QUEUE_FAMILY_IGNORED)
        .setDstQueueFamilyIndex(VK_QUEUE_FAMILY_IGNORED)
        .setImage(image)
        .setSubresourceRange(vk::ImageSubresourceRange(vk::ImageAspectFlagBits::eColor, 0, 1, 0, 1))
        .setSrcAccessMask(src_access)
        .setDstAccessMask(dst_access);

    cmd.pipelineBarrier(src_stage, dst_stage, {}, {}, {}, barrier);
}

vk::BufferImageCopy full_image_copy(uint32_t width, uint32_t height)
{
    return vk::BufferImageCopy()
        .setBufferOffset(0)
        .setBufferRowLength(0)
        .setBufferImageHeight(0)
        .setImageSubresource(vk::ImageSubresourceLayers(vk::ImageAspectFlagBits::eColor, 0, 0, 1))
        .setImageOffset({0, 0, 0})
        .setImageExtent({width, height, 1});
}

} // anonymous namespace

Texture::Texture(vk::Device device, uint32_t width, uint32_t height)
    : m_device(device)
    , m_width(width)
    , m_height(height)
{}

std::expected<Texture, Error> Texture::from_rgba(
    const VulkanContext& context,
    const OneTimeCommands& commands,
    uint32_t width,
    uint32_t height,
    std::span<const uint8_t> bytes
) {
    if (width == 0 || height == 0) {
        return std::unexpected(Error::make(ErrorCode::InvalidImage, std::format("Empty image {}x{}", width, height)));
    }
    if (bytes.size() != static_cast<std::size_t>(width) * height * CHANNELS) {
        return std::unexpected(Error::make(ErrorCode::InvalidImage,
            std::format("Image {}x{} needs {} bytes, got {}", width, height,
                static_cast<std::size_t>(width) * height * CHANNELS, bytes.size())));
    }

    auto device = context.device();
    Texture texture(device, width, height);

    auto image_info = vk::ImageCreateInfo()
        .setImageType(vk::ImageType::e2D)
        .setFormat(FORMAT)
        .setExtent({width, height, 1})
        .setMipLevels(1)
        .setArrayLayers(1)
        .setSamples(vk::SampleCountFlagBits::e1)
        .setTiling(vk::ImageTiling::eOptimal)
        .setUsage(vk::ImageUsageFlagBits::eSampled |
                  vk::ImageUsageFlagBits::eTransferDst |
                  vk::ImageUsageFlagBits::eTransferSrc)
        .setSharingMode(vk::SharingMode::eExclusive)
        .setInitialLayout(vk::ImageLayout::eUndefined);

    auto image_res = device.createImage(image_info);
    STARFALL_CHECK_VK_RESULT(image_res, VulkanCallFailed, "Failed to create texture image {}");
    texture.m_image = image_res.value;

    auto mem_reqs = device.getImageMemoryRequirements(texture.m_image);
    auto memory_type = find_memory_type(context.limits().memory_properties, mem_reqs.memoryTypeBits,
        vk::MemoryPropertyFlagBits::eDeviceLocal);
    if (!memory_type) {
        return std::unexpected(memory_type.error());
    }

    auto alloc_info = vk::MemoryAllocateInfo()
        .setAllocationSize(mem_reqs.size)
        .setMemoryTypeIndex(*memory_type);
    auto memory_res = device.allocateMemory(alloc_info);
    STARFALL_CHECK_VK_RESULT(memory_res, OutOfDeviceMemory, "Failed to allocate texture memory {}");
    texture.m_memory = memory_res.value;

    auto bind_res = device.bindImageMemory(texture.m_image, texture.m_memory, 0);
    STARFALL_CHECK_VK_RESULT_VOID(bind_res, VulkanCallFailed, "Failed to bind texture memory {}");

    auto staging = Buffer::create(context, bytes.size(), vk::BufferUsageFlagBits::eTransferSrc, MemoryUsage::HostVisible);
    if (!staging) {
        return std::unexpected(staging.error());
    }
    if (auto result = staging->write(std::as_bytes(bytes)); !result) {
        return std::unexpected(result.error());
    }

    auto upload = commands.submit([&](vk::CommandBuffer cmd) {
        transition_image(cmd, texture.m_image,
            vk::ImageLayout::eUndefined, vk::ImageLayout::eTransferDstOptimal,
            {}, vk::AccessFlagBits::eTransferWrite,
            vk::PipelineStageFlagBits::eTopOfPipe, vk::PipelineStageFlagBits::eTransfer);

        cmd.copyBufferToImage(staging->buffer(), texture.m_image, vk::ImageLayout::eTransferDstOptimal,
            full_image_copy(width, height));

        transition_image(cmd, texture.m_image,
            vk::ImageLayout::eTransferDstOptimal, vk::ImageLayout::eShaderReadOnlyOptimal,
            vk::AccessFlagBits::eTransferWrite, vk::AccessFlagBits::eShaderRead,
            vk::PipelineStageFlagBits::eTransfer, vk::PipelineStageFlagBits::eFragmentShader);
    });
    if (!upload) {
        return std::unexpected(upload.error());
    }

    auto view_info = vk::ImageViewCreateInfo()
        .setImage(texture.m_image)
        .setViewType(vk::ImageViewType::e2D)
        .setFormat(FORMAT)
        .setSubresourceRange(vk::ImageSubresourceRange(vk::ImageAspectFlagBits::eColor, 0, 1, 0, 1));
    auto view_res = device.createImageView(view_info);
    STARFALL_CHECK_VK_RESULT(view_res, VulkanCallFailed, "Failed to create texture view {}");
    texture.m_view = view_res.value;

    auto sampler_info = vk::SamplerCreateInfo()
        .setMagFilter(vk::Filter::eLinear)
        .setMinFilter(vk::Filter::eLinear)
        .setMipmapMode(vk::SamplerMipmapMode::eLinear)
        .setAddressModeU(vk::SamplerAddressMode::eRepeat)
        .setAddressModeV(vk::SamplerAddressMode::eRepeat)
        .setAddressModeW(vk::SamplerAddressMode::eRepeat)
        .setAnisotropyEnable(vk::False)
        .setMaxAnisotropy(1.0f)
        .setBorderColor(vk::BorderColor::eIntOpaqueBlack)
        .setMinLod(0.0f)
        .setMaxLod(0.0f);
    auto sampler_res = device.createSampler(sampler_info);
    STARFALL_CHECK_VK_RESULT(sampler_res, VulkanCallFailed, "Failed to create texture sampler {}");
    texture.m_sampler = sampler_res.value;

    Logger::instance().debug("Uploaded {}x{} texture", width, height);
    return texture;
}

std::expected<Texture, Error> Texture::solid_color(
    const VulkanContext& context,
    const OneTimeCommands& commands,
    std::array<uint8_t, 4> rgba
) {
    return from_rgba(context, commands, 1, 1, rgba);
}

std::expected<std::vector<uint8_t>, Error> Texture::read_back(
    const VulkanContext& context,
    const OneTimeCommands& commands
) const {
    auto size = static_cast<vk::DeviceSize>(m_width) * m_height * CHANNELS;
    auto staging = Buffer::create(context, size, vk::BufferUsageFlagBits::eTransferDst, MemoryUsage::HostVisible);
    if (!staging) {
        return std::unexpected(staging.error());
    }

    auto copy = commands.submit([&](vk::CommandBuffer cmd) {
        transition_image(cmd, m_image,
            vk::ImageLayout::eShaderReadOnlyOptimal, vk::ImageLayout::eTransferSrcOptimal,
            vk::AccessFlagBits::eShaderRead, vk::AccessFlagBits::eTransferRead,
            vk::PipelineStageFlagBits::eFragmentShader, vk::PipelineStageFlagBits::eTransfer);

        cmd.copyImageToBuffer(m_image, vk::ImageLayout::eTransferSrcOptimal, staging->buffer(),
            full_image_copy(m_width, m_height));

        transition_image(cmd, m_image,
            vk::ImageLayout::eTransferSrcOptimal, vk::ImageLayout::eShaderReadOnlyOptimal,
            vk::AccessFlagBits::eTransferRead, vk::AccessFlagBits::eShaderRead,
            vk::PipelineStageFlagBits::eTransfer, vk::PipelineStageFlagBits::eFragmentShader);
    });
    if (!copy) {
        return std::unexpected(copy.error());
    }

    const auto* data = static_cast<const uint8_t*>(staging->mapped());
    return std::vector<uint8_t>(data, data + size);
}

void Texture::destroy()
{
    if (m_view) {
        m_device.destroyImageView(m_view);
        m_view = nullptr;
    }
    if (m_sampler) {
        m_device.destroySampler(m_sampler);
        m_sampler = nullptr;
    }
    if (m_image) {
        m_device.destroyImage(m_image);
        m_image = nullptr;
    }
    if (m_memory) {
        m_device.freeMemory(m_memory);
        m_memory = nullptr;
    }
}

Texture::~Texture()
{
    destroy();
}

Texture::Texture(Texture&& other) noexcept
    : m_device(other.m_device)
    , m_image(std::exchange(other.m_image, nullptr))
    , m_memory(std::exchange(other.m_memory, nullptr))
    , m_view(std::exchange(other.m_view, nullptr))
    , m_sampler(std::exchange(other.m_sampler, nullptr))
    , m_width(other.m_width)
    , m_height(other.m_height)
{}

Texture& Texture::operator=(Texture&& other) noexcept
{
    if (this != &other) {
        destroy();
        m_device = other.m_device;
        m_image = std::exchange(other.m_image, nullptr);
        m_memory = std::exchange(other.m_memory, nullptr);
        m_view = std::exchange(other.m_view, nullptr);
        m_sampler = std::exchange(other.m_sampler, nullptr);
        m_width = other.m_width;
        m_height = other.m_height;
    }
    return *this;
}

} // namespace starfall
