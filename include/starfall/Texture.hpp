#pragma once

#include <starfall/Commands.hpp>
#include <starfall/VulkanContext.hpp>
#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <vector>

namespace starfall {

/**
 * @brief Sampled RGBA8 image with its memory, view and sampler
 *
 * Images are DEVICE_LOCAL with OPTIMAL tiling and end up in
 * SHADER_READ_ONLY_OPTIMAL. They also carry TRANSFER_SRC so read_back() works.
 */
class Texture
{
public:
    static constexpr vk::Format FORMAT = vk::Format::eR8G8B8A8Unorm;
    static constexpr uint32_t CHANNELS = 4;

    /**
     * @brief Upload decoded RGBA8 pixels
     *
     * @param bytes width * height * 4 bytes, rows tightly packed
     * @return Texture, or InvalidImage when the size does not match
     */
    static std::expected<Texture, Error> from_rgba(
        const VulkanContext& context,
        const OneTimeCommands& commands,
        uint32_t width,
        uint32_t height,
        std::span<const uint8_t> bytes
    );

    /**
     * @brief 1x1 texture of a single colour
     */
    static std::expected<Texture, Error> solid_color(
        const VulkanContext& context,
        const OneTimeCommands& commands,
        std::array<uint8_t, 4> rgba
    );

    ~Texture();

    Texture(const Texture&) = delete;
    Texture& operator=(const Texture&) = delete;
    Texture(Texture&& other) noexcept;
    Texture& operator=(Texture&& other) noexcept;

    /**
     * @brief Copy the image back to the host as tightly packed RGBA8
     */
    [[nodiscard]] std::expected<std::vector<uint8_t>, Error> read_back(
        const VulkanContext& context,
        const OneTimeCommands& commands
    ) const;

    [[nodiscard]] vk::Image image() const { return m_image; }
    [[nodiscard]] vk::ImageView view() const { return m_view; }
    [[nodiscard]] vk::Sampler sampler() const { return m_sampler; }
    [[nodiscard]] uint32_t width() const { return m_width; }
    [[nodiscard]] uint32_t height() const { return m_height; }
    [[nodiscard]] vk::Format format() const { return FORMAT; }
    [[nodiscard]] uint32_t channels() const { return CHANNELS; }

    [[nodiscard]] vk::DescriptorImageInfo descriptor_info() const {
        return vk::DescriptorImageInfo()
            .setSampler(m_sampler)
            .setImageView(m_view)
            .setImageLayout(vk::ImageLayout::eShaderReadOnlyOptimal);
    }

private:
    Texture(vk::Device device, uint32_t width, uint32_t height);
    void destroy();

    vk::Device m_device;
    vk::Image m_image;
    vk::DeviceMemory m_memory;
    vk::ImageView m_view;
    vk::Sampler m_sampler;
    uint32_t m_width = 0;
    uint32_t m_height = 0;
};

} // namespace starfall
