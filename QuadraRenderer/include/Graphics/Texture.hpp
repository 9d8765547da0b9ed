// QuadraRenderer/include/Graphics/Texture.hpp
#pragma once

#include <Graphics/Drawable.hpp>
#include <Graphics/GraphicsDevice.hpp>
#include <cstdint>
#include <vector>

namespace Quadra {

/**
 * @brief Handle to a device texture, drawable as a sprite
 *
 * Textures are cheap values; two textures are equal when they refer to the
 * same device handle. The device owns the underlying storage.
 */
class Texture : public Drawable {
public:
    Texture() = default;
    Texture(TextureHandle handle, int width, int height);

    // Creates a texture from tightly packed RGBA8 pixels.
    // Throws std::invalid_argument on bad dimensions or pixel count.
    static Texture fromPixels(GraphicsDevice& device, int width, int height,
                              const std::vector<uint8_t>& pixels);

    TextureHandle getHandle() const { return m_handle; }
    int getWidth() const { return m_width; }
    int getHeight() const { return m_height; }
    bool isValid() const { return m_handle != 0; }

    void renderInto(RenderContext& context, const DrawParams& params) const override;

    bool operator==(const Texture& other) const { return m_handle == other.m_handle; }
    bool operator!=(const Texture& other) const { return !(*this == other); }

private:
    TextureHandle m_handle = 0;
    int m_width = 0;
    int m_height = 0;
};

} // namespace Quadra
