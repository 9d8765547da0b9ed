// QuadraRenderer/src/Graphics/Texture.cpp
#include <Graphics/Texture.hpp>
#include <Core/RenderContext.hpp>
#include <Utils/Logger.hpp>
#include <stdexcept>
#include <string>

namespace Quadra {

Texture::Texture(TextureHandle handle, int width, int height)
    : m_handle(handle), m_width(width), m_height(height) {
}

Texture Texture::fromPixels(GraphicsDevice& device, int width, int height,
                            const std::vector<uint8_t>& pixels) {
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("Texture dimensions must be positive, got " +
                                    std::to_string(width) + "x" + std::to_string(height));
    }

    size_t expected = static_cast<size_t>(width) * static_cast<size_t>(height) * 4;
    if (pixels.size() != expected) {
        throw std::invalid_argument("Expected " + std::to_string(expected) +
                                    " bytes of RGBA data, got " + std::to_string(pixels.size()));
    }

    TextureHandle handle = device.newTexture(width, height, pixels);
    Logger::debug("Created {}x{} texture {}", width, height, handle);

    return Texture(handle, width, height);
}

void Texture::renderInto(RenderContext& context, const DrawParams& params) const {
    if (!isValid()) {
        Logger::warning("Attempting to draw an invalid texture");
        return;
    }

    context.setTexture(*this);

    float texture_width = static_cast<float>(m_width);
    float texture_height = static_cast<float>(m_height);
    Rectangle clip = params.clip.value_or(Rectangle(0.0f, 0.0f, texture_width, texture_height));

    float x1 = params.position.x - params.origin.x * params.scale.x;
    float y1 = params.position.y - params.origin.y * params.scale.y;
    float x2 = params.position.x + (clip.width - params.origin.x) * params.scale.x;
    float y2 = params.position.y + (clip.height - params.origin.y) * params.scale.y;

    float u1 = clip.x / texture_width;
    float v1 = clip.y / texture_height;
    float u2 = (clip.x + clip.width) / texture_width;
    float v2 = (clip.y + clip.height) / texture_height;

    context.pushQuad(x1, y1, x2, y2, u1, v1, u2, v2, params.color);
}

} // namespace Quadra
