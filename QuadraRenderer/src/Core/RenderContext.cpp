// QuadraRenderer/src/Core/RenderContext.cpp
#include <Core/RenderContext.hpp>
#include <Utils/Logger.hpp>
#include <stdexcept>
#include <string>

namespace Quadra {

const RenderContext::Config& RenderContext::validateConfig(const Config& config) {
    if (config.sprite_capacity < Limits::MIN_SPRITE_CAPACITY ||
        config.sprite_capacity > Limits::MAX_SPRITE_CAPACITY) {
        throw std::length_error("Can't have more than " + std::to_string(Limits::MAX_SPRITE_CAPACITY) +
                                " sprites to a single buffer (requested " +
                                std::to_string(config.sprite_capacity) + ")");
    }

    if (config.internal_width <= 0 || config.internal_height <= 0) {
        throw std::invalid_argument("Internal resolution must be positive, got " +
                                    std::to_string(config.internal_width) + "x" +
                                    std::to_string(config.internal_height));
    }

    if (config.window_width <= 0 || config.window_height <= 0) {
        throw std::invalid_argument("Window size must be positive, got " +
                                    std::to_string(config.window_width) + "x" +
                                    std::to_string(config.window_height));
    }

    return config;
}

RenderContext::RenderContext(GraphicsDevice& device)
    : RenderContext(device, Config{}) {
}

RenderContext::RenderContext(GraphicsDevice& device, const Config& config)
    : m_device(device),
      m_internal_width(validateConfig(config).internal_width),
      m_internal_height(config.internal_height),
      m_window_width(config.window_width),
      m_window_height(config.window_height) {

    // Offscreen surface the sprites are drawn into
    m_framebuffer = m_device.newFramebuffer();
    m_framebuffer_texture = Texture(m_device.newTexture(m_internal_width, m_internal_height),
                                    m_internal_width, m_internal_height);

    m_device.attachTextureToFramebuffer(m_framebuffer, m_framebuffer_texture.getHandle(), false);
    m_device.bindFramebuffer(m_framebuffer);
    m_device.setViewport(0, 0, m_internal_width, m_internal_height);

    m_batch = std::make_unique<BatchRenderer>(m_device, config.sprite_capacity);
    m_default_shader = Shader::createDefault(m_device);

    m_internal_projection = ortho(0.0f, static_cast<float>(m_internal_width),
                                  static_cast<float>(m_internal_height), 0.0f,
                                  -1.0f, 1.0f);
    updateWindowState();

    Logger::info("RenderContext created: internal {}x{}, window {}x{}, {} sprites per batch",
                 m_internal_width, m_internal_height, m_window_width, m_window_height,
                 config.sprite_capacity);
}

RenderContext::~RenderContext() {
    m_batch.reset();

    m_device.deleteProgram(m_default_shader.getHandle());
    m_device.deleteFramebuffer(m_framebuffer);
    m_device.deleteTexture(m_framebuffer_texture.getHandle());
}

void RenderContext::clear(const Color& color) {
    // Quads queued before the clear belong underneath it
    flush();
    m_device.clear(color.r, color.g, color.b, color.a);
}

void RenderContext::draw(const Drawable& drawable, const DrawParams& params) {
    drawable.renderInto(*this, params);
}

void RenderContext::draw(const Drawable& drawable, const Vec2& position) {
    drawable.renderInto(*this, DrawParams::at(position));
}

void RenderContext::setTexture(const Texture& texture) {
    if (m_texture && *m_texture == texture) {
        return;
    }

    if (m_texture) {
        // Everything buffered so far samples the old texture
        flush();
    }

    m_texture = texture;
}

void RenderContext::setShader(const Shader& shader) {
    if (m_shader && *m_shader == shader) {
        return;
    }

    flush();
    m_shader = shader;
}

void RenderContext::resetShader() {
    if (!m_shader) {
        return;
    }

    flush();
    m_shader.reset();
}

void RenderContext::pushVertex(float x, float y, float u, float v, const Color& color) {
    if (m_batch->isAtQuadBoundary() && m_batch->isFull()) {
        flush();

        if (m_batch->isFull()) {
            Logger::warning("Sprite batch full with no texture bound; discarding {} sprites",
                            m_batch->getSpriteCount());
            m_batch->clear();
        }
    }

    m_batch->pushVertex(x, y, u, v, color);
}

void RenderContext::pushQuad(float x1, float y1, float x2, float y2,
                             float u1, float v1, float u2, float v2, const Color& color) {
    if (!m_texture) {
        Logger::debug("Quad pushed with no texture bound");
    }

    pushVertex(x1, y1, u1, v1, color);
    pushVertex(x1, y2, u1, v2, color);
    pushVertex(x2, y2, u2, v2, color);
    pushVertex(x2, y1, u2, v1, color);
}

void RenderContext::flush() {
    if (m_batch->getSpriteCount() == 0 || !m_texture) {
        return;
    }

    const Shader& shader = activeShader();
    m_device.setUniform(shader.getHandle(), Constants::PROJECTION_UNIFORM, m_internal_projection);
    m_batch->submit(shader.getHandle(), m_texture->getHandle());
}

void RenderContext::present() {
    flush();

    m_device.bindDefaultFramebuffer();
    m_device.setViewport(0, 0, m_window_width, m_window_height);
    m_device.clear(0.0f, 0.0f, 0.0f, 1.0f);

    if (!m_batch->isEmpty()) {
        Logger::warning("Discarding {} vertices that could not be flushed before present",
                        m_batch->getVertices().size() / Constants::VERTEX_STRIDE);
        m_batch->clear();
    }

    // The blit bypasses the batch so it never shows up in the sprite stats.
    // Framebuffer textures are stored bottom-up, so v is flipped.
    const float left = m_letterbox.x;
    const float top = m_letterbox.y;
    const float right = m_letterbox.x + m_letterbox.width;
    const float bottom = m_letterbox.y + m_letterbox.height;

    const std::vector<float> blit = {
        left,  top,    0.0f, 1.0f, 1.0f, 1.0f, 1.0f, 1.0f,
        left,  bottom, 0.0f, 0.0f, 1.0f, 1.0f, 1.0f, 1.0f,
        right, bottom, 1.0f, 0.0f, 1.0f, 1.0f, 1.0f, 1.0f,
        right, top,    1.0f, 1.0f, 1.0f, 1.0f, 1.0f, 1.0f,
    };

    m_device.setUniform(m_default_shader.getHandle(), Constants::PROJECTION_UNIFORM, m_window_projection);
    m_device.setVertexBufferData(m_batch->getVertexBuffer(), blit, 0);
    m_device.draw(m_batch->getVertexBuffer(), m_batch->getIndexBuffer(),
                  m_default_shader.getHandle(), m_framebuffer_texture.getHandle(),
                  Constants::INDEX_STRIDE);

    m_device.swapWindow();

    m_device.bindFramebuffer(m_framebuffer);
    m_device.setViewport(0, 0, m_internal_width, m_internal_height);

    m_frames_presented++;
}

void RenderContext::setWindowSize(int width, int height) {
    if (width <= 0 || height <= 0) {
        Logger::debug("Ignoring window size {}x{}", width, height);
        return;
    }

    m_window_width = width;
    m_window_height = height;
    updateWindowState();

    Logger::debug("Window resized to {}x{}, letterbox {}x{} at ({}, {})",
                  width, height, m_letterbox.width, m_letterbox.height,
                  m_letterbox.x, m_letterbox.y);
}

void RenderContext::updateWindowState() {
    m_window_projection = ortho(0.0f, static_cast<float>(m_window_width),
                                static_cast<float>(m_window_height), 0.0f,
                                -1.0f, 1.0f);
    m_letterbox = letterbox(m_internal_width, m_internal_height, m_window_width, m_window_height);

    if (letterboxScaleFactor(m_internal_width, m_internal_height, m_window_width, m_window_height) < 1) {
        Logger::warning("Window {}x{} is smaller than the internal resolution {}x{}; content is cropped",
                        m_window_width, m_window_height, m_internal_width, m_internal_height);
    }
}

const Shader& RenderContext::activeShader() const {
    return m_shader ? *m_shader : m_default_shader;
}

} // namespace Quadra
