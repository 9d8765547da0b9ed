// QuadraRenderer/include/Core/RenderContext.hpp
#pragma once

#include <Types.hpp>
#include <Constants.hpp>
#include <Graphics/GraphicsDevice.hpp>
#include <Graphics/BatchRenderer.hpp>
#include <Graphics/Projection.hpp>
#include <Graphics/DrawParams.hpp>
#include <Graphics/Drawable.hpp>
#include <Graphics/Texture.hpp>
#include <Graphics/Shader.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Quadra {

/**
 * @brief Batched 2D renderer with a fixed-resolution offscreen surface
 *
 * Features:
 * - Quads are buffered and sent to the device only when the texture or
 *   shader changes, the batch is full, or the frame is presented
 * - Sprites render at the internal resolution into an offscreen framebuffer
 * - present() blits that surface into the window with integer-scaled,
 *   centered letterboxing
 *
 * The context owns all mutable render state and is driven from one thread.
 */
class RenderContext {
public:
    struct Config {
        int internal_width = static_cast<int>(Defaults::INTERNAL_WIDTH);
        int internal_height = static_cast<int>(Defaults::INTERNAL_HEIGHT);
        int window_width = static_cast<int>(Defaults::WINDOW_WIDTH);
        int window_height = static_cast<int>(Defaults::WINDOW_HEIGHT);
        size_t sprite_capacity = Defaults::SPRITE_CAPACITY;
    };

public:
    // Throws std::length_error for an out-of-range sprite capacity and
    // std::invalid_argument for non-positive dimensions
    explicit RenderContext(GraphicsDevice& device);
    RenderContext(GraphicsDevice& device, const Config& config);
    ~RenderContext();

    RenderContext(const RenderContext&) = delete;
    RenderContext& operator=(const RenderContext&) = delete;

    // Drawing
    void clear(const Color& color);
    void draw(const Drawable& drawable, const DrawParams& params);
    void draw(const Drawable& drawable, const Vec2& position);

    // Binding a different texture flushes the quads that use the old one
    void setTexture(const Texture& texture);

    // Switching the effective shader flushes the pending batch
    void setShader(const Shader& shader);
    void resetShader();

    // Batch input, used by Drawable implementations
    void pushVertex(float x, float y, float u, float v, const Color& color);

    // Corners in top-left, bottom-left, bottom-right, top-right order
    void pushQuad(float x1, float y1, float x2, float y2,
                  float u1, float v1, float u2, float v2, const Color& color);

    // Sends queued quads to the device as one draw call
    void flush();

    // Blits the offscreen surface into the window and swaps
    void present();

    // Events
    void setWindowSize(int width, int height);

    // Queries
    int getInternalWidth() const { return m_internal_width; }
    int getInternalHeight() const { return m_internal_height; }
    int getWindowWidth() const { return m_window_width; }
    int getWindowHeight() const { return m_window_height; }
    const Rectangle& getLetterbox() const { return m_letterbox; }

    const Matrix4& getInternalProjection() const { return m_internal_projection; }
    const Matrix4& getWindowProjection() const { return m_window_projection; }

    FramebufferHandle getFramebuffer() const { return m_framebuffer; }
    const Texture& getFramebufferTexture() const { return m_framebuffer_texture; }

    const std::optional<Texture>& getTexture() const { return m_texture; }
    const std::optional<Shader>& getShader() const { return m_shader; }
    const Shader& getDefaultShader() const { return m_default_shader; }

    size_t getSpriteCount() const { return m_batch->getSpriteCount(); }
    size_t getCapacity() const { return m_batch->getCapacity(); }
    const std::vector<float>& getVertices() const { return m_batch->getVertices(); }
    const BatchRenderer::Stats& getBatchStats() const { return m_batch->getStats(); }
    std::string getBatchReport() const { return m_batch->getBatchReport(); }
    uint64_t getFramesPresented() const { return m_frames_presented; }

private:
    static const Config& validateConfig(const Config& config);
    void updateWindowState();
    const Shader& activeShader() const;

private:
    GraphicsDevice& m_device;

    // Offscreen surface
    FramebufferHandle m_framebuffer = 0;
    Texture m_framebuffer_texture;

    std::unique_ptr<BatchRenderer> m_batch;

    // Bound state
    std::optional<Texture> m_texture;
    std::optional<Shader> m_shader;
    Shader m_default_shader;

    // Projections
    Matrix4 m_internal_projection;
    Matrix4 m_window_projection;

    // Dimensions
    int m_internal_width;
    int m_internal_height;
    int m_window_width;
    int m_window_height;
    Rectangle m_letterbox;

    uint64_t m_frames_presented = 0;
};

} // namespace Quadra
