// QuadraRenderer/include/Core/RaylibDevice.hpp
#pragma once

#include <Constants.hpp>
#include <Graphics/GraphicsDevice.hpp>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace Quadra {

/**
 * @brief Graphics device backed by raylib's window and rlgl layer
 *
 * Features:
 * - Window creation, resize tracking and event polling through raylib
 * - Vertex/index buffers, framebuffers, textures and programs through rlgl
 * - Buffer swaps driven by the caller, not by BeginDrawing/EndDrawing
 */
class RaylibDevice : public GraphicsDevice {
public:
    struct Config {
        uint32_t window_width = Defaults::WINDOW_WIDTH;
        uint32_t window_height = Defaults::WINDOW_HEIGHT;
        std::string window_title = Defaults::WINDOW_TITLE;
        bool enable_vsync = true;
        bool fullscreen = false;
        bool hidden = false;
        bool resizable = true;
    };

    struct Stats {
        uint64_t draw_calls_issued = 0;
        uint64_t buffer_uploads = 0;
        uint64_t frames_swapped = 0;
        uint32_t live_textures = 0;
        uint32_t live_buffers = 0;
    };

public:
    RaylibDevice();
    explicit RaylibDevice(const Config& config);
    ~RaylibDevice() override;

    RaylibDevice(const RaylibDevice&) = delete;
    RaylibDevice& operator=(const RaylibDevice&) = delete;

    // Lifecycle
    bool initialize();
    void shutdown();
    bool isInitialized() const { return m_initialized; }

    // Window
    bool shouldClose() const;
    void pollEvents();
    bool isWindowResized() const;
    int getWindowWidth() const;
    int getWindowHeight() const;

    // GraphicsDevice
    FramebufferHandle newFramebuffer() override;
    TextureHandle newTexture(int width, int height, const std::vector<uint8_t>& pixels = {}) override;
    BufferHandle newVertexBuffer(size_t count, size_t stride, BufferUsage usage) override;
    BufferHandle newIndexBuffer(size_t count, BufferUsage usage) override;
    ProgramHandle compileProgram(const std::string& vertex_source,
                                 const std::string& fragment_source) override;

    void deleteFramebuffer(FramebufferHandle framebuffer) override;
    void deleteTexture(TextureHandle texture) override;
    void deleteVertexBuffer(BufferHandle buffer) override;
    void deleteIndexBuffer(BufferHandle buffer) override;
    void deleteProgram(ProgramHandle program) override;

    void attachTextureToFramebuffer(FramebufferHandle framebuffer, TextureHandle texture,
                                    bool rebind_previous) override;
    void setVertexBufferAttribute(BufferHandle buffer, uint32_t index,
                                  int size, size_t offset) override;
    void setVertexBufferData(BufferHandle buffer, const std::vector<float>& data,
                             size_t offset) override;
    void setIndexBufferData(BufferHandle buffer, const std::vector<uint16_t>& data,
                            size_t offset) override;
    void setUniform(ProgramHandle program, const std::string& name,
                    const Matrix4& value) override;

    void setViewport(int x, int y, int width, int height) override;
    void bindFramebuffer(FramebufferHandle framebuffer) override;
    void bindDefaultFramebuffer() override;
    void clear(float r, float g, float b, float a) override;

    void draw(BufferHandle vertex_buffer, BufferHandle index_buffer,
              ProgramHandle program, TextureHandle texture, size_t count) override;

    void swapWindow() override;

    const Stats& getStats() const { return m_stats; }
    const Config& getConfig() const { return m_config; }

private:
    // Every vertex buffer lives in its own vertex array
    struct VertexBufferInfo {
        uint32_t vertex_array = 0;
        size_t stride = 0;
    };

    void releaseResources();

private:
    Config m_config;
    Stats m_stats;

    bool m_initialized = false;
    FramebufferHandle m_bound_framebuffer = 0;

    std::unordered_map<BufferHandle, VertexBufferInfo> m_vertex_buffers;
    std::unordered_set<BufferHandle> m_index_buffers;
    std::unordered_set<TextureHandle> m_textures;
    std::unordered_set<FramebufferHandle> m_framebuffers;
    std::unordered_set<ProgramHandle> m_programs;
};

} // namespace Quadra
