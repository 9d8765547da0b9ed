// QuadraRenderer/include/Graphics/GraphicsDevice.hpp
#pragma once

#include <Types.hpp>
#include <Graphics/Projection.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace Quadra {

// Opaque device handles; 0 is never a valid handle
using FramebufferHandle = uint32_t;
using TextureHandle = uint32_t;
using BufferHandle = uint32_t;
using ProgramHandle = uint32_t;

/**
 * @brief Low-level graphics device the renderer draws through
 *
 * The renderer owns no GPU state of its own: buffers, textures, framebuffers
 * and shader programs are created, bound and drawn through this interface.
 * Failures are the device's to report; callers assume every call succeeds.
 */
class GraphicsDevice {
public:
    virtual ~GraphicsDevice() = default;

    // Resource creation
    virtual FramebufferHandle newFramebuffer() = 0;

    // `pixels` is tightly packed RGBA8, or empty for an uninitialised texture
    virtual TextureHandle newTexture(int width, int height,
                                     const std::vector<uint8_t>& pixels = {}) = 0;

    // `count` is in floats, `stride` in floats per vertex
    virtual BufferHandle newVertexBuffer(size_t count, size_t stride, BufferUsage usage) = 0;
    virtual BufferHandle newIndexBuffer(size_t count, BufferUsage usage) = 0;
    virtual ProgramHandle compileProgram(const std::string& vertex_source,
                                         const std::string& fragment_source) = 0;

    // Resource destruction
    virtual void deleteFramebuffer(FramebufferHandle framebuffer) = 0;
    virtual void deleteTexture(TextureHandle texture) = 0;
    virtual void deleteVertexBuffer(BufferHandle buffer) = 0;
    virtual void deleteIndexBuffer(BufferHandle buffer) = 0;
    virtual void deleteProgram(ProgramHandle program) = 0;

    // State mutation
    virtual void attachTextureToFramebuffer(FramebufferHandle framebuffer, TextureHandle texture,
                                            bool rebind_previous) = 0;

    // `size` components starting `offset` floats into each vertex
    virtual void setVertexBufferAttribute(BufferHandle buffer, uint32_t index,
                                          int size, size_t offset) = 0;
    virtual void setVertexBufferData(BufferHandle buffer, const std::vector<float>& data,
                                     size_t offset) = 0;
    virtual void setIndexBufferData(BufferHandle buffer, const std::vector<uint16_t>& data,
                                    size_t offset) = 0;
    virtual void setUniform(ProgramHandle program, const std::string& name,
                            const Matrix4& value) = 0;

    virtual void setViewport(int x, int y, int width, int height) = 0;
    virtual void bindFramebuffer(FramebufferHandle framebuffer) = 0;
    virtual void bindDefaultFramebuffer() = 0;
    virtual void clear(float r, float g, float b, float a) = 0;

    // Indexed draw of `count` indices starting at the first one
    virtual void draw(BufferHandle vertex_buffer, BufferHandle index_buffer,
                      ProgramHandle program, TextureHandle texture, size_t count) = 0;

    // Present the window surface; may block on vsync
    virtual void swapWindow() = 0;
};

} // namespace Quadra
