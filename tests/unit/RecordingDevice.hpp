// tests/unit/RecordingDevice.hpp
#pragma once

#include <Graphics/GraphicsDevice.hpp>
#include <Graphics/Projection.hpp>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace Quadra {
namespace Testing {

/**
 * @brief GraphicsDevice fake that records every call instead of drawing
 *
 * Handles are handed out from one incrementing counter, so every resource
 * gets a distinct non-zero id.
 */
class RecordingDevice : public GraphicsDevice {
public:
    struct DrawCall {
        BufferHandle vertex_buffer;
        BufferHandle index_buffer;
        ProgramHandle program;
        TextureHandle texture;
        size_t count;
    };

    struct VertexUpload {
        BufferHandle buffer;
        std::vector<float> data;
        size_t offset;
    };

    struct IndexUpload {
        BufferHandle buffer;
        std::vector<uint16_t> data;
        size_t offset;
    };

    struct UniformSet {
        ProgramHandle program;
        std::string name;
        Matrix4 value;
    };

    struct Viewport {
        int x, y, width, height;
    };

    struct Attribute {
        BufferHandle buffer;
        uint32_t index;
        int size;
        size_t offset;
    };

    struct TextureInfo {
        int width;
        int height;
        std::vector<uint8_t> pixels;
    };

public:
    // Resource creation
    FramebufferHandle newFramebuffer() override {
        calls.push_back("newFramebuffer");
        return nextHandle();
    }

    TextureHandle newTexture(int width, int height, const std::vector<uint8_t>& pixels = {}) override {
        calls.push_back("newTexture");
        TextureHandle handle = nextHandle();
        textures[handle] = TextureInfo{width, height, pixels};
        return handle;
    }

    BufferHandle newVertexBuffer(size_t count, size_t stride, BufferUsage usage) override {
        calls.push_back("newVertexBuffer");
        vertex_buffer_count = count;
        vertex_buffer_stride = stride;
        vertex_buffer_usage = usage;
        return nextHandle();
    }

    BufferHandle newIndexBuffer(size_t count, BufferUsage usage) override {
        calls.push_back("newIndexBuffer");
        index_buffer_count = count;
        index_buffer_usage = usage;
        return nextHandle();
    }

    ProgramHandle compileProgram(const std::string& vertex_source,
                                 const std::string& fragment_source) override {
        calls.push_back("compileProgram");
        last_vertex_source = vertex_source;
        last_fragment_source = fragment_source;
        return nextHandle();
    }

    // Resource destruction
    void deleteFramebuffer(FramebufferHandle framebuffer) override {
        calls.push_back("deleteFramebuffer");
        deleted.push_back(framebuffer);
    }

    void deleteTexture(TextureHandle texture) override {
        calls.push_back("deleteTexture");
        deleted.push_back(texture);
    }

    void deleteVertexBuffer(BufferHandle buffer) override {
        calls.push_back("deleteVertexBuffer");
        deleted.push_back(buffer);
    }

    void deleteIndexBuffer(BufferHandle buffer) override {
        calls.push_back("deleteIndexBuffer");
        deleted.push_back(buffer);
    }

    void deleteProgram(ProgramHandle program) override {
        calls.push_back("deleteProgram");
        deleted.push_back(program);
    }

    // State mutation
    void attachTextureToFramebuffer(FramebufferHandle framebuffer, TextureHandle texture,
                                    bool rebind_previous) override {
        calls.push_back("attachTextureToFramebuffer");
        attached_framebuffer = framebuffer;
        attached_texture = texture;
        attach_rebind_previous = rebind_previous;
    }

    void setVertexBufferAttribute(BufferHandle buffer, uint32_t index,
                                  int size, size_t offset) override {
        calls.push_back("setVertexBufferAttribute");
        attributes.push_back(Attribute{buffer, index, size, offset});
    }

    void setVertexBufferData(BufferHandle buffer, const std::vector<float>& data,
                             size_t offset) override {
        calls.push_back("setVertexBufferData");
        vertex_uploads.push_back(VertexUpload{buffer, data, offset});
    }

    void setIndexBufferData(BufferHandle buffer, const std::vector<uint16_t>& data,
                            size_t offset) override {
        calls.push_back("setIndexBufferData");
        index_uploads.push_back(IndexUpload{buffer, data, offset});
    }

    void setUniform(ProgramHandle program, const std::string& name,
                    const Matrix4& value) override {
        calls.push_back("setUniform");
        uniforms.push_back(UniformSet{program, name, value});
    }

    void setViewport(int x, int y, int width, int height) override {
        calls.push_back("setViewport");
        viewports.push_back(Viewport{x, y, width, height});
    }

    void bindFramebuffer(FramebufferHandle framebuffer) override {
        calls.push_back("bindFramebuffer");
        bound_framebuffer = framebuffer;
    }

    void bindDefaultFramebuffer() override {
        calls.push_back("bindDefaultFramebuffer");
        bound_framebuffer = 0;
    }

    void clear(float r, float g, float b, float a) override {
        calls.push_back("clear");
        clears.push_back({r, g, b, a});
    }

    void draw(BufferHandle vertex_buffer, BufferHandle index_buffer,
              ProgramHandle program, TextureHandle texture, size_t count) override {
        calls.push_back("draw");
        draws.push_back(DrawCall{vertex_buffer, index_buffer, program, texture, count});
    }

    void swapWindow() override {
        calls.push_back("swapWindow");
        swaps++;
    }

    // Forgets everything recorded so far, keeping the handle counter
    void reset() {
        calls.clear();
        draws.clear();
        vertex_uploads.clear();
        index_uploads.clear();
        uniforms.clear();
        viewports.clear();
        attributes.clear();
        clears.clear();
        deleted.clear();
        swaps = 0;
    }

    size_t countCalls(const std::string& name) const {
        size_t count = 0;
        for (const auto& call : calls) {
            if (call == name) {
                count++;
            }
        }
        return count;
    }

public:
    std::vector<std::string> calls;
    std::vector<DrawCall> draws;
    std::vector<VertexUpload> vertex_uploads;
    std::vector<IndexUpload> index_uploads;
    std::vector<UniformSet> uniforms;
    std::vector<Viewport> viewports;
    std::vector<Attribute> attributes;
    std::vector<std::vector<float>> clears;
    std::vector<uint32_t> deleted;
    std::map<TextureHandle, TextureInfo> textures;

    size_t vertex_buffer_count = 0;
    size_t vertex_buffer_stride = 0;
    BufferUsage vertex_buffer_usage = BufferUsage::StaticDraw;
    size_t index_buffer_count = 0;
    BufferUsage index_buffer_usage = BufferUsage::DynamicDraw;

    FramebufferHandle attached_framebuffer = 0;
    TextureHandle attached_texture = 0;
    bool attach_rebind_previous = true;
    FramebufferHandle bound_framebuffer = 0;

    std::string last_vertex_source;
    std::string last_fragment_source;

    uint32_t swaps = 0;

private:
    uint32_t nextHandle() { return ++m_next_handle; }

    uint32_t m_next_handle = 0;
};

} // namespace Testing
} // namespace Quadra
