// QuadraRenderer/src/Core/RaylibDevice.cpp
#include <Core/RaylibDevice.hpp>
#include <Utils/Logger.hpp>

// raylib defines color macros (WHITE, BLACK, ...) that clash with
// Quadra::Color's constants, so it is included after every Quadra header
#include <raylib.h>
#include <rlgl.h>

#include <cstdint>

namespace Quadra {

namespace {

::Matrix toRaylibMatrix(const Matrix4& value) {
    // Both layouts are column-major: m0..m3 is the first column
    ::Matrix result;
    result.m0 = value.m[0];   result.m1 = value.m[1];   result.m2 = value.m[2];   result.m3 = value.m[3];
    result.m4 = value.m[4];   result.m5 = value.m[5];   result.m6 = value.m[6];   result.m7 = value.m[7];
    result.m8 = value.m[8];   result.m9 = value.m[9];   result.m10 = value.m[10]; result.m11 = value.m[11];
    result.m12 = value.m[12]; result.m13 = value.m[13]; result.m14 = value.m[14]; result.m15 = value.m[15];
    return result;
}

unsigned char toByte(float component) {
    if (component <= 0.0f) return 0;
    if (component >= 1.0f) return 255;
    return static_cast<unsigned char>(component * 255.0f + 0.5f);
}

} // namespace

RaylibDevice::RaylibDevice()
    : RaylibDevice(Config{}) {
}

RaylibDevice::RaylibDevice(const Config& config)
    : m_config(config) {
    Logger::info("RaylibDevice created with {}x{} window", m_config.window_width, m_config.window_height);
}

RaylibDevice::~RaylibDevice() {
    if (m_initialized) {
        shutdown();
    }
}

bool RaylibDevice::initialize() {
    if (m_initialized) {
        Logger::warning("RaylibDevice already initialized");
        return true;
    }

    Logger::info("Initializing RaylibDevice...");

    unsigned int flags = 0;

    if (m_config.enable_vsync) {
        flags |= FLAG_VSYNC_HINT;
    }

    if (m_config.fullscreen) {
        flags |= FLAG_FULLSCREEN_MODE;
    }

    if (m_config.hidden) {
        flags |= FLAG_WINDOW_HIDDEN;
    }

    if (m_config.resizable) {
        flags |= FLAG_WINDOW_RESIZABLE;
    }

    SetConfigFlags(flags);
    SetTraceLogLevel(LOG_WARNING);

    InitWindow(static_cast<int>(m_config.window_width), static_cast<int>(m_config.window_height),
               m_config.window_title.c_str());

    if (!IsWindowReady()) {
        Logger::error("Failed to create raylib window");
        return false;
    }

    rlEnableColorBlend();
    rlSetBlendMode(RL_BLEND_ALPHA);
    rlDisableDepthTest();
    rlDisableBackfaceCulling();

    m_initialized = true;

    Logger::info("RaylibDevice initialized successfully");
    Logger::info("raylib version: {}", RAYLIB_VERSION);
    Logger::info("OpenGL backend: {}", rlGetVersion());

    return true;
}

void RaylibDevice::shutdown() {
    if (!m_initialized) {
        return;
    }

    Logger::info("Shutting down RaylibDevice...");

    releaseResources();

    if (IsWindowReady()) {
        CloseWindow();
    }

    m_initialized = false;
    Logger::info("RaylibDevice shutdown complete");
}

bool RaylibDevice::shouldClose() const {
    return !m_initialized || WindowShouldClose();
}

void RaylibDevice::pollEvents() {
    PollInputEvents();
}

bool RaylibDevice::isWindowResized() const {
    return IsWindowResized();
}

int RaylibDevice::getWindowWidth() const {
    return GetScreenWidth();
}

int RaylibDevice::getWindowHeight() const {
    return GetScreenHeight();
}

FramebufferHandle RaylibDevice::newFramebuffer() {
    // Size arguments are ignored by rlgl; attachments define the size
    FramebufferHandle framebuffer = rlLoadFramebuffer(static_cast<int>(m_config.window_width),
                                                      static_cast<int>(m_config.window_height));
    if (framebuffer == 0) {
        Logger::error("Failed to create framebuffer");
        return 0;
    }

    m_framebuffers.insert(framebuffer);
    return framebuffer;
}

TextureHandle RaylibDevice::newTexture(int width, int height, const std::vector<uint8_t>& pixels) {
    TextureHandle texture = rlLoadTexture(pixels.empty() ? nullptr : pixels.data(), width, height,
                                          RL_PIXELFORMAT_UNCOMPRESSED_R8G8B8A8, 1);
    if (texture == 0) {
        Logger::error("Failed to create {}x{} texture", width, height);
        return 0;
    }

    // Pixel-perfect sampling for the integer-scaled output
    rlTextureParameters(texture, RL_TEXTURE_MIN_FILTER, RL_TEXTURE_FILTER_NEAREST);
    rlTextureParameters(texture, RL_TEXTURE_MAG_FILTER, RL_TEXTURE_FILTER_NEAREST);
    rlTextureParameters(texture, RL_TEXTURE_WRAP_S, RL_TEXTURE_WRAP_CLAMP);
    rlTextureParameters(texture, RL_TEXTURE_WRAP_T, RL_TEXTURE_WRAP_CLAMP);

    m_textures.insert(texture);
    m_stats.live_textures = static_cast<uint32_t>(m_textures.size());
    return texture;
}

BufferHandle RaylibDevice::newVertexBuffer(size_t count, size_t stride, BufferUsage usage) {
    VertexBufferInfo info;
    info.vertex_array = rlLoadVertexArray();
    info.stride = stride;

    rlEnableVertexArray(info.vertex_array);
    BufferHandle buffer = rlLoadVertexBuffer(nullptr, static_cast<int>(count * sizeof(float)),
                                             usage == BufferUsage::DynamicDraw);
    rlDisableVertexArray();

    if (buffer == 0) {
        Logger::error("Failed to create vertex buffer of {} floats", count);
        rlUnloadVertexArray(info.vertex_array);
        return 0;
    }

    m_vertex_buffers[buffer] = info;
    m_stats.live_buffers = static_cast<uint32_t>(m_vertex_buffers.size() + m_index_buffers.size());
    return buffer;
}

BufferHandle RaylibDevice::newIndexBuffer(size_t count, BufferUsage usage) {
    // No vertex array bound: the element buffer is attached at draw time
    rlDisableVertexArray();
    BufferHandle buffer = rlLoadVertexBufferElement(nullptr, static_cast<int>(count * sizeof(uint16_t)),
                                                    usage == BufferUsage::DynamicDraw);
    if (buffer == 0) {
        Logger::error("Failed to create index buffer of {} indices", count);
        return 0;
    }

    m_index_buffers.insert(buffer);
    m_stats.live_buffers = static_cast<uint32_t>(m_vertex_buffers.size() + m_index_buffers.size());
    return buffer;
}

ProgramHandle RaylibDevice::compileProgram(const std::string& vertex_source,
                                           const std::string& fragment_source) {
    ProgramHandle program = rlLoadShaderCode(vertex_source.c_str(), fragment_source.c_str());
    if (program == 0 || program == rlGetShaderIdDefault()) {
        Logger::error("Failed to compile shader program");
        return 0;
    }

    m_programs.insert(program);
    return program;
}

void RaylibDevice::deleteFramebuffer(FramebufferHandle framebuffer) {
    if (m_framebuffers.erase(framebuffer) == 0) {
        return;
    }

    if (m_bound_framebuffer == framebuffer) {
        bindDefaultFramebuffer();
    }

    // Detach so the color texture outlives the framebuffer; deleteTexture() owns it
    rlFramebufferAttach(framebuffer, 0, RL_ATTACHMENT_COLOR_CHANNEL0, RL_ATTACHMENT_TEXTURE2D, 0);
    rlUnloadFramebuffer(framebuffer);
}

void RaylibDevice::deleteTexture(TextureHandle texture) {
    if (m_textures.erase(texture) == 0) {
        return;
    }

    rlUnloadTexture(texture);
    m_stats.live_textures = static_cast<uint32_t>(m_textures.size());
}

void RaylibDevice::deleteVertexBuffer(BufferHandle buffer) {
    auto it = m_vertex_buffers.find(buffer);
    if (it == m_vertex_buffers.end()) {
        return;
    }

    rlUnloadVertexBuffer(buffer);
    rlUnloadVertexArray(it->second.vertex_array);
    m_vertex_buffers.erase(it);
    m_stats.live_buffers = static_cast<uint32_t>(m_vertex_buffers.size() + m_index_buffers.size());
}

void RaylibDevice::deleteIndexBuffer(BufferHandle buffer) {
    if (m_index_buffers.erase(buffer) == 0) {
        return;
    }

    rlUnloadVertexBuffer(buffer);
    m_stats.live_buffers = static_cast<uint32_t>(m_vertex_buffers.size() + m_index_buffers.size());
}

void RaylibDevice::deleteProgram(ProgramHandle program) {
    if (m_programs.erase(program) == 0) {
        return;
    }

    rlUnloadShaderProgram(program);
}

void RaylibDevice::attachTextureToFramebuffer(FramebufferHandle framebuffer, TextureHandle texture,
                                              bool rebind_previous) {
    rlFramebufferAttach(framebuffer, texture, RL_ATTACHMENT_COLOR_CHANNEL0, RL_ATTACHMENT_TEXTURE2D, 0);

    if (!rlFramebufferComplete(framebuffer)) {
        Logger::error("Framebuffer {} is incomplete after attaching texture {}", framebuffer, texture);
    }

    // rlFramebufferAttach leaves the default framebuffer bound
    if (rebind_previous) {
        bindFramebuffer(m_bound_framebuffer);
    } else {
        bindFramebuffer(framebuffer);
    }
}

void RaylibDevice::setVertexBufferAttribute(BufferHandle buffer, uint32_t index,
                                            int size, size_t offset) {
    auto it = m_vertex_buffers.find(buffer);
    if (it == m_vertex_buffers.end()) {
        Logger::warning("setVertexBufferAttribute on unknown buffer {}", buffer);
        return;
    }

    const VertexBufferInfo& info = it->second;

    rlEnableVertexArray(info.vertex_array);
    rlEnableVertexBuffer(buffer);
    rlSetVertexAttribute(index, size, RL_FLOAT, false,
                         static_cast<int>(info.stride * sizeof(float)),
                         reinterpret_cast<const void*>(offset * sizeof(float)));
    rlEnableVertexAttribute(index);
    rlDisableVertexArray();
}

void RaylibDevice::setVertexBufferData(BufferHandle buffer, const std::vector<float>& data,
                                       size_t offset) {
    rlUpdateVertexBuffer(buffer, data.data(), static_cast<int>(data.size() * sizeof(float)),
                         static_cast<int>(offset * sizeof(float)));
    m_stats.buffer_uploads++;
}

void RaylibDevice::setIndexBufferData(BufferHandle buffer, const std::vector<uint16_t>& data,
                                      size_t offset) {
    rlUpdateVertexBufferElements(buffer, data.data(), static_cast<int>(data.size() * sizeof(uint16_t)),
                                 static_cast<int>(offset * sizeof(uint16_t)));
    m_stats.buffer_uploads++;
}

void RaylibDevice::setUniform(ProgramHandle program, const std::string& name, const Matrix4& value) {
    int location = rlGetLocationUniform(program, name.c_str());
    if (location < 0) {
        Logger::warning("Shader program {} has no uniform named {}", program, name);
        return;
    }

    rlEnableShader(program);
    rlSetUniformMatrix(location, toRaylibMatrix(value));
}

void RaylibDevice::setViewport(int x, int y, int width, int height) {
    rlViewport(x, y, width, height);
}

void RaylibDevice::bindFramebuffer(FramebufferHandle framebuffer) {
    if (framebuffer == 0) {
        bindDefaultFramebuffer();
        return;
    }

    rlEnableFramebuffer(framebuffer);
    m_bound_framebuffer = framebuffer;
}

void RaylibDevice::bindDefaultFramebuffer() {
    rlDisableFramebuffer();
    m_bound_framebuffer = 0;
}

void RaylibDevice::clear(float r, float g, float b, float a) {
    rlClearColor(toByte(r), toByte(g), toByte(b), toByte(a));
    rlClearScreenBuffers();
}

void RaylibDevice::draw(BufferHandle vertex_buffer, BufferHandle index_buffer,
                        ProgramHandle program, TextureHandle texture, size_t count) {
    auto it = m_vertex_buffers.find(vertex_buffer);
    if (it == m_vertex_buffers.end()) {
        Logger::warning("draw with unknown vertex buffer {}", vertex_buffer);
        return;
    }

    rlEnableShader(program);
    rlActiveTextureSlot(0);
    rlEnableTexture(texture);

    rlEnableVertexArray(it->second.vertex_array);
    rlEnableVertexBufferElement(index_buffer);
    rlDrawVertexArrayElements(0, static_cast<int>(count), nullptr);
    rlDisableVertexArray();

    rlDisableTexture();
    rlDisableShader();

    m_stats.draw_calls_issued++;
}

void RaylibDevice::swapWindow() {
    SwapScreenBuffer();
    m_stats.frames_swapped++;
}

void RaylibDevice::releaseResources() {
    if (!m_vertex_buffers.empty() || !m_index_buffers.empty() || !m_textures.empty() ||
        !m_framebuffers.empty() || !m_programs.empty()) {
        Logger::warning("RaylibDevice releasing {} buffers, {} textures, {} framebuffers and {} programs still alive",
                        m_vertex_buffers.size() + m_index_buffers.size(), m_textures.size(),
                        m_framebuffers.size(), m_programs.size());
    }

    for (const auto& [buffer, info] : m_vertex_buffers) {
        rlUnloadVertexBuffer(buffer);
        rlUnloadVertexArray(info.vertex_array);
    }
    m_vertex_buffers.clear();

    for (BufferHandle buffer : m_index_buffers) {
        rlUnloadVertexBuffer(buffer);
    }
    m_index_buffers.clear();

    for (FramebufferHandle framebuffer : m_framebuffers) {
        rlFramebufferAttach(framebuffer, 0, RL_ATTACHMENT_COLOR_CHANNEL0, RL_ATTACHMENT_TEXTURE2D, 0);
        rlUnloadFramebuffer(framebuffer);
    }
    m_framebuffers.clear();

    for (TextureHandle texture : m_textures) {
        rlUnloadTexture(texture);
    }
    m_textures.clear();

    for (ProgramHandle program : m_programs) {
        rlUnloadShaderProgram(program);
    }
    m_programs.clear();

    m_stats.live_textures = 0;
    m_stats.live_buffers = 0;
}

} // namespace Quadra
