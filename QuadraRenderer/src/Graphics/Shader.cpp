// QuadraRenderer/src/Graphics/Shader.cpp
#include <Graphics/Shader.hpp>
#include <Utils/Logger.hpp>

namespace Quadra {

const char* const Shader::DEFAULT_VERTEX_SOURCE = R"(#version 330 core
layout (location = 0) in vec4 a_position_uv;
layout (location = 1) in vec4 a_color;

uniform mat4 projection;

out vec2 v_uv;
out vec4 v_color;

void main() {
    v_uv = a_position_uv.zw;
    v_color = a_color;
    gl_Position = projection * vec4(a_position_uv.xy, 0.0, 1.0);
}
)";

const char* const Shader::DEFAULT_FRAGMENT_SOURCE = R"(#version 330 core
in vec2 v_uv;
in vec4 v_color;

uniform sampler2D u_texture;

out vec4 o_color;

void main() {
    o_color = texture(u_texture, v_uv) * v_color;
}
)";

Shader Shader::fromSource(GraphicsDevice& device, const std::string& vertex_source,
                          const std::string& fragment_source) {
    ProgramHandle handle = device.compileProgram(vertex_source, fragment_source);
    if (handle == 0) {
        Logger::error("Shader program failed to compile");
    }
    return Shader(handle);
}

Shader Shader::createDefault(GraphicsDevice& device) {
    return fromSource(device, DEFAULT_VERTEX_SOURCE, DEFAULT_FRAGMENT_SOURCE);
}

} // namespace Quadra
