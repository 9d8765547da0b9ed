// QuadraRenderer/include/Graphics/Shader.hpp
#pragma once

#include <Graphics/GraphicsDevice.hpp>
#include <string>

namespace Quadra {

/**
 * @brief Handle to a compiled shader program
 *
 * Programs drawn through the sprite batch must declare a mat4 `projection`
 * uniform and read position/UV from attribute 0 and color from attribute 1.
 */
class Shader {
public:
    static const char* const DEFAULT_VERTEX_SOURCE;
    static const char* const DEFAULT_FRAGMENT_SOURCE;

public:
    Shader() = default;
    explicit Shader(ProgramHandle handle) : m_handle(handle) {}

    static Shader fromSource(GraphicsDevice& device, const std::string& vertex_source,
                             const std::string& fragment_source);
    static Shader createDefault(GraphicsDevice& device);

    ProgramHandle getHandle() const { return m_handle; }
    bool isValid() const { return m_handle != 0; }

    bool operator==(const Shader& other) const { return m_handle == other.m_handle; }
    bool operator!=(const Shader& other) const { return !(*this == other); }

private:
    ProgramHandle m_handle = 0;
};

} // namespace Quadra
