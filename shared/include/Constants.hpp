// shared/include/Constants.hpp
#pragma once

#include <cstddef>
#include <cstdint>

namespace Quadra {

constexpr const char* QUADRA_VERSION = "0.4.1";

// Constants for the sprite batch layout
namespace Constants {
    // Floats per vertex: x, y, u, v, r, g, b, a
    constexpr size_t VERTEX_STRIDE = 8;
    constexpr size_t VERTICES_PER_QUAD = 4;
    constexpr size_t INDEX_STRIDE = 6;
    constexpr size_t FLOATS_PER_QUAD = VERTICES_PER_QUAD * VERTEX_STRIDE;

    // Two triangles per quad, offset by 4 * quad index
    constexpr uint16_t INDEX_PATTERN[INDEX_STRIDE] = {0, 1, 2, 2, 3, 0};

    // Vertex attribute slots used by the default shader
    constexpr uint32_t ATTRIBUTE_POSITION_UV = 0;
    constexpr uint32_t ATTRIBUTE_COLOR = 1;

    constexpr const char* PROJECTION_UNIFORM = "projection";
}

// System limits
namespace Limits {
    // 16-bit indices: 4 vertices per quad must stay addressable
    constexpr size_t MAX_SPRITE_CAPACITY = 8191;
    constexpr size_t MIN_SPRITE_CAPACITY = 1;

    constexpr uint32_t MAX_FPS = 300;
    constexpr uint32_t MIN_FPS = 10;

    constexpr uint32_t MIN_INTERNAL_SIZE = 1;
    constexpr uint32_t MAX_SURFACE_SIZE = 16384;
}

// Default values
namespace Defaults {
    constexpr size_t SPRITE_CAPACITY = 1024;
    constexpr uint32_t INTERNAL_WIDTH = 320;
    constexpr uint32_t INTERNAL_HEIGHT = 240;
    constexpr uint32_t WINDOW_WIDTH = 640;
    constexpr uint32_t WINDOW_HEIGHT = 480;
    constexpr uint32_t TARGET_FPS = 60;
    constexpr const char* WINDOW_TITLE = "Quadra";
    constexpr const char* LOG_FILE = "quadra.log";
}

} // namespace Quadra
