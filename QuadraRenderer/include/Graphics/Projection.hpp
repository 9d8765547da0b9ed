// QuadraRenderer/include/Graphics/Projection.hpp
#pragma once

#include <Types.hpp>
#include <array>

namespace Quadra {

/**
 * @brief Column-major 4x4 matrix, laid out the way GL uniforms expect it
 */
struct Matrix4 {
    std::array<float, 16> m;

    Matrix4() : m{} {}

    static Matrix4 identity();

    float& at(int column, int row) { return m[column * 4 + row]; }
    float at(int column, int row) const { return m[column * 4 + row]; }

    const float* data() const { return m.data(); }

    // Applies the matrix to (x, y, z, 1)
    std::array<float, 4> transform(float x, float y, float z) const;

    bool operator==(const Matrix4& other) const { return m == other.m; }
    bool operator!=(const Matrix4& other) const { return !(*this == other); }
};

/**
 * @brief OpenGL-style orthographic projection
 *
 * Maps [left, right] x [bottom, top] x [near, far] onto the clip cube.
 * Screen-space callers pass bottom and top swapped (ortho(0, w, h, 0, -1, 1))
 * so that y grows downwards without an extra flip.
 */
Matrix4 ortho(float left, float right, float bottom, float top, float near_plane, float far_plane);

/**
 * @brief Integer-scaled, centered destination for the offscreen surface
 *
 * The scale factor is whole-number only and never drops below 1; a window
 * smaller than the internal resolution shows the centered content cropped.
 */
Rectangle letterbox(int internal_width, int internal_height, int window_width, int window_height);

// Whole-number scale factor used by letterbox(), before clamping
int letterboxScaleFactor(int internal_width, int internal_height, int window_width, int window_height);

} // namespace Quadra
