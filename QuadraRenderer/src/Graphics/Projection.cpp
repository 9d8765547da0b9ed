// QuadraRenderer/src/Graphics/Projection.cpp
#include <Graphics/Projection.hpp>
#include <algorithm>

namespace Quadra {

Matrix4 Matrix4::identity() {
    Matrix4 result;
    for (int i = 0; i < 4; ++i) {
        result.at(i, i) = 1.0f;
    }
    return result;
}

std::array<float, 4> Matrix4::transform(float x, float y, float z) const {
    const float in[4] = {x, y, z, 1.0f};
    std::array<float, 4> out{};

    for (int row = 0; row < 4; ++row) {
        float sum = 0.0f;
        for (int column = 0; column < 4; ++column) {
            sum += at(column, row) * in[column];
        }
        out[row] = sum;
    }

    return out;
}

Matrix4 ortho(float left, float right, float bottom, float top, float near_plane, float far_plane) {
    Matrix4 result;

    result.at(0, 0) = 2.0f / (right - left);
    result.at(1, 1) = 2.0f / (top - bottom);
    result.at(2, 2) = -2.0f / (far_plane - near_plane);

    result.at(3, 0) = -(right + left) / (right - left);
    result.at(3, 1) = -(top + bottom) / (top - bottom);
    result.at(3, 2) = -(far_plane + near_plane) / (far_plane - near_plane);
    result.at(3, 3) = 1.0f;

    return result;
}

int letterboxScaleFactor(int internal_width, int internal_height, int window_width, int window_height) {
    if (window_width <= window_height) {
        return window_width / internal_width;
    }
    return window_height / internal_height;
}

Rectangle letterbox(int internal_width, int internal_height, int window_width, int window_height) {
    int scale_factor = std::max(1, letterboxScaleFactor(internal_width, internal_height,
                                                        window_width, window_height));

    int letterbox_width = internal_width * scale_factor;
    int letterbox_height = internal_height * scale_factor;
    int letterbox_x = (window_width - letterbox_width) / 2;
    int letterbox_y = (window_height - letterbox_height) / 2;

    return Rectangle(static_cast<float>(letterbox_x),
                     static_cast<float>(letterbox_y),
                     static_cast<float>(letterbox_width),
                     static_cast<float>(letterbox_height));
}

} // namespace Quadra
