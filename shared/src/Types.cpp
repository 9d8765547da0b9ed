// shared/src/Types.cpp
#include <Types.hpp>

namespace Quadra {

// Color constants implementation
const Color Color::WHITE{1.0f, 1.0f, 1.0f, 1.0f};
const Color Color::BLACK{0.0f, 0.0f, 0.0f, 1.0f};
const Color Color::RED{1.0f, 0.0f, 0.0f, 1.0f};
const Color Color::GREEN{0.0f, 1.0f, 0.0f, 1.0f};
const Color Color::BLUE{0.0f, 0.0f, 1.0f, 1.0f};
const Color Color::TRANSPARENT{0.0f, 0.0f, 0.0f, 0.0f};

RectangleSequence Rectangle::row(float x, float y, float width, float height) {
    return RectangleSequence(Rectangle(x, y, width, height), RectangleSequence::Axis::Horizontal);
}

RectangleSequence Rectangle::column(float x, float y, float width, float height) {
    return RectangleSequence(Rectangle(x, y, width, height), RectangleSequence::Axis::Vertical);
}

std::vector<Rectangle> RectangleSequence::take(size_t count) const {
    std::vector<Rectangle> rects;
    rects.reserve(count);

    auto it = begin();
    for (size_t i = 0; i < count; ++i, ++it) {
        rects.push_back(*it);
    }

    return rects;
}

} // namespace Quadra
