// QuadraRenderer/include/Graphics/DrawParams.hpp
#pragma once

#include <Types.hpp>
#include <optional>

namespace Quadra {

/**
 * @brief Parameters used when drawing a graphic
 *
 * A default instance draws with:
 * - Position: (0, 0)
 * - Scale: (1, 1)
 * - Origin: (0, 0)
 * - Color: white
 * - Clip: the full source image
 */
struct DrawParams {
    Vec2 position{0.0f, 0.0f};
    Vec2 scale{1.0f, 1.0f};
    Vec2 origin{0.0f, 0.0f};
    Color color = Color::WHITE;
    std::optional<Rectangle> clip;

    DrawParams() = default;

    // Position shorthand, everything else defaulted
    explicit DrawParams(const Vec2& draw_position) : position(draw_position) {}

    static DrawParams at(const Vec2& draw_position) { return DrawParams(draw_position); }
    static DrawParams at(float x, float y) { return DrawParams(Vec2(x, y)); }

    // Builder-style setters
    DrawParams& setPosition(const Vec2& value) { position = value; return *this; }

    // Negative values flip the graphic around the origin
    DrawParams& setScale(const Vec2& value) { scale = value; return *this; }

    // Positioning and scaling are relative to this point
    DrawParams& setOrigin(const Vec2& value) { origin = value; return *this; }

    // White leaves the graphic's own colors untouched
    DrawParams& setColor(const Color& value) { color = value; return *this; }

    // Region of the source to draw, for spritesheets
    DrawParams& setClip(const Rectangle& value) { clip = value; return *this; }
    DrawParams& clearClip() { clip.reset(); return *this; }
};

} // namespace Quadra
