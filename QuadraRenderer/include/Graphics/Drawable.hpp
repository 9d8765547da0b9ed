// QuadraRenderer/include/Graphics/Drawable.hpp
#pragma once

#include <Graphics/DrawParams.hpp>

namespace Quadra {

class RenderContext;

/**
 * @brief Anything that can be drawn into a render context
 *
 * Implementations bind their texture through RenderContext::setTexture() and
 * push one or more quads through RenderContext::pushQuad(), transformed by
 * the position, scale, origin, clip and color in `params`.
 */
class Drawable {
public:
    virtual ~Drawable() = default;

    virtual void renderInto(RenderContext& context, const DrawParams& params) const = 0;
};

} // namespace Quadra
