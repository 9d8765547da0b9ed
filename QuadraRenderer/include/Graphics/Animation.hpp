// QuadraRenderer/include/Graphics/Animation.hpp
#pragma once

#include <Types.hpp>
#include <Graphics/Texture.hpp>
#include <vector>

namespace Quadra {

/**
 * @brief Frame-by-frame animation over regions of one texture
 *
 * Each frame is shown for `frame_length` calls to tick(). When drawn, a clip
 * in the draw parameters is taken relative to the current frame and cannot
 * extend past it.
 */
class Animation : public Drawable {
public:
    // Throws std::invalid_argument for an empty frame list or frame_length < 1
    Animation(const Texture& texture, std::vector<Rectangle> frames, int frame_length);

    // Advances the animation by one tick
    void tick();
    void restart();

    const Texture& getTexture() const { return m_texture; }
    void setTexture(const Texture& texture) { m_texture = texture; }

    const std::vector<Rectangle>& getFrames() const { return m_frames; }
    void setFrames(std::vector<Rectangle> frames);

    int getFrameLength() const { return m_frame_length; }
    void setFrameLength(int frame_length);

    size_t getCurrentFrameIndex() const { return m_current_frame; }
    const Rectangle& getCurrentFrame() const { return m_frames[m_current_frame]; }

    void renderInto(RenderContext& context, const DrawParams& params) const override;

private:
    Texture m_texture;
    std::vector<Rectangle> m_frames;
    int m_frame_length;

    size_t m_current_frame = 0;
    int m_timer = 0;
};

} // namespace Quadra
