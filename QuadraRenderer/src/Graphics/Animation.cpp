// QuadraRenderer/src/Graphics/Animation.cpp
#include <Graphics/Animation.hpp>
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace Quadra {

Animation::Animation(const Texture& texture, std::vector<Rectangle> frames, int frame_length)
    : m_texture(texture),
      m_frame_length(frame_length) {
    setFrames(std::move(frames));
    setFrameLength(frame_length);
}

void Animation::tick() {
    m_timer++;
    if (m_timer >= m_frame_length) {
        m_current_frame = (m_current_frame + 1) % m_frames.size();
        m_timer = 0;
    }
}

void Animation::restart() {
    m_current_frame = 0;
    m_timer = 0;
}

void Animation::setFrames(std::vector<Rectangle> frames) {
    if (frames.empty()) {
        throw std::invalid_argument("Animation requires at least one frame");
    }

    m_frames = std::move(frames);
    restart();
}

void Animation::setFrameLength(int frame_length) {
    if (frame_length < 1) {
        throw std::invalid_argument("Animation frame length must be at least 1 tick");
    }

    m_frame_length = frame_length;
}

void Animation::renderInto(RenderContext& context, const DrawParams& params) const {
    const Rectangle& frame_clip = m_frames[m_current_frame];

    DrawParams frame_params = params;
    if (params.clip) {
        Rectangle clip = *params.clip;
        clip.x += frame_clip.x;
        clip.y += frame_clip.y;
        clip.width = std::min(clip.width, frame_clip.width);
        clip.height = std::min(clip.height, frame_clip.height);
        frame_params.clip = clip;
    } else {
        frame_params.clip = frame_clip;
    }

    m_texture.renderInto(context, frame_params);
}

} // namespace Quadra
