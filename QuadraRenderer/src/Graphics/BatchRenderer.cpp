// QuadraRenderer/src/Graphics/BatchRenderer.cpp
#include <Graphics/BatchRenderer.hpp>
#include <Utils/Logger.hpp>
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace Quadra {

BatchRenderer::BatchRenderer(GraphicsDevice& device, size_t capacity)
    : m_device(device),
      m_capacity(capacity) {

    if (capacity < Limits::MIN_SPRITE_CAPACITY || capacity > Limits::MAX_SPRITE_CAPACITY) {
        throw std::length_error("Sprite capacity must be between 1 and " +
                                std::to_string(Limits::MAX_SPRITE_CAPACITY) +
                                ", got " + std::to_string(capacity));
    }

    m_vertex_buffer = m_device.newVertexBuffer(m_capacity * Constants::FLOATS_PER_QUAD,
                                               Constants::VERTEX_STRIDE,
                                               BufferUsage::DynamicDraw);

    // x, y, u, v then r, g, b, a
    m_device.setVertexBufferAttribute(m_vertex_buffer, Constants::ATTRIBUTE_POSITION_UV, 4, 0);
    m_device.setVertexBufferAttribute(m_vertex_buffer, Constants::ATTRIBUTE_COLOR, 4, 4);

    m_index_buffer = m_device.newIndexBuffer(m_capacity * Constants::INDEX_STRIDE,
                                             BufferUsage::StaticDraw);
    m_device.setIndexBufferData(m_index_buffer, BatchVertexUtils::generateQuadIndices(m_capacity), 0);

    m_vertices.reserve(m_capacity * Constants::FLOATS_PER_QUAD);
    m_stats.memory_usage_bytes = m_vertices.capacity() * sizeof(float) +
                                 m_capacity * Constants::INDEX_STRIDE * sizeof(uint16_t);

    Logger::debug("BatchRenderer created with capacity for {} sprites", m_capacity);
}

BatchRenderer::~BatchRenderer() {
    if (!m_vertices.empty()) {
        Logger::warning("BatchRenderer destroyed with {} unsubmitted sprites", m_sprite_count);
    }

    m_device.deleteIndexBuffer(m_index_buffer);
    m_device.deleteVertexBuffer(m_vertex_buffer);
}

void BatchRenderer::pushVertex(float x, float y, float u, float v, const Color& color) {
    m_vertices.push_back(x);
    m_vertices.push_back(y);
    m_vertices.push_back(u);
    m_vertices.push_back(v);
    m_vertices.push_back(color.r);
    m_vertices.push_back(color.g);
    m_vertices.push_back(color.b);
    m_vertices.push_back(color.a);

    if (++m_pending_vertices == Constants::VERTICES_PER_QUAD) {
        m_pending_vertices = 0;
        ++m_sprite_count;
    }
}

void BatchRenderer::submit(ProgramHandle program, TextureHandle texture) {
    if (m_sprite_count == 0) {
        return;
    }

    if (m_pending_vertices != 0) {
        Logger::warning("Submitting batch with {} vertices of an incomplete sprite", m_pending_vertices);
        m_vertices.resize(m_sprite_count * Constants::FLOATS_PER_QUAD);
        m_pending_vertices = 0;
    }

    m_device.setVertexBufferData(m_vertex_buffer, m_vertices, 0);
    m_device.draw(m_vertex_buffer, m_index_buffer, program, texture,
                  m_sprite_count * Constants::INDEX_STRIDE);

    m_stats.vertices_uploaded += m_sprite_count * Constants::VERTICES_PER_QUAD;
    updateStats(m_sprite_count);

    clear();
}

void BatchRenderer::clear() {
    m_vertices.clear();
    m_sprite_count = 0;
    m_pending_vertices = 0;
}

std::string BatchRenderer::getBatchReport() const {
    std::stringstream ss;
    ss << "BatchRenderer Report:\n";
    ss << "Capacity: " << m_capacity << " sprites\n";
    ss << "Buffered sprites: " << m_sprite_count << "\n";
    ss << "Draw calls issued: " << m_stats.draw_calls_issued << "\n";
    ss << "Batches flushed: " << m_stats.batches_flushed << "\n";
    ss << "Sprites flushed: " << m_stats.sprites_flushed << "\n";
    ss << "Peak sprites per batch: " << m_stats.peak_sprites_per_batch << "\n";
    ss << "Avg sprites per batch: " << m_stats.avg_sprites_per_batch << "\n";
    ss << "Batch efficiency: " << m_stats.batch_efficiency << "%\n";
    ss << "Memory usage: " << (m_stats.memory_usage_bytes / 1024) << " KB\n";

    return ss.str();
}

void BatchRenderer::updateStats(size_t sprites) {
    m_stats.draw_calls_issued++;
    m_stats.batches_flushed++;
    m_stats.sprites_flushed += sprites;
    m_stats.peak_sprites_per_batch = std::max(m_stats.peak_sprites_per_batch,
                                              static_cast<uint32_t>(sprites));

    m_stats.avg_sprites_per_batch = static_cast<double>(m_stats.sprites_flushed) / m_stats.batches_flushed;
    m_stats.batch_efficiency = m_stats.avg_sprites_per_batch / m_capacity * 100.0;
}

// BatchVertexUtils implementation

namespace BatchVertexUtils {

void generateQuadIndices(uint16_t base_vertex_index, uint16_t* indices) {
    for (size_t i = 0; i < Constants::INDEX_STRIDE; ++i) {
        indices[i] = static_cast<uint16_t>(base_vertex_index + Constants::INDEX_PATTERN[i]);
    }
}

std::vector<uint16_t> generateQuadIndices(size_t quad_count) {
    std::vector<uint16_t> indices(quad_count * Constants::INDEX_STRIDE);

    for (size_t quad = 0; quad < quad_count; ++quad) {
        generateQuadIndices(static_cast<uint16_t>(quad * Constants::VERTICES_PER_QUAD),
                            indices.data() + quad * Constants::INDEX_STRIDE);
    }

    return indices;
}

} // namespace BatchVertexUtils

} // namespace Quadra
