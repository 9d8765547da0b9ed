// QuadraRenderer/include/Graphics/BatchRenderer.hpp
#pragma once

#include <Types.hpp>
#include <Constants.hpp>
#include <Graphics/GraphicsDevice.hpp>
#include <string>
#include <vector>

namespace Quadra {

/**
 * @brief Sprite batch: vertex scratch buffer plus the fixed quad index buffer
 *
 * Vertices are appended on the CPU side and submitted to the device in a
 * single indexed draw call covering every buffered quad. The index buffer
 * holds the [0, 1, 2, 2, 3, 0] pattern repeated once per quad of capacity and
 * is uploaded once at construction.
 */
class BatchRenderer {
public:
    struct Stats {
        uint64_t draw_calls_issued = 0;
        uint64_t batches_flushed = 0;
        uint64_t sprites_flushed = 0;
        uint64_t vertices_uploaded = 0;

        uint32_t peak_sprites_per_batch = 0;
        size_t memory_usage_bytes = 0;

        double avg_sprites_per_batch = 0.0;
        double batch_efficiency = 0.0; // % of capacity used per batch on average
    };

public:
    // Throws std::length_error when capacity is 0 or above Limits::MAX_SPRITE_CAPACITY
    explicit BatchRenderer(GraphicsDevice& device, size_t capacity = Defaults::SPRITE_CAPACITY);
    ~BatchRenderer();

    BatchRenderer(const BatchRenderer&) = delete;
    BatchRenderer& operator=(const BatchRenderer&) = delete;

    // Appends one vertex; every fourth vertex completes a sprite
    void pushVertex(float x, float y, float u, float v, const Color& color);

    // Uploads the scratch buffer and draws every complete sprite in one call
    void submit(ProgramHandle program, TextureHandle texture);

    // Drops buffered vertices without drawing them
    void clear();

    // Batch state
    size_t getSpriteCount() const { return m_sprite_count; }
    size_t getCapacity() const { return m_capacity; }
    bool isEmpty() const { return m_vertices.empty(); }
    bool isFull() const { return m_sprite_count >= m_capacity; }
    bool isAtQuadBoundary() const { return m_pending_vertices == 0; }
    const std::vector<float>& getVertices() const { return m_vertices; }

    // Device resources
    BufferHandle getVertexBuffer() const { return m_vertex_buffer; }
    BufferHandle getIndexBuffer() const { return m_index_buffer; }

    // Statistics
    const Stats& getStats() const { return m_stats; }
    std::string getBatchReport() const;

private:
    void updateStats(size_t sprites);

private:
    GraphicsDevice& m_device;

    BufferHandle m_vertex_buffer = 0;
    BufferHandle m_index_buffer = 0;

    std::vector<float> m_vertices;
    size_t m_sprite_count = 0;
    size_t m_pending_vertices = 0;
    size_t m_capacity;

    Stats m_stats;
};

/**
 * @brief Index utilities for quad batching
 */
namespace BatchVertexUtils {
    // Six indices for the quad whose first vertex is base_vertex_index
    void generateQuadIndices(uint16_t base_vertex_index, uint16_t* indices);

    // Full index buffer contents for quad_count quads
    std::vector<uint16_t> generateQuadIndices(size_t quad_count);
}

} // namespace Quadra
