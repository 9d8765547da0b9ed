#include <gtest/gtest.h>
#include <Graphics/BatchRenderer.hpp>
#include "RecordingDevice.hpp"

#include <algorithm>
#include <stdexcept>

using namespace Quadra;
using Quadra::Testing::RecordingDevice;

// ============================================================================
// Index Generation Tests
// ============================================================================

TEST(QuadIndicesTest, SingleQuadPattern) {
    uint16_t indices[6];
    BatchVertexUtils::generateQuadIndices(0, indices);

    const uint16_t expected[6] = {0, 1, 2, 2, 3, 0};
    for (int i = 0; i < 6; ++i) {
        EXPECT_EQ(indices[i], expected[i]);
    }
}

TEST(QuadIndicesTest, QuadsAreOffsetByFourVertices) {
    auto indices = BatchVertexUtils::generateQuadIndices(3);

    std::vector<uint16_t> expected = {
        0, 1, 2, 2, 3, 0,
        4, 5, 6, 6, 7, 4,
        8, 9, 10, 10, 11, 8
    };
    EXPECT_EQ(indices, expected);
}

TEST(QuadIndicesTest, MaximumCapacityFitsSixteenBits) {
    auto indices = BatchVertexUtils::generateQuadIndices(Limits::MAX_SPRITE_CAPACITY);

    ASSERT_EQ(indices.size(), Limits::MAX_SPRITE_CAPACITY * 6);
    EXPECT_EQ(indices.back(), static_cast<uint16_t>((Limits::MAX_SPRITE_CAPACITY - 1) * 4));
    EXPECT_EQ(indices[indices.size() - 2], static_cast<uint16_t>((Limits::MAX_SPRITE_CAPACITY - 1) * 4 + 3));
}

// ============================================================================
// BatchRenderer Tests
// ============================================================================

class BatchRendererTest : public ::testing::Test {
protected:
    void pushQuad(BatchRenderer& batch, float x) {
        for (int i = 0; i < 4; ++i) {
            batch.pushVertex(x, 0.0f, 0.0f, 0.0f, Color::WHITE);
        }
    }

    RecordingDevice device;
};

TEST_F(BatchRendererTest, ConstructionSetsUpBuffers) {
    BatchRenderer batch(device, 16);

    EXPECT_EQ(device.vertex_buffer_count, 16u * 32u);
    EXPECT_EQ(device.vertex_buffer_stride, 8u);
    EXPECT_EQ(device.vertex_buffer_usage, BufferUsage::DynamicDraw);
    EXPECT_EQ(device.index_buffer_count, 16u * 6u);
    EXPECT_EQ(device.index_buffer_usage, BufferUsage::StaticDraw);

    ASSERT_EQ(device.attributes.size(), 2u);
    EXPECT_EQ(device.attributes[0].index, 0u);
    EXPECT_EQ(device.attributes[0].size, 4);
    EXPECT_EQ(device.attributes[0].offset, 0u);
    EXPECT_EQ(device.attributes[1].index, 1u);
    EXPECT_EQ(device.attributes[1].size, 4);
    EXPECT_EQ(device.attributes[1].offset, 4u);

    ASSERT_EQ(device.index_uploads.size(), 1u);
    EXPECT_EQ(device.index_uploads[0].buffer, batch.getIndexBuffer());
    EXPECT_EQ(device.index_uploads[0].data, BatchVertexUtils::generateQuadIndices(16));

    EXPECT_TRUE(batch.isEmpty());
    EXPECT_EQ(batch.getCapacity(), 16u);
}

TEST_F(BatchRendererTest, RejectsCapacityOutOfRange) {
    EXPECT_THROW(BatchRenderer(device, 0), std::length_error);
    EXPECT_THROW(BatchRenderer(device, Limits::MAX_SPRITE_CAPACITY + 1), std::length_error);
    EXPECT_NO_THROW(BatchRenderer(device, Limits::MAX_SPRITE_CAPACITY));
}

TEST_F(BatchRendererTest, EveryFourthVertexCompletesASprite) {
    BatchRenderer batch(device, 4);

    batch.pushVertex(1.0f, 2.0f, 0.25f, 0.5f, Color::rgba(0.1f, 0.2f, 0.3f, 0.4f));
    EXPECT_EQ(batch.getSpriteCount(), 0u);
    EXPECT_FALSE(batch.isAtQuadBoundary());

    const auto& vertices = batch.getVertices();
    ASSERT_EQ(vertices.size(), 8u);
    EXPECT_FLOAT_EQ(vertices[0], 1.0f);
    EXPECT_FLOAT_EQ(vertices[1], 2.0f);
    EXPECT_FLOAT_EQ(vertices[2], 0.25f);
    EXPECT_FLOAT_EQ(vertices[3], 0.5f);
    EXPECT_FLOAT_EQ(vertices[4], 0.1f);
    EXPECT_FLOAT_EQ(vertices[7], 0.4f);

    for (int i = 0; i < 3; ++i) {
        batch.pushVertex(0.0f, 0.0f, 0.0f, 0.0f, Color::WHITE);
    }
    EXPECT_EQ(batch.getSpriteCount(), 1u);
    EXPECT_TRUE(batch.isAtQuadBoundary());
    EXPECT_EQ(batch.getVertices().size(), 32u);
}

TEST_F(BatchRendererTest, SubmitDrawsEveryBufferedSprite) {
    BatchRenderer batch(device, 8);
    pushQuad(batch, 1.0f);
    pushQuad(batch, 2.0f);
    pushQuad(batch, 3.0f);

    batch.submit(7, 9);

    ASSERT_EQ(device.vertex_uploads.size(), 1u);
    EXPECT_EQ(device.vertex_uploads[0].buffer, batch.getVertexBuffer());
    EXPECT_EQ(device.vertex_uploads[0].data.size(), 3u * 32u);
    EXPECT_EQ(device.vertex_uploads[0].offset, 0u);

    ASSERT_EQ(device.draws.size(), 1u);
    EXPECT_EQ(device.draws[0].program, 7u);
    EXPECT_EQ(device.draws[0].texture, 9u);
    EXPECT_EQ(device.draws[0].count, 18u);
    EXPECT_EQ(device.draws[0].vertex_buffer, batch.getVertexBuffer());
    EXPECT_EQ(device.draws[0].index_buffer, batch.getIndexBuffer());

    EXPECT_TRUE(batch.isEmpty());
    EXPECT_EQ(batch.getSpriteCount(), 0u);

    const auto& stats = batch.getStats();
    EXPECT_EQ(stats.draw_calls_issued, 1u);
    EXPECT_EQ(stats.sprites_flushed, 3u);
    EXPECT_EQ(stats.peak_sprites_per_batch, 3u);
    EXPECT_EQ(stats.vertices_uploaded, 12u);
}

TEST_F(BatchRendererTest, SubmitWithNothingBufferedIsNoOp) {
    BatchRenderer batch(device, 8);
    batch.submit(1, 2);

    EXPECT_TRUE(device.draws.empty());
    EXPECT_TRUE(device.vertex_uploads.empty());
}

TEST_F(BatchRendererTest, SubmitDropsIncompleteSprite) {
    BatchRenderer batch(device, 8);
    pushQuad(batch, 1.0f);
    batch.pushVertex(0.0f, 0.0f, 0.0f, 0.0f, Color::WHITE);

    batch.submit(1, 2);

    ASSERT_EQ(device.draws.size(), 1u);
    EXPECT_EQ(device.draws[0].count, 6u);
    EXPECT_EQ(device.vertex_uploads[0].data.size(), 32u);
    EXPECT_TRUE(batch.isEmpty());
}

TEST_F(BatchRendererTest, FullAtCapacity) {
    BatchRenderer batch(device, 2);
    pushQuad(batch, 0.0f);
    EXPECT_FALSE(batch.isFull());
    pushQuad(batch, 0.0f);
    EXPECT_TRUE(batch.isFull());

    batch.clear();
    EXPECT_FALSE(batch.isFull());
    EXPECT_TRUE(device.draws.empty());
}

TEST_F(BatchRendererTest, DestructionReleasesBuffers) {
    BufferHandle vertex_buffer = 0;
    BufferHandle index_buffer = 0;
    {
        BatchRenderer batch(device, 2);
        vertex_buffer = batch.getVertexBuffer();
        index_buffer = batch.getIndexBuffer();
    }

    EXPECT_EQ(device.countCalls("deleteVertexBuffer"), 1u);
    EXPECT_EQ(device.countCalls("deleteIndexBuffer"), 1u);
    EXPECT_NE(std::find(device.deleted.begin(), device.deleted.end(), vertex_buffer), device.deleted.end());
    EXPECT_NE(std::find(device.deleted.begin(), device.deleted.end(), index_buffer), device.deleted.end());
}

TEST_F(BatchRendererTest, ReportDescribesFlushedBatches) {
    BatchRenderer batch(device, 4);
    pushQuad(batch, 0.0f);
    pushQuad(batch, 1.0f);
    batch.submit(1, 2);

    EXPECT_GT(batch.getStats().memory_usage_bytes, 0u);

    std::string report = batch.getBatchReport();
    EXPECT_NE(report.find("Capacity: 4 sprites"), std::string::npos);
    EXPECT_NE(report.find("Batches flushed: 1"), std::string::npos);
    EXPECT_NE(report.find("Sprites flushed: 2"), std::string::npos);
}
