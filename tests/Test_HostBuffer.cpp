#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <vector>

#include <glm/glm.hpp>

import RHI;

using namespace RHI;

TEST(HostBuffer, CreateCopiesSource)
{
    std::vector<float> source(12, 1.5f);
    HostBufferFactory factory;

    auto buffer = factory.CreateBuffer(source, VertexLayout{2, 2, 0}, PrimitiveKind::Triangles, TextureHandle{7});
    ASSERT_NE(buffer, nullptr);
    EXPECT_EQ(factory.GetCreateCount(), 1u);
    EXPECT_EQ(buffer->GetVertexCount(), 3u);
    EXPECT_EQ(buffer->GetSizeBytes(), 12 * sizeof(float));

    auto* host = dynamic_cast<HostBuffer*>(buffer.get());
    ASSERT_NE(host, nullptr);
    EXPECT_EQ(host->GetTexture(), std::optional<TextureHandle>(TextureHandle{7}));

    // Device copy only changes on upload.
    source[0] = 9.0f;
    EXPECT_EQ(host->GetDeviceData()[0], 1.5f);
}

TEST(HostBuffer, UpdateRangeCopiesOnlyThatRange)
{
    std::vector<float> source(8, 0.0f);
    HostBufferFactory factory;
    auto buffer = factory.CreateBuffer(source, VertexLayout{2, 0, 0}, PrimitiveKind::Lines, std::nullopt);
    auto* host = dynamic_cast<HostBuffer*>(buffer.get());
    ASSERT_NE(host, nullptr);

    for (float& f : source) f = 3.0f;
    host->UpdateRange(2 * sizeof(float), 2 * sizeof(float));

    const std::vector<float> expected = {0, 0, 3, 3, 0, 0, 0, 0};
    EXPECT_EQ(std::vector<float>(host->GetDeviceData().begin(), host->GetDeviceData().end()), expected);
    ASSERT_EQ(host->GetUploads().size(), 1u);
    EXPECT_EQ(host->GetUploads()[0].ByteOffset, 2 * sizeof(float));
    EXPECT_EQ(host->GetUploads()[0].ByteLength, 2 * sizeof(float));
}

TEST(HostBuffer, OutOfBoundsUpdateIsRejected)
{
    std::vector<float> source(4, 0.0f);
    HostBufferFactory factory;
    auto buffer = factory.CreateBuffer(source, VertexLayout{2, 0, 0}, PrimitiveKind::Triangles, std::nullopt);
    auto* host = dynamic_cast<HostBuffer*>(buffer.get());
    ASSERT_NE(host, nullptr);

    host->UpdateRange(8, 16);
    host->UpdateRange(1, 4);
    EXPECT_TRUE(host->GetUploads().empty());
}

TEST(HostBuffer, RenderRecordsDrawCall)
{
    std::vector<float> source(24, 0.0f);
    HostBufferFactory factory;
    auto buffer = factory.CreateBuffer(source, VertexLayout{2, 2, 0}, PrimitiveKind::Triangles, std::nullopt);
    auto* host = dynamic_cast<HostBuffer*>(buffer.get());
    ASSERT_NE(host, nullptr);

    buffer->Render(glm::vec3(1.0f, 2.0f, 0.0f), glm::vec3(4.0f, 4.0f, 1.0f));

    ASSERT_EQ(host->GetDrawCalls().size(), 1u);
    EXPECT_EQ(host->GetDrawCalls()[0].Position, glm::vec3(1.0f, 2.0f, 0.0f));
    EXPECT_EQ(host->GetDrawCalls()[0].Scale, glm::vec3(4.0f, 4.0f, 1.0f));
    EXPECT_EQ(host->GetDrawCalls()[0].VertexCount, 6u);
}

TEST(HostBuffer, FactoryRejectsStrideMismatch)
{
    std::vector<float> source(10, 0.0f);
    HostBufferFactory factory;

    EXPECT_EQ(factory.CreateBuffer(source, VertexLayout{2, 2, 4}, PrimitiveKind::Triangles, std::nullopt), nullptr);
    EXPECT_EQ(factory.GetCreateCount(), 0u);
}
