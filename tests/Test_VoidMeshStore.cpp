#include <gtest/gtest.h>

#include <optional>
#include <span>
#include <vector>

#include <glm/glm.hpp>

import Core;
import Geometry;
import RHI;
import Graphics;

#include "TestBoardBuilders.h"

using namespace Graphics;
using Geometry::GridRect;

namespace
{
    constexpr std::size_t kColoredStride = 6;

    std::vector<double> ExpectedSolidRect(const GridRect& rect, BoardCoords offset, glm::vec4 color)
    {
        std::vector<double> out(QuadEncoder::VERTICES_PER_QUAD * kColoredStride);
        QuadEncoder::WriteColoredQuad(out, QuadEncoder::RectBounds(rect, offset, 0.5), color);
        return out;
    }

    template <typename T>
    std::vector<T> ToVector(std::span<const T> data)
    {
        return {data.begin(), data.end()};
    }

    std::vector<BoardCoords> BlockWithIsland()
    {
        // 2x2 block at the origin, one lone square at (5,5).
        return {{0, 0}, {1, 0}, {0, 1}, {1, 1}, {5, 5}};
    }
}

TEST(VoidMeshStore, SolidRectanglesAreTriangles)
{
    SchedulerHarness h;
    VoidMeshStore store(h.Scheduler, h.Factory);

    const auto voids = BlockWithIsland();
    store.Regenerate(voids, {0, 0}, VoidMeshMode::Solid);
    EXPECT_EQ(store.GetState(), RegenerationState::Regenerating);
    EXPECT_EQ(h.TickUntilIdle(), 2u);

    ASSERT_TRUE(store.HasMesh());
    ASSERT_EQ(store.GetRectangles().size(), 2u);
    EXPECT_EQ(store.GetRectangles()[0], (GridRect{0, 1, 0, 1}));
    EXPECT_EQ(store.GetRectangles()[1], (GridRect{5, 5, 5, 5}));
    EXPECT_EQ(store.GetMode(), std::optional<VoidMeshMode>(VoidMeshMode::Solid));

    auto* host = AsHostBuffer(store.GetBuffer());
    ASSERT_NE(host, nullptr);
    EXPECT_EQ(host->GetPrimitiveKind(), RHI::PrimitiveKind::Triangles);
    EXPECT_EQ(host->GetVertexCount(), 12u);
    EXPECT_FALSE(host->GetTexture().has_value());

    const auto source = ToVector(store.GetSourceData());
    const auto expected = ExpectedSolidRect({0, 1, 0, 1}, {0, 0}, glm::vec4(0.0f, 0.0f, 0.0f, 1.0f));
    ASSERT_GE(source.size(), expected.size());
    EXPECT_EQ(std::vector<double>(source.begin(), source.begin() + expected.size()), expected);

    // First vertex is (L,B) of the 2x2 block.
    EXPECT_DOUBLE_EQ(source[0], -0.5);
    EXPECT_DOUBLE_EQ(source[1], -0.5);
    EXPECT_DOUBLE_EQ(source[5], 1.0);
}

TEST(VoidMeshStore, WireframeRectanglesAreLines)
{
    SchedulerHarness h;
    VoidMeshStore store(h.Scheduler, h.Factory);

    const auto voids = BlockWithIsland();
    store.Regenerate(voids, {0, 0}, VoidMeshMode::Wireframe);
    store.FinishPendingWork();

    auto* host = AsHostBuffer(store.GetBuffer());
    ASSERT_NE(host, nullptr);
    EXPECT_EQ(host->GetPrimitiveKind(), RHI::PrimitiveKind::Lines);
    EXPECT_EQ(host->GetVertexCount(), 2u * VoidMeshStore::VerticesPerRect(VoidMeshMode::Wireframe));
    EXPECT_EQ(VoidMeshStore::VerticesPerRect(VoidMeshMode::Wireframe), 12u);

    const auto render = ToVector(store.GetRenderData());
    EXPECT_EQ(render[2], 1.0f);
    EXPECT_EQ(render[3], 0.0f);
    EXPECT_EQ(render[4], 1.0f);
    EXPECT_EQ(render[5], 1.0f);
}

TEST(VoidMeshStore, PositionsAreOffsetRelative)
{
    SchedulerHarness h;
    VoidMeshStore store(h.Scheduler, h.Factory);

    const std::vector<BoardCoords> voids = {{10005, 3}};
    store.Regenerate(voids, {10000, 0}, VoidMeshMode::Solid);
    store.FinishPendingWork();

    const auto source = store.GetSourceData();
    ASSERT_EQ(source.size(), 36u);
    EXPECT_DOUBLE_EQ(source[0], 4.5);
    EXPECT_DOUBLE_EQ(source[1], 2.5);
    EXPECT_EQ(store.GetOffset(), std::optional<BoardCoords>(BoardCoords(10000, 0)));
}

TEST(VoidMeshStore, EmptyVoidsPublishEmptyMesh)
{
    SchedulerHarness h;
    VoidMeshStore store(h.Scheduler, h.Factory);

    store.Regenerate({}, {0, 0}, VoidMeshMode::Solid);
    h.TickUntilIdle();

    EXPECT_TRUE(store.HasMesh());
    EXPECT_TRUE(store.GetRenderData().empty());
    EXPECT_EQ(store.GetPublishCount(), 1u);
}

TEST(VoidMeshStore, ShiftMatchesRegenerateAtNewOffset)
{
    SchedulerHarness h;
    VoidMeshStore store(h.Scheduler, h.Factory);
    const auto voids = BlockWithIsland();
    store.Regenerate(voids, {0, 0}, VoidMeshMode::Wireframe);
    store.FinishPendingWork();

    // Offset moves from 0 to 20000.
    store.Shift({-20000, 0});
    EXPECT_EQ(store.GetOffset(), std::optional<BoardCoords>(BoardCoords(20000, 0)));

    SchedulerHarness cold;
    VoidMeshStore reference(cold.Scheduler, cold.Factory);
    reference.Regenerate(voids, {20000, 0}, VoidMeshMode::Wireframe);
    reference.FinishPendingWork();

    EXPECT_EQ(ToVector(store.GetSourceData()), ToVector(reference.GetSourceData()));
    EXPECT_EQ(ToVector(store.GetRenderData()), ToVector(reference.GetRenderData()));

    auto* host = AsHostBuffer(store.GetBuffer());
    ASSERT_NE(host, nullptr);
    ASSERT_EQ(host->GetUploads().size(), 1u);
    EXPECT_EQ(host->GetUploads()[0].ByteLength, store.GetRenderData().size() * sizeof(float));
    EXPECT_EQ(store.GetRegenerationCount(), 1u);
}

TEST(VoidMeshStore, ZeroShiftUploadsNothing)
{
    SchedulerHarness h;
    VoidMeshStore store(h.Scheduler, h.Factory);
    const auto voids = BlockWithIsland();
    store.Regenerate(voids, {0, 0}, VoidMeshMode::Solid);
    store.FinishPendingWork();

    store.Shift({0, 0});

    auto* host = AsHostBuffer(store.GetBuffer());
    ASSERT_NE(host, nullptr);
    EXPECT_TRUE(host->GetUploads().empty());
}

TEST(VoidMeshStore, NewerRequestCancelsRunningBuild)
{
    SchedulerHarness h;
    VoidMeshStore store(h.Scheduler, h.Factory);

    // Checkerboard: no two squares merge.
    std::vector<BoardCoords> scattered;
    for (int64_t i = 0; i < 10; ++i) scattered.emplace_back(i * 2, 0);
    store.Regenerate(scattered, {0, 0}, VoidMeshMode::Solid);
    h.Tick(3);

    const std::vector<BoardCoords> single = {{7, 7}};
    store.Regenerate(single, {0, 0}, VoidMeshMode::Solid);
    h.TickUntilIdle();

    EXPECT_EQ(store.GetCancelCount(), 1u);
    EXPECT_EQ(store.GetPublishCount(), 1u);
    ASSERT_EQ(store.GetRectangles().size(), 1u);
    EXPECT_EQ(store.GetRectangles()[0], GridRect::FromSquare({7, 7}));
}

TEST(VoidMeshStore, ShiftDuringBuildRestartsAtNewOffset)
{
    SchedulerHarness h;
    VoidMeshStore store(h.Scheduler, h.Factory);

    std::vector<BoardCoords> scattered;
    for (int64_t i = 0; i < 6; ++i) scattered.emplace_back(0, i * 2);
    store.Regenerate(scattered, {0, 0}, VoidMeshMode::Solid);
    h.Tick(2);

    store.Shift({-10000, -10000});
    h.TickUntilIdle();

    EXPECT_EQ(store.GetCancelCount(), 1u);
    EXPECT_EQ(store.GetOffset(), std::optional<BoardCoords>(BoardCoords(10000, 10000)));
    EXPECT_EQ(store.GetRectangles().size(), 6u);
    EXPECT_DOUBLE_EQ(store.GetSourceData()[0], -10000.5);
}

TEST(VoidMeshStore, RenderUsesOffsetRelativePosition)
{
    SchedulerHarness h;
    VoidMeshStore store(h.Scheduler, h.Factory);
    const std::vector<BoardCoords> voids = {{1, 1}};
    store.Regenerate(voids, {10000, 0}, VoidMeshMode::Solid);
    store.FinishPendingWork();

    store.Render(MakeView({10250.0, -3.0}));

    auto* host = AsHostBuffer(store.GetBuffer());
    ASSERT_NE(host, nullptr);
    ASSERT_EQ(host->GetDrawCalls().size(), 1u);
    EXPECT_EQ(host->GetDrawCalls()[0].Position, glm::vec3(-250.0f, 3.0f, 0.0f));
    EXPECT_EQ(host->GetDrawCalls()[0].VertexCount, 6u);
}
