#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <set>
#include <utility>
#include <vector>

import Geometry;

using Geometry::BoardCoords;
using Geometry::GridRect;
namespace Merger = Geometry::VoidRectangleMerger;

namespace
{
    // Expands rectangles back to squares; fails if any square is covered twice.
    std::set<std::pair<int64_t, int64_t>> Expand(const std::vector<GridRect>& rects)
    {
        std::set<std::pair<int64_t, int64_t>> squares;
        for (const GridRect& r : rects)
        {
            for (int64_t x = r.Left; x <= r.Right; ++x)
            {
                for (int64_t y = r.Bottom; y <= r.Top; ++y)
                {
                    const bool inserted = squares.insert({x, y}).second;
                    EXPECT_TRUE(inserted) << "square (" << x << ", " << y << ") covered twice";
                }
            }
        }
        return squares;
    }

    std::set<std::pair<int64_t, int64_t>> AsSet(const std::vector<BoardCoords>& squares)
    {
        std::set<std::pair<int64_t, int64_t>> set;
        for (const auto& s : squares) set.insert({s.x, s.y});
        return set;
    }
}

TEST(VoidRectangleMerger, EmptyInput)
{
    EXPECT_TRUE(Merger::Merge(std::vector<BoardCoords>{}).empty());
}

TEST(VoidRectangleMerger, SingleSquare)
{
    const std::vector<BoardCoords> squares = {{5, -3}};
    const auto rects = Merger::Merge(squares);

    ASSERT_EQ(rects.size(), 1u);
    EXPECT_EQ(rects[0], (GridRect{5, 5, -3, -3}));
}

TEST(VoidRectangleMerger, TwoByTwoBlockBecomesOneRectangle)
{
    const std::vector<BoardCoords> squares = {{0, 0}, {1, 0}, {0, 1}, {1, 1}};
    const auto rects = Merger::Merge(squares);

    ASSERT_EQ(rects.size(), 1u);
    EXPECT_EQ(rects[0], (GridRect{0, 1, 0, 1}));
}

TEST(VoidRectangleMerger, SeparatedSquaresStaySeparate)
{
    const std::vector<BoardCoords> squares = {{0, 0}, {2, 0}};
    const auto rects = Merger::Merge(squares);

    ASSERT_EQ(rects.size(), 2u);
    EXPECT_EQ(rects[0], (GridRect{0, 0, 0, 0}));
    EXPECT_EQ(rects[1], (GridRect{2, 2, 0, 0}));
}

TEST(VoidRectangleMerger, GrowsLeftBeforeRight)
{
    // Seed (1,0) claims (0,0) on the left first, then (2,0) on the right.
    const std::vector<BoardCoords> squares = {{1, 0}, {0, 0}, {2, 0}};
    const auto rects = Merger::Merge(squares);

    ASSERT_EQ(rects.size(), 1u);
    EXPECT_EQ(rects[0], (GridRect{0, 2, 0, 0}));
}

TEST(VoidRectangleMerger, LShapeSplitsGreedily)
{
    // X . .
    // X X X   (row y=0), seed (0,0)
    const std::vector<BoardCoords> squares = {{0, 0}, {1, 0}, {2, 0}, {0, 1}};
    const auto rects = Merger::Merge(squares);

    ASSERT_EQ(rects.size(), 2u);
    EXPECT_EQ(rects[0], (GridRect{0, 2, 0, 0}));
    EXPECT_EQ(rects[1], (GridRect{0, 0, 1, 1}));
}

TEST(VoidRectangleMerger, DuplicatesAreIgnored)
{
    const std::vector<BoardCoords> squares = {{3, 3}, {3, 3}, {4, 3}};
    Merger::MergeStats stats;
    const auto rects = Merger::Merge(squares, stats);

    ASSERT_EQ(rects.size(), 1u);
    EXPECT_EQ(stats.InputSquares, 3u);
    EXPECT_EQ(stats.UniqueSquares, 2u);
    EXPECT_EQ(stats.Rectangles, 1u);
    EXPECT_EQ(Merger::CoveredSquareCount(rects), 2u);
}

TEST(VoidRectangleMerger, PartitionOfIrregularShape)
{
    std::vector<BoardCoords> squares;
    for (int64_t x = -6; x <= 6; ++x)
    {
        for (int64_t y = -4; y <= 5; ++y)
        {
            // Ring with a notch and a few isolated holes.
            const bool ring = (x * x + y * y) >= 9 && (x * x + y * y) <= 30;
            const bool notch = x == 0 && y > 0;
            if (ring && !notch) squares.push_back({x, y});
        }
    }
    squares.push_back({100, 100});
    squares.push_back({-100, 7});

    const auto rects = Merger::Merge(squares);

    EXPECT_EQ(Expand(rects), AsSet(squares));
    EXPECT_EQ(Merger::CoveredSquareCount(rects), squares.size());
    EXPECT_LT(rects.size(), squares.size());
}

TEST(VoidRectangleMerger, FilledBoardIsOneRectangle)
{
    std::vector<BoardCoords> squares;
    for (int64_t y = 0; y < 8; ++y)
    {
        for (int64_t x = 0; x < 8; ++x) squares.push_back({x, y});
    }

    const auto rects = Merger::Merge(squares);
    ASSERT_EQ(rects.size(), 1u);
    EXPECT_EQ(rects[0], (GridRect{0, 7, 0, 7}));
}

TEST(VoidRectangleMerger, Deterministic)
{
    const std::vector<BoardCoords> squares = {{0, 0}, {1, 1}, {1, 0}, {5, 5}, {0, 1}, {2, 1}, {6, 5}};
    EXPECT_EQ(Merger::Merge(squares), Merger::Merge(squares));
}

TEST(VoidRectangleMerger, FarAwaySquares)
{
    const int64_t far = int64_t{1} << 60;
    const std::vector<BoardCoords> squares = {{far, -far}, {far + 1, -far}};
    const auto rects = Merger::Merge(squares);

    ASSERT_EQ(rects.size(), 1u);
    EXPECT_EQ(rects[0], (GridRect{far, far + 1, -far, -far}));
}

TEST(VoidRectangleMerger, StopsGrowingAtCoordinateLimits)
{
    constexpr int64_t kMin = std::numeric_limits<int64_t>::min();
    constexpr int64_t kMax = std::numeric_limits<int64_t>::max();

    const std::vector<BoardCoords> squares = {{kMin, 0}, {kMin + 1, 0}, {kMax, kMax - 1}, {kMax, kMax}};
    const auto rects = Merger::Merge(squares);

    ASSERT_EQ(rects.size(), 2u);
    EXPECT_EQ(rects[0], (GridRect{kMin, kMin + 1, 0, 0}));
    EXPECT_EQ(rects[1], (GridRect{kMax, kMax, kMax - 1, kMax}));
}
