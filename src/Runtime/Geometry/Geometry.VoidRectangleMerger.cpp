module;

#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <unordered_set>
#include <vector>

#include <glm/glm.hpp>
#include <glm/gtc/type_precision.hpp>
#define GLM_ENABLE_EXPERIMENTAL
#include <glm/gtx/hash.hpp>

module Geometry:VoidRectangleMerger.Impl;

import :GridRect;
import :VoidRectangleMerger;

namespace Geometry::VoidRectangleMerger
{
    namespace
    {
        using SquareSet = std::unordered_set<BoardCoords>;

        constexpr int64_t kMinCoord = std::numeric_limits<int64_t>::min();
        constexpr int64_t kMaxCoord = std::numeric_limits<int64_t>::max();

        // Claims the `count` squares first, first+step, ... if every one of them
        // is a void that has not been merged yet. All or nothing.
        bool TryClaimLine(const SquareSet& voids, SquareSet& merged,
                          BoardCoords first, BoardCoords step, int64_t count,
                          std::vector<BoardCoords>& scratch)
        {
            scratch.clear();
            BoardCoords square = first;
            for (int64_t i = 0; i < count; ++i)
            {
                if (!voids.contains(square) || merged.contains(square)) return false;
                scratch.push_back(square);
                if (i + 1 < count) square += step;
            }

            merged.insert(scratch.begin(), scratch.end());
            return true;
        }

        GridRect GrowFrom(const BoardCoords& seed, const SquareSet& voids, SquareSet& merged,
                          std::vector<BoardCoords>& scratch)
        {
            GridRect rect = GridRect::FromSquare(seed);

            bool grew = true;
            while (grew)
            {
                // Left column
                if (rect.Left > kMinCoord &&
                    TryClaimLine(voids, merged, {rect.Left - 1, rect.Bottom}, {0, 1}, rect.GetHeight(), scratch))
                {
                    --rect.Left;
                    continue;
                }
                // Right column
                if (rect.Right < kMaxCoord &&
                    TryClaimLine(voids, merged, {rect.Right + 1, rect.Bottom}, {0, 1}, rect.GetHeight(), scratch))
                {
                    ++rect.Right;
                    continue;
                }
                // Bottom row
                if (rect.Bottom > kMinCoord &&
                    TryClaimLine(voids, merged, {rect.Left, rect.Bottom - 1}, {1, 0}, rect.GetWidth(), scratch))
                {
                    --rect.Bottom;
                    continue;
                }
                // Top row
                if (rect.Top < kMaxCoord &&
                    TryClaimLine(voids, merged, {rect.Left, rect.Top + 1}, {1, 0}, rect.GetWidth(), scratch))
                {
                    ++rect.Top;
                    continue;
                }

                grew = false;
            }

            return rect;
        }
    }

    std::vector<GridRect> Merge(std::span<const BoardCoords> squares)
    {
        MergeStats stats;
        return Merge(squares, stats);
    }

    std::vector<GridRect> Merge(std::span<const BoardCoords> squares, MergeStats& outStats)
    {
        outStats = {};
        outStats.InputSquares = squares.size();

        SquareSet voids;
        voids.reserve(squares.size());
        voids.insert(squares.begin(), squares.end());
        outStats.UniqueSquares = voids.size();

        std::vector<GridRect> rectangles;
        if (voids.empty()) return rectangles;

        SquareSet merged;
        merged.reserve(voids.size());
        std::vector<BoardCoords> scratch;

        for (const BoardCoords& square : squares)
        {
            if (merged.contains(square)) continue;
            merged.insert(square);

            rectangles.push_back(GrowFrom(square, voids, merged, scratch));
        }

        outStats.Rectangles = rectangles.size();
        return rectangles;
    }

    std::size_t CoveredSquareCount(std::span<const GridRect> rects)
    {
        std::size_t total = 0;
        for (const GridRect& rect : rects)
        {
            total += static_cast<std::size_t>(rect.GetArea());
        }
        return total;
    }
}
