module;

#include <cstddef>
#include <span>
#include <vector>

export module Geometry:VoidRectangleMerger;

import :GridRect;

export namespace Geometry::VoidRectangleMerger
{
    // =========================================================================
    // Void Rectangle Merging
    // =========================================================================
    //
    // Covers a set of board squares with disjoint axis-aligned rectangles
    // whose union is exactly that set. Used to shrink the void mesh from one
    // quad per removed square to one quad per rectangle.
    //
    // Greedy: squares are visited in input order. Each unmerged square seeds
    // a 1x1 rectangle which grows by one full column or row at a time, trying
    // left, right, bottom, top in that order and restarting from left after
    // every successful growth. A column/row is accepted only if every square
    // in it is in the set and not yet merged.
    //
    // Not a minimum cover (that problem is NP-hard), but deterministic: the
    // same input sequence always produces the same rectangles in the same
    // order. Duplicate squares in the input are ignored.

    struct MergeStats
    {
        std::size_t InputSquares{0};
        std::size_t UniqueSquares{0};
        std::size_t Rectangles{0};
    };

    [[nodiscard]] std::vector<GridRect> Merge(std::span<const BoardCoords> squares);
    [[nodiscard]] std::vector<GridRect> Merge(std::span<const BoardCoords> squares, MergeStats& outStats);

    // Number of squares covered by `rects` (sum of areas).
    [[nodiscard]] std::size_t CoveredSquareCount(std::span<const GridRect> rects);
}
