module;

#include <cstdint>
#include <glm/glm.hpp>
#include <glm/gtc/type_precision.hpp>

export module Geometry:GridRect;

export namespace Geometry
{
    // Integer square coordinates on an unbounded board.
    using BoardCoords = glm::i64vec2;

    // Inclusive rectangle of board squares: {Left..Right} x {Bottom..Top}.
    struct GridRect
    {
        int64_t Left = 0;
        int64_t Right = 0;
        int64_t Bottom = 0;
        int64_t Top = 0;

        [[nodiscard]] static constexpr GridRect FromSquare(const BoardCoords& square)
        {
            return {square.x, square.x, square.y, square.y};
        }

        [[nodiscard]] constexpr int64_t GetWidth() const { return Right - Left + 1; }
        [[nodiscard]] constexpr int64_t GetHeight() const { return Top - Bottom + 1; }
        [[nodiscard]] constexpr int64_t GetArea() const { return GetWidth() * GetHeight(); }

        [[nodiscard]] constexpr bool Contains(const BoardCoords& square) const
        {
            return square.x >= Left && square.x <= Right && square.y >= Bottom && square.y <= Top;
        }

        [[nodiscard]] constexpr bool Overlaps(const GridRect& other) const
        {
            return Left <= other.Right && other.Left <= Right && Bottom <= other.Top && other.Bottom <= Top;
        }

        constexpr bool operator==(const GridRect&) const = default;
    };
}
