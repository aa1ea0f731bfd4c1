module;

#include <cstdint>
#include <optional>
#include <vector>

#include <glm/glm.hpp>

export module Graphics:BoardTypes;

import Geometry;

// =============================================================================
// Data exchanged with the board-state, texture-atlas and camera collaborators.
// The mesh stores never own game state; they mirror it into vertex arrays.
// =============================================================================

export namespace Graphics
{
    using Geometry::BoardCoords;

    using PieceTypeId = uint32_t;

    // Per-type ordered collection of pieces. Slot indices are stable; an
    // empty slot is a hole left by a capture or an unused placeholder.
    struct PieceBucket
    {
        PieceTypeId Type = 0;
        uint32_t Player = 0;

        // Types that can appear mid-game (promotions) get trailing placeholders.
        bool ReservesPlaceholders = true;

        std::vector<std::optional<BoardCoords>> Slots;

        [[nodiscard]] uint32_t CountHoles() const
        {
            uint32_t holes = 0;
            for (const auto& slot : Slots)
            {
                if (!slot) ++holes;
            }
            return holes;
        }
    };

    struct BoardPieces
    {
        std::vector<PieceBucket> Buckets;
        std::vector<BoardCoords> Voids;
    };

    // Address of one slot: bucket index within BoardPieces::Buckets, slot
    // index within that bucket.
    struct PieceSlot
    {
        uint32_t Bucket = 0;
        uint32_t Slot = 0;

        constexpr bool operator==(const PieceSlot&) const = default;
    };

    // Texture-space rectangle of one sprite in the atlas.
    struct TexRect
    {
        double Left = 0.0;
        double Bottom = 0.0;
        double Right = 0.0;
        double Top = 0.0;

        // Same sprite rotated 180 degrees.
        [[nodiscard]] constexpr TexRect Inverted() const
        {
            return {Right, Top, Left, Bottom};
        }

        constexpr bool operator==(const TexRect&) const = default;
    };

    class ITextureAtlas
    {
    public:
        virtual ~ITextureAtlas() = default;
        [[nodiscard]] virtual TexRect GetTexRect(PieceTypeId type) const = 0;
    };

    // Custom per-player piece tint (themes). Missing players render untinted.
    struct TintConfig
    {
        std::vector<glm::vec4> PlayerColors;

        [[nodiscard]] glm::vec4 GetColor(uint32_t player) const
        {
            if (player < PlayerColors.size()) return PlayerColors[player];
            return glm::vec4(1.0f);
        }
    };

    // Snapshot of the camera collaborator.
    struct ViewState
    {
        glm::dvec2 Focus{0.0};
        double Scale = 1.0;

        // Viewing the board from the opposite side; rendered with the mirror.
        bool ReversedPerspective = false;

        // Sprites encoded upside down (playing the second side).
        bool InvertTextures = false;
    };
}
