module;

#include <cstdint>
#include <optional>
#include <vector>

export module Graphics:BoardMeshManager;

import :BoardTypes;
import :CoordinateOffset;
import :PieceMeshStore;
import :VoidMeshStore;
import Core;
import RHI;

export namespace Graphics
{
    // -------------------------------------------------------------------------
    // BoardMeshManager - Piece and void meshes of one loaded board
    // -------------------------------------------------------------------------
    // Keeps both meshes on the same offset: whenever the piece mesh publishes
    // the void mesh is rebuilt against its offset, and linear shifts are
    // applied to both. Board-state events are forwarded as patches.
    // -------------------------------------------------------------------------
    class BoardMeshManager
    {
    public:
        struct Config
        {
            PieceMeshStore::Config Pieces{};
            VoidMeshStore::Config Voids{};
            bool WireframeVoids = false;

            // Recentering is skipped while ViewState::Scale is below this,
            // i.e. while a square covers less than a pixel.
            double MinRecenterScale = 0.0;
        };

        BoardMeshManager(Core::Tasks::CooperativeScheduler& scheduler,
                         RHI::IBufferFactory& factory,
                         const ITextureAtlas& atlas);
        BoardMeshManager(const Config& config,
                         Core::Tasks::CooperativeScheduler& scheduler,
                         RHI::IBufferFactory& factory,
                         const ITextureAtlas& atlas);

        BoardMeshManager(const BoardMeshManager&) = delete;
        BoardMeshManager& operator=(const BoardMeshManager&) = delete;

        void Regenerate(const BoardPieces& board, const ViewState& view,
                        std::optional<TintConfig> tint = std::nullopt);

        // Per-frame camera sync: recenters once the focus leaves the band and
        // builds or erases the mirror with the perspective.
        ShiftOutcome UpdateView(const ViewState& view);

        void SetWireframeVoids(bool enabled);

        void Render(const ViewState& view);

        void FinishPendingWork();

        // ---------------------------------------------------------------
        // Board-state events
        // ---------------------------------------------------------------
        Core::Result OnMove(PieceSlot slot, const BoardCoords& to);
        Core::Result OnCapture(PieceSlot slot);

        // The promoted piece lands in `promotedSlot` of its type's bucket.
        // When that bucket has no placeholder left the whole board is rebuilt
        // from `board`, which must already reflect the promotion.
        Core::Result OnPromote(PieceSlot pawnSlot, PieceSlot promotedSlot, PieceTypeId promotedType,
                               const BoardCoords& at, const BoardPieces& board);

        [[nodiscard]] PieceMeshStore& GetPieces() { return m_Pieces; }
        [[nodiscard]] const PieceMeshStore& GetPieces() const { return m_Pieces; }
        [[nodiscard]] VoidMeshStore& GetVoids() { return m_Voids; }
        [[nodiscard]] const VoidMeshStore& GetVoids() const { return m_Voids; }

    private:
        void OnPiecesPublished(const BoardCoords& offset);
        [[nodiscard]] VoidMeshMode GetVoidMode() const;

        double m_MinRecenterScale = 0.0;
        CoordinateOffsetPolicy m_OffsetPolicy;
        PieceMeshStore m_Pieces;
        VoidMeshStore m_Voids;

        std::vector<BoardCoords> m_VoidSquares;
        std::optional<TintConfig> m_Tint;
        ViewState m_View;
        bool m_WireframeVoids = false;
    };
}
