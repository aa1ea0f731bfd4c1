module;

#include <optional>
#include <utility>
#include <vector>

module Graphics:BoardMeshManager.Impl;

import :BoardMeshManager;
import :BoardTypes;
import :CoordinateOffset;
import :PieceMeshStore;
import :VoidMeshStore;
import Core;
import RHI;

namespace Graphics
{
    BoardMeshManager::BoardMeshManager(Core::Tasks::CooperativeScheduler& scheduler,
                                       RHI::IBufferFactory& factory,
                                       const ITextureAtlas& atlas)
        : BoardMeshManager(Config{}, scheduler, factory, atlas)
    {
    }

    BoardMeshManager::BoardMeshManager(const Config& config,
                                       Core::Tasks::CooperativeScheduler& scheduler,
                                       RHI::IBufferFactory& factory,
                                       const ITextureAtlas& atlas)
        : m_MinRecenterScale(config.MinRecenterScale),
          m_OffsetPolicy(config.Pieces.Offset),
          m_Pieces(config.Pieces, scheduler, factory, atlas),
          m_Voids(config.Voids, scheduler, factory),
          m_WireframeVoids(config.WireframeVoids)
    {
        m_Pieces.SetOnPublished([this](const BoardCoords& offset) { OnPiecesPublished(offset); });
    }

    void BoardMeshManager::Regenerate(const BoardPieces& board, const ViewState& view, std::optional<TintConfig> tint)
    {
        m_VoidSquares = board.Voids;
        m_Tint = tint;
        m_View = view;

        m_Pieces.SetMirrorEnabled(view.ReversedPerspective);
        m_Pieces.Regenerate(board, view, std::move(tint));
    }

    void BoardMeshManager::OnPiecesPublished(const BoardCoords& offset)
    {
        m_Voids.Regenerate(m_VoidSquares, offset, GetVoidMode());
    }

    ShiftOutcome BoardMeshManager::UpdateView(const ViewState& view)
    {
        m_View = view;
        m_Pieces.SetMirrorEnabled(view.ReversedPerspective);

        if (view.Scale < m_MinRecenterScale) return ShiftOutcome::Unchanged;

        // An in-flight build picks its offset from the focus it was given;
        // the band is checked again once it publishes.
        if (m_Pieces.GetState() != RegenerationState::Idle) return ShiftOutcome::Unchanged;

        const auto offset = m_Pieces.GetOffset();
        if (!offset) return ShiftOutcome::Unchanged;

        if (m_OffsetPolicy.Evaluate(*offset, view.Focus).Action == RecenterAction::Keep)
        {
            return ShiftOutcome::Unchanged;
        }

        const ShiftResult result = m_Pieces.Shift(view.Focus);
        if (result.Outcome == ShiftOutcome::Shifted)
        {
            m_Voids.Shift(result.Delta);
        }
        // Regenerated: the voids follow when the new piece mesh publishes.
        return result.Outcome;
    }

    void BoardMeshManager::SetWireframeVoids(bool enabled)
    {
        if (enabled == m_WireframeVoids) return;
        m_WireframeVoids = enabled;

        if (const auto offset = m_Pieces.GetOffset(); offset && m_Pieces.GetState() == RegenerationState::Idle)
        {
            m_Voids.Regenerate(m_VoidSquares, *offset, GetVoidMode());
        }
    }

    void BoardMeshManager::Render(const ViewState& view)
    {
        m_Voids.Render(view);
        m_Pieces.Render(view);
    }

    void BoardMeshManager::FinishPendingWork()
    {
        m_Pieces.FinishPendingWork();
        m_Voids.FinishPendingWork();
    }

    Core::Result BoardMeshManager::OnMove(PieceSlot slot, const BoardCoords& to)
    {
        return m_Pieces.Move(slot, to);
    }

    Core::Result BoardMeshManager::OnCapture(PieceSlot slot)
    {
        return m_Pieces.Delete(slot);
    }

    Core::Result BoardMeshManager::OnPromote(PieceSlot pawnSlot, PieceSlot promotedSlot, PieceTypeId promotedType,
                                             const BoardCoords& at, const BoardPieces& board)
    {
        // The pawn stays until the promoted piece is placed.
        auto placed = m_Pieces.Overwrite(promotedSlot, promotedType, at, m_Tint);
        if (!placed)
        {
            if (placed.error() != Core::ErrorCode::ResourceExhausted) return placed;

            Core::Log::Info("Promotion to type {} does not fit the piece mesh; regenerating.", promotedType);
            Regenerate(board, m_View, m_Tint);
            return Core::Ok();
        }

        return m_Pieces.Delete(pawnSlot);
    }

    VoidMeshMode BoardMeshManager::GetVoidMode() const
    {
        return m_WireframeVoids ? VoidMeshMode::Wireframe : VoidMeshMode::Solid;
    }
}
