#include <glm/glm.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

import Core;
import Geometry;
import RHI;
import Graphics;

using namespace Core;

namespace
{
    // Two rows of 6 sprites: white pieces on top, black below.
    class SpriteSheetAtlas final : public Graphics::ITextureAtlas
    {
    public:
        [[nodiscard]] Graphics::TexRect GetTexRect(Graphics::PieceTypeId type) const override
        {
            const double column = static_cast<double>(type % 6);
            const double row = static_cast<double>(type / 6);
            return {column / 6.0, 1.0 - (row + 1.0) / 2.0, (column + 1.0) / 6.0, 1.0 - row / 2.0};
        }
    };

    enum PieceType : Graphics::PieceTypeId
    {
        King, Queen, Bishop, Knight, Rook, Pawn
    };

    // `boards` standard boards side by side with one empty file between them.
    Graphics::BoardPieces MakeTiledBoard(int64_t boards)
    {
        const PieceType backRank[8] = {Rook, Knight, Bishop, Queen, King, Bishop, Knight, Rook};

        Graphics::BoardPieces board;
        for (uint32_t player = 0; player < 2; ++player)
        {
            const int64_t pawnRank = player == 0 ? 1 : 6;
            const int64_t backRankY = player == 0 ? 0 : 7;

            for (Graphics::PieceTypeId type = King; type <= Pawn; ++type)
            {
                Graphics::PieceBucket bucket;
                bucket.Type = type + player * 6;
                bucket.Player = player;
                bucket.ReservesPlaceholders = type != King && type != Pawn;

                for (int64_t b = 0; b < boards; ++b)
                {
                    const int64_t x0 = b * 9;
                    for (int64_t file = 0; file < 8; ++file)
                    {
                        if (type == Pawn) bucket.Slots.emplace_back(Geometry::BoardCoords{x0 + file, pawnRank});
                        else if (backRank[file] == type) bucket.Slots.emplace_back(Geometry::BoardCoords{x0 + file, backRankY});
                    }
                }
                board.Buckets.push_back(std::move(bucket));
            }
        }

        // The separating files are removed squares.
        for (int64_t b = 1; b < boards; ++b)
        {
            for (int64_t y = 0; y < 8; ++y) board.Voids.emplace_back(b * 9 - 1, y);
        }
        return board;
    }
}

class SandboxApp
{
public:
    SandboxApp()
        : m_Scheduler(m_Budget),
          m_Meshes(MakeConfig(), m_Scheduler, m_Buffers, m_Atlas)
    {
    }

    void OnStart()
    {
        Log::Info("Sandbox Started!");

        m_Board = MakeTiledBoard(250);
        Log::Info("Board: {} buckets, {} void squares.", m_Board.Buckets.size(), m_Board.Voids.size());

        m_Meshes.Regenerate(m_Board, m_View);
    }

    void OnUpdate(uint64_t frame)
    {
        switch (frame)
        {
            case 30:
                // White e-pawn of the first board: e2-e4.
                m_Board.Buckets[PawnBucket(0)].Slots[4] = Geometry::BoardCoords{4, 3};
                Check(m_Meshes.OnMove({PawnBucket(0), 4}, {4, 3}), "move");
                break;
            case 45:
                // Black d-pawn captured on the second board.
                m_Board.Buckets[PawnBucket(1)].Slots[8 + 3].reset();
                Check(m_Meshes.OnCapture({PawnBucket(1), 8 + 3}), "capture");
                break;
            case 60:
                m_View.Focus = {12000.0, 3.0};
                break;
            case 90:
                m_View.ReversedPerspective = true;
                break;
            case 120:
                m_Meshes.SetWireframeVoids(true);
                break;
            case 150:
                // Far enough for the float mantissa to run out: rebuilt instead of shifted.
                m_View.Focus = {1.0e16, 0.0};
                break;
            default:
                break;
        }

        if (frame >= 180 && frame < 190) Promote(static_cast<uint32_t>(frame - 180));

        const Graphics::ShiftOutcome outcome = m_Meshes.UpdateView(m_View);
        if (outcome != Graphics::ShiftOutcome::Unchanged)
        {
            Log::Info("Frame {}: view recentered ({}).", frame,
                      outcome == Graphics::ShiftOutcome::Shifted ? "shifted" : "regenerating");
        }

        m_Meshes.Render(m_View);
    }

    void Run(uint64_t frames)
    {
        OnStart();

        using Ms = FrameBudget::Milliseconds;
        const auto start = std::chrono::steady_clock::now();
        const auto now = [&start]() { return Ms(std::chrono::steady_clock::now() - start); };

        for (uint64_t frame = 0; frame < frames; ++frame)
        {
            m_Budget.BeginFrame(now());
            OnUpdate(frame);
            m_Budget.EndFrame(now());

            m_Scheduler.Tick();
        }

        m_Meshes.FinishPendingWork();
        OnShutdown();
    }

    void OnShutdown()
    {
        const Graphics::PieceMeshStore& pieces = m_Meshes.GetPieces();
        const Graphics::VoidMeshStore& voids = m_Meshes.GetVoids();
        const auto offset = pieces.GetOffset().value_or(Geometry::BoardCoords{0});

        Log::Info("Pieces: {} quads at offset ({}, {}); {} builds, {} published, {} cancelled.",
                  pieces.GetQuadCount(), offset.x, offset.y, pieces.GetRegenerationCount(),
                  pieces.GetPublishCount(), pieces.GetCancelCount());
        Log::Info("Voids: {} rectangles; {} builds, {} published, {} cancelled.",
                  voids.GetRectangles().size(), voids.GetRegenerationCount(), voids.GetPublishCount(),
                  voids.GetCancelCount());
        Log::Info("Scheduler yielded {} times; {} buffers created; {:.1f} fps.",
                  m_Scheduler.GetYieldCount(), m_Buffers.GetCreateCount(), m_Budget.GetFps());
    }

private:
    static Graphics::BoardMeshManager::Config MakeConfig()
    {
        Graphics::BoardMeshManager::Config config;
        config.Pieces.Texture = RHI::TextureHandle{1};
        return config;
    }

    static uint32_t PawnBucket(uint32_t player) { return player * 6 + Pawn; }
    static uint32_t QueenBucket(uint32_t player) { return player * 6 + Queen; }

    // Promotes white pawns of consecutive boards to queens. The first few
    // land in placeholders, the rest force a rebuild.
    void Promote(uint32_t index)
    {
        const uint32_t pawnSlot = index * 8;
        auto& pawns = m_Board.Buckets[PawnBucket(0)].Slots;
        if (pawnSlot >= pawns.size() || !pawns[pawnSlot]) return;

        const Geometry::BoardCoords at{(*pawns[pawnSlot]).x, 7};
        pawns[pawnSlot].reset();

        auto& queens = m_Board.Buckets[QueenBucket(0)].Slots;
        const auto queenSlot = static_cast<uint32_t>(queens.size());
        queens.emplace_back(at);

        Check(m_Meshes.OnPromote({PawnBucket(0), pawnSlot}, {QueenBucket(0), queenSlot}, Queen, at, m_Board),
              "promotion");
    }

    static void Check(const Result& result, const char* what)
    {
        if (!result) Log::Error("Sandbox {} failed: {}", what, ErrorCodeToString(result.error()));
    }

    FrameBudget m_Budget;
    Tasks::CooperativeScheduler m_Scheduler;
    RHI::HostBufferFactory m_Buffers;
    SpriteSheetAtlas m_Atlas;
    Graphics::BoardMeshManager m_Meshes;

    Graphics::BoardPieces m_Board;
    Graphics::ViewState m_View;
};

int main()
{
    SandboxApp app;
    app.Run(240);
    return 0;
}
