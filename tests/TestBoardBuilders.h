#pragma once

// =============================================================================
// Shared board builders and a headless scheduler harness for mesh tests.
//
// Usage: #include "TestBoardBuilders.h" AFTER `import Core; import RHI;
// import Graphics;` in each test file. Everything is inline to avoid ODR
// issues across translation units.
// =============================================================================

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <vector>

#include <glm/glm.hpp>

// Sprite of type t covers u in [t/16, (t+1)/16], v in [1/2, 3/4]. All values
// are exact in float so narrowed data can be compared with ==.
class FakeAtlas final : public Graphics::ITextureAtlas
{
public:
    [[nodiscard]] Graphics::TexRect GetTexRect(Graphics::PieceTypeId type) const override
    {
        const double left = static_cast<double>(type) * 0.0625;
        return {left, 0.5, left + 0.0625, 0.75};
    }
};

using SlotList = std::initializer_list<std::optional<Geometry::BoardCoords>>;

inline Graphics::PieceBucket MakeBucket(Graphics::PieceTypeId type, uint32_t player, SlotList slots,
                                        bool reservesPlaceholders = true)
{
    Graphics::PieceBucket bucket;
    bucket.Type = type;
    bucket.Player = player;
    bucket.ReservesPlaceholders = reservesPlaceholders;
    bucket.Slots.assign(slots.begin(), slots.end());
    return bucket;
}

// Bucket 0: pawns (type 1, player 0) at (0,1) (1,1) (2,1)
// Bucket 1: king  (type 2, player 0) at (4,0), no placeholders
// Bucket 2: queens (type 3, player 1), empty, placeholders only
inline Graphics::BoardPieces MakeSmallBoard()
{
    Graphics::BoardPieces board;
    board.Buckets.push_back(MakeBucket(1, 0, {Geometry::BoardCoords{0, 1}, Geometry::BoardCoords{1, 1},
                                              Geometry::BoardCoords{2, 1}}));
    board.Buckets.push_back(MakeBucket(2, 0, {Geometry::BoardCoords{4, 0}}, false));
    board.Buckets.push_back(MakeBucket(3, 1, {}));
    return board;
}

// One bucket of `count` pieces along a row starting at `origin`.
inline Graphics::BoardPieces MakeRowBoard(uint32_t count, Geometry::BoardCoords origin = {0, 0},
                                          Graphics::PieceTypeId type = 1)
{
    Graphics::BoardPieces board;
    Graphics::PieceBucket bucket;
    bucket.Type = type;
    for (uint32_t i = 0; i < count; ++i)
    {
        bucket.Slots.emplace_back(Geometry::BoardCoords{origin.x + i, origin.y});
    }
    board.Buckets.push_back(std::move(bucket));
    return board;
}

inline Graphics::ViewState MakeView(glm::dvec2 focus = glm::dvec2(0.0), bool reversed = false)
{
    Graphics::ViewState view;
    view.Focus = focus;
    view.ReversedPerspective = reversed;
    return view;
}

// Scheduler with a frozen clock and a zero budget: every Tick() advances each
// job by exactly one item, which makes yields fully deterministic.
struct SchedulerHarness
{
    Core::FrameBudget Budget;
    std::chrono::nanoseconds Now{0};
    Core::Tasks::CooperativeScheduler Scheduler;
    RHI::HostBufferFactory Factory;
    FakeAtlas Atlas;

    SchedulerHarness()
        : Scheduler(Core::Tasks::CooperativeScheduler::Config{1}, Budget, [this]() { return Now; })
    {
        Budget.SetFixedLongTaskTime(std::chrono::nanoseconds{0});
    }

    SchedulerHarness(const SchedulerHarness&) = delete;
    SchedulerHarness& operator=(const SchedulerHarness&) = delete;

    // Returns the number of ticks it took.
    uint32_t TickUntilIdle(uint32_t maxTicks = 100'000)
    {
        uint32_t ticks = 0;
        while (Scheduler.HasPendingWork() && ticks < maxTicks)
        {
            Scheduler.Tick();
            ++ticks;
        }
        return ticks;
    }

    void Tick(uint32_t count)
    {
        for (uint32_t i = 0; i < count; ++i) Scheduler.Tick();
    }
};

inline RHI::HostBuffer* AsHostBuffer(RHI::IVertexBuffer* buffer)
{
    return dynamic_cast<RHI::HostBuffer*>(buffer);
}
