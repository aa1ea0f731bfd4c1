module;

#include <chrono>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <vector>

export module Core:Tasks;

import :FrameBudget;

export namespace Core::Tasks
{
    enum class JobStatus : uint8_t
    {
        Running,
        Completed,
        Cancelled
    };

    struct JobProgress
    {
        uint64_t ItemsDone = 0;
        uint64_t TotalItems = 0;

        [[nodiscard]] double Fraction() const
        {
            if (TotalItems == 0) return 1.0;
            return static_cast<double>(ItemsDone) / static_cast<double>(TotalItems);
        }
    };

    // Generational reference to a job. Stale handles (job finished and its
    // slot reused) resolve to nothing.
    struct JobHandle
    {
        static constexpr uint32_t INVALID_INDEX = std::numeric_limits<uint32_t>::max();

        uint32_t Index = INVALID_INDEX;
        uint32_t Generation = 0;

        [[nodiscard]] constexpr bool IsValid() const noexcept { return Index != INVALID_INDEX; }
        [[nodiscard]] constexpr explicit operator bool() const noexcept { return IsValid(); }

        auto operator<=>(const JobHandle&) const = default;
    };

    struct ChunkedJobDesc
    {
        std::string Name;
        uint64_t TotalItems = 0;

        // Called once per unit of work, with indices 0..TotalItems-1 in order.
        std::function<void(uint64_t)> PerItem;

        // Polled at the start of every slice, i.e. after each yield.
        std::function<bool()> IsCancelled;

        // Called whenever the job yields back to the host loop.
        std::function<void(const JobProgress&)> OnYield;

        // Called exactly once with Completed or Cancelled. May submit new jobs.
        std::function<void(JobStatus)> OnFinished;
    };

    // -------------------------------------------------------------------------
    // CooperativeScheduler - Time-boxed chunking on the main thread
    // -------------------------------------------------------------------------
    // Long loops (mesh regeneration) are split into slices. Tick() runs once
    // per host frame and advances every job until the frame budget deadline,
    // then returns: that is the yield. Work resumes on the next Tick().
    //
    // Contract:
    // - Single logical thread. Nothing here is thread-safe.
    // - A job processes at least one item per slice, so it always finishes.
    // - Reading the clock every item is wasteful; it is read every
    //   ItemsPerClockCheck items.
    // -------------------------------------------------------------------------
    class CooperativeScheduler
    {
    public:
        using Clock = std::function<std::chrono::nanoseconds()>;

        struct Config
        {
            uint32_t ItemsPerClockCheck = 1000;
        };

        explicit CooperativeScheduler(FrameBudget& budget);
        CooperativeScheduler(const Config& config, FrameBudget& budget, Clock clock = {});

        CooperativeScheduler(const CooperativeScheduler&) = delete;
        CooperativeScheduler& operator=(const CooperativeScheduler&) = delete;

        [[nodiscard]] JobHandle RunChunked(ChunkedJobDesc desc);

        // Advance all jobs within this frame's long-task budget.
        void Tick();

        // Finish one job right now without yielding.
        void RunToCompletion(JobHandle handle);

        // Drop a job without invoking any of its callbacks.
        void Discard(JobHandle handle);

        [[nodiscard]] bool IsAlive(JobHandle handle) const;
        [[nodiscard]] std::optional<JobProgress> GetProgress(JobHandle handle) const;
        [[nodiscard]] bool HasPendingWork() const { return m_ActiveJobs > 0; }
        [[nodiscard]] uint32_t GetActiveJobCount() const { return m_ActiveJobs; }
        [[nodiscard]] uint64_t GetYieldCount() const { return m_YieldCount; }

        [[nodiscard]] static std::chrono::nanoseconds SteadyNow();

    private:
        struct JobSlot
        {
            ChunkedJobDesc Desc;
            JobProgress Progress;
            uint32_t Generation = 0;
            bool Active = false;
        };

        // Runs one slice of the job in slot `index` until `deadline`.
        JobStatus Step(uint32_t index, std::chrono::nanoseconds deadline);
        void Finish(uint32_t index, JobStatus status);
        [[nodiscard]] const JobSlot* Resolve(JobHandle handle) const;

        Config m_Config;
        FrameBudget& m_Budget;
        Clock m_Clock;

        std::vector<JobSlot> m_Jobs;
        std::vector<uint32_t> m_FreeSlots;
        uint32_t m_ActiveJobs = 0;
        uint64_t m_YieldCount = 0;
    };
}
