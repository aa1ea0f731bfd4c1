module;
#include <cassert>
#include <chrono>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

module Core:Tasks.Impl;
import :Tasks;
import :Logging;

namespace Core::Tasks
{
    CooperativeScheduler::CooperativeScheduler(FrameBudget& budget)
        : CooperativeScheduler(Config{}, budget)
    {
    }

    CooperativeScheduler::CooperativeScheduler(const Config& config, FrameBudget& budget, Clock clock)
        : m_Config(config),
          m_Budget(budget),
          m_Clock(clock ? std::move(clock) : Clock(&CooperativeScheduler::SteadyNow))
    {
        if (m_Config.ItemsPerClockCheck == 0) m_Config.ItemsPerClockCheck = 1;
    }

    std::chrono::nanoseconds CooperativeScheduler::SteadyNow()
    {
        return std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now().time_since_epoch());
    }

    JobHandle CooperativeScheduler::RunChunked(ChunkedJobDesc desc)
    {
        assert((desc.PerItem || desc.TotalItems == 0) && "Chunked job without a work function");

        uint32_t index;
        if (!m_FreeSlots.empty())
        {
            index = m_FreeSlots.back();
            m_FreeSlots.pop_back();
        }
        else
        {
            index = static_cast<uint32_t>(m_Jobs.size());
            m_Jobs.emplace_back();
        }

        JobSlot& slot = m_Jobs[index];
        slot.Desc = std::move(desc);
        slot.Progress = JobProgress{0, slot.Desc.TotalItems};
        slot.Active = true;
        ++m_ActiveJobs;

        Log::Debug("Scheduled job '{}' ({} items).", slot.Desc.Name, slot.Desc.TotalItems);
        return JobHandle{index, slot.Generation};
    }

    void CooperativeScheduler::Tick()
    {
        if (m_ActiveJobs == 0) return;

        const std::chrono::nanoseconds deadline = m_Clock() + m_Budget.GetLongTaskTime();

        // Jobs submitted from callbacks during this tick start on the next one.
        const auto count = static_cast<uint32_t>(m_Jobs.size());
        for (uint32_t i = 0; i < count; ++i)
        {
            if (!m_Jobs[i].Active) continue;

            const JobStatus status = Step(i, deadline);
            if (status != JobStatus::Running)
            {
                Finish(i, status);
                continue;
            }

            ++m_YieldCount;
            const JobProgress progress = m_Jobs[i].Progress;
            auto onYield = m_Jobs[i].Desc.OnYield;
            if (onYield) onYield(progress);
        }
    }

    void CooperativeScheduler::RunToCompletion(JobHandle handle)
    {
        if (!IsAlive(handle)) return;

        const JobStatus status = Step(handle.Index, std::chrono::nanoseconds::max());
        assert(status != JobStatus::Running);
        Finish(handle.Index, status);
    }

    void CooperativeScheduler::Discard(JobHandle handle)
    {
        if (!IsAlive(handle)) return;

        JobSlot& slot = m_Jobs[handle.Index];
        Log::Debug("Discarded job '{}' at {}/{} items.", slot.Desc.Name, slot.Progress.ItemsDone, slot.Progress.TotalItems);
        slot.Desc = {};
        slot.Active = false;
        ++slot.Generation;
        m_FreeSlots.push_back(handle.Index);
        --m_ActiveJobs;
    }

    bool CooperativeScheduler::IsAlive(JobHandle handle) const
    {
        return Resolve(handle) != nullptr;
    }

    std::optional<JobProgress> CooperativeScheduler::GetProgress(JobHandle handle) const
    {
        const JobSlot* slot = Resolve(handle);
        if (!slot) return std::nullopt;
        return slot->Progress;
    }

    // PerItem must not submit or discard jobs; the slot vector may not move
    // while a work function runs.
    JobStatus CooperativeScheduler::Step(uint32_t index, std::chrono::nanoseconds deadline)
    {
        JobSlot& job = m_Jobs[index];

        if (job.Desc.IsCancelled && job.Desc.IsCancelled()) return JobStatus::Cancelled;

        uint32_t sinceClockCheck = 0;
        while (job.Progress.ItemsDone < job.Progress.TotalItems)
        {
            job.Desc.PerItem(job.Progress.ItemsDone);
            ++job.Progress.ItemsDone;

            if (++sinceClockCheck < m_Config.ItemsPerClockCheck) continue;
            sinceClockCheck = 0;

            if (job.Progress.ItemsDone < job.Progress.TotalItems && m_Clock() >= deadline)
            {
                return JobStatus::Running;
            }
        }

        return JobStatus::Completed;
    }

    void CooperativeScheduler::Finish(uint32_t index, JobStatus status)
    {
        JobSlot& slot = m_Jobs[index];
        auto onFinished = std::move(slot.Desc.OnFinished);

        if (status == JobStatus::Cancelled)
        {
            Log::Info("Job '{}' terminated at {}/{} items.", slot.Desc.Name, slot.Progress.ItemsDone, slot.Progress.TotalItems);
        }
        else
        {
            Log::Debug("Job '{}' completed ({} items).", slot.Desc.Name, slot.Progress.TotalItems);
        }

        slot.Desc = {};
        slot.Active = false;
        ++slot.Generation;
        m_FreeSlots.push_back(index);
        --m_ActiveJobs;

        if (onFinished) onFinished(status);
    }

    const CooperativeScheduler::JobSlot* CooperativeScheduler::Resolve(JobHandle handle) const
    {
        if (!handle.IsValid() || handle.Index >= m_Jobs.size()) return nullptr;

        const JobSlot& slot = m_Jobs[handle.Index];
        if (!slot.Active || slot.Generation != handle.Generation) return nullptr;
        return &slot;
    }
}
