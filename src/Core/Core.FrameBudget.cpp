module;

#include <algorithm>
#include <chrono>
#include <deque>

module Core:FrameBudget.Impl;

import :FrameBudget;

namespace Core
{
    FrameBudget::FrameBudget(const Config& config)
        : m_Config(config)
    {
    }

    void FrameBudget::BeginFrame(Milliseconds runTime)
    {
        m_RunTime = runTime;
        m_DeltaTime = m_FrameCount == 0 ? Milliseconds{0.0} : runTime - m_LastFrameStart;
        m_LastFrameStart = runTime;
        ++m_FrameCount;

        m_FrameStamps.push_back(runTime);
        TrimFrames();

        m_Fps = static_cast<double>(m_FrameStamps.size()) * 1000.0 / m_Config.FpsWindow.count();

        // Our highest-ever fps is the monitor's refresh rate.
        if (m_Fps > m_MonitorRefreshRate)
        {
            m_MonitorRefreshRate = m_Fps;
            m_IdealFrameTime = Milliseconds{1000.0 / m_MonitorRefreshRate};
        }
    }

    void FrameBudget::EndFrame(Milliseconds frameEndTime)
    {
        m_LastFrameWork = std::max(Milliseconds{0.0}, frameEndTime - m_RunTime);
        UpdateLongTaskTime();
        m_HasMeasurement = true;
    }

    std::chrono::nanoseconds FrameBudget::GetLongTaskTime() const
    {
        if (m_FixedBudget) return *m_FixedBudget;

        const Milliseconds budget = m_HasMeasurement ? m_LongTaskTime : m_Config.FallbackLongTaskTime;
        return std::chrono::duration_cast<std::chrono::nanoseconds>(budget);
    }

    // Drops frame stamps older than the fps window. A stamp exactly on the
    // window edge is kept.
    void FrameBudget::TrimFrames()
    {
        const Milliseconds splitPoint = m_RunTime - m_Config.FpsWindow;
        while (!m_FrameStamps.empty() && m_FrameStamps.front() < splitPoint)
        {
            m_FrameStamps.pop_front();
        }
    }

    void FrameBudget::UpdateLongTaskTime()
    {
        // Time left after rendering until the next frame is due.
        Milliseconds available = m_IdealFrameTime - m_LastFrameWork - m_Config.Damping;

        // At least as much time as rendering, never more than a whole frame.
        const Milliseconds minTime = m_LastFrameWork * m_Config.MinLongTaskRatio;
        available = std::max(available, minTime);
        available = std::min(available, m_IdealFrameTime);

        m_LongTaskTime = available;
    }
}
