module;

#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>

export module Core:FrameBudget;

export namespace Core
{
    // -------------------------------------------------------------------------
    // FrameBudget - Time slice granted to long tasks each frame
    // -------------------------------------------------------------------------
    // The host loop reports frame boundaries:
    //   BeginFrame(t) at the start of the frame (t = host run time),
    //   EndFrame(t)   after rendering.
    //
    // fps is measured over a sliding window. The highest fps ever observed is
    // taken as the monitor refresh rate, which defines the ideal frame time.
    // Whatever is left of the ideal frame after rendering goes to long tasks,
    // but never less than the render time itself (scaled by MinLongTaskRatio)
    // and never more than one ideal frame.
    // -------------------------------------------------------------------------
    class FrameBudget
    {
    public:
        using Milliseconds = std::chrono::duration<double, std::milli>;

        struct Config
        {
            Milliseconds FpsWindow{1000.0};
            double MinLongTaskRatio = 1.0; // 1 gives long tasks as much time as rendering
            Milliseconds Damping{1.0};     // Slack left for work between frames
            Milliseconds FallbackLongTaskTime{8.0}; // Before any frame was measured
        };

        FrameBudget() : FrameBudget(Config{}) {}
        explicit FrameBudget(const Config& config);

        void BeginFrame(Milliseconds runTime);
        void EndFrame(Milliseconds frameEndTime);

        // Headless hosts and tests pin the budget instead of measuring it.
        void SetFixedLongTaskTime(std::optional<std::chrono::nanoseconds> budget) { m_FixedBudget = budget; }

        [[nodiscard]] std::chrono::nanoseconds GetLongTaskTime() const;

        [[nodiscard]] double GetFps() const { return m_Fps; }
        [[nodiscard]] double GetMonitorRefreshRate() const { return m_MonitorRefreshRate; }
        [[nodiscard]] Milliseconds GetDeltaTime() const { return m_DeltaTime; }
        [[nodiscard]] Milliseconds GetLastFrameWork() const { return m_LastFrameWork; }
        [[nodiscard]] uint64_t GetFrameCount() const { return m_FrameCount; }

    private:
        void TrimFrames();
        void UpdateLongTaskTime();

        Config m_Config;

        std::deque<Milliseconds> m_FrameStamps; // Start times within the fps window
        Milliseconds m_RunTime{0.0};
        Milliseconds m_LastFrameStart{0.0};
        Milliseconds m_DeltaTime{0.0};
        Milliseconds m_LastFrameWork{0.0};
        Milliseconds m_LongTaskTime{0.0};

        double m_Fps = 0.0;
        double m_MonitorRefreshRate = 0.0;
        Milliseconds m_IdealFrameTime{0.0};
        uint64_t m_FrameCount = 0;
        bool m_HasMeasurement = false;

        std::optional<std::chrono::nanoseconds> m_FixedBudget;
    };
}
