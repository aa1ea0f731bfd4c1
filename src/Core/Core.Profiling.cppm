module;
#include <source_location>
#include <chrono>

export module Core:Profiling;

import :Logging;

export namespace Core::Profiling
{
    // Logs the wall time of a synchronous scope at debug level.
    struct ScopedTimer
    {
        const char* Name;
        std::source_location Loc;
        std::chrono::steady_clock::time_point Start;

        ScopedTimer(const char* name, std::source_location loc = std::source_location::current())
            : Name(name),
              Loc(loc),
              Start(std::chrono::steady_clock::now())
        {
        }

        ScopedTimer(const ScopedTimer&) = delete;
        ScopedTimer& operator=(const ScopedTimer&) = delete;

        ~ScopedTimer()
        {
            auto end = std::chrono::steady_clock::now();
            auto dur = std::chrono::duration_cast<std::chrono::microseconds>(end - Start).count();
            Log::Debug("[PROFILE] {} ({}:{}) took {} us", Name, Loc.file_name(), Loc.line(), dur);
        }
    };
}
