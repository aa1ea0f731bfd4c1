module;

#include <cstdint>
#include <string_view>

export module Graphics:RegenerationState;

export namespace Graphics
{
    enum class RegenerationState : uint8_t
    {
        Idle,
        Regenerating,
        Cancelling
    };

    constexpr std::string_view RegenerationStateToString(RegenerationState state)
    {
        switch (state)
        {
            case RegenerationState::Idle:         return "Idle";
            case RegenerationState::Regenerating: return "Regenerating";
            case RegenerationState::Cancelling:   return "Cancelling";
        }
        return "Unknown";
    }

    // -------------------------------------------------------------------------
    // RegenerationStateMachine
    // -------------------------------------------------------------------------
    // Idle --TryBegin--> Regenerating --RequestCancel--> Cancelling
    //   ^                     |                              |
    //   +------ Finish -------+-------------- Finish --------+
    //
    // At most one regeneration is in flight per store. A running job polls
    // IsCancelRequested() at every yield and calls Finish() exactly once,
    // whether it completed or unwound.
    // -------------------------------------------------------------------------
    class RegenerationStateMachine
    {
    public:
        [[nodiscard]] RegenerationState GetState() const { return m_State; }
        [[nodiscard]] bool IsIdle() const { return m_State == RegenerationState::Idle; }
        [[nodiscard]] bool IsBusy() const { return m_State != RegenerationState::Idle; }
        [[nodiscard]] bool IsCancelRequested() const { return m_State == RegenerationState::Cancelling; }

        // Idle -> Regenerating. False if a regeneration is already in flight.
        [[nodiscard]] bool TryBegin()
        {
            if (m_State != RegenerationState::Idle) return false;
            m_State = RegenerationState::Regenerating;
            return true;
        }

        // Regenerating -> Cancelling. False when there is nothing to cancel.
        bool RequestCancel()
        {
            if (m_State == RegenerationState::Idle) return false;
            m_State = RegenerationState::Cancelling;
            return true;
        }

        void Finish() { m_State = RegenerationState::Idle; }

    private:
        RegenerationState m_State = RegenerationState::Idle;
    };
}
