module;

#include <cstdint>

#include <glm/glm.hpp>

export module Graphics:CoordinateOffset;

import :BoardTypes;

export namespace Graphics
{
    enum class RecenterAction : uint8_t
    {
        Keep,       // Focus still inside the band around the current offset
        Shift,      // Move every vertex linearly by Delta
        Regenerate  // Delta too large for a linear shift to stay exact
    };

    struct OffsetDecision
    {
        RecenterAction Action = RecenterAction::Keep;
        BoardCoords NewOffset{0};
        BoardCoords Delta{0}; // old offset - new offset; valid for Shift only
    };

    // -------------------------------------------------------------------------
    // CoordinateOffsetPolicy
    // -------------------------------------------------------------------------
    // Vertex positions are stored relative to an integer MeshOffset so that the
    // values fed to the float vertex format stay small no matter how far the
    // camera is from the origin. The offset snaps to multiples of GridSize.
    //
    // Recentering fires only once the focus is more than RecenterBand away
    // from the current offset on either axis. A shift whose Chebyshev length
    // exceeds GlitchDistance would lose precision in the double source array
    // (cancellation), so the policy asks for a regeneration instead.
    // -------------------------------------------------------------------------
    class CoordinateOffsetPolicy
    {
    public:
        struct Config
        {
            int64_t GridSize = 10'000;
            double RecenterBand = 10'000.0;
            double GlitchDistance = 9'007'199'254'740'991.0; // 2^53 - 1
        };

        CoordinateOffsetPolicy() : CoordinateOffsetPolicy(Config{}) {}
        explicit CoordinateOffsetPolicy(const Config& config);

        // Nearest multiple of GridSize on each axis; halves round up.
        [[nodiscard]] BoardCoords NearestGridPoint(const glm::dvec2& focus) const;

        [[nodiscard]] bool IsOutOfBand(const BoardCoords& offset, const glm::dvec2& focus) const;

        // Decision for an explicit recentering request, ignoring the band.
        [[nodiscard]] OffsetDecision DecideShift(const BoardCoords& currentOffset, const glm::dvec2& focus) const;

        // Per-frame check: Keep while inside the band, DecideShift() otherwise.
        [[nodiscard]] OffsetDecision Evaluate(const BoardCoords& currentOffset, const glm::dvec2& focus) const;

        [[nodiscard]] static double ChebyshevDistance(const BoardCoords& a, const BoardCoords& b);

        [[nodiscard]] const Config& GetConfig() const { return m_Config; }

    private:
        Config m_Config;
    };
}
