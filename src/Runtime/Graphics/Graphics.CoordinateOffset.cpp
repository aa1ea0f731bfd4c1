module;

#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstdint>
#include <limits>

#include <glm/glm.hpp>

module Graphics:CoordinateOffset.Impl;

import :CoordinateOffset;
import :BoardTypes;

namespace Graphics
{
    namespace
    {
        int64_t RoundToGrid(double value, int64_t gridSize)
        {
            const double grid = static_cast<double>(gridSize);
            const double maxCells = static_cast<double>(std::numeric_limits<int64_t>::max() / gridSize);

            double cells = std::floor(value / grid + 0.5);
            if (std::isnan(cells)) cells = 0.0;
            cells = std::clamp(cells, -maxCells, maxCells);

            return static_cast<int64_t>(cells) * gridSize;
        }
    }

    CoordinateOffsetPolicy::CoordinateOffsetPolicy(const Config& config)
        : m_Config(config)
    {
        assert(m_Config.GridSize > 0 && "Offset grid size must be positive");
        if (m_Config.GridSize <= 0) m_Config.GridSize = 1;
    }

    BoardCoords CoordinateOffsetPolicy::NearestGridPoint(const glm::dvec2& focus) const
    {
        return {RoundToGrid(focus.x, m_Config.GridSize), RoundToGrid(focus.y, m_Config.GridSize)};
    }

    bool CoordinateOffsetPolicy::IsOutOfBand(const BoardCoords& offset, const glm::dvec2& focus) const
    {
        const double dx = std::abs(focus.x - static_cast<double>(offset.x));
        const double dy = std::abs(focus.y - static_cast<double>(offset.y));
        return dx > m_Config.RecenterBand || dy > m_Config.RecenterBand;
    }

    OffsetDecision CoordinateOffsetPolicy::DecideShift(const BoardCoords& currentOffset, const glm::dvec2& focus) const
    {
        OffsetDecision decision;
        decision.NewOffset = NearestGridPoint(focus);

        if (decision.NewOffset == currentOffset)
        {
            decision.Action = RecenterAction::Keep;
            return decision;
        }

        if (ChebyshevDistance(currentOffset, decision.NewOffset) > m_Config.GlitchDistance)
        {
            decision.Action = RecenterAction::Regenerate;
            return decision;
        }

        decision.Action = RecenterAction::Shift;
        decision.Delta = currentOffset - decision.NewOffset;
        return decision;
    }

    OffsetDecision CoordinateOffsetPolicy::Evaluate(const BoardCoords& currentOffset, const glm::dvec2& focus) const
    {
        if (!IsOutOfBand(currentOffset, focus))
        {
            return OffsetDecision{RecenterAction::Keep, currentOffset, BoardCoords{0}};
        }
        return DecideShift(currentOffset, focus);
    }

    double CoordinateOffsetPolicy::ChebyshevDistance(const BoardCoords& a, const BoardCoords& b)
    {
        const double dx = std::abs(static_cast<double>(a.x) - static_cast<double>(b.x));
        const double dy = std::abs(static_cast<double>(a.y) - static_cast<double>(b.y));
        return std::max(dx, dy);
    }
}
