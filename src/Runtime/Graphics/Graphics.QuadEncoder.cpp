module;

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <optional>
#include <span>

#include <glm/glm.hpp>

module Graphics:QuadEncoder.Impl;

import :QuadEncoder;
import :BoardTypes;
import Geometry;
import RHI;

namespace Graphics::QuadEncoder
{
    namespace
    {
        // Writes one vertex and returns the cursor past it.
        std::size_t PutVertex(std::span<double> out, std::size_t at, double x, double y)
        {
            out[at++] = x;
            out[at++] = y;
            return at;
        }

        std::size_t PutUV(std::span<double> out, std::size_t at, double u, double v)
        {
            out[at++] = u;
            out[at++] = v;
            return at;
        }

        std::size_t PutColor(std::span<double> out, std::size_t at, const glm::vec4& c)
        {
            out[at++] = c.r;
            out[at++] = c.g;
            out[at++] = c.b;
            out[at++] = c.a;
            return at;
        }

        std::size_t PutColoredVertex(std::span<double> out, std::size_t at, double x, double y, const glm::vec4& c)
        {
            at = PutVertex(out, at, x, y);
            return PutColor(out, at, c);
        }

        // Taken in double: squares and offsets may lie on opposite ends of the int64 range.
        double Relative(int64_t coord, int64_t offset)
        {
            return static_cast<double>(coord) - static_cast<double>(offset);
        }
    }

    RHI::VertexLayout TexturedLayout(bool tinted)
    {
        return RHI::VertexLayout{2, 2, tinted ? 4u : 0u};
    }

    RHI::VertexLayout ColoredLayout()
    {
        return RHI::VertexLayout{2, 0, 4};
    }

    QuadBounds SquareBounds(const BoardCoords& coords, const BoardCoords& offset, double squareCenter)
    {
        QuadBounds b;
        b.Left = Relative(coords.x, offset.x) - squareCenter;
        b.Bottom = Relative(coords.y, offset.y) - squareCenter;
        b.Right = b.Left + 1.0;
        b.Top = b.Bottom + 1.0;
        return b;
    }

    QuadBounds RectBounds(const Geometry::GridRect& rect, const BoardCoords& offset, double squareCenter)
    {
        QuadBounds b;
        b.Left = Relative(rect.Left, offset.x) - squareCenter;
        b.Bottom = Relative(rect.Bottom, offset.y) - squareCenter;
        b.Right = Relative(rect.Right, offset.x) + 1.0 - squareCenter;
        b.Top = Relative(rect.Top, offset.y) + 1.0 - squareCenter;
        return b;
    }

    void WriteTexturedQuad(std::span<double> out, const QuadBounds& bounds, const TexRect& tex,
                           const std::optional<glm::vec4>& tint)
    {
        assert(out.size() == VERTICES_PER_QUAD * TexturedLayout(tint.has_value()).GetStride());

        const auto& [l, b, r, t] = bounds;
        const double corners[VERTICES_PER_QUAD][4] = {
            {l, b, tex.Left, tex.Bottom},
            {l, t, tex.Left, tex.Top},
            {r, b, tex.Right, tex.Bottom},
            {r, b, tex.Right, tex.Bottom},
            {l, t, tex.Left, tex.Top},
            {r, t, tex.Right, tex.Top},
        };

        std::size_t at = 0;
        for (const auto& c : corners)
        {
            at = PutVertex(out, at, c[0], c[1]);
            at = PutUV(out, at, c[2], c[3]);
            if (tint) at = PutColor(out, at, *tint);
        }
    }

    void WriteColoredQuad(std::span<double> out, const QuadBounds& bounds, const glm::vec4& color)
    {
        assert(out.size() == VERTICES_PER_QUAD * ColoredLayout().GetStride());

        const auto& [l, b, r, t] = bounds;
        std::size_t at = 0;
        at = PutColoredVertex(out, at, l, b, color);
        at = PutColoredVertex(out, at, l, t, color);
        at = PutColoredVertex(out, at, r, b, color);
        at = PutColoredVertex(out, at, r, b, color);
        at = PutColoredVertex(out, at, l, t, color);
        PutColoredVertex(out, at, r, t, color);
    }

    void WriteWireframeRect(std::span<double> out, const QuadBounds& bounds, const glm::vec4& color)
    {
        assert(out.size() == VERTICES_PER_WIREFRAME_RECT * ColoredLayout().GetStride());

        const auto& [l, b, r, t] = bounds;
        const double segments[VERTICES_PER_WIREFRAME_RECT][2] = {
            // First triangle
            {l, b}, {l, t},
            {l, t}, {r, b},
            {r, b}, {l, b},
            // Second triangle
            {r, b}, {l, t},
            {l, t}, {r, t},
            {r, t}, {r, b},
        };

        std::size_t at = 0;
        for (const auto& p : segments)
        {
            at = PutColoredVertex(out, at, p[0], p[1], color);
        }
    }

    void WriteMirroredQuad(std::span<const double> source, std::span<double> out, uint32_t stride)
    {
        assert(source.size() == out.size());
        assert(source.size() == static_cast<std::size_t>(VERTICES_PER_QUAD) * stride);
        assert(stride >= TEXCOORD_OFFSET + 2);

        std::copy(source.begin(), source.end(), out.begin());

        // v0 carries (texLeft, texBottom) and v5 (texRight, texTop). Their sums
        // are the same whichever way the sprite was encoded.
        const std::size_t first = TEXCOORD_OFFSET;
        const std::size_t last = static_cast<std::size_t>(VERTICES_PER_QUAD - 1) * stride + TEXCOORD_OFFSET;
        const double uSum = source[first] + source[last];
        const double vSum = source[first + 1] + source[last + 1];

        for (uint32_t v = 0; v < VERTICES_PER_QUAD; ++v)
        {
            const std::size_t uv = static_cast<std::size_t>(v) * stride + TEXCOORD_OFFSET;
            out[uv] = uSum - source[uv];
            out[uv + 1] = vSum - source[uv + 1];
        }
    }

    void TranslatePositions(std::span<double> block, uint32_t stride, const glm::dvec2& delta)
    {
        assert(stride >= 2 && block.size() % stride == 0);

        for (std::size_t at = 0; at + 1 < block.size(); at += stride)
        {
            block[at] += delta.x;
            block[at + 1] += delta.y;
        }
    }

    bool IsZero(std::span<const double> block)
    {
        return std::all_of(block.begin(), block.end(), [](double v) { return v == 0.0; });
    }

    void Narrow(std::span<const double> precise, std::span<float> render)
    {
        assert(precise.size() == render.size());
        std::transform(precise.begin(), precise.end(), render.begin(),
                       [](double v) { return static_cast<float>(v); });
    }
}
