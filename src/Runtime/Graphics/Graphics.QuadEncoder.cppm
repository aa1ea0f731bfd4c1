module;

#include <cstdint>
#include <optional>
#include <span>

#include <glm/glm.hpp>

export module Graphics:QuadEncoder;

import :BoardTypes;
import Geometry;
import RHI;

// =============================================================================
// QuadEncoder - Fixed-size vertex blocks for board squares
// =============================================================================
//
// Every square renders as two triangles sharing the diagonal (L,T)-(R,B):
//
//     v1,v4 (L,T) +------+ v5 (R,T)
//                 |\     |
//                 |  \   |
//                 |    \ |
//        v0 (L,B) +------+ v2,v3 (R,B)
//
// Attributes are interleaved as position, [uv], [rgba]. All writers are pure:
// the same inputs always produce bit-identical output, which lets the mesh
// stores patch a slot by byte range instead of diffing content.
//
// Writers fill double-precision blocks. Narrow() is the single place where
// those values are converted to the float render format.
// =============================================================================

export namespace Graphics::QuadEncoder
{
    inline constexpr uint32_t VERTICES_PER_QUAD = 6;
    inline constexpr uint32_t VERTICES_PER_WIREFRAME_RECT = 12;

    // Offset of the uv pair inside a textured vertex.
    inline constexpr uint32_t TEXCOORD_OFFSET = 2;

    // Offset-relative world bounds of a quad.
    struct QuadBounds
    {
        double Left = 0.0;
        double Bottom = 0.0;
        double Right = 0.0;
        double Top = 0.0;
    };

    [[nodiscard]] RHI::VertexLayout TexturedLayout(bool tinted);
    [[nodiscard]] RHI::VertexLayout ColoredLayout();

    // Square centered on `coords`, expressed relative to `offset`.
    [[nodiscard]] QuadBounds SquareBounds(const BoardCoords& coords, const BoardCoords& offset, double squareCenter);

    // Rectangle covering every square of `rect`, relative to `offset`.
    [[nodiscard]] QuadBounds RectBounds(const Geometry::GridRect& rect, const BoardCoords& offset, double squareCenter);

    // out.size() == VERTICES_PER_QUAD * TexturedLayout(tint.has_value()).GetStride()
    void WriteTexturedQuad(std::span<double> out, const QuadBounds& bounds, const TexRect& tex,
                           const std::optional<glm::vec4>& tint);

    // out.size() == VERTICES_PER_QUAD * ColoredLayout().GetStride()
    void WriteColoredQuad(std::span<double> out, const QuadBounds& bounds, const glm::vec4& color);

    // Line-list outline of both triangles.
    // out.size() == VERTICES_PER_WIREFRAME_RECT * ColoredLayout().GetStride()
    void WriteWireframeRect(std::span<double> out, const QuadBounds& bounds, const glm::vec4& color);

    // Copies a textured quad and rotates its texture coordinates 180 degrees
    // about the sprite center. Positions and colors are copied unchanged.
    void WriteMirroredQuad(std::span<const double> source, std::span<double> out, uint32_t stride);

    // Adds `delta` to the position of every vertex in `block`.
    void TranslatePositions(std::span<double> block, uint32_t stride, const glm::dvec2& delta);

    [[nodiscard]] bool IsZero(std::span<const double> block);

    // Explicit double -> float conversion of a range of vertex data.
    void Narrow(std::span<const double> precise, std::span<float> render);
}
