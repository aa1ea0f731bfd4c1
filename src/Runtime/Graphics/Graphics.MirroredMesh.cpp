module;

#include <array>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <vector>

module Graphics:MirroredMesh.Impl;

import :MirroredMesh;
import :QuadEncoder;
import RHI;
import Core;

namespace Graphics
{
    namespace
    {
        // Largest textured vertex: position + uv + rgba.
        constexpr std::size_t MAX_QUAD_FLOATS = QuadEncoder::VERTICES_PER_QUAD * 8;
    }

    MirroredMesh::MirroredMesh(uint32_t quadCount, const RHI::VertexLayout& layout)
        : m_QuadCount(quadCount),
          m_Layout(layout),
          m_Render(static_cast<std::size_t>(quadCount) * QuadEncoder::VERTICES_PER_QUAD * layout.GetStride(), 0.0f)
    {
        assert(layout.HasTexCoords() && "Only textured meshes can be mirrored");
        assert(QuadFloats() <= MAX_QUAD_FLOATS);
    }

    std::size_t MirroredMesh::QuadFloats() const
    {
        return static_cast<std::size_t>(QuadEncoder::VERTICES_PER_QUAD) * m_Layout.GetStride();
    }

    void MirroredMesh::DeriveQuad(std::span<const double> source, uint32_t quadIndex)
    {
        assert(quadIndex < m_QuadCount);
        assert(source.size() == m_Render.size());

        const std::size_t floats = QuadFloats();
        const std::size_t first = static_cast<std::size_t>(quadIndex) * floats;

        std::array<double, MAX_QUAD_FLOATS> scratch{};
        std::span<double> mirrored(scratch.data(), floats);
        QuadEncoder::WriteMirroredQuad(source.subspan(first, floats), mirrored, m_Layout.GetStride());
        QuadEncoder::Narrow(mirrored, std::span<float>(m_Render).subspan(first, floats));
    }

    void MirroredMesh::DeriveAll(std::span<const double> source)
    {
        for (uint32_t q = 0; q < m_QuadCount; ++q)
        {
            DeriveQuad(source, q);
        }
    }

    bool MirroredMesh::Publish(RHI::IBufferFactory& factory, std::optional<RHI::TextureHandle> texture)
    {
        m_Buffer = factory.CreateBuffer(m_Render, m_Layout, RHI::PrimitiveKind::Triangles, texture);
        if (!m_Buffer)
        {
            Core::Log::Error("Failed to create the mirrored piece buffer ({} quads).", m_QuadCount);
            return false;
        }
        return true;
    }

    void MirroredMesh::UploadQuad(uint32_t quadIndex)
    {
        if (!m_Buffer) return;
        const std::size_t bytes = QuadFloats() * sizeof(float);
        m_Buffer->UpdateRange(static_cast<std::size_t>(quadIndex) * bytes, bytes);
    }

    void MirroredMesh::UploadAll()
    {
        if (!m_Buffer) return;
        m_Buffer->UpdateRange(0, m_Render.size() * sizeof(float));
    }
}
