module;

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <vector>

export module Graphics:MirroredMesh;

import RHI;

export namespace Graphics
{
    // -------------------------------------------------------------------------
    // MirroredMesh - Reversed-perspective copy of a piece mesh
    // -------------------------------------------------------------------------
    // Viewed from the other side of the board, every sprite must be rotated
    // 180 degrees. The mirror is a cached transform of the canonical double
    // source array: it owns only render-precision floats and is re-derived
    // quad by quad from the source, never patched independently.
    //
    // A mirror is filled incrementally (DeriveQuad) and becomes drawable once
    // Publish() hands its array to the renderer.
    // -------------------------------------------------------------------------
    class MirroredMesh
    {
    public:
        MirroredMesh(uint32_t quadCount, const RHI::VertexLayout& layout);

        MirroredMesh(const MirroredMesh&) = delete;
        MirroredMesh& operator=(const MirroredMesh&) = delete;

        // Re-derives quad `quadIndex` from the canonical source array.
        void DeriveQuad(std::span<const double> source, uint32_t quadIndex);
        void DeriveAll(std::span<const double> source);

        // Creates the drawable. False if the renderer refused the array.
        [[nodiscard]] bool Publish(RHI::IBufferFactory& factory, std::optional<RHI::TextureHandle> texture);

        // Re-uploads one quad, or everything. No-op before Publish().
        void UploadQuad(uint32_t quadIndex);
        void UploadAll();

        [[nodiscard]] bool IsPublished() const { return m_Buffer != nullptr; }
        [[nodiscard]] RHI::IVertexBuffer* GetBuffer() const { return m_Buffer.get(); }
        [[nodiscard]] std::span<const float> GetRenderData() const { return m_Render; }
        [[nodiscard]] uint32_t GetQuadCount() const { return m_QuadCount; }

    private:
        [[nodiscard]] std::size_t QuadFloats() const;

        uint32_t m_QuadCount = 0;
        RHI::VertexLayout m_Layout;
        std::vector<float> m_Render;
        std::unique_ptr<RHI::IVertexBuffer> m_Buffer;
    };
}
