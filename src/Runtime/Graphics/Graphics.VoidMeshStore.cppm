module;

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <vector>

#include <glm/glm.hpp>

export module Graphics:VoidMeshStore;

import :BoardTypes;
import :RegenerationState;
import Core;
import Geometry;
import RHI;

export namespace Graphics
{
    enum class VoidMeshMode : uint8_t
    {
        Solid,     // Filled quads (TRIANGLES)
        Wireframe  // Outline of both triangles of every rectangle (LINES)
    };

    // -------------------------------------------------------------------------
    // VoidMeshStore - Vertex data of removed squares
    // -------------------------------------------------------------------------
    // Void squares are merged into rectangles first, so a large hole in the
    // board costs one quad instead of thousands. The mesh shares the piece
    // mesh's offset; the owner keeps the two in step.
    //
    // The mode is fixed for the lifetime of a mesh: switching between solid
    // and wireframe takes a Regenerate().
    // -------------------------------------------------------------------------
    class VoidMeshStore
    {
    public:
        struct Config
        {
            glm::vec4 SolidColor{0.0f, 0.0f, 0.0f, 1.0f};
            glm::vec4 WireframeColor{1.0f, 0.0f, 1.0f, 1.0f};
            double SquareCenter = 0.5;
        };

        VoidMeshStore(Core::Tasks::CooperativeScheduler& scheduler, RHI::IBufferFactory& factory);
        VoidMeshStore(const Config& config, Core::Tasks::CooperativeScheduler& scheduler, RHI::IBufferFactory& factory);
        ~VoidMeshStore();

        VoidMeshStore(const VoidMeshStore&) = delete;
        VoidMeshStore& operator=(const VoidMeshStore&) = delete;

        // Merges synchronously, encodes through the scheduler.
        void Regenerate(std::span<const BoardCoords> voids, const BoardCoords& meshOffset, VoidMeshMode mode);
        void FinishPendingWork();

        // Re-expresses the mesh relative to (offset - delta).
        void Shift(const BoardCoords& delta);

        void Render(const ViewState& view);

        [[nodiscard]] RegenerationState GetState() const { return m_State.GetState(); }
        [[nodiscard]] bool HasMesh() const { return m_Live != nullptr; }
        [[nodiscard]] std::optional<VoidMeshMode> GetMode() const;
        [[nodiscard]] std::optional<BoardCoords> GetOffset() const;
        [[nodiscard]] std::span<const Geometry::GridRect> GetRectangles() const;
        [[nodiscard]] std::span<const double> GetSourceData() const;
        [[nodiscard]] std::span<const float> GetRenderData() const;
        [[nodiscard]] RHI::IVertexBuffer* GetBuffer() const;

        [[nodiscard]] uint64_t GetRegenerationCount() const { return m_RegenerationCount; }
        [[nodiscard]] uint64_t GetPublishCount() const { return m_PublishCount; }
        [[nodiscard]] uint64_t GetCancelCount() const { return m_CancelCount; }

        [[nodiscard]] static uint32_t VerticesPerRect(VoidMeshMode mode);

    private:
        struct MeshData
        {
            BoardCoords Offset{0};
            VoidMeshMode Mode = VoidMeshMode::Solid;
            std::vector<Geometry::GridRect> Rects;
            std::vector<double> Source;
            std::vector<float> Render;
            std::unique_ptr<RHI::IVertexBuffer> Buffer;
        };

        struct BuildRequest
        {
            std::vector<Geometry::GridRect> Rects;
            BoardCoords Offset{0};
            VoidMeshMode Mode = VoidMeshMode::Solid;
        };

        void StartBuild(BuildRequest request);
        void EncodeRect(MeshData& mesh, std::size_t index) const;
        void OnBuildFinished(Core::Tasks::JobStatus status);

        [[nodiscard]] static std::size_t RectFloats(VoidMeshMode mode);

        Config m_Config;
        Core::Tasks::CooperativeScheduler& m_Scheduler;
        RHI::IBufferFactory& m_Factory;

        RegenerationStateMachine m_State;
        std::unique_ptr<MeshData> m_Live;
        std::unique_ptr<MeshData> m_Building;
        std::optional<BuildRequest> m_Queued;
        Core::Tasks::JobHandle m_BuildJob;

        uint64_t m_RegenerationCount = 0;
        uint64_t m_PublishCount = 0;
        uint64_t m_CancelCount = 0;
    };
}
