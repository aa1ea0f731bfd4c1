module;

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

module Graphics:VoidMeshStore.Impl;

import :VoidMeshStore;
import :BoardTypes;
import :QuadEncoder;
import :RegenerationState;
import Core;
import Geometry;
import RHI;

namespace Graphics
{
    using Core::Tasks::JobStatus;

    VoidMeshStore::VoidMeshStore(Core::Tasks::CooperativeScheduler& scheduler, RHI::IBufferFactory& factory)
        : VoidMeshStore(Config{}, scheduler, factory)
    {
    }

    VoidMeshStore::VoidMeshStore(const Config& config, Core::Tasks::CooperativeScheduler& scheduler,
                                 RHI::IBufferFactory& factory)
        : m_Config(config),
          m_Scheduler(scheduler),
          m_Factory(factory)
    {
    }

    VoidMeshStore::~VoidMeshStore()
    {
        m_Scheduler.Discard(m_BuildJob);
    }

    uint32_t VoidMeshStore::VerticesPerRect(VoidMeshMode mode)
    {
        return mode == VoidMeshMode::Solid ? QuadEncoder::VERTICES_PER_QUAD
                                           : QuadEncoder::VERTICES_PER_WIREFRAME_RECT;
    }

    std::size_t VoidMeshStore::RectFloats(VoidMeshMode mode)
    {
        return static_cast<std::size_t>(VerticesPerRect(mode)) * QuadEncoder::ColoredLayout().GetStride();
    }

    void VoidMeshStore::Regenerate(std::span<const BoardCoords> voids, const BoardCoords& meshOffset, VoidMeshMode mode)
    {
        BuildRequest request;
        request.Offset = meshOffset;
        request.Mode = mode;

        Geometry::VoidRectangleMerger::MergeStats stats;
        {
            Core::Profiling::ScopedTimer timer("VoidRectangleMerger::Merge");
            request.Rects = Geometry::VoidRectangleMerger::Merge(voids, stats);
        }
        Core::Log::Debug("Merged {} void squares ({} unique) into {} rectangles.",
                         stats.InputSquares, stats.UniqueSquares, stats.Rectangles);

        if (m_State.IsBusy())
        {
            m_Queued = std::move(request);
            m_State.RequestCancel();
            return;
        }

        StartBuild(std::move(request));
    }

    void VoidMeshStore::FinishPendingWork()
    {
        while (m_Scheduler.IsAlive(m_BuildJob))
        {
            m_Scheduler.RunToCompletion(m_BuildJob);
        }
    }

    void VoidMeshStore::StartBuild(BuildRequest request)
    {
        [[maybe_unused]] const bool began = m_State.TryBegin();
        assert(began && "A void mesh build is already in flight");

        auto mesh = std::make_unique<MeshData>();
        mesh->Offset = request.Offset;
        mesh->Mode = request.Mode;
        mesh->Rects = std::move(request.Rects);

        const std::size_t floats = mesh->Rects.size() * RectFloats(mesh->Mode);
        mesh->Source.assign(floats, 0.0);
        mesh->Render.assign(floats, 0.0f);

        const auto rectCount = static_cast<uint64_t>(mesh->Rects.size());
        m_Building = std::move(mesh);
        ++m_RegenerationCount;

        Core::Tasks::ChunkedJobDesc desc;
        desc.Name = "VoidMesh.Regenerate";
        desc.TotalItems = rectCount;
        desc.PerItem = [this](uint64_t item) { EncodeRect(*m_Building, static_cast<std::size_t>(item)); };
        desc.IsCancelled = [this]() { return m_State.IsCancelRequested(); };
        desc.OnFinished = [this](JobStatus status) { OnBuildFinished(status); };

        m_BuildJob = m_Scheduler.RunChunked(std::move(desc));
    }

    void VoidMeshStore::EncodeRect(MeshData& mesh, std::size_t index) const
    {
        const std::size_t floats = RectFloats(mesh.Mode);
        std::span<double> block = std::span<double>(mesh.Source).subspan(index * floats, floats);

        const auto bounds = QuadEncoder::RectBounds(mesh.Rects[index], mesh.Offset, m_Config.SquareCenter);
        if (mesh.Mode == VoidMeshMode::Solid)
        {
            QuadEncoder::WriteColoredQuad(block, bounds, m_Config.SolidColor);
        }
        else
        {
            QuadEncoder::WriteWireframeRect(block, bounds, m_Config.WireframeColor);
        }

        QuadEncoder::Narrow(block, std::span<float>(mesh.Render).subspan(index * floats, floats));
    }

    void VoidMeshStore::OnBuildFinished(JobStatus status)
    {
        std::unique_ptr<MeshData> mesh = std::move(m_Building);
        m_BuildJob = {};
        const bool cancelled = status != JobStatus::Completed || m_State.IsCancelRequested();
        m_State.Finish();

        if (cancelled)
        {
            ++m_CancelCount;
            Core::Log::Info("Void mesh regeneration terminated.");
        }
        else
        {
            const RHI::PrimitiveKind kind = mesh->Mode == VoidMeshMode::Solid ? RHI::PrimitiveKind::Triangles
                                                                              : RHI::PrimitiveKind::Lines;
            mesh->Buffer = m_Factory.CreateBuffer(mesh->Render, QuadEncoder::ColoredLayout(), kind, std::nullopt);
            if (mesh->Buffer)
            {
                m_Live = std::move(mesh);
                ++m_PublishCount;
                Core::Log::Info("Published void mesh: {} rectangles ({}).", m_Live->Rects.size(),
                                m_Live->Mode == VoidMeshMode::Solid ? "solid" : "wireframe");
            }
            else
            {
                Core::Log::Error("Renderer refused the void mesh; keeping the previous one.");
            }
        }

        if (m_Queued)
        {
            BuildRequest next = std::move(*m_Queued);
            m_Queued.reset();
            StartBuild(std::move(next));
        }
    }

    void VoidMeshStore::Shift(const BoardCoords& delta)
    {
        if (delta == BoardCoords{0}) return;

        if (m_State.IsBusy())
        {
            // Restart the in-flight build at the new offset.
            if (!m_Queued)
            {
                m_Queued = BuildRequest{m_Building->Rects, m_Building->Offset, m_Building->Mode};
            }
            m_Queued->Offset -= delta;
            m_State.RequestCancel();
            return;
        }

        if (!m_Live) return;

        Core::Profiling::ScopedTimer timer("VoidMeshStore::Shift");

        const glm::dvec2 shift(static_cast<double>(delta.x), static_cast<double>(delta.y));
        QuadEncoder::TranslatePositions(m_Live->Source, QuadEncoder::ColoredLayout().GetStride(), shift);
        QuadEncoder::Narrow(m_Live->Source, m_Live->Render);
        m_Live->Offset -= delta;
        m_Live->Buffer->UpdateRange(0, m_Live->Render.size() * sizeof(float));
    }

    void VoidMeshStore::Render(const ViewState& view)
    {
        if (!m_Live || !m_Live->Buffer) return;

        const glm::vec3 position(static_cast<float>(static_cast<double>(m_Live->Offset.x) - view.Focus.x),
                                 static_cast<float>(static_cast<double>(m_Live->Offset.y) - view.Focus.y),
                                 0.0f);
        const glm::vec3 scale(static_cast<float>(view.Scale), static_cast<float>(view.Scale), 1.0f);
        m_Live->Buffer->Render(position, scale);
    }

    std::optional<VoidMeshMode> VoidMeshStore::GetMode() const
    {
        if (!m_Live) return std::nullopt;
        return m_Live->Mode;
    }

    std::optional<BoardCoords> VoidMeshStore::GetOffset() const
    {
        if (!m_Live) return std::nullopt;
        return m_Live->Offset;
    }

    std::span<const Geometry::GridRect> VoidMeshStore::GetRectangles() const
    {
        if (!m_Live) return {};
        return m_Live->Rects;
    }

    std::span<const double> VoidMeshStore::GetSourceData() const
    {
        if (!m_Live) return {};
        return m_Live->Source;
    }

    std::span<const float> VoidMeshStore::GetRenderData() const
    {
        if (!m_Live) return {};
        return m_Live->Render;
    }

    RHI::IVertexBuffer* VoidMeshStore::GetBuffer() const
    {
        return m_Live ? m_Live->Buffer.get() : nullptr;
    }
}
