module;

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

module Graphics:PieceMeshStore.Impl;

import :PieceMeshStore;
import :BoardTypes;
import :CoordinateOffset;
import :MirroredMesh;
import :QuadEncoder;
import :RegenerationState;
import Core;
import RHI;

namespace Graphics
{
    using Core::Tasks::JobStatus;

    PieceMeshStore::PieceMeshStore(Core::Tasks::CooperativeScheduler& scheduler,
                                   RHI::IBufferFactory& factory,
                                   const ITextureAtlas& atlas)
        : PieceMeshStore(Config{}, scheduler, factory, atlas)
    {
    }

    PieceMeshStore::PieceMeshStore(const Config& config,
                                   Core::Tasks::CooperativeScheduler& scheduler,
                                   RHI::IBufferFactory& factory,
                                   const ITextureAtlas& atlas)
        : m_Config(config),
          m_OffsetPolicy(config.Offset),
          m_Scheduler(scheduler),
          m_Factory(factory),
          m_Atlas(atlas)
    {
    }

    PieceMeshStore::~PieceMeshStore()
    {
        m_Scheduler.Discard(m_BuildJob);
        m_Scheduler.Discard(m_MirrorJob);
    }

    // =========================================================================
    // Regeneration
    // =========================================================================

    void PieceMeshStore::Regenerate(const BoardPieces& board, const ViewState& view, std::optional<TintConfig> tint)
    {
        // The new snapshot already contains every change queued so far.
        m_Patches.clear();

        BuildRequest request{board, view, std::move(tint)};

        if (m_State.IsBusy())
        {
            m_Queued = std::move(request);
            if (m_State.RequestCancel())
            {
                Core::Log::Debug("Piece mesh regeneration superseded; cancelling the running build.");
            }
            return;
        }

        StartBuild(std::move(request));
    }

    void PieceMeshStore::FinishPendingWork()
    {
        // Finishing a cancelled build starts the queued one.
        while (m_Scheduler.IsAlive(m_BuildJob))
        {
            m_Scheduler.RunToCompletion(m_BuildJob);
        }
        m_Scheduler.RunToCompletion(m_MirrorJob);
    }

    void PieceMeshStore::StartBuild(BuildRequest request)
    {
        [[maybe_unused]] const bool began = m_State.TryBegin();
        assert(began && "A piece mesh build is already in flight");

        auto mesh = std::make_unique<MeshData>();
        mesh->Offset = m_OffsetPolicy.NearestGridPoint(request.View.Focus);
        mesh->Tint = request.Tint;
        mesh->InvertTextures = request.View.InvertTextures;
        mesh->Layout = QuadEncoder::TexturedLayout(request.Tint.has_value());

        uint32_t quadCount = 0;
        mesh->Buckets.reserve(request.Board.Buckets.size());
        for (const PieceBucket& bucket : request.Board.Buckets)
        {
            const BucketLayout layout = MakeBucketLayout(bucket, quadCount);
            mesh->Buckets.push_back(layout);

            quadCount += layout.Capacity;
        }

        const std::size_t floats = static_cast<std::size_t>(quadCount) * QuadFloats(*mesh);
        mesh->Slots.assign(quadCount, std::nullopt);
        mesh->Source.assign(floats, 0.0);
        mesh->Render.assign(floats, 0.0f);

        const bool withMirror = m_MirrorEnabled;
        if (withMirror)
        {
            mesh->Mirror = std::make_unique<MirroredMesh>(quadCount, mesh->Layout);
        }

        Core::Log::Info("Regenerating piece mesh: {} buckets, {} quads, offset ({}, {}){}.",
                        mesh->Buckets.size(), quadCount, mesh->Offset.x, mesh->Offset.y,
                        withMirror ? ", with mirror" : "");

        m_Build = std::make_unique<Build>();
        m_Build->Request = std::move(request);
        m_Build->Mesh = std::move(mesh);
        m_Build->WithMirror = withMirror;
        ++m_RegenerationCount;

        Core::Tasks::ChunkedJobDesc desc;
        desc.Name = "PieceMesh.Regenerate";
        desc.TotalItems = static_cast<uint64_t>(quadCount) * (withMirror ? 2u : 1u);
        desc.PerItem = [this](uint64_t item) { BuildItem(item); };
        desc.IsCancelled = [this]() { return m_State.IsCancelRequested(); };
        desc.OnYield = [](const Core::Tasks::JobProgress& progress)
        {
            Core::Log::Debug("Piece mesh {:.0f}% built.", progress.Fraction() * 100.0);
        };
        desc.OnFinished = [this](JobStatus status) { OnBuildFinished(status); };

        m_BuildJob = m_Scheduler.RunChunked(std::move(desc));
    }

    PieceMeshStore::BucketLayout PieceMeshStore::MakeBucketLayout(const PieceBucket& bucket, uint32_t firstQuad) const
    {
        const uint32_t reserve = bucket.ReservesPlaceholders ? GetPlaceholderReserve(bucket.Type) : 0;
        const uint32_t holes = bucket.CountHoles();
        const uint32_t extra = reserve > holes ? reserve - holes : 0;

        BucketLayout layout;
        layout.Type = bucket.Type;
        layout.Player = bucket.Player;
        layout.ReservesPlaceholders = bucket.ReservesPlaceholders;
        layout.FirstQuad = firstQuad;
        layout.Capacity = static_cast<uint32_t>(bucket.Slots.size()) + extra;
        return layout;
    }

    // Items [0, quads) encode slots in layout order, items [quads, 2*quads)
    // derive the mirror from the finished source array.
    void PieceMeshStore::BuildItem(uint64_t item)
    {
        Build& build = *m_Build;
        MeshData& mesh = *build.Mesh;
        const auto quadCount = static_cast<uint64_t>(mesh.Slots.size());

        if (item >= quadCount)
        {
            mesh.Mirror->DeriveQuad(mesh.Source, static_cast<uint32_t>(item - quadCount));
            return;
        }

        while (build.CursorSlot >= mesh.Buckets[build.CursorBucket].Capacity)
        {
            ++build.CursorBucket;
            build.CursorSlot = 0;
        }

        const BucketLayout& layout = mesh.Buckets[build.CursorBucket];
        const PieceBucket& bucket = build.Request.Board.Buckets[build.CursorBucket];
        assert(layout.FirstQuad + build.CursorSlot == item);

        std::optional<BoardCoords> coords;
        if (build.CursorSlot < bucket.Slots.size()) coords = bucket.Slots[build.CursorSlot];

        EncodeQuad(mesh, static_cast<uint32_t>(item), layout, coords, std::nullopt);
        ++build.CursorSlot;
    }

    void PieceMeshStore::OnBuildFinished(JobStatus status)
    {
        std::unique_ptr<Build> build = std::move(m_Build);
        m_BuildJob = {};

        if (status == JobStatus::Completed && !m_State.IsCancelRequested())
        {
            // Patches that arrived while building were applied to the old
            // arrays; replay them so the fresh mesh does not lose them.
            std::vector<Patch> overflow;
            for (const Patch& patch : m_Patches)
            {
                auto result = ApplyPatch(*build->Mesh, patch, false);
                if (result) continue;

                if (result.error() == Core::ErrorCode::ResourceExhausted)
                {
                    GrowReserve(patch.Type);
                    overflow.push_back(patch);
                    continue;
                }
                Core::Log::Warn("Dropped queued piece patch on bucket {} slot {}: {}",
                                patch.Slot.Bucket, patch.Slot.Slot, Core::ErrorCodeToString(result.error()));
            }
            m_Patches.clear();
            m_State.Finish();

            Publish(std::move(build->Mesh));

            if (!overflow.empty() && m_Live && !m_Queued)
            {
                // A queued promotion did not fit; rebuild with the larger
                // reservation and the promoted pieces in place.
                BuildRequest retry{SnapshotBoard(*m_Live), build->Request.View, m_Live->Tint};
                for (const Patch& patch : overflow)
                {
                    if (patch.Slot.Bucket >= retry.Board.Buckets.size()) continue;
                    auto& slots = retry.Board.Buckets[patch.Slot.Bucket].Slots;
                    if (slots.size() <= patch.Slot.Slot) slots.resize(patch.Slot.Slot + 1);
                    slots[patch.Slot.Slot] = patch.Coords;
                }
                StartBuild(std::move(retry));
                return;
            }
        }
        else
        {
            ++m_CancelCount;
            m_State.Finish();
            Core::Log::Info("Piece mesh regeneration terminated; {} request.",
                            m_Queued ? "starting the newer" : "no pending");
        }

        if (m_Queued)
        {
            BuildRequest next = std::move(*m_Queued);
            m_Queued.reset();
            StartBuild(std::move(next));
        }
    }

    void PieceMeshStore::Publish(std::unique_ptr<MeshData> mesh)
    {
        mesh->Buffer = m_Factory.CreateBuffer(mesh->Render, mesh->Layout, RHI::PrimitiveKind::Triangles, m_Config.Texture);
        if (!mesh->Buffer)
        {
            Core::Log::Error("Renderer refused the piece mesh ({} quads); keeping the previous one.", mesh->Slots.size());
            return;
        }

        // The outgoing mirror dies with the outgoing mesh.
        m_Scheduler.Discard(m_MirrorJob);
        m_MirrorJob = {};

        if (mesh->Mirror)
        {
            if (!m_MirrorEnabled || !mesh->Mirror->Publish(m_Factory, m_Config.Texture))
            {
                mesh->Mirror.reset();
            }
        }

        m_Live = std::move(mesh);
        ++m_PublishCount;
        Core::Log::Info("Published piece mesh: {} quads at offset ({}, {}).",
                        m_Live->Slots.size(), m_Live->Offset.x, m_Live->Offset.y);

        if (m_MirrorEnabled && !m_Live->Mirror) StartMirrorBuild();

        if (m_OnPublished) m_OnPublished(m_Live->Offset);
    }

    // =========================================================================
    // Mirror
    // =========================================================================

    void PieceMeshStore::SetMirrorEnabled(bool enabled)
    {
        if (enabled == m_MirrorEnabled) return;
        m_MirrorEnabled = enabled;

        if (!enabled)
        {
            DropMirror();
            return;
        }

        // A build in flight without a mirror phase gets one after publishing.
        if (m_Live) StartMirrorBuild();
    }

    void PieceMeshStore::StartMirrorBuild()
    {
        if (!m_Live || m_Live->Mirror) return;

        const auto quadCount = static_cast<uint32_t>(m_Live->Slots.size());
        m_Live->Mirror = std::make_unique<MirroredMesh>(quadCount, m_Live->Layout);

        Core::Tasks::ChunkedJobDesc desc;
        desc.Name = "PieceMesh.Mirror";
        desc.TotalItems = quadCount;
        desc.PerItem = [this](uint64_t item)
        {
            m_Live->Mirror->DeriveQuad(m_Live->Source, static_cast<uint32_t>(item));
        };
        desc.OnFinished = [this](JobStatus status)
        {
            m_MirrorJob = {};
            if (status != JobStatus::Completed || !m_Live || !m_Live->Mirror) return;

            if (m_Live->Mirror->Publish(m_Factory, m_Config.Texture))
            {
                Core::Log::Info("Built mirrored piece mesh ({} quads).", m_Live->Mirror->GetQuadCount());
            }
            else
            {
                m_Live->Mirror.reset();
            }
        };

        m_MirrorJob = m_Scheduler.RunChunked(std::move(desc));
    }

    void PieceMeshStore::DropMirror()
    {
        m_Scheduler.Discard(m_MirrorJob);
        m_MirrorJob = {};

        if (m_Live && m_Live->Mirror)
        {
            m_Live->Mirror.reset();
            Core::Log::Info("Erased mirrored piece mesh.");
        }
    }

    // =========================================================================
    // Patches
    // =========================================================================

    Core::Result PieceMeshStore::Move(PieceSlot slot, const BoardCoords& to)
    {
        Patch patch;
        patch.Kind = PatchKind::Move;
        patch.Slot = slot;
        patch.Coords = to;
        return Submit(patch);
    }

    Core::Result PieceMeshStore::Delete(PieceSlot slot)
    {
        Patch patch;
        patch.Kind = PatchKind::Delete;
        patch.Slot = slot;
        return Submit(patch);
    }

    Core::Result PieceMeshStore::Overwrite(PieceSlot slot, PieceTypeId type, const BoardCoords& at,
                                           const std::optional<TintConfig>& tint)
    {
        Patch patch;
        patch.Kind = PatchKind::Overwrite;
        patch.Slot = slot;
        patch.Type = type;
        patch.Coords = at;
        patch.Tint = tint;

        auto result = Submit(patch);
        if (!result && result.error() == Core::ErrorCode::ResourceExhausted)
        {
            GrowReserve(type);
        }
        return result;
    }

    Core::Result PieceMeshStore::Submit(const Patch& patch)
    {
        if (m_State.IsBusy())
        {
            if (auto checked = CheckQueuedPatch(patch); !checked) return checked;

            m_Patches.push_back(patch);

            // Keep the outgoing mesh current until the new one is published.
            if (m_Live)
            {
                if (auto result = ApplyPatch(*m_Live, patch, false); !result)
                {
                    Core::Log::Debug("Queued piece patch does not apply to the outgoing mesh: {}",
                                     Core::ErrorCodeToString(result.error()));
                }
            }
            return Core::Ok();
        }

        if (!m_Live)
        {
            Core::Log::Error("Piece patch on bucket {} slot {} before any mesh was built.",
                             patch.Slot.Bucket, patch.Slot.Slot);
            return Core::Err(Core::ErrorCode::InvalidState);
        }

        return ApplyPatch(*m_Live, patch, true);
    }

    std::optional<PieceMeshStore::BucketLayout> PieceMeshStore::GetPendingBucketLayout(uint32_t bucket) const
    {
        if (m_Queued)
        {
            if (bucket >= m_Queued->Board.Buckets.size()) return std::nullopt;
            return MakeBucketLayout(m_Queued->Board.Buckets[bucket], 0);
        }
        if (m_Build)
        {
            if (bucket >= m_Build->Mesh->Buckets.size()) return std::nullopt;
            return m_Build->Mesh->Buckets[bucket];
        }
        return std::nullopt;
    }

    // A patch queued behind a build must address a bucket and slot of either
    // the outgoing mesh or the layout that will replace it. Overwrites past
    // the pending capacity are left to the replay, which grows the reserve.
    Core::Result PieceMeshStore::CheckQueuedPatch(const Patch& patch) const
    {
        std::optional<BucketLayout> live;
        if (m_Live && patch.Slot.Bucket < m_Live->Buckets.size()) live = m_Live->Buckets[patch.Slot.Bucket];
        const std::optional<BucketLayout> pending = GetPendingBucketLayout(patch.Slot.Bucket);

        if (!live && !pending)
        {
            Core::Log::Error("Piece patch on unknown bucket {}.", patch.Slot.Bucket);
            assert(false && "Piece patch on an unknown bucket");
            return Core::Err(Core::ErrorCode::OutOfRange);
        }

        if (patch.Kind == PatchKind::Overwrite)
        {
            const PieceTypeId type = pending ? pending->Type : live->Type;
            if (type != patch.Type)
            {
                Core::Log::Error("Bucket {} holds type {}, not {}.", patch.Slot.Bucket, type, patch.Type);
                assert(false && "Overwrite into a bucket of another piece type");
                return Core::Err(Core::ErrorCode::TypeMismatch);
            }
            return Core::Ok();
        }

        const auto fits = [&patch](const std::optional<BucketLayout>& layout)
        {
            return layout && patch.Slot.Slot < layout->Capacity;
        };
        if (!fits(live) && !fits(pending))
        {
            Core::Log::Error("Piece slot {} out of range for bucket {}.", patch.Slot.Slot, patch.Slot.Bucket);
            assert(false && "Piece slot index out of range");
            return Core::Err(Core::ErrorCode::OutOfRange);
        }
        return Core::Ok();
    }

    // `strict` patches come straight from the caller: contract violations
    // assert. Queued patches may legitimately miss an older layout.
    Core::Result PieceMeshStore::ApplyPatch(MeshData& mesh, const Patch& patch, bool strict)
    {
        if (patch.Slot.Bucket >= mesh.Buckets.size())
        {
            assert(!strict && "Piece patch on an unknown bucket");
            if (strict) Core::Log::Error("Piece patch on unknown bucket {}.", patch.Slot.Bucket);
            return Core::Err(Core::ErrorCode::OutOfRange);
        }

        const BucketLayout& bucket = mesh.Buckets[patch.Slot.Bucket];
        if (patch.Slot.Slot >= bucket.Capacity)
        {
            if (patch.Kind == PatchKind::Overwrite)
            {
                Core::Log::Warn("No placeholder left for piece type {} (bucket {} slot {}, capacity {}).",
                                bucket.Type, patch.Slot.Bucket, patch.Slot.Slot, bucket.Capacity);
                return Core::Err(Core::ErrorCode::ResourceExhausted);
            }

            assert(!strict && "Piece slot index out of range");
            if (strict) Core::Log::Error("Piece slot {} out of range for bucket {}.", patch.Slot.Slot, patch.Slot.Bucket);
            return Core::Err(Core::ErrorCode::OutOfRange);
        }

        const uint32_t quad = bucket.FirstQuad + patch.Slot.Slot;

        switch (patch.Kind)
        {
            case PatchKind::Move:
            {
                if (!mesh.Slots[quad])
                {
                    assert(!strict && "Moving an empty piece slot");
                    return Core::Err(Core::ErrorCode::InvalidState);
                }
                EncodeQuad(mesh, quad, bucket, patch.Coords, ReadColor(mesh, quad));
                break;
            }
            case PatchKind::Delete:
            {
                EncodeQuad(mesh, quad, bucket, std::nullopt, std::nullopt);
                break;
            }
            case PatchKind::Overwrite:
            {
                if (bucket.Type != patch.Type)
                {
                    assert(!strict && "Overwrite into a bucket of another piece type");
                    if (strict) Core::Log::Error("Bucket {} holds type {}, not {}.", patch.Slot.Bucket, bucket.Type, patch.Type);
                    return Core::Err(Core::ErrorCode::TypeMismatch);
                }
                if (mesh.Slots[quad])
                {
                    assert(!strict && "Overwrite into an occupied piece slot");
                    return Core::Err(Core::ErrorCode::InvalidState);
                }
                if (patch.Tint && !mesh.Tint)
                {
                    assert(!strict && "Tinted overwrite into an untinted mesh");
                    return Core::Err(Core::ErrorCode::LayoutMismatch);
                }

                std::optional<glm::vec4> color;
                if (patch.Tint) color = patch.Tint->GetColor(bucket.Player);
                EncodeQuad(mesh, quad, bucket, patch.Coords, color);
                break;
            }
        }

        if (mesh.Mirror) mesh.Mirror->DeriveQuad(mesh.Source, quad);
        UploadQuad(mesh, quad);
        return Core::Ok();
    }

    // =========================================================================
    // Shift
    // =========================================================================

    ShiftResult PieceMeshStore::Shift(const glm::dvec2& focus)
    {
        if (m_State.IsBusy())
        {
            // The build in flight targets a stale offset: restart it (with the
            // patch queue intact) unless it already lands on the right one.
            BuildRequest& target = m_Queued ? *m_Queued : m_Build->Request;
            if (m_OffsetPolicy.NearestGridPoint(target.View.Focus) == m_OffsetPolicy.NearestGridPoint(focus))
            {
                return {};
            }

            if (!m_Queued) m_Queued = m_Build->Request;
            m_Queued->View.Focus = focus;
            m_State.RequestCancel();
            Core::Log::Info("Piece mesh recentered during regeneration; restarting the build.");
            return {ShiftOutcome::Regenerated, BoardCoords{0}};
        }

        if (!m_Live)
        {
            Core::Log::Warn("PieceMeshStore::Shift() called before any mesh was built.");
            return {};
        }

        const OffsetDecision decision = m_OffsetPolicy.DecideShift(m_Live->Offset, focus);
        switch (decision.Action)
        {
            case RecenterAction::Keep:
                return {};

            case RecenterAction::Regenerate:
            {
                Core::Log::Info("Piece mesh offset jump to ({}, {}) is past the glitch distance; regenerating.",
                                decision.NewOffset.x, decision.NewOffset.y);

                ViewState view;
                view.Focus = focus;
                view.InvertTextures = m_Live->InvertTextures;
                StartBuild(BuildRequest{SnapshotBoard(*m_Live), view, m_Live->Tint});
                return {ShiftOutcome::Regenerated, BoardCoords{0}};
            }

            case RecenterAction::Shift:
                break;
        }

        Core::Profiling::ScopedTimer timer("PieceMeshStore::Shift");

        MeshData& mesh = *m_Live;
        const glm::dvec2 delta(static_cast<double>(decision.Delta.x), static_cast<double>(decision.Delta.y));
        const uint32_t stride = mesh.Layout.GetStride();

        // Placeholders stay all-zero so a shifted mesh matches a rebuilt one.
        for (uint32_t quad = 0; quad < mesh.Slots.size(); ++quad)
        {
            if (!mesh.Slots[quad]) continue;
            QuadEncoder::TranslatePositions(QuadSpan(mesh, quad), stride, delta);
        }
        QuadEncoder::Narrow(mesh.Source, mesh.Render);
        mesh.Offset = decision.NewOffset;
        mesh.Buffer->UpdateRange(0, mesh.Render.size() * sizeof(float));

        if (mesh.Mirror)
        {
            mesh.Mirror->DeriveAll(mesh.Source);
            if (m_Scheduler.IsAlive(m_MirrorJob))
            {
                // Everything is derived now; publish instead of finishing the job.
                m_Scheduler.Discard(m_MirrorJob);
                m_MirrorJob = {};
                if (!mesh.Mirror->Publish(m_Factory, m_Config.Texture)) mesh.Mirror.reset();
            }
            else
            {
                mesh.Mirror->UploadAll();
            }
        }

        Core::Log::Debug("Shifted piece mesh by ({}, {}) to offset ({}, {}).",
                         decision.Delta.x, decision.Delta.y, mesh.Offset.x, mesh.Offset.y);
        return {ShiftOutcome::Shifted, decision.Delta};
    }

    // =========================================================================
    // Rendering & queries
    // =========================================================================

    void PieceMeshStore::Render(const ViewState& view)
    {
        if (!m_Live || !m_Live->Buffer) return;

        const glm::vec3 position(static_cast<float>(static_cast<double>(m_Live->Offset.x) - view.Focus.x),
                                 static_cast<float>(static_cast<double>(m_Live->Offset.y) - view.Focus.y),
                                 0.0f);
        const glm::vec3 scale(static_cast<float>(view.Scale), static_cast<float>(view.Scale), 1.0f);

        RHI::IVertexBuffer* buffer = m_Live->Buffer.get();
        if (view.ReversedPerspective && IsMirrorReady()) buffer = m_Live->Mirror->GetBuffer();

        buffer->Render(position, scale);
    }

    std::optional<BoardCoords> PieceMeshStore::GetOffset() const
    {
        if (!m_Live) return std::nullopt;
        return m_Live->Offset;
    }

    std::optional<RHI::VertexLayout> PieceMeshStore::GetLayout() const
    {
        if (!m_Live) return std::nullopt;
        return m_Live->Layout;
    }

    uint32_t PieceMeshStore::GetQuadCount() const
    {
        return m_Live ? static_cast<uint32_t>(m_Live->Slots.size()) : 0;
    }

    std::span<const double> PieceMeshStore::GetSourceData() const
    {
        if (!m_Live) return {};
        return m_Live->Source;
    }

    std::span<const float> PieceMeshStore::GetRenderData() const
    {
        if (!m_Live) return {};
        return m_Live->Render;
    }

    std::optional<std::span<const double>> PieceMeshStore::GetQuadSource(PieceSlot slot) const
    {
        if (!m_Live) return std::nullopt;
        auto quad = ResolveQuad(*m_Live, slot);
        if (!quad) return std::nullopt;

        const std::size_t floats = QuadFloats(*m_Live);
        return std::span<const double>(m_Live->Source).subspan(*quad * floats, floats);
    }

    std::optional<std::span<const float>> PieceMeshStore::GetQuadRender(PieceSlot slot) const
    {
        if (!m_Live) return std::nullopt;
        auto quad = ResolveQuad(*m_Live, slot);
        if (!quad) return std::nullopt;

        const std::size_t floats = QuadFloats(*m_Live);
        return std::span<const float>(m_Live->Render).subspan(*quad * floats, floats);
    }

    bool PieceMeshStore::IsMirrorReady() const
    {
        return m_Live && m_Live->Mirror && m_Live->Mirror->IsPublished();
    }

    std::span<const float> PieceMeshStore::GetMirrorRenderData() const
    {
        if (!m_Live || !m_Live->Mirror) return {};
        return m_Live->Mirror->GetRenderData();
    }

    RHI::IVertexBuffer* PieceMeshStore::GetBuffer() const
    {
        return m_Live ? m_Live->Buffer.get() : nullptr;
    }

    RHI::IVertexBuffer* PieceMeshStore::GetMirrorBuffer() const
    {
        return IsMirrorReady() ? m_Live->Mirror->GetBuffer() : nullptr;
    }

    std::optional<uint32_t> PieceMeshStore::GetRemainingPlaceholders(uint32_t bucket) const
    {
        if (!m_Live || bucket >= m_Live->Buckets.size()) return std::nullopt;

        const BucketLayout& layout = m_Live->Buckets[bucket];
        const auto first = m_Live->Slots.begin() + layout.FirstQuad;
        return static_cast<uint32_t>(std::count(first, first + layout.Capacity, std::nullopt));
    }

    uint32_t PieceMeshStore::GetPlaceholderReserve(PieceTypeId type) const
    {
        uint32_t reserve = m_Config.PlaceholdersPerBucket;
        if (auto it = m_Reserve.find(type); it != m_Reserve.end()) reserve = it->second;
        return std::min(reserve, m_Config.MaxPlaceholdersPerBucket);
    }

    std::optional<Core::Tasks::JobProgress> PieceMeshStore::GetProgress() const
    {
        return m_Scheduler.GetProgress(m_BuildJob);
    }

    // =========================================================================
    // Helpers
    // =========================================================================

    Core::Expected<uint32_t> PieceMeshStore::ResolveQuad(const MeshData& mesh, PieceSlot slot)
    {
        if (slot.Bucket >= mesh.Buckets.size()) return Core::Err<uint32_t>(Core::ErrorCode::OutOfRange);

        const BucketLayout& bucket = mesh.Buckets[slot.Bucket];
        if (slot.Slot >= bucket.Capacity) return Core::Err<uint32_t>(Core::ErrorCode::OutOfRange);

        return bucket.FirstQuad + slot.Slot;
    }

    void PieceMeshStore::EncodeQuad(MeshData& mesh, uint32_t quad, const BucketLayout& bucket,
                                    const std::optional<BoardCoords>& coords,
                                    const std::optional<glm::vec4>& color) const
    {
        std::span<double> block = QuadSpan(mesh, quad);

        if (!coords)
        {
            std::fill(block.begin(), block.end(), 0.0);
        }
        else
        {
            TexRect tex = m_Atlas.GetTexRect(bucket.Type);
            if (mesh.InvertTextures) tex = tex.Inverted();

            std::optional<glm::vec4> tint;
            if (mesh.Tint) tint = color ? *color : mesh.Tint->GetColor(bucket.Player);

            const auto bounds = QuadEncoder::SquareBounds(*coords, mesh.Offset, m_Config.SquareCenter);
            QuadEncoder::WriteTexturedQuad(block, bounds, tex, tint);
        }

        const std::size_t floats = QuadFloats(mesh);
        QuadEncoder::Narrow(block, std::span<float>(mesh.Render).subspan(static_cast<std::size_t>(quad) * floats, floats));
        mesh.Slots[quad] = coords;
    }

    std::optional<glm::vec4> PieceMeshStore::ReadColor(const MeshData& mesh, uint32_t quad)
    {
        if (!mesh.Layout.HasColor()) return std::nullopt;

        const std::size_t at = static_cast<std::size_t>(quad) * QuadFloats(mesh)
                               + mesh.Layout.PositionComponents + mesh.Layout.TexCoordComponents;
        return glm::vec4(static_cast<float>(mesh.Source[at]), static_cast<float>(mesh.Source[at + 1]),
                         static_cast<float>(mesh.Source[at + 2]), static_cast<float>(mesh.Source[at + 3]));
    }

    void PieceMeshStore::UploadQuad(MeshData& mesh, uint32_t quad)
    {
        const std::size_t bytes = QuadFloats(mesh) * sizeof(float);
        if (mesh.Buffer) mesh.Buffer->UpdateRange(static_cast<std::size_t>(quad) * bytes, bytes);
        if (mesh.Mirror) mesh.Mirror->UploadQuad(quad);
    }

    std::span<double> PieceMeshStore::QuadSpan(MeshData& mesh, uint32_t quad)
    {
        const std::size_t floats = QuadFloats(mesh);
        return std::span<double>(mesh.Source).subspan(static_cast<std::size_t>(quad) * floats, floats);
    }

    std::size_t PieceMeshStore::QuadFloats(const MeshData& mesh)
    {
        return static_cast<std::size_t>(QuadEncoder::VERTICES_PER_QUAD) * mesh.Layout.GetStride();
    }

    BoardPieces PieceMeshStore::SnapshotBoard(const MeshData& mesh)
    {
        BoardPieces board;
        board.Buckets.reserve(mesh.Buckets.size());
        for (const BucketLayout& layout : mesh.Buckets)
        {
            PieceBucket bucket;
            bucket.Type = layout.Type;
            bucket.Player = layout.Player;
            bucket.ReservesPlaceholders = layout.ReservesPlaceholders;

            const auto first = mesh.Slots.begin() + layout.FirstQuad;
            bucket.Slots.assign(first, first + layout.Capacity);
            board.Buckets.push_back(std::move(bucket));
        }
        return board;
    }

    void PieceMeshStore::GrowReserve(PieceTypeId type)
    {
        const uint32_t current = GetPlaceholderReserve(type);
        const uint32_t next = std::min(std::max(current * 2, 1u), m_Config.MaxPlaceholdersPerBucket);
        m_Reserve[type] = next;
        Core::Log::Warn("Placeholders for piece type {} exhausted; reserve {} -> {}.", type, current, next);
    }
}
