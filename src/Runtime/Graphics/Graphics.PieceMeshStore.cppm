module;

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <unordered_map>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

export module Graphics:PieceMeshStore;

import :BoardTypes;
import :CoordinateOffset;
import :MirroredMesh;
import :RegenerationState;
import Core;
import RHI;

export namespace Graphics
{
    enum class ShiftOutcome : uint8_t
    {
        Unchanged,  // Offset already nearest to the focus
        Shifted,    // Vertices moved linearly
        Regenerated // Delta too large (or a rebuild was in flight); rebuilt instead
    };

    struct ShiftResult
    {
        ShiftOutcome Outcome = ShiftOutcome::Unchanged;
        BoardCoords Delta{0}; // old offset - new offset, when Shifted
    };

    // -------------------------------------------------------------------------
    // PieceMeshStore - Vertex data of every piece on the board
    // -------------------------------------------------------------------------
    //
    // Layout: buckets are laid out back to back in board order. A bucket
    // holds one quad per slot followed by its trailing placeholders, so a
    // slot always maps to the same byte range:
    //
    //   [ bucket 0: slot 0 .. slot n-1 | placeholders ][ bucket 1: ... ] ...
    //
    // Two parallel arrays back the mesh: the double "source" array is the
    // precise copy every edit is applied to, the float "render" array is
    // what the renderer reads. They only differ by QuadEncoder::Narrow().
    //
    // Lifecycle:
    // - Regenerate() builds new arrays through the cooperative scheduler and
    //   swaps them in atomically once complete. A newer request cancels the
    //   running build at its next yield; only the newest request publishes.
    // - Move/Delete/Overwrite patch one quad synchronously. While a build is
    //   in flight they also go to a queue that is replayed against the fresh
    //   arrays before those are published.
    // - Shift() re-expresses all positions relative to a new offset.
    //
    // Contract: single logical thread; the scheduler must outlive the store.
    // -------------------------------------------------------------------------
    class PieceMeshStore
    {
    public:
        struct Config
        {
            uint32_t PlaceholdersPerBucket = 5;
            uint32_t MaxPlaceholdersPerBucket = 1024;
            double SquareCenter = 0.5;
            CoordinateOffsetPolicy::Config Offset{};
            std::optional<RHI::TextureHandle> Texture{}; // Sprite atlas
        };

        // Fired every time a new mesh is published, with its offset.
        using PublishedCallback = std::function<void(const BoardCoords& offset)>;

        PieceMeshStore(Core::Tasks::CooperativeScheduler& scheduler,
                       RHI::IBufferFactory& factory,
                       const ITextureAtlas& atlas);
        PieceMeshStore(const Config& config,
                       Core::Tasks::CooperativeScheduler& scheduler,
                       RHI::IBufferFactory& factory,
                       const ITextureAtlas& atlas);
        ~PieceMeshStore();

        PieceMeshStore(const PieceMeshStore&) = delete;
        PieceMeshStore& operator=(const PieceMeshStore&) = delete;

        // Rebuilds the whole mesh from a board snapshot. The offset is the
        // grid point nearest to view.Focus. Never blocks: the work runs in
        // scheduler ticks.
        void Regenerate(const BoardPieces& board, const ViewState& view,
                        std::optional<TintConfig> tint = std::nullopt);

        // Drives the in-flight build (and any build queued behind it) to the
        // end without yielding.
        void FinishPendingWork();

        // ---------------------------------------------------------------
        // Patches (O(1) in piece count, never suspend)
        // ---------------------------------------------------------------
        Core::Result Move(PieceSlot slot, const BoardCoords& to);
        Core::Result Delete(PieceSlot slot);

        // Writes a live piece into an empty slot of a bucket of `type`.
        // ResourceExhausted if the slot lies past the bucket's reservation;
        // the reservation for that type is enlarged for the next Regenerate().
        Core::Result Overwrite(PieceSlot slot, PieceTypeId type, const BoardCoords& at,
                               const std::optional<TintConfig>& tint = std::nullopt);

        ShiftResult Shift(const glm::dvec2& focus);

        void SetMirrorEnabled(bool enabled);

        void Render(const ViewState& view);

        void SetOnPublished(PublishedCallback callback) { m_OnPublished = std::move(callback); }

        // ---------------------------------------------------------------
        // Queries
        // ---------------------------------------------------------------
        [[nodiscard]] RegenerationState GetState() const { return m_State.GetState(); }
        [[nodiscard]] bool HasMesh() const { return m_Live != nullptr; }
        [[nodiscard]] std::optional<BoardCoords> GetOffset() const;
        [[nodiscard]] std::optional<RHI::VertexLayout> GetLayout() const;
        [[nodiscard]] uint32_t GetQuadCount() const;

        [[nodiscard]] std::span<const double> GetSourceData() const;
        [[nodiscard]] std::span<const float> GetRenderData() const;
        [[nodiscard]] std::optional<std::span<const double>> GetQuadSource(PieceSlot slot) const;
        [[nodiscard]] std::optional<std::span<const float>> GetQuadRender(PieceSlot slot) const;

        [[nodiscard]] bool IsMirrorEnabled() const { return m_MirrorEnabled; }
        [[nodiscard]] bool IsMirrorReady() const;
        [[nodiscard]] std::span<const float> GetMirrorRenderData() const;

        [[nodiscard]] RHI::IVertexBuffer* GetBuffer() const;
        [[nodiscard]] RHI::IVertexBuffer* GetMirrorBuffer() const;

        // Empty slots (holes and trailing placeholders) left in a bucket.
        [[nodiscard]] std::optional<uint32_t> GetRemainingPlaceholders(uint32_t bucket) const;
        [[nodiscard]] uint32_t GetPlaceholderReserve(PieceTypeId type) const;

        // Number of builds started, including ones that were later cancelled.
        [[nodiscard]] uint64_t GetRegenerationCount() const { return m_RegenerationCount; }
        [[nodiscard]] uint64_t GetPublishCount() const { return m_PublishCount; }
        [[nodiscard]] uint64_t GetCancelCount() const { return m_CancelCount; }
        [[nodiscard]] std::size_t GetQueuedPatchCount() const { return m_Patches.size(); }
        [[nodiscard]] std::optional<Core::Tasks::JobProgress> GetProgress() const;

    private:
        struct BucketLayout
        {
            PieceTypeId Type = 0;
            uint32_t Player = 0;
            bool ReservesPlaceholders = true;
            uint32_t FirstQuad = 0;
            uint32_t Capacity = 0;
        };

        struct MeshData
        {
            BoardCoords Offset{0};
            std::optional<TintConfig> Tint;
            bool InvertTextures = false;
            RHI::VertexLayout Layout;
            std::vector<BucketLayout> Buckets;
            std::vector<std::optional<BoardCoords>> Slots; // One per quad
            std::vector<double> Source;
            std::vector<float> Render;
            std::unique_ptr<RHI::IVertexBuffer> Buffer;
            std::unique_ptr<MirroredMesh> Mirror;
        };

        struct BuildRequest
        {
            BoardPieces Board;
            ViewState View;
            std::optional<TintConfig> Tint;
        };

        struct Build
        {
            BuildRequest Request;
            std::unique_ptr<MeshData> Mesh;
            bool WithMirror = false;
            uint32_t CursorBucket = 0; // Next slot to encode
            uint32_t CursorSlot = 0;
        };

        enum class PatchKind : uint8_t { Move, Delete, Overwrite };

        struct Patch
        {
            PatchKind Kind = PatchKind::Move;
            PieceSlot Slot;
            PieceTypeId Type = 0;
            BoardCoords Coords{0};
            std::optional<TintConfig> Tint;
        };

        void StartBuild(BuildRequest request);
        void BuildItem(uint64_t item);
        void OnBuildFinished(Core::Tasks::JobStatus status);
        void Publish(std::unique_ptr<MeshData> mesh);

        void StartMirrorBuild();
        void DropMirror();

        [[nodiscard]] BucketLayout MakeBucketLayout(const PieceBucket& bucket, uint32_t firstQuad) const;
        [[nodiscard]] std::optional<BucketLayout> GetPendingBucketLayout(uint32_t bucket) const;

        Core::Result Submit(const Patch& patch);
        [[nodiscard]] Core::Result CheckQueuedPatch(const Patch& patch) const;
        Core::Result ApplyPatch(MeshData& mesh, const Patch& patch, bool strict);
        [[nodiscard]] static Core::Expected<uint32_t> ResolveQuad(const MeshData& mesh, PieceSlot slot);
        void EncodeQuad(MeshData& mesh, uint32_t quad, const BucketLayout& bucket,
                        const std::optional<BoardCoords>& coords, const std::optional<glm::vec4>& color) const;
        [[nodiscard]] static std::optional<glm::vec4> ReadColor(const MeshData& mesh, uint32_t quad);
        static void UploadQuad(MeshData& mesh, uint32_t quad);

        [[nodiscard]] static std::span<double> QuadSpan(MeshData& mesh, uint32_t quad);
        [[nodiscard]] static std::size_t QuadFloats(const MeshData& mesh);
        [[nodiscard]] static BoardPieces SnapshotBoard(const MeshData& mesh);
        void GrowReserve(PieceTypeId type);

        Config m_Config;
        CoordinateOffsetPolicy m_OffsetPolicy;
        Core::Tasks::CooperativeScheduler& m_Scheduler;
        RHI::IBufferFactory& m_Factory;
        const ITextureAtlas& m_Atlas;

        RegenerationStateMachine m_State;
        std::unique_ptr<MeshData> m_Live;
        std::unique_ptr<Build> m_Build;
        std::optional<BuildRequest> m_Queued;
        std::vector<Patch> m_Patches;
        Core::Tasks::JobHandle m_BuildJob;
        Core::Tasks::JobHandle m_MirrorJob;

        bool m_MirrorEnabled = false;
        std::unordered_map<PieceTypeId, uint32_t> m_Reserve;
        PublishedCallback m_OnPublished;

        uint64_t m_RegenerationCount = 0;
        uint64_t m_PublishCount = 0;
        uint64_t m_CancelCount = 0;
    };
}
