module;

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <vector>

#include <glm/glm.hpp>

export module RHI:HostBuffer;

import :VertexBuffer;

export namespace RHI
{
    // -------------------------------------------------------------------------
    // HostBuffer - CPU-side IVertexBuffer for headless runs and tests
    // -------------------------------------------------------------------------
    // Keeps a "device" copy of the vertex data that only changes on creation
    // and on UpdateRange(), so callers can verify that exactly the right
    // ranges were uploaded. Draw calls are recorded instead of executed.
    class HostBuffer final : public IVertexBuffer
    {
    public:
        struct DrawCall
        {
            glm::vec3 Position{0.0f};
            glm::vec3 Scale{1.0f};
            uint32_t VertexCount = 0;
        };

        struct UploadRange
        {
            std::size_t ByteOffset = 0;
            std::size_t ByteLength = 0;
        };

        HostBuffer(std::span<const float> source, const VertexLayout& layout,
                   PrimitiveKind kind, std::optional<TextureHandle> texture);

        void UpdateRange(std::size_t byteOffset, std::size_t byteLength) override;
        void Render(const glm::vec3& position, const glm::vec3& scale) override;

        [[nodiscard]] std::size_t GetSizeBytes() const override { return m_DeviceData.size() * sizeof(float); }
        [[nodiscard]] uint32_t GetVertexCount() const override;
        [[nodiscard]] const VertexLayout& GetLayout() const override { return m_Layout; }
        [[nodiscard]] PrimitiveKind GetPrimitiveKind() const override { return m_Kind; }

        [[nodiscard]] std::span<const float> GetDeviceData() const { return m_DeviceData; }
        [[nodiscard]] const std::vector<UploadRange>& GetUploads() const { return m_Uploads; }
        [[nodiscard]] const std::vector<DrawCall>& GetDrawCalls() const { return m_DrawCalls; }
        [[nodiscard]] std::optional<TextureHandle> GetTexture() const { return m_Texture; }

    private:
        std::span<const float> m_Source;
        std::vector<float> m_DeviceData;
        VertexLayout m_Layout;
        PrimitiveKind m_Kind;
        std::optional<TextureHandle> m_Texture;

        std::vector<UploadRange> m_Uploads;
        std::vector<DrawCall> m_DrawCalls;
    };

    class HostBufferFactory final : public IBufferFactory
    {
    public:
        [[nodiscard]] std::unique_ptr<IVertexBuffer> CreateBuffer(std::span<const float> vertices,
                                                                  const VertexLayout& layout,
                                                                  PrimitiveKind kind,
                                                                  std::optional<TextureHandle> texture) override;

        // Number of buffers ever created (full uploads).
        [[nodiscard]] uint32_t GetCreateCount() const { return m_CreateCount; }

    private:
        uint32_t m_CreateCount = 0;
    };
}
