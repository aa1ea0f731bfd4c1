module;

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>

#include <glm/glm.hpp>

export module RHI:VertexBuffer;

export namespace RHI
{
    enum class PrimitiveKind : uint8_t
    {
        Triangles,
        Lines
    };

    // Interleaved float attributes, in this order: position, [texcoord], [color].
    struct VertexLayout
    {
        uint32_t PositionComponents = 2;
        uint32_t TexCoordComponents = 0;
        uint32_t ColorComponents = 0;

        [[nodiscard]] constexpr uint32_t GetStride() const
        {
            return PositionComponents + TexCoordComponents + ColorComponents;
        }

        [[nodiscard]] constexpr uint32_t GetStrideBytes() const
        {
            return GetStride() * static_cast<uint32_t>(sizeof(float));
        }

        [[nodiscard]] constexpr bool HasTexCoords() const { return TexCoordComponents != 0; }
        [[nodiscard]] constexpr bool HasColor() const { return ColorComponents != 0; }

        constexpr bool operator==(const VertexLayout&) const = default;
    };

    struct TextureHandle
    {
        uint32_t Id = 0;
        constexpr bool operator==(const TextureHandle&) const = default;
    };

    // -------------------------------------------------------------------------
    // IVertexBuffer - A drawable built from a host vertex array
    // -------------------------------------------------------------------------
    // The buffer keeps a view of the host array it was created from.
    // UpdateRange() re-reads bytes [byteOffset, byteOffset + byteLength) of
    // that array, so the array must outlive the buffer and must not be
    // reallocated.
    class IVertexBuffer
    {
    public:
        virtual ~IVertexBuffer() = default;

        virtual void UpdateRange(std::size_t byteOffset, std::size_t byteLength) = 0;
        virtual void Render(const glm::vec3& position, const glm::vec3& scale) = 0;

        [[nodiscard]] virtual std::size_t GetSizeBytes() const = 0;
        [[nodiscard]] virtual uint32_t GetVertexCount() const = 0;
        [[nodiscard]] virtual const VertexLayout& GetLayout() const = 0;
        [[nodiscard]] virtual PrimitiveKind GetPrimitiveKind() const = 0;
    };

    class IBufferFactory
    {
    public:
        virtual ~IBufferFactory() = default;

        [[nodiscard]] virtual std::unique_ptr<IVertexBuffer> CreateBuffer(std::span<const float> vertices,
                                                                          const VertexLayout& layout,
                                                                          PrimitiveKind kind,
                                                                          std::optional<TextureHandle> texture) = 0;
    };
}
