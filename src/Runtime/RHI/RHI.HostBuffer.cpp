module;
#include <algorithm>
#include <cstddef>
#include <cstring>
#include <memory>
#include <optional>
#include <span>

#include <glm/glm.hpp>

module RHI:HostBuffer.Impl;

import :HostBuffer;
import :VertexBuffer;
import Core;

namespace RHI
{
    HostBuffer::HostBuffer(std::span<const float> source, const VertexLayout& layout,
                           PrimitiveKind kind, std::optional<TextureHandle> texture)
        : m_Source(source),
          m_DeviceData(source.begin(), source.end()),
          m_Layout(layout),
          m_Kind(kind),
          m_Texture(texture)
    {
    }

    void HostBuffer::UpdateRange(std::size_t byteOffset, std::size_t byteLength)
    {
        if (byteLength == 0) return;

        const std::size_t capacity = GetSizeBytes();
        if (byteOffset + byteLength > capacity || byteOffset % sizeof(float) != 0 || byteLength % sizeof(float) != 0)
        {
            Core::Log::Error("HostBuffer::UpdateRange(): bad range. offset={} length={} cap={}",
                             byteOffset, byteLength, capacity);
            return;
        }

        std::memcpy(reinterpret_cast<std::byte*>(m_DeviceData.data()) + byteOffset,
                    reinterpret_cast<const std::byte*>(m_Source.data()) + byteOffset,
                    byteLength);
        m_Uploads.push_back({byteOffset, byteLength});
    }

    void HostBuffer::Render(const glm::vec3& position, const glm::vec3& scale)
    {
        m_DrawCalls.push_back({position, scale, GetVertexCount()});
    }

    uint32_t HostBuffer::GetVertexCount() const
    {
        const uint32_t stride = std::max(m_Layout.GetStride(), 1u);
        return static_cast<uint32_t>(m_DeviceData.size() / stride);
    }

    std::unique_ptr<IVertexBuffer> HostBufferFactory::CreateBuffer(std::span<const float> vertices,
                                                                   const VertexLayout& layout,
                                                                   PrimitiveKind kind,
                                                                   std::optional<TextureHandle> texture)
    {
        if (layout.GetStride() == 0 || vertices.size() % layout.GetStride() != 0)
        {
            Core::Log::Error("HostBufferFactory::CreateBuffer(): {} floats do not fit stride {}",
                             vertices.size(), layout.GetStride());
            return nullptr;
        }

        ++m_CreateCount;
        return std::make_unique<HostBuffer>(vertices, layout, kind, texture);
    }
}
