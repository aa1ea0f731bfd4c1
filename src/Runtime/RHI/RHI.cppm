export module RHI;

export import :VertexBuffer;
export import :HostBuffer;
