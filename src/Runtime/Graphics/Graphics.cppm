export module Graphics;

export import :BoardTypes;
export import :CoordinateOffset;
export import :QuadEncoder;
export import :RegenerationState;
export import :MirroredMesh;
export import :PieceMeshStore;
export import :VoidMeshStore;
export import :BoardMeshManager;
