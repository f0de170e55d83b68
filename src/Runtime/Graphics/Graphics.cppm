export module Graphics;

export import :Mesh;
export import :MeshStore;
export import :Components;
