module;

export module Graphics:Components;

import :MeshStore;

export namespace ECS::MeshRef
{
    // Exactly one content resource per mesh object. The object counts as a
    // user of the resource while the component points at it.
    struct Component
    {
        Graphics::MeshHandle Handle;
    };
}
