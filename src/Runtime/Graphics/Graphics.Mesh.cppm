module;
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <glm/glm.hpp>

export module Graphics:Mesh;

export namespace Graphics
{
    enum class PrimitiveTopology
    {
        Triangles,
        Lines,
        Points
    };

    // Named per-vertex auxiliary data (UVs, weights, custom attributes).
    struct AttributeLayer
    {
        std::string Name;
        std::vector<glm::vec4> Values;
    };

    // CPU-side tessellated geometry as produced by the evaluation service.
    struct MeshData
    {
        std::vector<glm::vec3> Positions;
        std::vector<glm::vec3> Normals;
        std::vector<uint32_t> Indices;
        PrimitiveTopology Topology = PrimitiveTopology::Triangles;
        std::vector<AttributeLayer> Layers;

        [[nodiscard]] bool Empty() const { return Positions.empty(); }
        [[nodiscard]] size_t VertexCount() const { return Positions.size(); }

        // Moves every vertex by `offset`. Normals and layers are unaffected.
        void Translate(const glm::vec3& offset)
        {
            for (glm::vec3& p : Positions)
                p += offset;
        }

        [[nodiscard]] const AttributeLayer* FindLayer(std::string_view name) const
        {
            for (const AttributeLayer& layer : Layers)
            {
                if (layer.Name == name)
                    return &layer;
            }
            return nullptr;
        }
    };
}
