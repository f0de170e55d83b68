module;
#define GLM_ENABLE_EXPERIMENTAL
#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtx/quaternion.hpp>
#include <entt/entity/entity.hpp>

export module ECS:Components.Transform;

export namespace ECS::Components::Transform
{
    // Object-level placement. Not part of the curve fingerprint.
    struct Component
    {
        glm::vec3 Position{0.0f};
        glm::quat Rotation{1.0f, 0.0f, 0.0f, 0.0f};
        glm::vec3 Scale{1.0f};
    };

    [[nodiscard]] glm::mat4 GetMatrix(const Component& transform)
    {
        glm::mat4 mat = glm::translate(glm::mat4(1.0f), transform.Position);
        mat = mat * glm::mat4_cast(transform.Rotation);
        mat = glm::scale(mat, transform.Scale);
        return mat;
    }
}

export namespace ECS::Components::Parent
{
    // Child-to-parent relation used to keep a generated mesh following its
    // source. ParentInverse is captured at parenting time so the child keeps
    // its world placement at the moment it was attached.
    struct Component
    {
        entt::entity Parent = entt::null;
        glm::mat4 ParentInverse{1.0f};
    };
}
