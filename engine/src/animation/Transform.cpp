#include "kine/animation/Transform.hpp"

#include <glm/gtc/matrix_transform.hpp>

namespace kine::animation
{
    glm::mat4 toMatrix(const BoneTransform& transform)
    {
        return glm::translate(glm::mat4(1.0f), transform.position) *
               glm::mat4_cast(transform.rotation) *
               glm::scale(glm::mat4(1.0f), transform.scale);
    }
} // namespace kine::animation
