#pragma once
#include <cmath>
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <glm/gtc/matrix_transform.hpp>

namespace GenViewer {

/**
 * @brief Position, rotation and scale of a scene node.
 */
struct Transform {
    glm::vec3 position{0.0f, 0.0f, 0.0f};
    glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f}; // Identity quaternion (w, x, y, z)
    glm::vec3 scale{1.0f, 1.0f, 1.0f};

    /**
     * @brief TRS matrix (translate * rotate * scale)
     */
    glm::mat4 toMatrix() const {
        glm::mat4 t = glm::translate(glm::mat4(1.0f), position);
        glm::mat4 r = glm::mat4_cast(rotation);
        glm::mat4 s = glm::scale(glm::mat4(1.0f), scale);
        return t * r * s;
    }

    /**
     * @brief Replace the rotation with a turn of `radians` about +Y
     */
    void setYaw(float radians) {
        rotation = glm::angleAxis(radians, glm::vec3(0.0f, 1.0f, 0.0f));
    }

    // Yaw recovered from the quaternion, in (-pi, pi]
    float yaw() const {
        glm::vec3 fwd = rotation * glm::vec3(0.0f, 0.0f, 1.0f);
        return std::atan2(fwd.x, fwd.z);
    }
};

} // namespace GenViewer
