#pragma once
#include <memory>
#include <cstdint>
#include <glm/glm.hpp>
#include <GenViewer/Mesh.hpp>
#include <GenViewer/Transform.hpp>

namespace GenViewer {

class SceneGraph;

/**
 * @brief Transform node wrapping exactly one Mesh.
 *
 * The mesh is attached as a child offset by `meshOffset` (normally minus the
 * mesh's bounding-box center), so rotating the pivot spins the mesh about its
 * own center. Only SceneGraph flips the attached flag.
 */
class Pivot {
public:
    Pivot(std::shared_ptr<const Mesh> mesh, const glm::vec3& meshOffset);

    const std::shared_ptr<const Mesh>& mesh() const { return mesh_; }
    const glm::vec3& meshOffset() const { return meshOffset_; }

    Transform& transform() { return transform_; }
    const Transform& transform() const { return transform_; }

    // Pivot-space model matrix of the wrapped mesh (pivot TRS * child offset)
    glm::mat4 meshMatrix() const;

    // Bounds of the mesh after the child offset, in pivot space (unrotated)
    BoundingBox localBounds() const;

    uint64_t id() const { return id_; }
    bool isAttached() const { return attached_; }

private:
    friend class SceneGraph;

    std::shared_ptr<const Mesh> mesh_;
    glm::vec3 meshOffset_{0.0f};
    Transform transform_;
    uint64_t id_ = 0;
    bool attached_ = false;
};

} // namespace GenViewer
