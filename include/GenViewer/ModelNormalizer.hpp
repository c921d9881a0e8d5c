#pragma once
#include <memory>
#include <GenViewer/Mesh.hpp>
#include <GenViewer/Pivot.hpp>

namespace GenViewer {

// Wraps a freshly parsed mesh in a Pivot whose origin is the mesh's bounding-box
// center. The pivot itself sits at the world origin with identity rotation.
struct ModelNormalizer {
    // Returns nullptr only when `mesh` is null. Degenerate boxes are fine:
    // the extent is never divided by.
    static std::unique_ptr<Pivot> normalize(std::shared_ptr<const Mesh> mesh);

    // Offset that moves the box center onto the origin
    static glm::vec3 centeringOffset(const BoundingBox& box);
};

} // namespace GenViewer
