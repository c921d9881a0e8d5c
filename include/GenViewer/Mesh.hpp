#pragma once
#include <string>
#include <vector>
#include <glm/glm.hpp>

namespace GenViewer {

/**
 * @brief Axis-aligned bounding box
 */
struct BoundingBox {
    glm::vec3 min{0.0f};
    glm::vec3 max{0.0f};
    bool valid = false; // false until at least one point has been added

    void expand(const glm::vec3& p) {
        if(!valid){ min = max = p; valid = true; return; }
        min = glm::min(min, p);
        max = glm::max(max, p);
    }

    glm::vec3 center() const { return (min + max) * 0.5f; }
    glm::vec3 extent() const { return max - min; }

    // Zero volume along at least one axis (includes the single point box)
    bool isDegenerate() const {
        glm::vec3 e = extent();
        return e.x <= 0.0f || e.y <= 0.0f || e.z <= 0.0f;
    }

    static BoundingBox fromPoints(const std::vector<glm::vec3>& points) {
        BoundingBox box;
        for(const auto& p : points) box.expand(p);
        return box;
    }
};

/**
 * @brief Triangle geometry parsed from a remote asset.
 *
 * Positions are in the asset's own model space. A Mesh is never modified after
 * parsing; it is shared as std::shared_ptr<const Mesh> between the fetch worker,
 * the scene and the GPU upload cache.
 */
struct Mesh {
    std::string name;
    std::vector<glm::vec3> positions;
    std::vector<glm::vec3> normals;    // same count as positions
    std::vector<unsigned int> indices; // triangles (triplets)

    size_t vertexCount() const { return positions.size(); }
    size_t triangleCount() const { return indices.size() / 3; }
    bool empty() const { return positions.empty() || indices.empty(); }

    BoundingBox bounds() const { return BoundingBox::fromPoints(positions); }
};

} // namespace GenViewer
