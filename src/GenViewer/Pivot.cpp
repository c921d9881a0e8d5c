#include <GenViewer/Pivot.hpp>
#include <atomic>
#include <utility>
#include <glm/gtc/matrix_transform.hpp>

namespace GenViewer {

namespace {
std::atomic<uint64_t> s_nextPivotId{1};
}

Pivot::Pivot(std::shared_ptr<const Mesh> mesh, const glm::vec3& meshOffset)
    : mesh_(std::move(mesh)), meshOffset_(meshOffset), id_(s_nextPivotId.fetch_add(1)) {}

glm::mat4 Pivot::meshMatrix() const {
    return transform_.toMatrix() * glm::translate(glm::mat4(1.0f), meshOffset_);
}

BoundingBox Pivot::localBounds() const {
    BoundingBox box;
    if(!mesh_) return box;
    for(const auto& p : mesh_->positions) box.expand(p + meshOffset_);
    return box;
}

} // namespace GenViewer
