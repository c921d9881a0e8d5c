#include <GenViewer/ModelNormalizer.hpp>
#include <plog/Log.h>
#include <tracy/Tracy.hpp>

namespace GenViewer {

glm::vec3 ModelNormalizer::centeringOffset(const BoundingBox& box){
    if(!box.valid) return glm::vec3(0.0f);
    return -box.center();
}

std::unique_ptr<Pivot> ModelNormalizer::normalize(std::shared_ptr<const Mesh> mesh){
    ZoneScopedN("ModelNormalizer::normalize");
    if(!mesh){
        PLOGW << "normalize: null mesh";
        return nullptr;
    }
    BoundingBox box = mesh->bounds();
    glm::vec3 offset = centeringOffset(box);
    if(box.isDegenerate()) PLOGD << "normalize: degenerate bounds for '" << mesh->name << "'";
    PLOGV << "normalize: '" << mesh->name << "' center=(" << box.center().x << "," << box.center().y << "," << box.center().z << ")";
    auto pivot = std::make_unique<Pivot>(std::move(mesh), offset);
    pivot->transform() = Transform();
    return pivot;
}

} // namespace GenViewer
