#include <GenViewer/SceneGraph.hpp>
#include <plog/Log.h>
#include <string>
#include <glm/gtc/matrix_transform.hpp>

namespace GenViewer {

glm::mat4 Camera::view() const {
    return glm::lookAt(position, target, glm::vec3(0.0f, 1.0f, 0.0f));
}

glm::mat4 Camera::projection() const {
    float a = aspect > 0.0f ? aspect : 1.0f;
    return glm::perspective(glm::radians(fovDegrees), a, nearPlane, farPlane);
}

SceneGraph::SceneGraph(){
    PLOGV << "scene:created fov=" << camera_.fovDegrees << " camera_z=" << camera_.position.z << " ambient=" << light_.intensity;
}

SceneGraph::~SceneGraph(){
    if(model_) model_->attached_ = false;
}

std::unique_ptr<Pivot> SceneGraph::replaceModel(std::unique_ptr<Pivot> pivot){
    if(!pivot){
        PLOGW << "scene:replaceModel called with null pivot, ignoring";
        return nullptr;
    }
    std::unique_ptr<Pivot> previous = std::move(model_);
    if(previous) previous->attached_ = false;
    pivot->attached_ = true;
    model_ = std::move(pivot);
    ++revision_;
    PLOGI << "scene:model replaced id=" << model_->id() << (previous ? " (detached id=" + std::to_string(previous->id()) + ")" : std::string());
    return previous;
}

std::unique_ptr<Pivot> SceneGraph::clearModel(){
    std::unique_ptr<Pivot> previous = std::move(model_);
    if(previous){
        previous->attached_ = false;
        ++revision_;
        PLOGD << "scene:model cleared id=" << previous->id();
    }
    return previous;
}

void SceneGraph::setViewportSize(int width, int height){
    if(width <= 0 || height <= 0) return; // minimized
    viewportW_ = width;
    viewportH_ = height;
    camera_.aspect = static_cast<float>(width) / static_cast<float>(height);
}

} // namespace GenViewer
