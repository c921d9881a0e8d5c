#pragma once
#include <memory>
#include <cstdint>
#include <glm/glm.hpp>
#include <GenViewer/Pivot.hpp>

namespace GenViewer {

struct Camera {
    float fovDegrees = 75.0f; // vertical
    float aspect = 1.0f;
    float nearPlane = 0.1f;
    float farPlane = 1000.0f;
    glm::vec3 position{0.0f, 0.0f, 3.0f};
    glm::vec3 target{0.0f, 0.0f, 0.0f};

    glm::mat4 view() const;
    glm::mat4 projection() const;
};

struct AmbientLight {
    glm::vec3 color{1.0f, 1.0f, 1.0f};
    float intensity = 1.0f;

    glm::vec3 radiance() const { return color * intensity; }
};

/**
 * @brief Camera, one ambient light and at most one displayed Pivot.
 *
 * replaceModel() is the only way a pivot enters the scene and it always
 * detaches the previous occupant first, so the scene never holds two pivots.
 * All calls happen on the main thread, between render ticks.
 */
class SceneGraph {
public:
    SceneGraph();
    ~SceneGraph();

    SceneGraph(const SceneGraph&) = delete;
    SceneGraph& operator=(const SceneGraph&) = delete;

    // Detach the current pivot (if any) and attach `pivot`. Returns the detached
    // pivot; dropping it discards it. A null pivot is ignored and returns null.
    std::unique_ptr<Pivot> replaceModel(std::unique_ptr<Pivot> pivot);

    // Detach and return the current pivot (teardown)
    std::unique_ptr<Pivot> clearModel();

    Pivot* currentModel() { return model_.get(); }
    const Pivot* currentModel() const { return model_.get(); }
    bool hasModel() const { return model_ != nullptr; }
    size_t modelCount() const { return model_ ? 1 : 0; }

    Camera& camera() { return camera_; }
    const Camera& camera() const { return camera_; }
    const AmbientLight& ambientLight() const { return light_; }
    size_t lightCount() const { return 1; }

    // Framebuffer size change; keeps the camera aspect in sync
    void setViewportSize(int width, int height);
    int viewportWidth() const { return viewportW_; }
    int viewportHeight() const { return viewportH_; }

    // Incremented on every successful replaceModel/clearModel
    uint64_t revision() const { return revision_; }

private:
    Camera camera_;
    AmbientLight light_;
    std::unique_ptr<Pivot> model_;
    int viewportW_ = 0, viewportH_ = 0;
    uint64_t revision_ = 0;
};

} // namespace GenViewer
