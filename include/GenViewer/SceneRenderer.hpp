#pragma once

namespace GenViewer {

class SceneGraph;

// Backend that draws a SceneGraph. render() may be called with an empty scene.
struct ISceneRenderer {
    virtual ~ISceneRenderer() = default;
    virtual void render(const SceneGraph& scene) = 0;
    virtual void present() = 0;
};

} // namespace GenViewer
