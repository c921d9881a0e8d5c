#pragma once

#include <memory>
#include <glm/glm.hpp>
#include <GenViewer/SceneRenderer.hpp>
#include <GenViewer/Mesh.hpp>

struct GLFWwindow;

namespace GenViewer {

// OpenGL 3.3 core renderer drawing straight into the window's default
// framebuffer. Must be created, used and destroyed on the thread owning the
// GL context. The displayed mesh is uploaded lazily and re-uploaded whenever
// the scene's pivot wraps a different Mesh.
class GLSceneRenderer : public ISceneRenderer {
public:
    explicit GLSceneRenderer(GLFWwindow* window);
    ~GLSceneRenderer() override;

    GLSceneRenderer(const GLSceneRenderer&) = delete;
    GLSceneRenderer& operator=(const GLSceneRenderer&) = delete;

    void render(const SceneGraph& scene) override;
    void present() override;

    // False when the shader program failed to build; render() then only clears
    bool isReady() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    GLFWwindow* window_ = nullptr;
    glm::vec3 clearColor_{0.0f, 0.0f, 0.0f};
    glm::vec3 baseColor_{0.8f, 0.8f, 0.9f};
};

} // namespace GenViewer
