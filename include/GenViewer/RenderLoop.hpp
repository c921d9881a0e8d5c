#pragma once

#include <cstdint>
#include <functional>
#include <GenViewer/SceneRenderer.hpp>
#include <GenViewer/ViewerState.hpp>

namespace GenViewer {

/**
 * @brief Per-frame procedure: apply the rotation, draw, overlay, present.
 *
 * The loop is armed by start() and re-arms itself at the top of every tick, so
 * stop() (window closed or iconified) only prevents future ticks and never
 * leaves a frame half drawn.
 */
class RenderLoop {
public:
    using OverlayFn = std::function<void()>;

    RenderLoop(ViewerState& state, ISceneRenderer& renderer);

    void start();
    void stop();
    bool isRunning() const { return running_; }

    // Runs one frame if the loop is armed. Returns false when it was a no-op.
    bool tick();

    // Drawn after the scene and before present (UI overlay)
    void setOverlay(OverlayFn fn) { overlay_ = std::move(fn); }

    uint64_t frameCount() const { return frames_; }

private:
    ViewerState& state_;
    ISceneRenderer& renderer_;
    OverlayFn overlay_;
    bool running_ = false;
    bool scheduled_ = false;
    uint64_t frames_ = 0;
};

} // namespace GenViewer
