#include <GenViewer/RenderLoop.hpp>
#include <plog/Log.h>
#include <tracy/Tracy.hpp>

namespace GenViewer {

RenderLoop::RenderLoop(ViewerState& state, ISceneRenderer& renderer)
    : state_(state), renderer_(renderer) {}

void RenderLoop::start(){
    if(running_) return;
    running_ = true;
    scheduled_ = true;
    PLOGD << "render:loop started at frame " << frames_;
}

void RenderLoop::stop(){
    if(!running_) return;
    running_ = false;
    scheduled_ = false;
    PLOGD << "render:loop stopped at frame " << frames_;
}

bool RenderLoop::tick(){
    if(!scheduled_) return false;
    ZoneScopedN("RenderLoop::tick");
    // re-arm first; stop() during this frame cancels the next one only
    scheduled_ = running_;

    if(Pivot* pivot = state_.scene.currentModel()){
        pivot->transform().setYaw(static_cast<float>(wrapAngle(state_.rotation.angle)));
    }
    renderer_.render(state_.scene);
    if(overlay_) overlay_();
    renderer_.present();
    ++frames_;
    FrameMark;
    return true;
}

} // namespace GenViewer
