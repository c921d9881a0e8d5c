#pragma once
#include <GenViewer/SceneGraph.hpp>
#include <GenViewer/RotationController.hpp>

namespace GenViewer {

// Everything one viewer session mutates, owned by the application and handed
// to components by reference. Lives as long as the window.
struct ViewerState {
    SceneGraph scene;
    RotationState rotation;
};

} // namespace GenViewer
