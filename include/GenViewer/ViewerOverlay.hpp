#pragma once

#include <optional>
#include <GenViewer/OperationCoordinator.hpp>
#include <GenViewer/RotationController.hpp>

namespace GenViewer {

// Dear ImGui layer over the render surface: drag-to-rotate, the "Generate" and
// "Reload Model" buttons, the busy modal and the success/error alert.
class ViewerOverlay {
public:
    ViewerOverlay(OperationCoordinator& coordinator, RotationController& rotation);

    // Forward mouse drags to the rotation controller unless ImGui owns the mouse.
    // Call after ImGui::NewFrame().
    void handleInput();

    // Build the widget tree for this frame (between NewFrame and Render)
    void draw();

private:
    void drawButtons();
    void drawBusyModal();
    void drawAlertModal();

    OperationCoordinator& coordinator_;
    RotationController& rotation_;
    std::optional<Notice> shownNotice_;
    int spinnerPhase_ = 0;
};

} // namespace GenViewer
