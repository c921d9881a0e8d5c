#include <GenViewer/RotationController.hpp>
#include <cmath>

namespace GenViewer {

constexpr double RotationController::kSensitivity;

void RotationController::onDrag(double deltaX, double /*deltaY*/){
    state_.angle += deltaX * kSensitivity;
}

void RotationController::onPointerMove(bool buttonDown, double deltaX, double deltaY){
    if(!buttonDown || deltaX == 0.0) return;
    onDrag(deltaX, deltaY);
}

double wrapAngle(double radians){
    const double twoPi = 6.28318530717958647692;
    double r = std::fmod(radians, twoPi);
    if(r < 0.0) r += twoPi;
    if(r >= twoPi) r = 0.0;
    return r;
}

} // namespace GenViewer
