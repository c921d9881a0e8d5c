#pragma once

namespace GenViewer {

// Accumulated yaw of the displayed model, in radians. Unbounded: it is reduced
// modulo 2*pi only when applied to the pivot at render time. Kept in double so
// that small drags still register after many turns.
struct RotationState {
    double angle = 0.0;
};

// Maps horizontal drag distance onto RotationState::angle
class RotationController {
public:
    static constexpr double kSensitivity = 0.001; // radians per unit of drag

    explicit RotationController(RotationState& state) : state_(state) {}

    // deltaY is accepted so callers can forward raw pointer deltas; it never
    // affects the angle.
    void onDrag(double deltaX, double deltaY = 0.0);

    // Per-frame pointer movement. Every unit moved while the button is held
    // counts, with no drag threshold.
    void onPointerMove(bool buttonDown, double deltaX, double deltaY);

    double angle() const { return state_.angle; }

private:
    RotationState& state_;
};

// Reduce an angle into [0, 2*pi)
double wrapAngle(double radians);

} // namespace GenViewer
