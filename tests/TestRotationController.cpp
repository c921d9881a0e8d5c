#include <GenViewer/RotationController.hpp>

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

using namespace GenViewer;

TEST(RotationController, StartsAtZero)
{
    RotationState state;
    RotationController rc{state};
    ASSERT_EQ(rc.angle(), 0.0);
}

TEST(RotationController, DragSequenceAccumulatesScaledBySensitivity)
{
    RotationState state;
    RotationController rc{state};
    for (double dx : {100.0, -50.0, 200.0}) {
        rc.onDrag(dx);
    }
    ASSERT_NEAR(rc.angle(), 0.25, 1e-9);
    ASSERT_NEAR(state.angle, 0.25, 1e-9);
}

TEST(RotationController, AngleEqualsSumOfDeltasTimesSensitivity)
{
    RotationState state;
    RotationController rc{state};
    std::vector<double> deltas = {3.0, -17.5, 42.0, 0.0, 1000.0, -250.25, 7.0};
    double sum = 0.0;
    for (double d : deltas) {
        rc.onDrag(d);
        sum += d;
    }
    ASSERT_NEAR(rc.angle(), sum * RotationController::kSensitivity, 1e-9);
}

TEST(RotationController, VerticalMovementIsIgnored)
{
    RotationState state;
    RotationController rc{state};
    rc.onDrag(0.0, 500.0);
    rc.onDrag(10.0, -300.0);
    ASSERT_NEAR(rc.angle(), 0.01, 1e-9);
}

TEST(RotationController, NeverClampsLargeAngles)
{
    RotationState state;
    RotationController rc{state};
    for (int i = 0; i < 100; ++i) {
        rc.onDrag(1000.0);  // 1 rad per step
    }
    ASSERT_NEAR(rc.angle(), 100.0, 1e-9);
}

TEST(RotationController, SmallDragsStillCountAtLargeAngles)
{
    RotationState state;
    state.angle = 40000.0;
    RotationController rc{state};
    for (int i = 0; i < 1000; ++i) {
        rc.onDrag(1.0);
    }
    ASSERT_NEAR(rc.angle() - 40000.0, 1.0, 1e-6);
}

TEST(RotationController, SharesStateWithOtherReaders)
{
    RotationState state;
    state.angle = 1.5;
    RotationController rc{state};
    rc.onDrag(500.0);
    ASSERT_NEAR(state.angle, 2.0, 1e-9);
}

TEST(RotationController, PointerMovesBelowDragThresholdAreNotLost)
{
    RotationState state;
    RotationController rc{state};
    // five one-pixel moves with the button held: a 5 px drag in total
    for (int i = 0; i < 5; ++i) {
        rc.onPointerMove(true, 1.0, 0.0);
    }
    ASSERT_NEAR(rc.angle(), 0.005, 1e-9);
}

TEST(RotationController, PointerMovesWithoutButtonAreIgnored)
{
    RotationState state;
    RotationController rc{state};
    rc.onPointerMove(false, 300.0, 0.0);
    rc.onPointerMove(true, 0.0, 40.0);
    ASSERT_EQ(rc.angle(), 0.0);
    rc.onPointerMove(true, 300.0, 40.0);
    ASSERT_NEAR(rc.angle(), 0.3, 1e-9);
}

TEST(WrapAngle, ReducesIntoZeroToTwoPi)
{
    const double twoPi = 6.28318530717958647692;
    ASSERT_NEAR(wrapAngle(0.25), 0.25, 1e-12);
    ASSERT_NEAR(wrapAngle(twoPi + 0.5), 0.5, 1e-9);
    ASSERT_NEAR(wrapAngle(-0.5), twoPi - 0.5, 1e-9);
    double big = wrapAngle(100.0);
    ASSERT_GE(big, 0.0);
    ASSERT_LT(big, twoPi);
    ASSERT_NEAR(std::sin(big), std::sin(100.0), 1e-9);
    ASSERT_NEAR(std::cos(big), std::cos(100.0), 1e-9);
}
