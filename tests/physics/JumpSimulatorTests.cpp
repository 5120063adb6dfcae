/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE JumpSimulatorTests
#include <boost/test/unit_test.hpp>

#include "physics/JumpSimulator.hpp"
#include "world/FlatWorld.hpp"
#include "world/SpatialQueryAdapter.hpp"

using namespace SwarmForge;

namespace {
constexpr float HEIGHT_OFFSET = 3.0f;
constexpr float FRAME = 0.016f;
constexpr Uint64 FRAME_MS = 16;
}

class JumpFixture {
public:
    JumpFixture() : queries(world, settings), jumper(settings, queries) {}

    // Step until the jump resolves; returns the final step result
    JumpSimulator::StepResult runUntilDone(JumpState& state, Vector3D& position, Uint64 startMs,
                                           int maxFrames, float* peakY = nullptr) {
        JumpSimulator::StepResult result = JumpSimulator::StepResult::Airborne;
        for (int i = 1; i <= maxFrames; ++i) {
            result = jumper.step(state, position, HEIGHT_OFFSET, FRAME, startMs + i * FRAME_MS);
            if (peakY && position.getY() > *peakY) {
                *peakY = position.getY();
            }
            if (result != JumpSimulator::StepResult::Airborne) {
                break;
            }
        }
        return result;
    }

protected:
    JumpSettings settings;
    FlatWorld world;
    SpatialQueryAdapter queries;
    JumpSimulator jumper;
};

BOOST_FIXTURE_TEST_SUITE(JumpSimulatorTests, JumpFixture)

BOOST_AUTO_TEST_CASE(TestIdleStateDoesNothing) {
    JumpState state;
    Vector3D position(0.0f, HEIGHT_OFFSET, 0.0f);
    BOOST_CHECK(jumper.step(state, position, HEIGHT_OFFSET, FRAME, 0) ==
                JumpSimulator::StepResult::NotJumping);
    BOOST_CHECK_EQUAL(position, Vector3D(0.0f, HEIGHT_OFFSET, 0.0f));
}

BOOST_AUTO_TEST_CASE(TestCannotJumpWhileAirborne) {
    JumpState state;
    BOOST_CHECK(jumper.startJump(state, 0.0f, 0));
    BOOST_CHECK_CLOSE(state.verticalVelocity, settings.defaultJumpPower, 0.001f);
    BOOST_CHECK(!jumper.startJump(state, 80.0f, 10));
    BOOST_CHECK(!jumper.startFall(state, 10));
}

BOOST_AUTO_TEST_CASE(TestJumpRisesAndLandsOnGround) {
    JumpState state;
    Vector3D position(0.0f, HEIGHT_OFFSET, 0.0f);
    BOOST_REQUIRE(jumper.startJump(state, 0.0f, 0));

    float peak = position.getY();
    auto result = runUntilDone(state, position, 0, 200, &peak);

    BOOST_CHECK(result == JumpSimulator::StepResult::Landed);
    BOOST_CHECK(!state.active);
    BOOST_CHECK_CLOSE(position.getY(), HEIGHT_OFFSET, 0.001f);

    // Discrete integration stays within a step of the analytic apex
    const float apex = jumper.apexHeight(0.0f);
    BOOST_CHECK_GT(peak, HEIGHT_OFFSET + apex * 0.9f);
    BOOST_CHECK_LT(peak, HEIGHT_OFFSET + apex * 1.1f);
}

BOOST_AUTO_TEST_CASE(TestLandOnLedgeMidAir) {
    world.addBox(Vector3D(10.0f, 0.0f, -5.0f), Vector3D(20.0f, 4.0f, 5.0f));

    JumpState state;
    Vector3D position(0.0f, HEIGHT_OFFSET, 0.0f);
    BOOST_REQUIRE(jumper.startJump(state, 0.0f, 0));

    // Rise to the apex, then drift over the ledge
    int frame = 1;
    while (state.verticalVelocity > 0.0f && frame < 100) {
        jumper.step(state, position, HEIGHT_OFFSET, FRAME, frame * FRAME_MS);
        ++frame;
    }
    BOOST_REQUIRE_GT(position.getY(), 4.0f + HEIGHT_OFFSET);
    position.setX(15.0f);

    auto result = runUntilDone(state, position, frame * FRAME_MS, 200);
    BOOST_CHECK(result == JumpSimulator::StepResult::Landed);
    BOOST_CHECK_CLOSE(position.getY(), 4.0f + HEIGHT_OFFSET, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestWalkOffLedgeFalls) {
    JumpState state;
    Vector3D position(0.0f, 12.0f, 0.0f);
    BOOST_REQUIRE(jumper.startFall(state, 0));
    BOOST_CHECK_EQUAL(state.verticalVelocity, 0.0f);

    auto result = runUntilDone(state, position, 0, 200);
    BOOST_CHECK(result == JumpSimulator::StepResult::Landed);
    BOOST_CHECK_CLOSE(position.getY(), HEIGHT_OFFSET, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestTimeoutSnapsToGround) {
    JumpState state;
    Vector3D position(0.0f, 20.0f, 0.0f);
    BOOST_REQUIRE(jumper.startJump(state, 0.0f, 1000));

    const Uint64 timeoutMs = static_cast<Uint64>(settings.jumpTimeout * 1000.0f);
    auto result = jumper.step(state, position, HEIGHT_OFFSET, FRAME, 1000 + timeoutMs);
    BOOST_CHECK(result == JumpSimulator::StepResult::TimedOut);
    BOOST_CHECK(!state.active);
    BOOST_CHECK_CLOSE(position.getY(), HEIGHT_OFFSET, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestForceEndJump) {
    JumpState state;
    Vector3D position(5.0f, 8.0f, 5.0f);
    jumper.startJump(state, 30.0f, 0);
    jumper.forceEndJump(state, position, HEIGHT_OFFSET);
    BOOST_CHECK(!state.active);
    BOOST_CHECK_EQUAL(state.verticalVelocity, 0.0f);
    BOOST_CHECK_CLOSE(position.getY(), HEIGHT_OFFSET, 0.001f);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// TRAJECTORY MATH
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(TrajectoryTests, JumpFixture)

BOOST_AUTO_TEST_CASE(TestApexAndClearance) {
    const float v = settings.defaultJumpPower;
    BOOST_CHECK_CLOSE(jumper.apexHeight(0.0f), v * v / (2.0f * settings.gravity), 0.001f);
    BOOST_CHECK(jumper.canClearObstacle(5.0f, 0.0f));
    BOOST_CHECK(!jumper.canClearObstacle(7.0f, 0.0f));
    BOOST_CHECK(jumper.canClearObstacle(7.0f, 80.0f));
}

BOOST_AUTO_TEST_CASE(TestLevelTrajectory) {
    auto trajectory = jumper.calculateTrajectory(Vector3D(0.0f, 3.0f, 0.0f), Vector3D(10.0f, 3.0f, 0.0f), 0.0f);
    BOOST_REQUIRE(trajectory.has_value());

    const float expectedLanding = 2.0f * settings.defaultJumpPower / settings.gravity;
    BOOST_CHECK_CLOSE(trajectory->landingTime, expectedLanding, 0.01f);
    BOOST_CHECK_CLOSE(trajectory->timeToApex, expectedLanding * 0.5f, 0.01f);
    BOOST_CHECK_CLOSE(trajectory->horizontalSpeed, 10.0f / expectedLanding, 0.01f);
}

BOOST_AUTO_TEST_CASE(TestTargetAboveApexUnreachable) {
    BOOST_CHECK(!jumper.calculateTrajectory(Vector3D(0.0f, 3.0f, 0.0f), Vector3D(5.0f, 13.0f, 0.0f), 0.0f));
    BOOST_CHECK(jumper.calculateTrajectory(Vector3D(0.0f, 3.0f, 0.0f), Vector3D(5.0f, 7.0f, 0.0f), 0.0f));
}

BOOST_AUTO_TEST_CASE(TestDropTakesLongerThanLevelJump) {
    auto level = jumper.calculateTrajectory(Vector3D(0.0f, 10.0f, 0.0f), Vector3D(5.0f, 10.0f, 0.0f), 0.0f);
    auto drop = jumper.calculateTrajectory(Vector3D(0.0f, 10.0f, 0.0f), Vector3D(5.0f, 3.0f, 0.0f), 0.0f);
    BOOST_REQUIRE(level && drop);
    BOOST_CHECK_GT(drop->landingTime, level->landingTime);
}

BOOST_AUTO_TEST_SUITE_END()
