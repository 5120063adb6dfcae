/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE SpatialQueryTests
#include <boost/test/unit_test.hpp>

#include "core/SimulationSettings.hpp"
#include "world/FlatWorld.hpp"
#include "world/SpatialQueryAdapter.hpp"

using namespace SwarmForge;

struct SpatialQueryFixture {
    SpatialQueryFixture() : queries(world, jump) {}

    JumpSettings jump;
    FlatWorld world;
    SpatialQueryAdapter queries;
};

// ============================================================================
// RAW RAYCAST
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(FlatWorldTests, SpatialQueryFixture)

BOOST_AUTO_TEST_CASE(TestGroundHitFromAbove) {
    auto hit = world.raycast(Vector3D(0.0f, 10.0f, 0.0f), Vector3D(0.0f, -1.0f, 0.0f), 50.0f, {});
    BOOST_REQUIRE(hit.has_value());
    BOOST_CHECK_EQUAL(hit->obstacleId, 0u);
    BOOST_CHECK_CLOSE(hit->distance, 10.0f, 0.001f);
    BOOST_CHECK_EQUAL(hit->tag, "ground");
}

BOOST_AUTO_TEST_CASE(TestGroundOutOfReach) {
    BOOST_CHECK(!world.raycast(Vector3D(0.0f, 10.0f, 0.0f), Vector3D(0.0f, -1.0f, 0.0f), 5.0f, {}));
    BOOST_CHECK(!world.raycast(Vector3D(0.0f, 10.0f, 0.0f), Vector3D(0.0f, 1.0f, 0.0f), 50.0f, {}));
}

BOOST_AUTO_TEST_CASE(TestNearestBoxWins) {
    const uint32_t nearBox = world.addBox(Vector3D(5.0f, 0.0f, -1.0f), Vector3D(6.0f, 5.0f, 1.0f));
    world.addBox(Vector3D(10.0f, 0.0f, -1.0f), Vector3D(11.0f, 5.0f, 1.0f));

    auto hit = world.raycast(Vector3D(0.0f, 1.0f, 0.0f), Vector3D(1.0f, 0.0f, 0.0f), 20.0f, {});
    BOOST_REQUIRE(hit.has_value());
    BOOST_CHECK_EQUAL(hit->obstacleId, nearBox);
    BOOST_CHECK_CLOSE(hit->distance, 5.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestFilterIgnoresTaggedGeometry) {
    world.addBox(Vector3D(5.0f, 0.0f, -1.0f), Vector3D(6.0f, 5.0f, 1.0f), true, "npc_1");
    RaycastFilter filter;
    filter.ignoreTags.push_back("npc_1");
    BOOST_CHECK(!world.raycast(Vector3D(0.0f, 1.0f, 0.0f), Vector3D(1.0f, 0.0f, 0.0f), 20.0f, filter));
}

BOOST_AUTO_TEST_CASE(TestBoxEditing) {
    const uint32_t id = world.addBox(Vector3D(2.0f, 0.0f, 2.0f), Vector3D(1.0f, 1.0f, 1.0f));
    const BoxObstacle* box = world.getBox(id);
    BOOST_REQUIRE(box != nullptr);
    // Corners are normalized
    BOOST_CHECK_EQUAL(box->min, Vector3D(1.0f, 0.0f, 1.0f));

    BOOST_CHECK(world.moveBox(id, Vector3D(10.0f, 0.0f, 10.0f), Vector3D(11.0f, 1.0f, 11.0f)));
    BOOST_CHECK(world.removeBox(id));
    BOOST_CHECK(!world.removeBox(id));
    BOOST_CHECK(world.getBoxes().empty());
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// ADAPTER
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(AdapterTests, SpatialQueryFixture)

BOOST_AUTO_TEST_CASE(TestSnapToGroundOnPlaneAndPlatform) {
    auto snapped = queries.snapToGround(Vector3D(0.0f, 7.0f, 0.0f), 3.0f);
    BOOST_REQUIRE(snapped.has_value());
    BOOST_CHECK_CLOSE(snapped->getY(), 3.0f, 0.001f);

    world.addBox(Vector3D(-5.0f, 0.0f, -5.0f), Vector3D(5.0f, 2.0f, 5.0f));
    snapped = queries.snapToGround(Vector3D(0.0f, 7.0f, 0.0f), 3.0f);
    BOOST_REQUIRE(snapped.has_value());
    BOOST_CHECK_CLOSE(snapped->getY(), 5.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestNonSolidSurfacesSkipped) {
    world.addBox(Vector3D(-5.0f, 0.0f, -5.0f), Vector3D(5.0f, 4.0f, 5.0f), false, "foliage");
    auto ground = queries.groundPosition(Vector3D(0.0f, 10.0f, 0.0f));
    BOOST_REQUIRE(ground.has_value());
    BOOST_CHECK_SMALL(ground->getY(), 0.001f);
}

BOOST_AUTO_TEST_CASE(TestSkipLimitGivesUp) {
    jump.maxGroundSkips = 2;
    for (int i = 0; i < 5; ++i) {
        const float y = 2.0f * static_cast<float>(i) + 1.0f;
        world.addBox(Vector3D(-1.0f, y, -1.0f), Vector3D(1.0f, y + 0.5f, 1.0f), false, "leaf");
    }
    BOOST_CHECK(!queries.groundPosition(Vector3D(0.0f, 12.0f, 0.0f)).has_value());
}

BOOST_AUTO_TEST_CASE(TestIsOnGround) {
    BOOST_CHECK(queries.isOnGround(Vector3D(0.0f, 3.0f, 0.0f), 3.0f));
    BOOST_CHECK(queries.isOnGround(Vector3D(0.0f, 3.9f, 0.0f), 3.0f));
    BOOST_CHECK(!queries.isOnGround(Vector3D(0.0f, 6.0f, 0.0f), 3.0f));
}

BOOST_AUTO_TEST_CASE(TestLineOfSightBlockedOnlyBySolid) {
    const Vector3D a(0.0f, 3.0f, 0.0f);
    const Vector3D b(20.0f, 3.0f, 0.0f);
    BOOST_CHECK(queries.hasLineOfSight(a, b));

    world.addBox(Vector3D(9.0f, 0.0f, -2.0f), Vector3D(11.0f, 6.0f, 2.0f), false, "bush");
    BOOST_CHECK(queries.hasLineOfSight(a, b));

    world.addBox(Vector3D(14.0f, 0.0f, -2.0f), Vector3D(15.0f, 6.0f, 2.0f), true, "wall");
    BOOST_CHECK(!queries.hasLineOfSight(a, b));
}

BOOST_AUTO_TEST_CASE(TestProbeStepsOverLowObstacles) {
    world.addBox(Vector3D(2.0f, 0.0f, -1.0f), Vector3D(3.0f, 0.3f, 1.0f), true, "curb");
    const Vector3D feet(0.0f, 0.0f, 0.0f);
    const Vector3D east(1.0f, 0.0f, 0.0f);
    BOOST_CHECK(!queries.isBlocked(feet, east, 5.0f, 0.5f));

    world.addBox(Vector3D(4.0f, 0.0f, -1.0f), Vector3D(5.0f, 3.0f, 1.0f), true, "wall");
    BOOST_CHECK(queries.isBlocked(feet, east, 5.0f, 0.5f));
    BOOST_CHECK(!queries.isBlocked(feet, east, 3.5f, 0.5f));
}

BOOST_AUTO_TEST_SUITE_END()
