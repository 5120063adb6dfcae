/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE SightManagerTests
#include <boost/test/unit_test.hpp>

#include "entities/PlayerRegistry.hpp"
#include "managers/AgentStateStore.hpp"
#include "managers/SightManager.hpp"
#include "world/FlatWorld.hpp"
#include "world/SpatialQueryAdapter.hpp"
#include <map>
#include <string>
#include <vector>

using namespace SwarmForge;

// ============================================================================
// Test Fixture
// ============================================================================

class SightFixture {
public:
    SightFixture() : queries(world, jump), sight(sightSettings, store, players, queries, 7) {
        store.init();
        sight.init();

        viewerConfig.sightRange = 50.0f;
        viewerConfig.faction = "raiders";

        sight.setQueryResolver([this](const AgentId&) -> std::optional<SightQuery> {
            if (!resolvable) {
                return std::nullopt;
            }
            return SightQuery{viewerPosition, Orientation(), &viewerConfig};
        });
        sight.setResultHandler([this](const SightResult& result) { results[result.agentId]++; });
    }

    ~SightFixture() {
        sight.clean();
        store.clean();
    }

    void spawnAgent(const std::string& id, const Vector3D& position, const std::string& faction) {
        AgentRecord record;
        record.id = id;
        record.position = position;
        record.configJson = faction.empty() ? "" : "{\"Faction\": \"" + faction + "\"}";
        store.createAgent(std::move(record));
    }

    // Viewer at the origin looking down -Z
    SightResult look() { return sight.detect("viewer", SightQuery{viewerPosition, Orientation(), &viewerConfig}, 0); }

    // Pump the scheduler every 100ms through [fromMs, toMs]
    void pump(Uint64 fromMs, Uint64 toMs) {
        for (Uint64 t = fromMs; t <= toMs; t += 100) {
            sight.update(t);
        }
    }

protected:
    SightSettings sightSettings;
    JumpSettings jump;
    FlatWorld world;
    SpatialQueryAdapter queries;
    AgentStateStore store;
    PlayerRegistry players;
    SightManager sight;

    AgentConfig viewerConfig;
    Vector3D viewerPosition{0.0f, 3.0f, 0.0f};
    bool resolvable{true};
    std::map<AgentId, int> results;
};

// ============================================================================
// DETECTION PIPELINE TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(DetectionTests, SightFixture)

BOOST_AUTO_TEST_CASE(TestPlayerInFrontDetected) {
    players.addPlayer("alice", 1, Vector3D(0.0f, 3.0f, -20.0f));
    SightResult result = look();
    BOOST_REQUIRE(result.target.has_value());
    BOOST_CHECK_EQUAL(*result.target, (TargetRef{TargetKind::Player, "alice"}));
    BOOST_CHECK_CLOSE(result.distance, 20.0f, 0.001f);
    BOOST_CHECK_EQUAL(result.targetPosition, Vector3D(0.0f, 3.0f, -20.0f));
}

BOOST_AUTO_TEST_CASE(TestConeExcludesTargetsBehind) {
    players.addPlayer("alice", 1, Vector3D(0.0f, 3.0f, 20.0f));
    BOOST_CHECK(!look().target.has_value());

    // Just outside the 60 degree half-angle
    players.setPosition("alice", Vector3D(20.0f, 3.0f, -5.0f));
    BOOST_CHECK(!look().target.has_value());

    // Just inside it
    players.setPosition("alice", Vector3D(5.0f, 3.0f, -20.0f));
    BOOST_CHECK(look().target.has_value());
}

BOOST_AUTO_TEST_CASE(TestOmnidirectionalSeesEverywhere) {
    viewerConfig.sightMode = SightMode::Omnidirectional;
    players.addPlayer("alice", 1, Vector3D(0.0f, 3.0f, 20.0f));
    BOOST_CHECK(look().target.has_value());
}

BOOST_AUTO_TEST_CASE(TestCandidateDirectlyAboveAlwaysSeen) {
    players.addPlayer("alice", 1, Vector3D(0.0f, 20.0f, 0.0f));
    BOOST_CHECK(look().target.has_value());
}

BOOST_AUTO_TEST_CASE(TestRangeLimit) {
    players.addPlayer("alice", 1, Vector3D(0.0f, 3.0f, -60.0f));
    BOOST_CHECK(!look().target.has_value());

    viewerConfig.sightRange = 0.0f;
    players.setPosition("alice", Vector3D(0.0f, 3.0f, -1.0f));
    BOOST_CHECK(!look().target.has_value());
}

BOOST_AUTO_TEST_CASE(TestNearestCandidateWins) {
    players.addPlayer("far", 1, Vector3D(0.0f, 3.0f, -30.0f));
    players.addPlayer("near", 1, Vector3D(2.0f, 3.0f, -10.0f));
    spawnAgent("middle", Vector3D(0.0f, 3.0f, -20.0f), "settlers");

    SightResult result = look();
    BOOST_REQUIRE(result.target.has_value());
    BOOST_CHECK_EQUAL(result.target->id, "near");
}

BOOST_AUTO_TEST_CASE(TestSolidGeometryBlocksSight) {
    players.addPlayer("alice", 1, Vector3D(0.0f, 3.0f, -20.0f));

    world.addBox(Vector3D(-5.0f, 0.0f, -8.0f), Vector3D(5.0f, 10.0f, -6.0f), false, "hedge");
    BOOST_CHECK(look().target.has_value());

    world.addBox(Vector3D(-5.0f, 0.0f, -12.0f), Vector3D(5.0f, 10.0f, -11.0f), true, "wall");
    BOOST_CHECK(!look().target.has_value());
}

BOOST_AUTO_TEST_CASE(TestOwnCollisionDoesNotBlock) {
    spawnAgent("foe", Vector3D(0.0f, 3.0f, -20.0f), "settlers");
    world.addBox(Vector3D(-1.0f, 0.0f, -21.0f), Vector3D(1.0f, 6.0f, -19.0f), true, "foe");
    world.addBox(Vector3D(-1.0f, 0.0f, -1.0f), Vector3D(1.0f, 6.0f, 1.0f), true, "viewer");

    SightResult result = look();
    BOOST_REQUIRE(result.target.has_value());
    BOOST_CHECK_EQUAL(result.target->id, "foe");
}

BOOST_AUTO_TEST_CASE(TestAlliesFiltered) {
    spawnAgent("friend", Vector3D(0.0f, 3.0f, -5.0f), "raiders");
    spawnAgent("foe", Vector3D(0.0f, 3.0f, -15.0f), "settlers");

    SightResult result = look();
    BOOST_REQUIRE(result.target.has_value());
    BOOST_CHECK_EQUAL(*result.target, (TargetRef{TargetKind::Agent, "foe"}));

    viewerConfig.canAttackAllies = true;
    result = look();
    BOOST_REQUIRE(result.target.has_value());
    BOOST_CHECK_EQUAL(result.target->id, "friend");
}

BOOST_AUTO_TEST_CASE(TestFactionlessAgentsAreAllies) {
    viewerConfig.faction.clear();
    spawnAgent("drifter", Vector3D(0.0f, 3.0f, -5.0f), "");
    BOOST_CHECK(!look().target.has_value());
}

BOOST_AUTO_TEST_CASE(TestPlayersNeverAllyFiltered) {
    viewerConfig.faction.clear();
    players.addPlayer("alice", 1, Vector3D(0.0f, 3.0f, -5.0f));
    BOOST_CHECK(look().target.has_value());
}

BOOST_AUTO_TEST_CASE(TestDeadCandidatesIgnored) {
    players.addPlayer("alice", 1, Vector3D(0.0f, 3.0f, -5.0f));
    players.setAlive("alice", false);
    spawnAgent("foe", Vector3D(0.0f, 3.0f, -10.0f), "settlers");
    store.setHealth("foe", 0.0f);
    BOOST_CHECK(!look().target.has_value());
    BOOST_CHECK_EQUAL(sight.getStats().targetsFound, 0u);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// SCHEDULER TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(SchedulerTests, SightFixture)

BOOST_AUTO_TEST_CASE(TestRegisterRequiresInit) {
    sight.clean();
    BOOST_CHECK(!sight.registerAgent("viewer", 0));
    BOOST_CHECK_EQUAL(sight.registeredCount(), 0u);
}

BOOST_AUTO_TEST_CASE(TestFirstDetectionWithinMinimumInterval) {
    BOOST_CHECK(sight.registerAgent("viewer", 0));
    BOOST_CHECK(!sight.registerAgent("viewer", 0));

    pump(0, 1000);
    BOOST_CHECK_EQUAL(results["viewer"], 1);
    BOOST_CHECK_EQUAL(sight.getStats().detectionsRun, 1u);
}

BOOST_AUTO_TEST_CASE(TestPeriodicDetections) {
    sight.registerAgent("viewer", 0);
    pump(0, 10000);
    // One detection within the first second, then one every 1-3 seconds
    BOOST_CHECK_GE(results["viewer"], 4);
    BOOST_CHECK_LE(results["viewer"], 11);
}

BOOST_AUTO_TEST_CASE(TestUnregisterLeavesNothingScheduled) {
    sight.registerAgent("viewer", 0);
    BOOST_CHECK(sight.unregisterAgent("viewer"));
    BOOST_CHECK(!sight.unregisterAgent("viewer"));
    BOOST_CHECK_EQUAL(sight.registeredCount(), 0u);
    BOOST_CHECK_EQUAL(sight.scheduledCount(), 0u);

    pump(0, 5000);
    BOOST_CHECK(results.empty());
}

BOOST_AUTO_TEST_CASE(TestReregisterDropsStaleEntry) {
    sight.registerAgent("viewer", 0);
    sight.registerAgent("other", 0);
    sight.unregisterAgent("viewer");
    sight.registerAgent("viewer", 0);
    BOOST_CHECK_EQUAL(sight.scheduledCount(), 3u);

    pump(0, 1000);
    BOOST_CHECK_EQUAL(results["viewer"], 1);
    BOOST_CHECK_EQUAL(results["other"], 1);
    BOOST_CHECK_EQUAL(sight.getStats().staleEntriesDropped, 1u);
}

BOOST_AUTO_TEST_CASE(TestUnresolvableAgentAutoUnregistered) {
    resolvable = false;
    sight.registerAgent("viewer", 0);
    pump(0, 1000);
    BOOST_CHECK(results.empty());
    BOOST_CHECK(!sight.isRegistered("viewer"));
    BOOST_CHECK_EQUAL(sight.getStats().autoUnregistered, 1u);
    BOOST_CHECK_EQUAL(sight.scheduledCount(), 0u);
}

BOOST_AUTO_TEST_CASE(TestHandlerMayUnregister) {
    sight.setResultHandler([this](const SightResult& result) {
        results[result.agentId]++;
        sight.unregisterAgent(result.agentId);
    });
    sight.registerAgent("viewer", 0);
    pump(0, 10000);
    BOOST_CHECK_EQUAL(results["viewer"], 1);
    BOOST_CHECK_EQUAL(sight.registeredCount(), 0u);
}

BOOST_AUTO_TEST_SUITE_END()
