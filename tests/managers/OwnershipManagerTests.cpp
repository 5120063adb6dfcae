/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE OwnershipManagerTests
#include <boost/test/unit_test.hpp>

#include "managers/AgentStateStore.hpp"
#include "managers/OwnershipManager.hpp"
#include <string>
#include <vector>

using namespace SwarmForge;

// ============================================================================
// Test Fixture
// ============================================================================

class OwnershipFixture {
public:
    OwnershipFixture() : ownership(settings, store) {
        settings.clientSimulation.maxAgentsPerNode = 3;
        settings.ownership.ownershipTimeout = 3.0f;
        store.init();
        ownership.init();
        ownership.setChangeListener([this](const AgentId& id, NodeId node, OwnershipChange change) {
            changes.push_back({id, node, change});
        });
    }

    ~OwnershipFixture() {
        ownership.clean();
        store.clean();
    }

    void spawn(const std::string& id, const Vector3D& position = Vector3D()) {
        AgentRecord record;
        record.id = id;
        record.position = position;
        store.createAgent(std::move(record));
    }

    uint64_t versionOf(const std::string& id) const { return store.getAgent(id)->claimVersion; }

    struct Change {
        AgentId id;
        NodeId node;
        OwnershipChange change;
    };

protected:
    SimulationSettings settings;
    AgentStateStore store;
    OwnershipManager ownership;
    std::vector<Change> changes;
};

// ============================================================================
// CLAIM TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(ClaimTests, OwnershipFixture)

BOOST_AUTO_TEST_CASE(TestClaimWritesRecord) {
    spawn("npc");
    BOOST_CHECK_EQUAL(ownership.claimAgent(1, "npc", std::nullopt, 1000), ClaimResult::Accepted);

    const AgentRecord* record = store.getAgent("npc");
    BOOST_CHECK_EQUAL(record->ownerNode, 1u);
    BOOST_CHECK_EQUAL(record->status, OwnershipStatus::Claimed);
    BOOST_CHECK_EQUAL(record->claimVersion, 1u);
    BOOST_CHECK_EQUAL(record->lastUpdateMs, 1000u);
    BOOST_CHECK_EQUAL(ownership.getOwner("npc"), 1u);
    BOOST_REQUIRE_EQUAL(changes.size(), 1u);
    BOOST_CHECK(changes[0].change == OwnershipChange::Claimed);
}

BOOST_AUTO_TEST_CASE(TestReclaimIsIdempotent) {
    spawn("npc");
    ownership.claimAgent(1, "npc", std::nullopt, 1000);
    BOOST_CHECK_EQUAL(ownership.claimAgent(1, "npc", std::nullopt, 2000), ClaimResult::Accepted);
    BOOST_CHECK_EQUAL(versionOf("npc"), 1u);
    BOOST_CHECK_EQUAL(store.getAgent("npc")->lastUpdateMs, 2000u);
    BOOST_CHECK_EQUAL(ownership.getOwnedCount(1), 1u);
    BOOST_CHECK_EQUAL(changes.size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestSecondClaimantRejected) {
    spawn("npc");
    ownership.claimAgent(1, "npc", std::nullopt, 0);
    BOOST_CHECK_EQUAL(ownership.claimAgent(2, "npc", std::nullopt, 0), ClaimResult::OwnedByOther);
    BOOST_CHECK_EQUAL(ownership.getOwner("npc"), 1u);
    BOOST_CHECK_EQUAL(ownership.getStats().claimsRejected, 1u);
}

BOOST_AUTO_TEST_CASE(TestUnknownAndDeadAgents) {
    BOOST_CHECK_EQUAL(ownership.claimAgent(1, "ghost", std::nullopt, 0), ClaimResult::UnknownAgent);
    spawn("npc");
    store.setHealth("npc", 0.0f);
    BOOST_CHECK_EQUAL(ownership.claimAgent(1, "npc", std::nullopt, 0), ClaimResult::AgentDead);
    BOOST_CHECK_EQUAL(ownership.getTotalOwned(), 0u);
}

BOOST_AUTO_TEST_CASE(TestCapacityEnforced) {
    for (int i = 0; i < 4; ++i) {
        spawn("npc" + std::to_string(i));
    }
    BOOST_CHECK_EQUAL(ownership.claimAgent(1, "npc0", std::nullopt, 0), ClaimResult::Accepted);
    BOOST_CHECK_EQUAL(ownership.claimAgent(1, "npc1", std::nullopt, 0), ClaimResult::Accepted);
    BOOST_CHECK_EQUAL(ownership.claimAgent(1, "npc2", std::nullopt, 0), ClaimResult::Accepted);
    BOOST_CHECK_EQUAL(ownership.claimAgent(1, "npc3", std::nullopt, 0), ClaimResult::CapacityExceeded);

    // Another node still has room
    BOOST_CHECK_EQUAL(ownership.claimAgent(2, "npc3", std::nullopt, 0), ClaimResult::Accepted);

    // A release frees the slot
    ownership.releaseAgent(1, "npc0");
    BOOST_CHECK_EQUAL(ownership.getOwnedCount(1), 2u);
}

BOOST_AUTO_TEST_CASE(TestExpectedVersionGuardsRaces) {
    spawn("npc");
    const uint64_t announced = versionOf("npc");

    // First claimant wins with the announced version
    BOOST_CHECK_EQUAL(ownership.claimAgent(1, "npc", announced, 0), ClaimResult::Accepted);
    ownership.releaseAgent(1, "npc");

    // A late claimant carrying the original announcement is stale even
    // though the agent is unowned again
    BOOST_CHECK_EQUAL(ownership.claimAgent(2, "npc", announced, 0), ClaimResult::StaleVersion);
    BOOST_CHECK_EQUAL(ownership.claimAgent(2, "npc", versionOf("npc"), 0), ClaimResult::Accepted);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// RELEASE AND ORPHAN TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(OrphanTests, OwnershipFixture)

BOOST_AUTO_TEST_CASE(TestOnlyOwnerReleases) {
    spawn("npc", Vector3D(3.0f, 0.0f, 4.0f));
    ownership.claimAgent(1, "npc", std::nullopt, 0);

    BOOST_CHECK(!ownership.releaseAgent(2, "npc").has_value());
    BOOST_CHECK(!ownership.releaseAgent(INVALID_NODE, "npc").has_value());

    auto orphan = ownership.releaseAgent(1, "npc");
    BOOST_REQUIRE(orphan.has_value());
    BOOST_CHECK_EQUAL(orphan->id, "npc");
    BOOST_CHECK_EQUAL(orphan->lastPosition, Vector3D(3.0f, 0.0f, 4.0f));
    BOOST_CHECK_EQUAL(orphan->claimVersion, 2u);
    BOOST_CHECK_EQUAL(versionOf("npc"), 2u);
    BOOST_CHECK_EQUAL(store.getAgent("npc")->ownerNode, INVALID_NODE);
    BOOST_CHECK_EQUAL(store.getAgent("npc")->status, OwnershipStatus::Orphaned);
    BOOST_CHECK(changes.back().change == OwnershipChange::Released);
}

BOOST_AUTO_TEST_CASE(TestDisconnectOrphansEverything) {
    spawn("a");
    spawn("b");
    spawn("c");
    ownership.claimAgent(1, "a", std::nullopt, 0);
    ownership.claimAgent(1, "b", std::nullopt, 0);
    ownership.claimAgent(2, "c", std::nullopt, 0);

    auto orphans = ownership.handleNodeDisconnected(1);
    BOOST_CHECK_EQUAL(orphans.size(), 2u);
    BOOST_CHECK_EQUAL(ownership.getOwnedCount(1), 0u);
    BOOST_CHECK_EQUAL(ownership.getOwner("c"), 2u);
    BOOST_CHECK_EQUAL(ownership.getStats().disconnectOrphans, 2u);
    BOOST_CHECK(ownership.handleNodeDisconnected(1).empty());
}

BOOST_AUTO_TEST_CASE(TestTimeoutSweep) {
    spawn("quiet");
    spawn("busy");
    ownership.claimAgent(1, "quiet", std::nullopt, 1000);
    ownership.claimAgent(1, "busy", std::nullopt, 1000);

    ownership.touch("busy", 3500);
    BOOST_CHECK(ownership.sweepTimeouts(4000).empty());

    auto orphans = ownership.sweepTimeouts(4001);
    BOOST_REQUIRE_EQUAL(orphans.size(), 1u);
    BOOST_CHECK_EQUAL(orphans[0].id, "quiet");
    BOOST_CHECK_EQUAL(ownership.getOwner("busy"), 1u);
    BOOST_CHECK(changes.back().change == OwnershipChange::TimedOut);
}

BOOST_AUTO_TEST_CASE(TestTouchIgnoresUnowned) {
    spawn("npc");
    BOOST_CHECK(!ownership.touch("npc", 500));
    BOOST_CHECK_EQUAL(store.getAgent("npc")->lastUpdateMs, 0u);
}

BOOST_AUTO_TEST_CASE(TestVersionsStrictlyIncrease) {
    spawn("npc");
    uint64_t last = versionOf("npc");
    for (NodeId node = 1; node <= 3; ++node) {
        ownership.claimAgent(node, "npc", std::nullopt, 0);
        BOOST_CHECK_GT(versionOf("npc"), last);
        last = versionOf("npc");
        ownership.releaseAgent(node, "npc");
        BOOST_CHECK_GT(versionOf("npc"), last);
        last = versionOf("npc");
    }
}

BOOST_AUTO_TEST_CASE(TestFallbackStatusRefusedWhileOwned) {
    spawn("npc");
    BOOST_CHECK(ownership.setFallbackStatus("npc", true));
    BOOST_CHECK_EQUAL(store.getAgent("npc")->status, OwnershipStatus::FallbackSimulated);

    ownership.claimAgent(1, "npc", std::nullopt, 0);
    BOOST_CHECK(!ownership.setFallbackStatus("npc", true));
    BOOST_CHECK_EQUAL(store.getAgent("npc")->status, OwnershipStatus::Claimed);
}

BOOST_AUTO_TEST_CASE(TestForgetAgent) {
    spawn("npc");
    ownership.claimAgent(1, "npc", std::nullopt, 0);
    ownership.forgetAgent("npc");
    BOOST_CHECK_EQUAL(ownership.getOwner("npc"), INVALID_NODE);
    BOOST_CHECK_EQUAL(ownership.getOwnedCount(1), 0u);
    BOOST_CHECK(changes.back().change == OwnershipChange::Forgotten);
}

BOOST_AUTO_TEST_SUITE_END()
