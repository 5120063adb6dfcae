/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE MessageBusTests
#include <boost/test/unit_test.hpp>

#include "net/MessageBus.hpp"
#include "net/Messages.hpp"
#include <string>
#include <vector>

using namespace SwarmForge;

// ============================================================================
// MESSAGE PAYLOADS
// ============================================================================

BOOST_AUTO_TEST_SUITE(MessagePayloadTests)

BOOST_AUTO_TEST_CASE(TestClaimRequestKeepsOptionalVersion) {
    ClaimAgentRequest request;
    request.agentId = "npc_7";
    request.expectedVersion = 42;

    auto message = makeMessage(MessageType::ClaimAgent, 3, request);
    BOOST_REQUIRE(message.has_value());
    BOOST_CHECK_EQUAL(message->sender, 3u);

    ClaimAgentRequest decoded;
    BOOST_REQUIRE(readPayload(*message, decoded));
    BOOST_CHECK_EQUAL(decoded.agentId, "npc_7");
    BOOST_REQUIRE(decoded.expectedVersion.has_value());
    BOOST_CHECK_EQUAL(*decoded.expectedVersion, 42u);

    request.expectedVersion.reset();
    message = makeMessage(MessageType::ClaimAgent, 3, request);
    BOOST_REQUIRE(message.has_value());
    BOOST_REQUIRE(readPayload(*message, decoded));
    BOOST_CHECK(!decoded.expectedVersion.has_value());
}

BOOST_AUTO_TEST_CASE(TestClaimResponse) {
    ClaimAgentResponse response;
    response.agentId = "npc_7";
    response.result = ClaimResult::StaleVersion;
    response.claimVersion = 9;

    auto message = makeMessage(MessageType::ClaimResponse, AUTHORITY_NODE, response);
    BOOST_REQUIRE(message.has_value());

    ClaimAgentResponse decoded;
    BOOST_REQUIRE(readPayload(*message, decoded));
    BOOST_CHECK_EQUAL(decoded.result, ClaimResult::StaleVersion);
    BOOST_CHECK_EQUAL(decoded.claimVersion, 9u);
}

BOOST_AUTO_TEST_CASE(TestOrphanBroadcast) {
    AgentsOrphaned orphaned;
    orphaned.agents.push_back(OrphanEntry{"a", Vector3D(1.0f, 3.0f, 2.0f), 4});
    orphaned.agents.push_back(OrphanEntry{"b", Vector3D(-5.0f, 3.0f, 8.0f), 11});

    auto message = makeMessage(MessageType::AgentsOrphaned, AUTHORITY_NODE, orphaned);
    BOOST_REQUIRE(message.has_value());

    AgentsOrphaned decoded;
    BOOST_REQUIRE(readPayload(*message, decoded));
    BOOST_REQUIRE_EQUAL(decoded.agents.size(), 2u);
    BOOST_CHECK_EQUAL(decoded.agents[1].agentId, "b");
    BOOST_CHECK_EQUAL(decoded.agents[1].lastPosition, Vector3D(-5.0f, 3.0f, 8.0f));
    BOOST_CHECK_EQUAL(decoded.agents[1].claimVersion, 11u);
}

BOOST_AUTO_TEST_CASE(TestPositionBatchPreservesOrientation) {
    PositionBatch batch;
    batch.updates.push_back(PositionUpdate{"a", Vector3D(1.0f, 3.0f, 1.0f), Orientation::fromYaw(0.5f), 100});
    batch.updates.push_back(PositionUpdate{"b", Vector3D(2.0f, 3.0f, 2.0f), Orientation::fromYaw(-1.0f), 120});

    auto message = makeMessage(MessageType::UpdateAgentPositionBatch, 2, batch);
    BOOST_REQUIRE(message.has_value());

    PositionBatch decoded;
    BOOST_REQUIRE(readPayload(*message, decoded));
    BOOST_REQUIRE_EQUAL(decoded.updates.size(), 2u);
    BOOST_CHECK(decoded.updates[0].orientation == batch.updates[0].orientation);
    BOOST_CHECK_EQUAL(decoded.updates[1].timestampMs, 120u);
}

BOOST_AUTO_TEST_CASE(TestCorruptPayloadRejected) {
    AgentJumpTriggered jump;
    jump.agentId = "npc_1";
    jump.jumpPower = 65.0f;
    auto message = makeMessage(MessageType::AgentJumpTriggered, AUTHORITY_NODE, jump);
    BOOST_REQUIRE(message.has_value());

    AgentJumpTriggered decoded;
    BOOST_REQUIRE(readPayload(*message, decoded));
    BOOST_CHECK_CLOSE(decoded.jumpPower, 65.0f, 0.001f);

    Message truncated = *message;
    truncated.payload.pop_back();
    BOOST_CHECK(!readPayload(truncated, decoded));

    Message foreign = *message;
    foreign.payload[0] = 0x7F;
    BOOST_CHECK(!readPayload(foreign, decoded));
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Bus Fixture
// ============================================================================

class BusFixture {
public:
    BusFixture() {
        bus.setAuthorityHandler([this](const Message& message) { authorityInbox.push_back(message); });
        bus.setConnectionListener([this](NodeId node, bool connected) {
            connectionEvents.push_back(connected ? static_cast<int>(node) : -static_cast<int>(node));
        });
    }

    MessageBus::HandlerToken attach(NodeId node) {
        return bus.connect(node, [this, node](const Message& message) {
            nodeInbox.push_back({node, message.type});
        });
    }

    Message ping(NodeId sender, MessageType type = MessageType::ReleaseAgent) {
        ReleaseAgentRequest request;
        request.agentId = "npc";
        auto message = makeMessage(type, sender, request);
        BOOST_REQUIRE(message.has_value());
        return *message;
    }

    struct Delivery {
        NodeId node;
        MessageType type;
    };

protected:
    MessageBus bus;
    std::vector<Message> authorityInbox;
    std::vector<Delivery> nodeInbox;
    std::vector<int> connectionEvents;
};

// ============================================================================
// CONNECTION TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(ConnectionTests, BusFixture)

BOOST_AUTO_TEST_CASE(TestReservedIdsRefused) {
    BOOST_CHECK(!bus.connect(INVALID_NODE, [](const Message&) {}).valid());
    BOOST_CHECK(!bus.connect(AUTHORITY_NODE, [](const Message&) {}).valid());
    BOOST_CHECK(bus.getConnectedNodes().empty());
}

BOOST_AUTO_TEST_CASE(TestConnectDisconnectNotifies) {
    BOOST_CHECK(attach(1).valid());
    BOOST_CHECK(attach(2).valid());
    BOOST_CHECK(bus.isConnected(1));
    BOOST_CHECK(bus.disconnect(1));
    BOOST_CHECK(!bus.disconnect(1));

    BOOST_REQUIRE_EQUAL(connectionEvents.size(), 3u);
    BOOST_CHECK_EQUAL(connectionEvents[0], 1);
    BOOST_CHECK_EQUAL(connectionEvents[2], -1);
}

BOOST_AUTO_TEST_CASE(TestStaleTokenCannotRemoveReconnectedNode) {
    MessageBus::HandlerToken first = attach(1);
    MessageBus::HandlerToken second = attach(1);
    BOOST_CHECK_NE(first.id, second.id);
    // Reconnecting is not a new connection
    BOOST_CHECK_EQUAL(connectionEvents.size(), 1u);

    BOOST_CHECK(!bus.removeHandler(first));
    BOOST_CHECK(bus.isConnected(1));
    BOOST_CHECK(bus.removeHandler(second));
    BOOST_CHECK(!bus.isConnected(1));
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// DISPATCH TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(DispatchTests, BusFixture)

BOOST_AUTO_TEST_CASE(TestDeferredWaitsForPump) {
    attach(1);
    BOOST_CHECK(bus.post(1, ping(AUTHORITY_NODE)));
    BOOST_CHECK(bus.postToAuthority(ping(1)));
    BOOST_CHECK(nodeInbox.empty());
    BOOST_CHECK(authorityInbox.empty());
    BOOST_CHECK_EQUAL(bus.getQueueSize(), 2u);

    BOOST_CHECK_EQUAL(bus.pump(), 2u);
    BOOST_CHECK_EQUAL(nodeInbox.size(), 1u);
    BOOST_CHECK_EQUAL(authorityInbox.size(), 1u);
    BOOST_CHECK_EQUAL(authorityInbox[0].sender, 1u);
}

BOOST_AUTO_TEST_CASE(TestImmediateDeliversInline) {
    attach(1);
    BOOST_CHECK(bus.post(1, ping(AUTHORITY_NODE), MessageBus::DispatchMode::Immediate));
    BOOST_CHECK_EQUAL(nodeInbox.size(), 1u);
    BOOST_CHECK_EQUAL(bus.getQueueSize(), 0u);
}

BOOST_AUTO_TEST_CASE(TestDeliveryPreservesOrder) {
    attach(1);
    bus.post(1, ping(AUTHORITY_NODE, MessageType::ClaimResponse));
    bus.post(1, ping(AUTHORITY_NODE, MessageType::AgentsOrphaned));
    bus.post(1, ping(AUTHORITY_NODE, MessageType::AgentJumpTriggered));
    bus.pump();

    BOOST_REQUIRE_EQUAL(nodeInbox.size(), 3u);
    BOOST_CHECK(nodeInbox[0].type == MessageType::ClaimResponse);
    BOOST_CHECK(nodeInbox[1].type == MessageType::AgentsOrphaned);
    BOOST_CHECK(nodeInbox[2].type == MessageType::AgentJumpTriggered);
}

BOOST_AUTO_TEST_CASE(TestPostsDuringPumpAreDelivered) {
    bus.setAuthorityHandler([this](const Message& message) {
        authorityInbox.push_back(message);
        bus.post(message.sender, ping(AUTHORITY_NODE));
    });
    attach(1);
    bus.postToAuthority(ping(1));

    BOOST_CHECK_EQUAL(bus.pump(), 2u);
    BOOST_CHECK_EQUAL(nodeInbox.size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestUnknownDestinationDropped) {
    BOOST_CHECK(!bus.post(9, ping(AUTHORITY_NODE)));
    attach(1);
    bus.post(1, ping(AUTHORITY_NODE));
    bus.disconnect(1);
    BOOST_CHECK_EQUAL(bus.pump(), 0u);
    BOOST_CHECK_EQUAL(bus.getStats().dropped, 2u);
}

BOOST_AUTO_TEST_CASE(TestHandlerMayDisconnectItself) {
    bus.connect(1, [this](const Message&) { bus.disconnect(1); });
    bus.post(1, ping(AUTHORITY_NODE));
    bus.post(1, ping(AUTHORITY_NODE));
    BOOST_CHECK_EQUAL(bus.pump(), 1u);
    BOOST_CHECK(!bus.isConnected(1));
}

BOOST_AUTO_TEST_CASE(TestSynchronousCall) {
    BOOST_CHECK(!bus.call(ping(1)).has_value());

    bus.setRequestHandler([](const Message& request) -> std::optional<Message> {
        ClaimAgentResponse response;
        response.agentId = "npc";
        response.result = ClaimResult::Accepted;
        response.claimVersion = request.sender;
        return makeMessage(MessageType::ClaimResponse, AUTHORITY_NODE, response);
    });

    // The caller must be connected
    BOOST_CHECK(!bus.call(ping(4)).has_value());

    attach(4);
    auto reply = bus.call(ping(4, MessageType::ClaimAgent));
    BOOST_REQUIRE(reply.has_value());
    ClaimAgentResponse response;
    BOOST_REQUIRE(readPayload(*reply, response));
    BOOST_CHECK_EQUAL(response.claimVersion, 4u);
    BOOST_CHECK_EQUAL(bus.getStats().calls, 1u);
}

BOOST_AUTO_TEST_SUITE_END()
