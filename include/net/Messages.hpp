/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MESSAGES_HPP
#define MESSAGES_HPP

/**
 * @file Messages.hpp
 * @brief Wire messages between simulation nodes and the authority
 *
 * Every message travels as a Message envelope whose payload is one of the
 * structs below encoded with BinarySerial. Payload layouts start with a
 * layout byte, like AgentRecord.
 */

#include "entities/AgentTypes.hpp"
#include "managers/OwnershipManager.hpp"
#include "utils/BinarySerializer.hpp"
#include "utils/Orientation.hpp"
#include "utils/Vector3D.hpp"
#include <SDL3/SDL_stdinc.h>
#include <cstdint>
#include <optional>
#include <ostream>
#include <vector>

namespace SwarmForge {

enum class MessageType : uint8_t {
    ClaimAgent = 1,               // node -> authority, request
    ClaimResponse,                // authority -> node, reply
    ReleaseAgent,                 // node -> authority
    UpdateAgentPosition,          // both directions, single update
    UpdateAgentPositionBatch,     // both directions
    AgentsOrphaned,               // authority -> nodes
    AgentJumpTriggered            // authority -> nodes
};

std::ostream& operator<<(std::ostream& os, MessageType type);

struct Message {
    MessageType type{MessageType::UpdateAgentPosition};
    NodeId sender{INVALID_NODE};
    BinarySerial::Buffer payload;
};

struct PositionUpdate {
    AgentId agentId;
    Vector3D position;
    Orientation orientation;
    Uint64 timestampMs{0};

    DECLARE_SERIALIZABLE()
};

struct PositionBatch {
    std::vector<PositionUpdate> updates;

    DECLARE_SERIALIZABLE()
};

struct OrphanEntry {
    AgentId agentId;
    Vector3D lastPosition;
    uint64_t claimVersion{0};

    DECLARE_SERIALIZABLE()
};

struct AgentsOrphaned {
    std::vector<OrphanEntry> agents;

    DECLARE_SERIALIZABLE()
};

struct ClaimAgentRequest {
    AgentId agentId;
    std::optional<uint64_t> expectedVersion;

    DECLARE_SERIALIZABLE()
};

struct ClaimAgentResponse {
    AgentId agentId;
    ClaimResult result{ClaimResult::UnknownAgent};
    uint64_t claimVersion{0};

    DECLARE_SERIALIZABLE()
};

struct ReleaseAgentRequest {
    AgentId agentId;

    DECLARE_SERIALIZABLE()
};

struct AgentJumpTriggered {
    AgentId agentId;
    float jumpPower{0.0f};   // <= 0 uses the agent's configured power

    DECLARE_SERIALIZABLE()
};

/**
 * @brief Wrap a payload in an envelope
 * @return nullopt if encoding failed
 */
template <typename T>
std::optional<Message> makeMessage(MessageType type, NodeId sender, const T& payload) {
    Message message;
    message.type = type;
    message.sender = sender;
    BinarySerial::Writer writer;
    if (!writer.writeSerializable(payload)) {
        SERIAL_ERROR(std::format("Failed to encode {} payload", static_cast<int>(type)));
        return std::nullopt;
    }
    message.payload = writer.release();
    return message;
}

template <typename T>
bool readPayload(const Message& message, T& payload) {
    return BinarySerial::decode(message.payload, payload);
}

} // namespace SwarmForge

#endif // MESSAGES_HPP
