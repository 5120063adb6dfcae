/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "net/Messages.hpp"

namespace SwarmForge {

namespace {

constexpr uint8_t MESSAGE_LAYOUT = 1;

// Bounds a batch so a corrupt count cannot allocate unbounded memory
constexpr uint32_t MAX_BATCH_ENTRIES = 4096;

bool readLayout(BinarySerial::Reader& reader) {
    uint8_t layout = 0;
    if (!reader.read(layout)) {
        return false;
    }
    if (layout != MESSAGE_LAYOUT) {
        SERIAL_ERROR(std::format("Unsupported message layout: {}", layout));
        return false;
    }
    return true;
}

template <typename T>
bool writeList(BinarySerial::Writer& writer, const std::vector<T>& items) {
    if (items.size() > MAX_BATCH_ENTRIES) {
        SERIAL_ERROR(std::format("Message list too large: {} entries", items.size()));
        return false;
    }
    SERIALIZE_PRIMITIVE(writer, static_cast<uint32_t>(items.size()))
    for (const T& item : items) {
        SERIALIZE_SERIALIZABLE(writer, item)
    }
    return true;
}

template <typename T>
bool readList(BinarySerial::Reader& reader, std::vector<T>& items) {
    uint32_t count = 0;
    DESERIALIZE_PRIMITIVE(reader, count)
    if (count > MAX_BATCH_ENTRIES) {
        SERIAL_ERROR(std::format("Message list too large: {} entries", count));
        return false;
    }
    items.clear();
    items.resize(count);
    for (T& item : items) {
        DESERIALIZE_SERIALIZABLE(reader, item)
    }
    return true;
}

} // namespace

std::ostream& operator<<(std::ostream& os, MessageType type) {
    switch (type) {
        case MessageType::ClaimAgent: return os << "ClaimAgent";
        case MessageType::ClaimResponse: return os << "ClaimResponse";
        case MessageType::ReleaseAgent: return os << "ReleaseAgent";
        case MessageType::UpdateAgentPosition: return os << "UpdateAgentPosition";
        case MessageType::UpdateAgentPositionBatch: return os << "UpdateAgentPositionBatch";
        case MessageType::AgentsOrphaned: return os << "AgentsOrphaned";
        case MessageType::AgentJumpTriggered: return os << "AgentJumpTriggered";
    }
    return os << "Unknown";
}

// ===== Position updates =====

bool PositionUpdate::serialize(BinarySerial::Writer& writer) const {
    SERIALIZE_STRING(writer, agentId)
    SERIALIZE_PRIMITIVE(writer, position)
    SERIALIZE_PRIMITIVE(writer, orientation)
    SERIALIZE_PRIMITIVE(writer, timestampMs)
    return true;
}

bool PositionUpdate::deserialize(BinarySerial::Reader& reader) {
    DESERIALIZE_STRING(reader, agentId)
    DESERIALIZE_PRIMITIVE(reader, position)
    DESERIALIZE_PRIMITIVE(reader, orientation)
    DESERIALIZE_PRIMITIVE(reader, timestampMs)
    return true;
}

bool PositionBatch::serialize(BinarySerial::Writer& writer) const {
    SERIALIZE_PRIMITIVE(writer, MESSAGE_LAYOUT)
    return writeList(writer, updates);
}

bool PositionBatch::deserialize(BinarySerial::Reader& reader) {
    return readLayout(reader) && readList(reader, updates);
}

// ===== Ownership =====

bool OrphanEntry::serialize(BinarySerial::Writer& writer) const {
    SERIALIZE_STRING(writer, agentId)
    SERIALIZE_PRIMITIVE(writer, lastPosition)
    SERIALIZE_PRIMITIVE(writer, claimVersion)
    return true;
}

bool OrphanEntry::deserialize(BinarySerial::Reader& reader) {
    DESERIALIZE_STRING(reader, agentId)
    DESERIALIZE_PRIMITIVE(reader, lastPosition)
    DESERIALIZE_PRIMITIVE(reader, claimVersion)
    return true;
}

bool AgentsOrphaned::serialize(BinarySerial::Writer& writer) const {
    SERIALIZE_PRIMITIVE(writer, MESSAGE_LAYOUT)
    return writeList(writer, agents);
}

bool AgentsOrphaned::deserialize(BinarySerial::Reader& reader) {
    return readLayout(reader) && readList(reader, agents);
}

bool ClaimAgentRequest::serialize(BinarySerial::Writer& writer) const {
    SERIALIZE_PRIMITIVE(writer, MESSAGE_LAYOUT)
    SERIALIZE_STRING(writer, agentId)
    const bool hasVersion = expectedVersion.has_value();
    SERIALIZE_PRIMITIVE(writer, hasVersion)
    if (hasVersion) {
        SERIALIZE_PRIMITIVE(writer, *expectedVersion)
    }
    return true;
}

bool ClaimAgentRequest::deserialize(BinarySerial::Reader& reader) {
    if (!readLayout(reader)) {
        return false;
    }
    DESERIALIZE_STRING(reader, agentId)
    bool hasVersion = false;
    DESERIALIZE_PRIMITIVE(reader, hasVersion)
    if (hasVersion) {
        uint64_t version = 0;
        DESERIALIZE_PRIMITIVE(reader, version)
        expectedVersion = version;
    } else {
        expectedVersion.reset();
    }
    return true;
}

bool ClaimAgentResponse::serialize(BinarySerial::Writer& writer) const {
    SERIALIZE_PRIMITIVE(writer, MESSAGE_LAYOUT)
    SERIALIZE_STRING(writer, agentId)
    SERIALIZE_PRIMITIVE(writer, result)
    SERIALIZE_PRIMITIVE(writer, claimVersion)
    return true;
}

bool ClaimAgentResponse::deserialize(BinarySerial::Reader& reader) {
    if (!readLayout(reader)) {
        return false;
    }
    DESERIALIZE_STRING(reader, agentId)
    DESERIALIZE_PRIMITIVE(reader, result)
    if (static_cast<uint8_t>(result) > static_cast<uint8_t>(ClaimResult::AgentDead)) {
        return false;
    }
    DESERIALIZE_PRIMITIVE(reader, claimVersion)
    return true;
}

bool ReleaseAgentRequest::serialize(BinarySerial::Writer& writer) const {
    SERIALIZE_PRIMITIVE(writer, MESSAGE_LAYOUT)
    SERIALIZE_STRING(writer, agentId)
    return true;
}

bool ReleaseAgentRequest::deserialize(BinarySerial::Reader& reader) {
    if (!readLayout(reader)) {
        return false;
    }
    DESERIALIZE_STRING(reader, agentId)
    return true;
}

bool AgentJumpTriggered::serialize(BinarySerial::Writer& writer) const {
    SERIALIZE_PRIMITIVE(writer, MESSAGE_LAYOUT)
    SERIALIZE_STRING(writer, agentId)
    SERIALIZE_PRIMITIVE(writer, jumpPower)
    return true;
}

bool AgentJumpTriggered::deserialize(BinarySerial::Reader& reader) {
    if (!readLayout(reader)) {
        return false;
    }
    DESERIALIZE_STRING(reader, agentId)
    DESERIALIZE_PRIMITIVE(reader, jumpPower)
    return true;
}

} // namespace SwarmForge
