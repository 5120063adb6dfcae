/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/AgentRecord.hpp"

namespace SwarmForge {

// Wire layout version, bumped whenever fields change
constexpr uint8_t AGENT_RECORD_LAYOUT = 1;

bool AgentRecord::serialize(BinarySerial::Writer& writer) const {
    SERIALIZE_PRIMITIVE(writer, AGENT_RECORD_LAYOUT)
    SERIALIZE_STRING(writer, id)
    SERIALIZE_PRIMITIVE(writer, position)
    SERIALIZE_PRIMITIVE(writer, orientation)
    SERIALIZE_PRIMITIVE(writer, spawnPosition)
    SERIALIZE_PRIMITIVE(writer, health)
    SERIALIZE_PRIMITIVE(writer, maxHealth)
    SERIALIZE_PRIMITIVE(writer, isAlive)
    SERIALIZE_STRING(writer, configJson)

    const bool hasDestination = destination.has_value();
    SERIALIZE_PRIMITIVE(writer, hasDestination)
    if (hasDestination) {
        SERIALIZE_PRIMITIVE(writer, *destination)
    }

    SERIALIZE_PRIMITIVE(writer, ownerNode)
    SERIALIZE_PRIMITIVE(writer, status)
    SERIALIZE_PRIMITIVE(writer, claimVersion)
    SERIALIZE_PRIMITIVE(writer, lastUpdateMs)
    return true;
}

bool AgentRecord::deserialize(BinarySerial::Reader& reader) {
    uint8_t layout = 0;
    DESERIALIZE_PRIMITIVE(reader, layout)
    if (layout != AGENT_RECORD_LAYOUT) {
        SERIAL_ERROR(std::format("Unsupported agent record layout: {}", layout));
        return false;
    }

    DESERIALIZE_STRING(reader, id)
    DESERIALIZE_PRIMITIVE(reader, position)
    DESERIALIZE_PRIMITIVE(reader, orientation)
    DESERIALIZE_PRIMITIVE(reader, spawnPosition)
    DESERIALIZE_PRIMITIVE(reader, health)
    DESERIALIZE_PRIMITIVE(reader, maxHealth)
    DESERIALIZE_PRIMITIVE(reader, isAlive)
    DESERIALIZE_STRING(reader, configJson)

    bool hasDestination = false;
    DESERIALIZE_PRIMITIVE(reader, hasDestination)
    if (hasDestination) {
        Vector3D dest;
        DESERIALIZE_PRIMITIVE(reader, dest)
        destination = dest;
    } else {
        destination.reset();
    }

    DESERIALIZE_PRIMITIVE(reader, ownerNode)
    DESERIALIZE_PRIMITIVE(reader, status)
    if (static_cast<uint8_t>(status) > static_cast<uint8_t>(OwnershipStatus::FallbackSimulated)) {
        return false;
    }
    DESERIALIZE_PRIMITIVE(reader, claimVersion)
    DESERIALIZE_PRIMITIVE(reader, lastUpdateMs)
    return true;
}

} // namespace SwarmForge
