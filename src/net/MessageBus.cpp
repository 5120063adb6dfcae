/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "net/MessageBus.hpp"
#include "core/Logger.hpp"
#include <format>

namespace SwarmForge {

MessageBus::HandlerToken MessageBus::connect(NodeId node, MessageHandler handler) {
    if (node == INVALID_NODE || node == AUTHORITY_NODE) {
        BUS_ERROR(std::format("Refusing connection with reserved node id {}", node));
        return {};
    }
    const uint64_t tokenId = m_nextTokenId++;
    const bool reconnect = m_nodes.contains(node);
    m_nodes[node] = Connection{tokenId, std::move(handler)};

    BUS_DEBUG(std::format("Node {} {}", node, reconnect ? "reconnected" : "connected"));
    if (!reconnect && m_connectionListener) {
        m_connectionListener(node, true);
    }
    return HandlerToken{node, tokenId};
}

bool MessageBus::disconnect(NodeId node) {
    if (m_nodes.erase(node) == 0) {
        return false;
    }
    BUS_DEBUG(std::format("Node {} disconnected", node));
    if (m_connectionListener) {
        m_connectionListener(node, false);
    }
    return true;
}

bool MessageBus::removeHandler(const HandlerToken& token) {
    auto it = m_nodes.find(token.node);
    if (it == m_nodes.end() || it->second.tokenId != token.id) {
        return false;
    }
    return disconnect(token.node);
}

std::vector<NodeId> MessageBus::getConnectedNodes() const {
    std::vector<NodeId> nodes;
    nodes.reserve(m_nodes.size());
    for (const auto& [node, connection] : m_nodes) {
        nodes.push_back(node);
    }
    return nodes;
}

bool MessageBus::post(NodeId to, Message message, DispatchMode mode) {
    if (!m_nodes.contains(to)) {
        m_stats.dropped++;
        return false;
    }
    m_stats.posted++;
    m_stats.bytes += message.payload.size();
    Envelope envelope{to, std::move(message)};
    if (mode == DispatchMode::Immediate) {
        return deliver(envelope);
    }
    m_queue.push_back(std::move(envelope));
    return true;
}

bool MessageBus::postToAuthority(Message message, DispatchMode mode) {
    if (!m_authorityHandler) {
        m_stats.dropped++;
        return false;
    }
    m_stats.posted++;
    m_stats.bytes += message.payload.size();
    Envelope envelope{AUTHORITY_NODE, std::move(message)};
    if (mode == DispatchMode::Immediate) {
        return deliver(envelope);
    }
    m_queue.push_back(std::move(envelope));
    return true;
}

std::optional<Message> MessageBus::call(const Message& request) {
    if (!m_requestHandler || !m_nodes.contains(request.sender)) {
        return std::nullopt;
    }
    m_stats.calls++;
    m_stats.bytes += request.payload.size();
    return m_requestHandler(request);
}

size_t MessageBus::pump() {
    size_t delivered = 0;
    while (!m_queue.empty()) {
        Envelope envelope = std::move(m_queue.front());
        m_queue.pop_front();
        if (deliver(envelope)) {
            delivered++;
        }
    }
    return delivered;
}

bool MessageBus::deliver(const Envelope& envelope) {
    if (envelope.to == AUTHORITY_NODE) {
        if (!m_authorityHandler) {
            m_stats.dropped++;
            return false;
        }
        m_authorityHandler(envelope.message);
        m_stats.delivered++;
        return true;
    }

    auto it = m_nodes.find(envelope.to);
    if (it == m_nodes.end()) {
        m_stats.dropped++;
        return false;
    }
    // Copy so a handler that disconnects its own node stays valid
    MessageHandler handler = it->second.handler;
    handler(envelope.message);
    m_stats.delivered++;
    return true;
}

} // namespace SwarmForge
