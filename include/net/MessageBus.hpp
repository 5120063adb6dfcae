/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MESSAGE_BUS_HPP
#define MESSAGE_BUS_HPP

/**
 * @file MessageBus.hpp
 * @brief In-process transport between simulation nodes and the authority
 *
 * Nodes connect with a handler and receive messages addressed to them.
 * The authority installs one message handler (posted traffic) and one
 * request handler (RPC). Deferred messages are queued and delivered by
 * pump(); Immediate messages are delivered inside post().
 *
 * Messages addressed to a node that disconnected before delivery are
 * dropped and counted.
 */

#include "net/Messages.hpp"
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <unordered_map>
#include <vector>

namespace SwarmForge {

class MessageBus {
public:
    using MessageHandler = std::function<void(const Message&)>;
    using RequestHandler = std::function<std::optional<Message>(const Message&)>;
    using ConnectionListener = std::function<void(NodeId, bool connected)>;

    enum class DispatchMode : uint8_t { Deferred = 0, Immediate = 1 };

    struct HandlerToken {
        NodeId node{INVALID_NODE};
        uint64_t id{0};
        bool valid() const { return id != 0; }
    };

    MessageBus() = default;
    MessageBus(const MessageBus&) = delete;
    MessageBus& operator=(const MessageBus&) = delete;

    // ===== Connections =====

    /**
     * @brief Attach a node. Reconnecting replaces the previous handler.
     */
    HandlerToken connect(NodeId node, MessageHandler handler);

    /**
     * @brief Detach a node and notify the connection listener
     */
    bool disconnect(NodeId node);

    // Detach only if the token still names the live connection
    bool removeHandler(const HandlerToken& token);

    bool isConnected(NodeId node) const { return m_nodes.contains(node); }
    std::vector<NodeId> getConnectedNodes() const;

    void setConnectionListener(ConnectionListener listener) { m_connectionListener = std::move(listener); }

    // ===== Authority side =====

    void setAuthorityHandler(MessageHandler handler) { m_authorityHandler = std::move(handler); }
    void setRequestHandler(RequestHandler handler) { m_requestHandler = std::move(handler); }

    // ===== Traffic =====

    bool post(NodeId to, Message message, DispatchMode mode = DispatchMode::Deferred);
    bool postToAuthority(Message message, DispatchMode mode = DispatchMode::Deferred);

    /**
     * @brief Synchronous request to the authority
     * @return the reply, nullopt without a request handler or sender connection
     */
    std::optional<Message> call(const Message& request);

    /**
     * @brief Deliver queued messages, including any posted during delivery
     * @return number of messages delivered
     */
    size_t pump();

    size_t getQueueSize() const { return m_queue.size(); }

    struct BusStats {
        uint64_t posted{0};
        uint64_t delivered{0};
        uint64_t dropped{0};
        uint64_t calls{0};
        uint64_t bytes{0};
    };
    const BusStats& getStats() const { return m_stats; }
    void resetStats() { m_stats = BusStats{}; }

private:
    struct Envelope {
        NodeId to;            // AUTHORITY_NODE for the authority
        Message message;
    };

    struct Connection {
        uint64_t tokenId;
        MessageHandler handler;
    };

    bool deliver(const Envelope& envelope);

    std::unordered_map<NodeId, Connection> m_nodes;
    std::deque<Envelope> m_queue;
    uint64_t m_nextTokenId{1};

    MessageHandler m_authorityHandler;
    RequestHandler m_requestHandler;
    ConnectionListener m_connectionListener;
    BusStats m_stats;
};

} // namespace SwarmForge

#endif // MESSAGE_BUS_HPP
