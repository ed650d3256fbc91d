//----------------------------------------------------------------------------------------------------------------------
// File: Loopback.hpp
// Description: An in-process cluster. Each node provides the message broker and cluster service consumed by its query
// manager, messages published by one node are handed synchronously to the matching subscribers of every other node.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Identifier/NodeIdentifier.hpp"
#include "Components/Subscription/Ssid.hpp"
#include "Interfaces/ClusterPeer.hpp"
#include "Interfaces/ClusterService.hpp"
#include "Interfaces/MessageBroker.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string_view>
#include <utility>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Cluster {
//----------------------------------------------------------------------------------------------------------------------

class LoopbackNetwork;
class LoopbackNode;
class LoopbackPeer;

//----------------------------------------------------------------------------------------------------------------------
} // Cluster namespace
//----------------------------------------------------------------------------------------------------------------------

class Cluster::LoopbackNetwork : public std::enable_shared_from_this<Cluster::LoopbackNetwork>
{
public:
    LoopbackNetwork();

    LoopbackNetwork(LoopbackNetwork const&) = delete;
    LoopbackNetwork(LoopbackNetwork&& ) = delete;
    LoopbackNetwork& operator=(LoopbackNetwork const&) = delete;
    LoopbackNetwork& operator=(LoopbackNetwork&&) = delete;

    // Returns nullptr when the name is zero or already in use.
    [[nodiscard]] std::shared_ptr<LoopbackNode> Attach(PeerName name);
    bool Detach(PeerName name);

    [[nodiscard]] std::shared_ptr<LoopbackNode> GetNode(PeerName name) const;
    [[nodiscard]] std::size_t GetNodeCount() const;

    // Hands the message to the subscribers of every node other than the origin. Returns the number of subscribers
    // that were handed the message.
    std::size_t Broadcast(
        PeerName origin, Subscription::Ssid const& ssid, std::string_view channel, Message::Buffer const& payload) const;

private:
    mutable std::shared_mutex m_mutex;
    std::map<PeerName, std::shared_ptr<LoopbackNode>> m_nodes;
    std::shared_ptr<spdlog::logger> m_logger;
};

//----------------------------------------------------------------------------------------------------------------------

class Cluster::LoopbackNode final : public IMessageBroker, public IClusterService
{
public:
    using Notification = std::pair<Node::Identifier, Subscription::Ssid>;

    LoopbackNode(PeerName name, std::weak_ptr<LoopbackNetwork> const& wpNetwork);

    LoopbackNode(LoopbackNode const&) = delete;
    LoopbackNode(LoopbackNode&& ) = delete;
    LoopbackNode& operator=(LoopbackNode const&) = delete;
    LoopbackNode& operator=(LoopbackNode&&) = delete;

    // IMessageBroker {
    // Note: Unsubscribe blocks until deliveries to the subscriber on other threads have returned.
    [[nodiscard]] bool Subscribe(Subscription::Ssid const& ssid, ISubscriber* const pSubscriber) override;
    bool Unsubscribe(Subscription::Ssid const& ssid, ISubscriber* const pSubscriber) override;
    std::size_t Publish(
        Subscription::Ssid const& ssid, std::string_view channel, Message::Buffer const& payload) override;
    // } IMessageBroker

    // IClusterService {
    [[nodiscard]] std::shared_ptr<IClusterPeer> FindPeer(PeerName name) const override;
    [[nodiscard]] PeerName GetLocalName() const override;
    [[nodiscard]] std::size_t GetPeerCount() const override;
    void NotifySubscribe(Node::Identifier const& identifier, Subscription::Ssid const& ssid) override;
    // } IClusterService

    // Hands the message to each local subscriber whose subscription is a prefix of the provided identifier.
    // Subscribers withdrawn before their turn are skipped.
    std::size_t Deliver(Subscription::Ssid const& ssid, std::string_view channel, Message::Buffer const& payload);

    [[nodiscard]] std::size_t GetSubscriptionCount() const;
    [[nodiscard]] std::vector<Notification> GetNotifications() const;

private:
    class Registration;

    PeerName const m_name;
    std::weak_ptr<LoopbackNetwork> const m_wpNetwork;

    mutable std::shared_mutex m_mutex;
    std::vector<std::shared_ptr<Registration>> m_subscriptions;
    std::vector<Notification> m_notifications;

    std::shared_ptr<spdlog::logger> m_logger;
};

//----------------------------------------------------------------------------------------------------------------------

class Cluster::LoopbackPeer final : public IClusterPeer
{
public:
    LoopbackPeer(PeerName name, std::weak_ptr<LoopbackNode> const& wpNode);

    // IClusterPeer {
    [[nodiscard]] PeerName GetName() const override;
    [[nodiscard]] bool Send(
        Subscription::Ssid const& ssid, std::string_view channel, Message::Buffer const& payload) override;
    // } IClusterPeer

private:
    PeerName const m_name;
    std::weak_ptr<LoopbackNode> const m_wpNode;
};

//----------------------------------------------------------------------------------------------------------------------
