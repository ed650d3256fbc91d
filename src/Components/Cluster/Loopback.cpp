//----------------------------------------------------------------------------------------------------------------------
// File: Loopback.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Loopback.hpp"
#include "Interfaces/Subscriber.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cassert>
#include <condition_variable>
#include <optional>
#include <ranges>
#include <thread>
//----------------------------------------------------------------------------------------------------------------------

class Cluster::LoopbackNode::Registration
{
public:
    Registration(Subscription::Ssid const& ssid, ISubscriber* const pSubscriber);

    [[nodiscard]] bool Matches(Subscription::Ssid const& ssid, ISubscriber const* const pSubscriber) const;
    [[nodiscard]] bool IsPrefixOf(Subscription::Ssid const& ssid) const;

    // Returns the subscriber's result, or nullopt when the registration has been withdrawn.
    [[nodiscard]] std::optional<bool> Deliver(
        Subscription::Ssid const& ssid, std::string_view channel, Message::Buffer const& payload);

    // Prevents any further deliveries and blocks until those in progress on other threads have returned. Deliveries
    // on the calling thread are not waited upon, a subscriber may withdraw itself while handling a message.
    void Withdraw();

private:
    void Complete();

    Subscription::Ssid const m_subscription;
    ISubscriber* const m_pSubscriber;

    std::mutex m_mutex;
    std::condition_variable m_condition;
    bool m_withdrawn;
    std::vector<std::thread::id> m_deliveries;
};

//----------------------------------------------------------------------------------------------------------------------

Cluster::LoopbackNetwork::LoopbackNetwork()
    : m_mutex()
    , m_nodes()
    , m_logger(Logger::Get(Logger::Name::Cluster))
{
    assert(m_logger);
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Cluster::LoopbackNode> Cluster::LoopbackNetwork::Attach(PeerName name)
{
    constexpr std::string_view AttachedMessage = "Node attached to the loopback cluster. [name={}]";
    constexpr std::string_view DuplicateWarning = "Unable to attach a node with a name already in use. [name={}]";

    if (name == 0) { return nullptr; } // Zero is never a valid cluster address.

    std::unique_lock lock{ m_mutex };
    if (m_nodes.contains(name)) {
        m_logger->warn(DuplicateWarning, name);
        return nullptr;
    }

    auto const spNode = std::make_shared<LoopbackNode>(name, weak_from_this());
    m_nodes.emplace(name, spNode);
    m_logger->debug(AttachedMessage, name);
    return spNode;
}

//----------------------------------------------------------------------------------------------------------------------

bool Cluster::LoopbackNetwork::Detach(PeerName name)
{
    constexpr std::string_view DetachedMessage = "Node detached from the loopback cluster. [name={}]";

    std::unique_lock lock{ m_mutex };
    if (m_nodes.erase(name) == 0) { return false; }
    m_logger->debug(DetachedMessage, name);
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Cluster::LoopbackNode> Cluster::LoopbackNetwork::GetNode(PeerName name) const
{
    std::shared_lock lock{ m_mutex };
    if (auto const itr = m_nodes.find(name); itr != m_nodes.end()) { return itr->second; }
    return nullptr;
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Cluster::LoopbackNetwork::GetNodeCount() const
{
    std::shared_lock lock{ m_mutex };
    return m_nodes.size();
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Cluster::LoopbackNetwork::Broadcast(
    PeerName origin, Subscription::Ssid const& ssid, std::string_view channel, Message::Buffer const& payload) const
{
    // Delivery may re-enter the network (e.g. a subscriber responding to the message), the lock must not be held
    // while the recipients are handed the message.
    std::vector<std::shared_ptr<LoopbackNode>> recipients;
    {
        std::shared_lock lock{ m_mutex };
        recipients.reserve(m_nodes.size());
        for (auto const& [name, spNode] : m_nodes) {
            if (name != origin) { recipients.emplace_back(spNode); }
        }
    }

    std::size_t reached = 0;
    for (auto const& spNode : recipients) { reached += spNode->Deliver(ssid, channel, payload); }
    return reached;
}

//----------------------------------------------------------------------------------------------------------------------

Cluster::LoopbackNode::LoopbackNode(PeerName name, std::weak_ptr<LoopbackNetwork> const& wpNetwork)
    : m_name(name)
    , m_wpNetwork(wpNetwork)
    , m_mutex()
    , m_subscriptions()
    , m_notifications()
    , m_logger(Logger::Get(Logger::Name::Cluster))
{
    assert(m_logger);
}

//----------------------------------------------------------------------------------------------------------------------

bool Cluster::LoopbackNode::Subscribe(Subscription::Ssid const& ssid, ISubscriber* const pSubscriber)
{
    if (!pSubscriber || ssid.IsEmpty()) { return false; }

    std::unique_lock lock{ m_mutex };
    auto const matches = [&] (auto const& spRegistration) { return spRegistration->Matches(ssid, pSubscriber); };
    if (std::ranges::any_of(m_subscriptions, matches)) { return false; }
    m_subscriptions.emplace_back(std::make_shared<Registration>(ssid, pSubscriber));
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Cluster::LoopbackNode::Unsubscribe(Subscription::Ssid const& ssid, ISubscriber* const pSubscriber)
{
    std::shared_ptr<Registration> spRegistration;
    {
        std::unique_lock lock{ m_mutex };
        auto const itr = std::ranges::find_if(m_subscriptions, [&] (auto const& spCandidate) {
            return spCandidate->Matches(ssid, pSubscriber);
        });
        if (itr == m_subscriptions.end()) { return false; }
        spRegistration = *itr;
        m_subscriptions.erase(itr);
    }

    // The subscriber may be destroyed once this returns, in-flight deliveries must finish with it first.
    spRegistration->Withdraw();
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Cluster::LoopbackNode::Publish(
    Subscription::Ssid const& ssid, std::string_view channel, Message::Buffer const& payload)
{
    constexpr std::string_view DetachedWarning = "Unable to publish from a node outside of the cluster. [name={}]";

    auto const spNetwork = m_wpNetwork.lock();
    if (!spNetwork) {
        m_logger->warn(DetachedWarning, m_name);
        return 0;
    }

    return spNetwork->Broadcast(m_name, ssid, channel, payload);
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<IClusterPeer> Cluster::LoopbackNode::FindPeer(PeerName name) const
{
    auto const spNetwork = m_wpNetwork.lock();
    if (!spNetwork) { return nullptr; }

    auto const spNode = spNetwork->GetNode(name);
    if (!spNode) { return nullptr; }

    return std::make_shared<LoopbackPeer>(name, spNode);
}

//----------------------------------------------------------------------------------------------------------------------

Cluster::PeerName Cluster::LoopbackNode::GetLocalName() const { return m_name; }

//----------------------------------------------------------------------------------------------------------------------

std::size_t Cluster::LoopbackNode::GetPeerCount() const
{
    auto const spNetwork = m_wpNetwork.lock();
    if (!spNetwork) { return 0; }

    std::size_t const nodes = spNetwork->GetNodeCount();
    return (nodes > 0) ? nodes - 1 : 0; // The local node is not a peer of itself.
}

//----------------------------------------------------------------------------------------------------------------------

void Cluster::LoopbackNode::NotifySubscribe(Node::Identifier const& identifier, Subscription::Ssid const& ssid)
{
    constexpr std::string_view SubscribedMessage = "Announcing subscription {} for {}. [name={}]";

    {
        std::unique_lock lock{ m_mutex };
        m_notifications.emplace_back(identifier, ssid);
    }

    m_logger->debug(SubscribedMessage, ssid.ToString(), identifier.ToString(), m_name);
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Cluster::LoopbackNode::Deliver(
    Subscription::Ssid const& ssid, std::string_view channel, Message::Buffer const& payload)
{
    constexpr std::string_view RejectedMessage = "A subscriber rejected a message on {}. [name={}, channel={}]";

    std::vector<std::shared_ptr<Registration>> registrations;
    {
        std::shared_lock lock{ m_mutex };
        for (auto const& spRegistration : m_subscriptions) {
            if (spRegistration->IsPrefixOf(ssid)) { registrations.emplace_back(spRegistration); }
        }
    }

    std::size_t reached = 0;
    for (auto const& spRegistration : registrations) {
        auto const optAccepted = spRegistration->Deliver(ssid, channel, payload);
        if (!optAccepted) { continue; } // The subscriber was withdrawn by an earlier recipient or another thread.

        ++reached;
        if (!*optAccepted) { m_logger->debug(RejectedMessage, ssid.ToString(), m_name, channel); }
    }

    return reached;
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Cluster::LoopbackNode::GetSubscriptionCount() const
{
    std::shared_lock lock{ m_mutex };
    return m_subscriptions.size();
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<Cluster::LoopbackNode::Notification> Cluster::LoopbackNode::GetNotifications() const
{
    std::shared_lock lock{ m_mutex };
    return m_notifications;
}

//----------------------------------------------------------------------------------------------------------------------

Cluster::LoopbackPeer::LoopbackPeer(PeerName name, std::weak_ptr<LoopbackNode> const& wpNode)
    : m_name(name)
    , m_wpNode(wpNode)
{
}

//----------------------------------------------------------------------------------------------------------------------

Cluster::PeerName Cluster::LoopbackPeer::GetName() const { return m_name; }

//----------------------------------------------------------------------------------------------------------------------

bool Cluster::LoopbackPeer::Send(
    Subscription::Ssid const& ssid, std::string_view channel, Message::Buffer const& payload)
{
    auto const spNode = m_wpNode.lock();
    if (!spNode) { return false; } // The peer has left the cluster.
    return spNode->Deliver(ssid, channel, payload) != 0;
}

//----------------------------------------------------------------------------------------------------------------------

Cluster::LoopbackNode::Registration::Registration(Subscription::Ssid const& ssid, ISubscriber* const pSubscriber)
    : m_subscription(ssid)
    , m_pSubscriber(pSubscriber)
    , m_mutex()
    , m_condition()
    , m_withdrawn(false)
    , m_deliveries()
{
    assert(m_pSubscriber);
}

//----------------------------------------------------------------------------------------------------------------------

bool Cluster::LoopbackNode::Registration::Matches(
    Subscription::Ssid const& ssid, ISubscriber const* const pSubscriber) const
{
    return m_pSubscriber == pSubscriber && m_subscription == ssid;
}

//----------------------------------------------------------------------------------------------------------------------

bool Cluster::LoopbackNode::Registration::IsPrefixOf(Subscription::Ssid const& ssid) const
{
    return m_subscription.IsPrefixOf(ssid);
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<bool> Cluster::LoopbackNode::Registration::Deliver(
    Subscription::Ssid const& ssid, std::string_view channel, Message::Buffer const& payload)
{
    {
        std::scoped_lock lock{ m_mutex };
        if (m_withdrawn) { return {}; }
        m_deliveries.emplace_back(std::this_thread::get_id());
    }

    struct Completion
    {
        ~Completion() { registration.Complete(); }
        Registration& registration;
    } const completion{ *this };

    return m_pSubscriber->Send(ssid, channel, payload);
}

//----------------------------------------------------------------------------------------------------------------------

void Cluster::LoopbackNode::Registration::Withdraw()
{
    auto const self = std::this_thread::get_id();
    std::unique_lock lock{ m_mutex };
    m_withdrawn = true;
    m_condition.wait(lock, [this, &self] {
        return std::ranges::all_of(m_deliveries, [&self] (std::thread::id const& id) { return id == self; });
    });
}

//----------------------------------------------------------------------------------------------------------------------

void Cluster::LoopbackNode::Registration::Complete()
{
    {
        std::scoped_lock lock{ m_mutex };
        if (auto const itr = std::ranges::find(m_deliveries, std::this_thread::get_id()); itr != m_deliveries.end()) {
            m_deliveries.erase(itr);
        }
    }
    m_condition.notify_all();
}

//----------------------------------------------------------------------------------------------------------------------
