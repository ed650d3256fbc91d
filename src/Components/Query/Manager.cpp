//----------------------------------------------------------------------------------------------------------------------
// File: Manager.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Manager.hpp"
#include "Channel.hpp"
#include "CorrelationTable.hpp"
#include "CanvassNode/ServiceProvider.hpp"
#include "Interfaces/ClusterService.hpp"
#include "Interfaces/MessageBroker.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <stdexcept>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] Node::Identifier GenerateIdentifier();

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Query::Manager::Manager(std::shared_ptr<Node::ServiceProvider> const& spServiceProvider)
    : m_identifier(local::GenerateIdentifier())
    , m_wpMessageBroker(spServiceProvider->Fetch<IMessageBroker>())
    , m_wpClusterService(spServiceProvider->Fetch<IClusterService>())
    , m_next(0)
    , m_spCorrelationTable(std::make_shared<CorrelationTable>())
    , m_handlers()
    , m_started(false)
    , m_logger(Logger::Get(Logger::Name::Query))
{
    assert(m_logger);
    assert(!m_wpMessageBroker.expired());
    assert(!m_wpClusterService.expired());
}

//----------------------------------------------------------------------------------------------------------------------

Query::Manager::~Manager()
{
    Stop();
}

//----------------------------------------------------------------------------------------------------------------------

bool Query::Manager::Start()
{
    constexpr std::string_view StartedWarning = "The query manager has already been started. [subscriber={}]";
    constexpr std::string_view BrokerError = "Unable to start the query manager, the message broker is unavailable.";
    constexpr std::string_view SubscribeError = "Unable to subscribe to the query channel {}. [subscriber={}]";
    constexpr std::string_view StartedMessage = "Listening for queries on {} with {} handler(s). [subscriber={}]";

    if (m_started.exchange(true)) {
        m_logger->warn(StartedWarning, m_identifier.ToString());
        return false;
    }

    auto const spMessageBroker = m_wpMessageBroker.lock();
    if (!spMessageBroker) {
        m_logger->error(BrokerError);
        m_started = false;
        return false;
    }

    auto const subscription = Channel::GetSubscription();
    if (!spMessageBroker->Subscribe(subscription, this)) {
        m_logger->error(SubscribeError, subscription.ToString(), m_identifier.ToString());
        m_started = false;
        return false;
    }

    if (auto const spClusterService = m_wpClusterService.lock(); spClusterService) {
        spClusterService->NotifySubscribe(m_identifier, subscription);
    }

    m_logger->debug(StartedMessage, subscription.ToString(), m_handlers.Size(), m_identifier.ToString());
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

void Query::Manager::Stop()
{
    if (!m_started.exchange(false)) { return; }
    if (auto const spMessageBroker = m_wpMessageBroker.lock(); spMessageBroker) {
        [[maybe_unused]] bool const unsubscribed = spMessageBroker->Unsubscribe(Channel::GetSubscription(), this);
    }
}

//----------------------------------------------------------------------------------------------------------------------

void Query::Manager::HandleFunc(Handler const& handler)
{
    m_handlers.Append(handler);
}

//----------------------------------------------------------------------------------------------------------------------

Node::Identifier const& Query::Manager::GetIdentifier() const { return m_identifier; }

//----------------------------------------------------------------------------------------------------------------------

Subscription::SubscriberType Query::Manager::GetType() const { return Subscription::SubscriberType::Direct; }

//----------------------------------------------------------------------------------------------------------------------

bool Query::Manager::Send(
    Subscription::Ssid const& ssid, std::string_view channel, Message::Buffer const& payload)
{
    return Process(ssid, channel, payload) == Status::Success;
}

//----------------------------------------------------------------------------------------------------------------------

Query::Status Query::Manager::Process(
    Subscription::Ssid const& ssid, std::string_view channel, Message::Buffer const& payload)
{
    constexpr std::string_view InvalidWarning = "Dropping query traffic addressed to {}. [channel={}]";

    if (ssid.GetSize() != Channel::AddressSize) {
        m_logger->warn(InvalidWarning, ssid.ToString(), channel);
        return Status::InvalidQuery;
    }

    CorrelationId const id = ssid[Channel::AddressSize - 1];
    if (Channel::IsResponse(channel)) { return OnResponse(id, payload); }
    return OnRequest(ssid, channel, payload);
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Query::Awaiter> Query::Manager::Request(std::string_view type, Message::Buffer const& payload)
{
    constexpr std::string_view TypeWarning = "Unable to issue a query with an invalid type. [type={}]";
    constexpr std::string_view ServiceError = "Unable to issue a query, the cluster services are unavailable.";
    constexpr std::string_view ReplacedWarning = "A query identifier was reissued while still outstanding. [id={}]";
    constexpr std::string_view PublishedMessage = "Published a \"{}\" query to {} of {} peer(s). [id={}]";

    if (!Channel::IsValidType(type)) {
        m_logger->warn(TypeWarning, type);
        return nullptr;
    }

    auto const spMessageBroker = m_wpMessageBroker.lock();
    auto const spClusterService = m_wpClusterService.lock();
    if (!spMessageBroker || !spClusterService) {
        m_logger->error(ServiceError);
        return nullptr;
    }

    CorrelationId const id = m_next.fetch_add(1) + 1;
    std::size_t const peers = spClusterService->GetPeerCount();

    // The awaiter must be discoverable before the request leaves the node, a peer may respond before publish returns.
    auto const spAwaiter = std::make_shared<Awaiter>(id, peers, m_spCorrelationTable);
    if (m_spCorrelationTable->Emplace(spAwaiter) == CorrelationTable::EmplaceResult::Replaced) {
        m_logger->warn(ReplacedWarning, id);
    }

    auto const channel = Channel::MakeRequest(type, spClusterService->GetLocalName());
    std::size_t const reached = spMessageBroker->Publish(Channel::GetAddress(id), channel, payload);
    m_logger->debug(PublishedMessage, type, reached, peers, id);

    return spAwaiter;
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Query::Manager::Waiting() const { return m_spCorrelationTable->Size(); }

//----------------------------------------------------------------------------------------------------------------------

Query::Status Query::Manager::OnResponse(CorrelationId id, Message::Buffer const& payload) const
{
    constexpr std::string_view UnknownMessage = "Ignoring a response for an unknown query. [id={}]";
    constexpr std::string_view AcceptedMessage = "Received a response for query. [id={}]";
    constexpr std::string_view CompletedMessage = "Ignoring a response for a completed query. [id={}]";
    constexpr std::string_view OverflowWarning = "Ignoring an unexpected response beyond the expected {}. [id={}]";

    auto const spAwaiter = m_spCorrelationTable->Find(id);
    if (!spAwaiter) {
        m_logger->debug(UnknownMessage, id);
        return Status::Success;
    }

    switch (spAwaiter->Deliver(payload)) {
        case Awaiter::DeliveryResult::Accepted: m_logger->trace(AcceptedMessage, id); break;
        case Awaiter::DeliveryResult::Completed: m_logger->debug(CompletedMessage, id); break;
        case Awaiter::DeliveryResult::Overflow: m_logger->warn(OverflowWarning, spAwaiter->GetMaximum(), id); break;
    }

    return Status::Success;
}

//----------------------------------------------------------------------------------------------------------------------

Query::Status Query::Manager::OnRequest(
    Subscription::Ssid const& ssid, std::string_view channel, Message::Buffer const& payload) const
{
    constexpr std::string_view MalformedWarning = "Dropping a query with a malformed reply address. [channel={}]";
    constexpr std::string_view ServiceError = "Unable to answer a query, the cluster service is unavailable.";
    constexpr std::string_view PeerWarning = "Unable to answer a query from an unknown peer. [peer={}, id={}]";
    constexpr std::string_view HandlerWarning = "No handler claimed the \"{}\" query. [peer={}, id={}]";
    constexpr std::string_view DeliveryWarning = "Failed to send a query response. [peer={}, id={}]";
    constexpr std::string_view RespondedMessage = "Responded to a \"{}\" query. [peer={}, id={}]";

    CorrelationId const id = ssid[Channel::AddressSize - 1];

    auto const optRequest = Channel::ParseRequest(channel);
    if (!optRequest) {
        m_logger->warn(MalformedWarning, channel);
        return Status::MalformedReplyAddress;
    }

    auto const spClusterService = m_wpClusterService.lock();
    if (!spClusterService) {
        m_logger->error(ServiceError);
        return Status::PeerUnavailable;
    }

    auto const spPeer = spClusterService->FindPeer(optRequest->reply);
    if (!spPeer) {
        m_logger->warn(PeerWarning, optRequest->reply, id);
        return Status::PeerUnavailable;
    }

    auto const optResponse = m_handlers.Handle(optRequest->type, payload);
    if (!optResponse) {
        m_logger->warn(HandlerWarning, optRequest->type, optRequest->reply, id);
        return Status::NoHandlerFound;
    }

    if (!spPeer->Send(ssid, Channel::Response, *optResponse)) {
        m_logger->warn(DeliveryWarning, optRequest->reply, id);
        return Status::DeliveryFailed;
    }

    m_logger->debug(RespondedMessage, optRequest->type, optRequest->reply, id);
    return Status::Success;
}

//----------------------------------------------------------------------------------------------------------------------

Node::Identifier local::GenerateIdentifier()
{
    auto optIdentifier = Node::GenerateIdentifier();
    if (!optIdentifier) { throw std::runtime_error("Failed to generate a query manager identifier!"); }
    return *optIdentifier;
}

//----------------------------------------------------------------------------------------------------------------------
