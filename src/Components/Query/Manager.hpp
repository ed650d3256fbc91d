//----------------------------------------------------------------------------------------------------------------------
// File: Manager.hpp
// Description: Issues scatter-gather queries to the cluster and answers the queries issued by other nodes. The
// manager subscribes to the reserved query channel and is handed every request and response carried on it.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Awaiter.hpp"
#include "Definitions.hpp"
#include "HandlerRegistry.hpp"
#include "Components/Identifier/NodeIdentifier.hpp"
#include "Interfaces/Subscriber.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <atomic>
#include <cstdint>
#include <memory>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

namespace spdlog { class logger; }
namespace Node { class ServiceProvider; }

class IClusterService;
class IMessageBroker;

//----------------------------------------------------------------------------------------------------------------------
namespace Query {
//----------------------------------------------------------------------------------------------------------------------

class CorrelationTable;
class Manager;

//----------------------------------------------------------------------------------------------------------------------
} // Query namespace
//----------------------------------------------------------------------------------------------------------------------

class Query::Manager final : public ISubscriber
{
public:
    explicit Manager(std::shared_ptr<Node::ServiceProvider> const& spServiceProvider);
    ~Manager() override;

    Manager(Manager const&) = delete;
    Manager(Manager&& ) = delete;
    Manager& operator=(Manager const&) = delete;
    Manager& operator=(Manager&&) = delete;

    // Subscribes to the query channel and announces the subscription to the cluster.
    [[nodiscard]] bool Start();
    void Stop();

    // Note: Handlers must be registered before the manager is started.
    void HandleFunc(Handler const& handler);

    // ISubscriber {
    [[nodiscard]] Node::Identifier const& GetIdentifier() const override;
    [[nodiscard]] Subscription::SubscriberType GetType() const override;
    [[nodiscard]] bool Send(
        Subscription::Ssid const& ssid, std::string_view channel, Message::Buffer const& payload) override;
    // } ISubscriber

    [[nodiscard]] Status Process(
        Subscription::Ssid const& ssid, std::string_view channel, Message::Buffer const& payload);

    // Broadcasts a query to the cluster. The returned awaiter expects one response from each peer known at the time
    // of the call. Returns nullptr when the query could not be issued.
    [[nodiscard]] std::shared_ptr<Awaiter> Request(std::string_view type, Message::Buffer const& payload);

    [[nodiscard]] std::size_t Waiting() const;

private:
    [[nodiscard]] Status OnResponse(CorrelationId id, Message::Buffer const& payload) const;
    [[nodiscard]] Status OnRequest(
        Subscription::Ssid const& ssid, std::string_view channel, Message::Buffer const& payload) const;

    Node::Identifier const m_identifier;
    std::weak_ptr<IMessageBroker> m_wpMessageBroker;
    std::weak_ptr<IClusterService> m_wpClusterService;

    std::atomic<CorrelationId> m_next;
    std::shared_ptr<CorrelationTable> m_spCorrelationTable;
    HandlerRegistry m_handlers;
    std::atomic_bool m_started;

    std::shared_ptr<spdlog::logger> m_logger;
};

//----------------------------------------------------------------------------------------------------------------------
