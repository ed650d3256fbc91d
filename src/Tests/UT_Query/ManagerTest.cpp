//----------------------------------------------------------------------------------------------------------------------
#include "TestHelpers.hpp"
#include "Components/Query/Awaiter.hpp"
#include "Components/Query/Channel.hpp"
#include "Components/Query/Manager.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------
using namespace std::chrono_literals;
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace test {
//----------------------------------------------------------------------------------------------------------------------

constexpr Cluster::PeerName RemoteName = 7;
constexpr Query::CorrelationId RemoteId = 99;

constexpr auto ExtendedTimeout = 10s;

Message::Buffer const Payload = Message::ToBuffer(Query::Test::RequestPayload);

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

class QueryManagerSuite : public testing::Test
{
protected:
    void SetUp() override
    {
        m_spMessageBroker = std::make_shared<Query::Test::MessageBrokerStub>();
        m_spClusterService = std::make_shared<Query::Test::ClusterServiceStub>();
        m_spServiceProvider = Query::Test::CreateServiceProvider(m_spMessageBroker, m_spClusterService);
        m_upManager = std::make_unique<Query::Manager>(m_spServiceProvider);
    }

    void TearDown() override
    {
        m_upManager.reset();
    }

    [[nodiscard]] std::string RemoteRequest(std::string_view type = Query::Test::RequestType) const
    {
        return Query::Channel::MakeRequest(type, test::RemoteName);
    }

    std::shared_ptr<Query::Test::MessageBrokerStub> m_spMessageBroker;
    std::shared_ptr<Query::Test::ClusterServiceStub> m_spClusterService;
    std::shared_ptr<Node::ServiceProvider> m_spServiceProvider;
    std::unique_ptr<Query::Manager> m_upManager;
};

//----------------------------------------------------------------------------------------------------------------------

TEST_F(QueryManagerSuite, StartupTest)
{
    EXPECT_TRUE(m_upManager->GetIdentifier().IsValid());
    EXPECT_EQ(m_upManager->GetType(), Subscription::SubscriberType::Direct);

    ASSERT_TRUE(m_upManager->Start());
    {
        auto const subscriptions = m_spMessageBroker->GetSubscriptions();
        ASSERT_EQ(subscriptions.size(), std::size_t{ 1 });
        EXPECT_EQ(subscriptions.front().first, Query::Channel::GetSubscription());
        EXPECT_EQ(subscriptions.front().second, static_cast<ISubscriber*>(m_upManager.get()));

        auto const notifications = m_spClusterService->GetNotifications();
        ASSERT_EQ(notifications.size(), std::size_t{ 1 });
        EXPECT_EQ(notifications.front().first, m_upManager->GetIdentifier());
        EXPECT_EQ(notifications.front().second, Query::Channel::GetSubscription());
    }

    EXPECT_FALSE(m_upManager->Start()); // A manager may only be started once.
    EXPECT_EQ(m_spMessageBroker->GetSubscriptions().size(), std::size_t{ 1 });

    m_upManager->Stop();
    EXPECT_TRUE(m_spMessageBroker->GetSubscriptions().empty());

    // A stopped manager may be started again.
    EXPECT_TRUE(m_upManager->Start());
    EXPECT_EQ(m_spMessageBroker->GetSubscriptions().size(), std::size_t{ 1 });

    m_upManager.reset();
    EXPECT_TRUE(m_spMessageBroker->GetSubscriptions().empty());
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(QueryManagerSuite, RejectedSubscriptionTest)
{
    m_spMessageBroker->SetAcceptSubscriptions(false);
    EXPECT_FALSE(m_upManager->Start());
    EXPECT_TRUE(m_spClusterService->GetNotifications().empty());

    m_spMessageBroker->SetAcceptSubscriptions(true);
    EXPECT_TRUE(m_upManager->Start());
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(QueryManagerSuite, RequestTest)
{
    m_spClusterService->SetPeerCount(3);

    auto const spFirst = m_upManager->Request(Query::Test::RequestType, test::Payload);
    ASSERT_TRUE(spFirst);
    EXPECT_EQ(spFirst->GetId(), Query::CorrelationId{ 1 });
    EXPECT_EQ(spFirst->GetMaximum(), std::size_t{ 3 });
    EXPECT_EQ(m_upManager->Waiting(), std::size_t{ 1 });

    auto const spSecond = m_upManager->Request("stats", Message::Buffer{});
    ASSERT_TRUE(spSecond);
    EXPECT_EQ(spSecond->GetId(), Query::CorrelationId{ 2 });
    EXPECT_EQ(m_upManager->Waiting(), std::size_t{ 2 });

    auto const published = m_spMessageBroker->GetPublished();
    ASSERT_EQ(published.size(), std::size_t{ 2 });

    EXPECT_EQ(published[0].ssid, Query::Channel::GetAddress(1));
    EXPECT_EQ(published[0].channel, "ping/1");
    EXPECT_EQ(published[0].payload, test::Payload);

    EXPECT_EQ(published[1].ssid, Query::Channel::GetAddress(2));
    EXPECT_EQ(published[1].channel, "stats/1");
    EXPECT_TRUE(published[1].payload.empty());

    EXPECT_TRUE(spFirst->Gather(1ms).empty());
    EXPECT_EQ(m_upManager->Waiting(), std::size_t{ 1 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(QueryManagerSuite, InvalidRequestTypeTest)
{
    EXPECT_FALSE(m_upManager->Request("ping/1", test::Payload));
    EXPECT_FALSE(m_upManager->Request("/", test::Payload));
    EXPECT_TRUE(m_spMessageBroker->GetPublished().empty());
    EXPECT_EQ(m_upManager->Waiting(), std::size_t{ 0 });

    // Rejected requests do not consume an identifier.
    auto const spAwaiter = m_upManager->Request(Query::Test::RequestType, test::Payload);
    ASSERT_TRUE(spAwaiter);
    EXPECT_EQ(spAwaiter->GetId(), Query::CorrelationId{ 1 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(QueryManagerSuite, UnavailableServicesTest)
{
    m_spClusterService.reset();
    EXPECT_FALSE(m_upManager->Request(Query::Test::RequestType, test::Payload));
    EXPECT_TRUE(m_spMessageBroker->GetPublished().empty());

    auto const address = Query::Channel::GetAddress(test::RemoteId);
    EXPECT_EQ(m_upManager->Process(address, RemoteRequest(), test::Payload), Query::Status::PeerUnavailable);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(QueryManagerSuite, NoExpectedResponsesTest)
{
    // A node without peers receives an immediately fulfilled query.
    auto const spAwaiter = m_upManager->Request(Query::Test::RequestType, test::Payload);
    ASSERT_TRUE(spAwaiter);
    EXPECT_EQ(spAwaiter->GetMaximum(), std::size_t{ 0 });

    auto const start = std::chrono::steady_clock::now();
    EXPECT_TRUE(spAwaiter->Gather(test::ExtendedTimeout).empty());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
    EXPECT_EQ(m_upManager->Waiting(), std::size_t{ 0 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(QueryManagerSuite, MaximumSnapshotTest)
{
    m_spClusterService->SetPeerCount(2);
    auto const spAwaiter = m_upManager->Request(Query::Test::RequestType, test::Payload);
    ASSERT_TRUE(spAwaiter);

    // Peers joining after the query was issued do not change the number of responses expected.
    m_spClusterService->SetPeerCount(5);
    EXPECT_EQ(spAwaiter->GetMaximum(), std::size_t{ 2 });

    auto const address = Query::Channel::GetAddress(spAwaiter->GetId());
    for (std::size_t idx = 0; idx < 3; ++idx) {
        EXPECT_EQ(m_upManager->Process(address, Query::Channel::Response, test::Payload), Query::Status::Success);
    }

    EXPECT_EQ(spAwaiter->Gather(test::ExtendedTimeout).size(), std::size_t{ 2 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(QueryManagerSuite, InvalidAddressTest)
{
    bool invoked = false;
    m_upManager->HandleFunc([&invoked] (std::string_view, Message::Buffer const&) -> std::optional<Message::Buffer> {
        invoked = true;
        return Message::ToBuffer("unexpected");
    });
    auto const spPeer = m_spClusterService->AddPeer(test::RemoteName);

    auto const subscription = Query::Channel::GetSubscription();
    EXPECT_EQ(m_upManager->Process(subscription, RemoteRequest(), test::Payload), Query::Status::InvalidQuery);
    EXPECT_EQ(
        m_upManager->Process(subscription.Append(1).Append(2), RemoteRequest(), test::Payload),
        Query::Status::InvalidQuery);
    EXPECT_EQ(
        m_upManager->Process(subscription, Query::Channel::Response, test::Payload), Query::Status::InvalidQuery);
    EXPECT_FALSE(m_upManager->Send(subscription, RemoteRequest(), test::Payload));

    EXPECT_FALSE(invoked);
    EXPECT_TRUE(spPeer->GetSent().empty());
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(QueryManagerSuite, HandleRequestTest)
{
    m_upManager->HandleFunc(Query::Test::CreateEchoHandler(Query::Test::RequestType, "pong"));
    auto const spPeer = m_spClusterService->AddPeer(test::RemoteName);

    auto const address = Query::Channel::GetAddress(test::RemoteId);
    EXPECT_EQ(m_upManager->Process(address, RemoteRequest(), test::Payload), Query::Status::Success);

    auto const sent = spPeer->GetSent();
    ASSERT_EQ(sent.size(), std::size_t{ 1 });
    EXPECT_EQ(sent.front().ssid, address);
    EXPECT_EQ(sent.front().channel, Query::Channel::Response);
    EXPECT_EQ(Message::ToString(sent.front().payload), "pong");

    EXPECT_TRUE(m_upManager->Send(address, RemoteRequest(), test::Payload));
    EXPECT_EQ(spPeer->GetSent().size(), std::size_t{ 2 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(QueryManagerSuite, FallthroughHandlerTest)
{
    std::vector<std::string> declined;
    auto const ping = [&declined] (std::string_view type, Message::Buffer const&) -> std::optional<Message::Buffer> {
        if (type == Query::Test::RequestType) { return Message::ToBuffer("pong"); }
        declined.emplace_back(type);
        return {};
    };
    m_upManager->HandleFunc(ping);
    m_upManager->HandleFunc(Query::Test::CreateEchoHandler("admin", "admin-report"));
    auto const spPeer = m_spClusterService->AddPeer(test::RemoteName);

    auto const address = Query::Channel::GetAddress(test::RemoteId);
    EXPECT_EQ(m_upManager->Process(address, RemoteRequest("admin"), test::Payload), Query::Status::Success);

    // Only the claiming handler's output is sent, the declining handler leaves no trace on the reply.
    auto const sent = spPeer->GetSent();
    ASSERT_EQ(sent.size(), std::size_t{ 1 });
    EXPECT_EQ(sent.front().ssid, address);
    EXPECT_EQ(Message::ToString(sent.front().payload), "admin-report");
    EXPECT_EQ(declined, (std::vector<std::string>{ "admin" }));
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(QueryManagerSuite, NoHandlerFoundTest)
{
    m_upManager->HandleFunc(Query::Test::CreateEchoHandler("stats", "{}"));
    auto const spPeer = m_spClusterService->AddPeer(test::RemoteName);

    auto const address = Query::Channel::GetAddress(test::RemoteId);
    EXPECT_EQ(m_upManager->Process(address, RemoteRequest(), test::Payload), Query::Status::NoHandlerFound);
    EXPECT_FALSE(m_upManager->Send(address, RemoteRequest(), test::Payload));
    EXPECT_TRUE(spPeer->GetSent().empty());
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(QueryManagerSuite, MalformedReplyAddressTest)
{
    bool invoked = false;
    m_upManager->HandleFunc([&invoked] (std::string_view, Message::Buffer const&) -> std::optional<Message::Buffer> {
        invoked = true;
        return Message::ToBuffer("unexpected");
    });
    auto const spPeer = m_spClusterService->AddPeer(test::RemoteName);

    auto const address = Query::Channel::GetAddress(test::RemoteId);
    EXPECT_EQ(m_upManager->Process(address, "stats/abc", test::Payload), Query::Status::MalformedReplyAddress);
    EXPECT_EQ(m_upManager->Process(address, "stats", test::Payload), Query::Status::MalformedReplyAddress);
    EXPECT_EQ(m_upManager->Process(address, "stats/-7", test::Payload), Query::Status::MalformedReplyAddress);

    EXPECT_FALSE(invoked);
    EXPECT_TRUE(spPeer->GetSent().empty());
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(QueryManagerSuite, PeerUnavailableTest)
{
    bool invoked = false;
    m_upManager->HandleFunc([&invoked] (std::string_view, Message::Buffer const&) -> std::optional<Message::Buffer> {
        invoked = true;
        return Message::ToBuffer("unexpected");
    });

    auto const address = Query::Channel::GetAddress(test::RemoteId);
    EXPECT_EQ(m_upManager->Process(address, RemoteRequest(), test::Payload), Query::Status::PeerUnavailable);
    EXPECT_FALSE(invoked);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(QueryManagerSuite, DeliveryFailedTest)
{
    m_upManager->HandleFunc(Query::Test::CreateEchoHandler(Query::Test::RequestType, "pong"));
    auto const spPeer = m_spClusterService->AddPeer(test::RemoteName);
    spPeer->SetAcceptMessages(false);

    auto const address = Query::Channel::GetAddress(test::RemoteId);
    EXPECT_EQ(m_upManager->Process(address, RemoteRequest(), test::Payload), Query::Status::DeliveryFailed);
    EXPECT_TRUE(spPeer->GetSent().empty());
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(QueryManagerSuite, UnknownResponseTest)
{
    auto const address = Query::Channel::GetAddress(test::RemoteId);
    EXPECT_EQ(m_upManager->Process(address, Query::Channel::Response, test::Payload), Query::Status::Success);
    EXPECT_TRUE(m_upManager->Send(address, Query::Channel::Response, test::Payload));
    EXPECT_EQ(m_upManager->Waiting(), std::size_t{ 0 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(QueryManagerSuite, GatherResponsesTest)
{
    m_spClusterService->SetPeerCount(3);
    auto const spAwaiter = m_upManager->Request(Query::Test::RequestType, test::Payload);
    ASSERT_TRUE(spAwaiter);

    auto const address = Query::Channel::GetAddress(spAwaiter->GetId());
    for (auto const response : { "alpha", "beta", "gamma" }) {
        EXPECT_TRUE(m_upManager->Send(address, Query::Channel::Response, Message::ToBuffer(response)));
    }

    auto const responses = spAwaiter->Gather(test::ExtendedTimeout);
    ASSERT_EQ(responses.size(), std::size_t{ 3 });
    EXPECT_EQ(Message::ToString(responses[0]), "alpha");
    EXPECT_EQ(Message::ToString(responses[1]), "beta");
    EXPECT_EQ(Message::ToString(responses[2]), "gamma");
    EXPECT_EQ(m_upManager->Waiting(), std::size_t{ 0 });

    // Responses arriving after the query completed are silently discarded.
    EXPECT_EQ(m_upManager->Process(address, Query::Channel::Response, test::Payload), Query::Status::Success);
    EXPECT_EQ(m_upManager->Waiting(), std::size_t{ 0 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(QueryManagerSuite, OutOfOrderResponsesTest)
{
    m_spClusterService->SetPeerCount(2);
    auto const spAwaiter = m_upManager->Request(Query::Test::RequestType, test::Payload);
    ASSERT_TRUE(spAwaiter);

    // The peer with the higher address answers first, responses are gathered in the order they arrived.
    auto const address = Query::Channel::GetAddress(spAwaiter->GetId());
    std::atomic_bool answered{ false };
    std::thread second([this, &address, &answered] {
        while (!answered) { std::this_thread::yield(); }
        EXPECT_TRUE(m_upManager->Send(address, Query::Channel::Response, Message::ToBuffer("peer-2")));
    });
    std::thread third([this, &address, &answered] {
        EXPECT_TRUE(m_upManager->Send(address, Query::Channel::Response, Message::ToBuffer("peer-3")));
        answered = true;
    });

    auto const responses = spAwaiter->Gather(test::ExtendedTimeout);
    second.join();
    third.join();

    ASSERT_EQ(responses.size(), std::size_t{ 2 });
    EXPECT_EQ(Message::ToString(responses[0]), "peer-3");
    EXPECT_EQ(Message::ToString(responses[1]), "peer-2");
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(QueryManagerSuite, SynchronousResponsesTest)
{
    // Responses may arrive before the request has finished publishing.
    constexpr std::size_t PeerCount = 4;
    m_spClusterService->SetPeerCount(PeerCount);
    m_spMessageBroker->SetPublishObserver([this] (Query::Test::Envelope const& envelope) {
        for (std::size_t idx = 0; idx < PeerCount; ++idx) {
            auto const response = Message::ToBuffer(std::to_string(idx));
            EXPECT_EQ(m_upManager->Process(envelope.ssid, Query::Channel::Response, response), Query::Status::Success);
        }
    });

    auto const spAwaiter = m_upManager->Request(Query::Test::RequestType, test::Payload);
    ASSERT_TRUE(spAwaiter);
    EXPECT_EQ(spAwaiter->GetReceived(), PeerCount);

    auto const start = std::chrono::steady_clock::now();
    auto const responses = spAwaiter->Gather(test::ExtendedTimeout);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
    EXPECT_EQ(responses.size(), PeerCount);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(QueryManagerSuite, ConcurrentResponsesTest)
{
    constexpr std::size_t PeerCount = 8;
    m_spClusterService->SetPeerCount(PeerCount);

    auto const spAwaiter = m_upManager->Request(Query::Test::RequestType, test::Payload);
    ASSERT_TRUE(spAwaiter);

    auto const address = Query::Channel::GetAddress(spAwaiter->GetId());
    std::vector<std::thread> responders;
    responders.reserve(PeerCount);
    for (std::size_t idx = 0; idx < PeerCount; ++idx) {
        responders.emplace_back([this, &address, idx] {
            auto const response = Message::ToBuffer(std::to_string(idx));
            EXPECT_TRUE(m_upManager->Send(address, Query::Channel::Response, response));
        });
    }

    auto const responses = spAwaiter->Gather(test::ExtendedTimeout);
    for (auto& responder : responders) { responder.join(); }

    EXPECT_EQ(responses.size(), PeerCount);
    EXPECT_EQ(m_upManager->Waiting(), std::size_t{ 0 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(QueryManagerSuite, IndependentQueriesTest)
{
    m_spClusterService->SetPeerCount(1);
    auto const spFirst = m_upManager->Request(Query::Test::RequestType, test::Payload);
    auto const spSecond = m_upManager->Request(Query::Test::RequestType, test::Payload);
    ASSERT_TRUE(spFirst && spSecond);
    EXPECT_NE(spFirst->GetId(), spSecond->GetId());

    auto const second = Query::Channel::GetAddress(spSecond->GetId());
    EXPECT_TRUE(m_upManager->Send(second, Query::Channel::Response, Message::ToBuffer("second")));

    // A response only reaches the query it is addressed to.
    EXPECT_EQ(spFirst->GetReceived(), std::size_t{ 0 });
    EXPECT_EQ(spSecond->GetReceived(), std::size_t{ 1 });

    auto const responses = spSecond->Gather(test::ExtendedTimeout);
    ASSERT_EQ(responses.size(), std::size_t{ 1 });
    EXPECT_EQ(Message::ToString(responses.front()), "second");
    EXPECT_EQ(m_upManager->Waiting(), std::size_t{ 1 });
}

//----------------------------------------------------------------------------------------------------------------------
