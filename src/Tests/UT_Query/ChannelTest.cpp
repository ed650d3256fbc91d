//----------------------------------------------------------------------------------------------------------------------
#include "Components/Query/Channel.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

TEST(ChannelSuite, SubscriptionTest)
{
    auto const subscription = Query::Channel::GetSubscription();
    EXPECT_EQ(subscription, (Subscription::Ssid{ 0, 3'939'663'052 }));

    auto const address = Query::Channel::GetAddress(7);
    EXPECT_EQ(address.GetSize(), Query::Channel::AddressSize);
    EXPECT_EQ(address[2], Query::CorrelationId{ 7 });
    EXPECT_TRUE(subscription.IsPrefixOf(address));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ChannelSuite, MakeRequestTest)
{
    EXPECT_EQ(Query::Channel::MakeRequest("ping", 17), "ping/17");
    EXPECT_EQ(Query::Channel::MakeRequest("", 1), "/1");

    constexpr auto Largest = std::numeric_limits<Cluster::PeerName>::max();
    EXPECT_EQ(Query::Channel::MakeRequest("stats", Largest), "stats/18446744073709551615");
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ChannelSuite, ParseRequestTest)
{
    {
        auto const optRequest = Query::Channel::ParseRequest("ping/17");
        ASSERT_TRUE(optRequest);
        EXPECT_EQ(optRequest->type, "ping");
        EXPECT_EQ(optRequest->reply, Cluster::PeerName{ 17 });
    }

    {
        auto const optRequest = Query::Channel::ParseRequest("stats/18446744073709551615");
        ASSERT_TRUE(optRequest);
        EXPECT_EQ(optRequest->type, "stats");
        EXPECT_EQ(optRequest->reply, std::numeric_limits<Cluster::PeerName>::max());
    }

    {
        // The type may be empty, only the reply address is required.
        auto const optRequest = Query::Channel::ParseRequest("/5");
        ASSERT_TRUE(optRequest);
        EXPECT_TRUE(optRequest->type.empty());
        EXPECT_EQ(optRequest->reply, Cluster::PeerName{ 5 });
    }

    {
        auto const channel = Query::Channel::MakeRequest("echo", 12345);
        auto const optRequest = Query::Channel::ParseRequest(channel);
        ASSERT_TRUE(optRequest);
        EXPECT_EQ(optRequest->type, "echo");
        EXPECT_EQ(optRequest->reply, Cluster::PeerName{ 12345 });
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ChannelSuite, MalformedRequestTest)
{
    EXPECT_FALSE(Query::Channel::ParseRequest(""));
    EXPECT_FALSE(Query::Channel::ParseRequest("ping"));
    EXPECT_FALSE(Query::Channel::ParseRequest("ping/"));
    EXPECT_FALSE(Query::Channel::ParseRequest("stats/abc"));
    EXPECT_FALSE(Query::Channel::ParseRequest("stats/12abc"));
    EXPECT_FALSE(Query::Channel::ParseRequest("stats/-1"));
    EXPECT_FALSE(Query::Channel::ParseRequest("stats/+1"));
    EXPECT_FALSE(Query::Channel::ParseRequest("stats/ 1"));
    EXPECT_FALSE(Query::Channel::ParseRequest("stats/1 "));
    EXPECT_FALSE(Query::Channel::ParseRequest("stats/18446744073709551616")); // Exceeds a 64-bit address.
    EXPECT_FALSE(Query::Channel::ParseRequest("a/b/1")); // The address follows the first separator.
    EXPECT_FALSE(Query::Channel::ParseRequest(Query::Channel::Response));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ChannelSuite, ClassificationTest)
{
    EXPECT_TRUE(Query::Channel::IsResponse("response"));
    EXPECT_FALSE(Query::Channel::IsResponse("Response"));
    EXPECT_FALSE(Query::Channel::IsResponse("response/1"));
    EXPECT_FALSE(Query::Channel::IsResponse("ping/1"));

    EXPECT_TRUE(Query::Channel::IsValidType("ping"));
    EXPECT_TRUE(Query::Channel::IsValidType("keyspace.size"));
    EXPECT_FALSE(Query::Channel::IsValidType("ping/1"));
    EXPECT_FALSE(Query::Channel::IsValidType("/"));
}

//----------------------------------------------------------------------------------------------------------------------
