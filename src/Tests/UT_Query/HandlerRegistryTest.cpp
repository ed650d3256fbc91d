//----------------------------------------------------------------------------------------------------------------------
#include "Components/Message/MessageTypes.hpp"
#include "Components/Query/HandlerRegistry.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace test {
//----------------------------------------------------------------------------------------------------------------------

Message::Buffer const Request = Message::ToBuffer("request");

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

TEST(HandlerRegistrySuite, EmptyRegistryTest)
{
    Query::HandlerRegistry const registry;
    EXPECT_TRUE(registry.IsEmpty());
    EXPECT_EQ(registry.Size(), std::size_t{ 0 });
    EXPECT_FALSE(registry.Handle("ping", test::Request));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(HandlerRegistrySuite, FirstClaimTest)
{
    std::vector<std::string> invoked;

    Query::HandlerRegistry registry;
    registry.Append([&invoked] (std::string_view type, Message::Buffer const&) -> std::optional<Message::Buffer> {
        invoked.emplace_back("first");
        if (type != "admin") { return {}; }
        return Message::ToBuffer("first");
    });
    registry.Append([&invoked] (std::string_view, Message::Buffer const& request) -> std::optional<Message::Buffer> {
        invoked.emplace_back("second");
        return request;
    });
    registry.Append([&invoked] (std::string_view, Message::Buffer const&) -> std::optional<Message::Buffer> {
        invoked.emplace_back("third");
        return Message::ToBuffer("third");
    });
    EXPECT_EQ(registry.Size(), std::size_t{ 3 });
    EXPECT_FALSE(registry.IsEmpty());

    {
        auto const optResponse = registry.Handle("admin", test::Request);
        ASSERT_TRUE(optResponse);
        EXPECT_EQ(Message::ToString(*optResponse), "first");
        EXPECT_EQ(invoked, (std::vector<std::string>{ "first" }));
    }

    invoked.clear();

    {
        // Handlers after the one that claims the query are never offered it.
        auto const optResponse = registry.Handle("other", test::Request);
        ASSERT_TRUE(optResponse);
        EXPECT_EQ(*optResponse, test::Request);
        EXPECT_EQ(invoked, (std::vector<std::string>{ "first", "second" }));
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST(HandlerRegistrySuite, UnclaimedQueryTest)
{
    std::size_t offered = 0;

    Query::HandlerRegistry registry;
    for (std::size_t idx = 0; idx < 3; ++idx) {
        registry.Append([&offered] (std::string_view, Message::Buffer const&) -> std::optional<Message::Buffer> {
            ++offered;
            return {};
        });
    }

    EXPECT_FALSE(registry.Handle("ping", test::Request));
    EXPECT_EQ(offered, std::size_t{ 3 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST(HandlerRegistrySuite, EmptyResponseTest)
{
    // An empty buffer is still a claim on the query.
    Query::HandlerRegistry registry;
    registry.Append([] (std::string_view, Message::Buffer const&) -> std::optional<Message::Buffer> {
        return Message::Buffer{};
    });
    registry.Append([] (std::string_view, Message::Buffer const&) -> std::optional<Message::Buffer> {
        return Message::ToBuffer("unreachable");
    });

    auto const optResponse = registry.Handle("ping", test::Request);
    ASSERT_TRUE(optResponse);
    EXPECT_TRUE(optResponse->empty());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(HandlerRegistrySuite, FailingHandlerTest)
{
    Query::HandlerRegistry registry;
    registry.Append([] (std::string_view, Message::Buffer const&) -> std::optional<Message::Buffer> {
        throw std::runtime_error("handler failure");
    });
    registry.Append([] (std::string_view type, Message::Buffer const&) -> std::optional<Message::Buffer> {
        if (type != "ping") { return {}; }
        return Message::ToBuffer("pong");
    });

    auto const optResponse = registry.Handle("ping", test::Request);
    ASSERT_TRUE(optResponse);
    EXPECT_EQ(Message::ToString(*optResponse), "pong");

    EXPECT_FALSE(registry.Handle("stats", test::Request));
}

//----------------------------------------------------------------------------------------------------------------------
