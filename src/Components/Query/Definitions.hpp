//----------------------------------------------------------------------------------------------------------------------
// File: Definitions.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Message/MessageTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Query {
//----------------------------------------------------------------------------------------------------------------------

// Note: Identifiers are drawn from a 32-bit counter that will wrap after 2^32 issued queries. An identifier is only
// guaranteed to be unique while the query using it is still awaiting responses.
using CorrelationId = std::uint32_t;

using Responses = std::vector<Message::Buffer>;

// A handler claims a query by returning a response. Returning std::nullopt passes the query to the next handler.
using Handler = std::function<std::optional<Message::Buffer>(std::string_view type, Message::Buffer const& request)>;

constexpr auto DefaultTimeout = std::chrono::milliseconds{ 1'500 };

enum class Status : std::uint32_t {
    Success,
    InvalidQuery,
    MalformedReplyAddress,
    NoHandlerFound,
    PeerUnavailable,
    DeliveryFailed
};

[[nodiscard]] constexpr std::string_view ToString(Status status)
{
    switch (status) {
        case Status::Success: return "Success";
        case Status::InvalidQuery: return "InvalidQuery";
        case Status::MalformedReplyAddress: return "MalformedReplyAddress";
        case Status::NoHandlerFound: return "NoHandlerFound";
        case Status::PeerUnavailable: return "PeerUnavailable";
        case Status::DeliveryFailed: return "DeliveryFailed";
    }
    return "Unknown";
}

//----------------------------------------------------------------------------------------------------------------------
} // Query namespace
//----------------------------------------------------------------------------------------------------------------------
