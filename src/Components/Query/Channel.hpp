//----------------------------------------------------------------------------------------------------------------------
// File: Channel.hpp
// Description: Encoding of the subscription identifiers and channel strings carried by query traffic. A request is
// published on [System, Query, id] with the channel "<type>/<reply>", where reply is the decimal cluster address of
// the requesting node. A response is sent directly to that node on the same identifier with the channel "response".
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Definitions.hpp"
#include "Components/Subscription/Ssid.hpp"
#include "Interfaces/ClusterPeer.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Query::Channel {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Response = "response";
constexpr char Separator = '/';

// The number of segments carried by every identifier on inbound and outbound query traffic.
constexpr std::size_t AddressSize = 3;

struct Request
{
    std::string_view type;
    Cluster::PeerName reply;
};

[[nodiscard]] Subscription::Ssid GetSubscription();
[[nodiscard]] Subscription::Ssid GetAddress(CorrelationId id);

[[nodiscard]] bool IsValidType(std::string_view type);
[[nodiscard]] bool IsResponse(std::string_view channel);

[[nodiscard]] std::string MakeRequest(std::string_view type, Cluster::PeerName reply);
[[nodiscard]] std::optional<Request> ParseRequest(std::string_view channel);

//----------------------------------------------------------------------------------------------------------------------
} // Query::Channel namespace
//----------------------------------------------------------------------------------------------------------------------
