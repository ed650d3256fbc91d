//----------------------------------------------------------------------------------------------------------------------
// File: Channel.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Channel.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <charconv>
#include <system_error>
//----------------------------------------------------------------------------------------------------------------------

Subscription::Ssid Query::Channel::GetSubscription()
{
    return Subscription::Ssid{ Subscription::Reserved::System, Subscription::Reserved::Query };
}

//----------------------------------------------------------------------------------------------------------------------

Subscription::Ssid Query::Channel::GetAddress(CorrelationId id)
{
    return Subscription::Ssid{ Subscription::Reserved::System, Subscription::Reserved::Query, id };
}

//----------------------------------------------------------------------------------------------------------------------

bool Query::Channel::IsValidType(std::string_view type)
{
    return type.find(Separator) == std::string_view::npos;
}

//----------------------------------------------------------------------------------------------------------------------

bool Query::Channel::IsResponse(std::string_view channel) { return channel == Response; }

//----------------------------------------------------------------------------------------------------------------------

std::string Query::Channel::MakeRequest(std::string_view type, Cluster::PeerName reply)
{
    std::string channel;
    channel.reserve(type.size() + 1 + 20); // The longest decimal representation of a 64-bit address is 20 digits.
    channel.append(type);
    channel.push_back(Separator);
    channel.append(std::to_string(reply));
    return channel;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Query::Channel::Request> Query::Channel::ParseRequest(std::string_view channel)
{
    auto const boundary = channel.find(Separator);
    if (boundary == std::string_view::npos) { return {}; }

    auto const type = channel.substr(0, boundary);
    auto const address = channel.substr(boundary + 1);
    if (address.empty()) { return {}; }

    // The address must be entirely consumed as an unsigned decimal value (i.e. no signs, whitespace, or suffixes).
    Cluster::PeerName reply = 0;
    auto const [end, error] = std::from_chars(address.data(), address.data() + address.size(), reply);
    if (error != std::errc{} || end != address.data() + address.size()) { return {}; }

    return Request{ type, reply };
}

//----------------------------------------------------------------------------------------------------------------------
