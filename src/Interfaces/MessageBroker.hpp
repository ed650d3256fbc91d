//----------------------------------------------------------------------------------------------------------------------
// File: MessageBroker.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Message/MessageTypes.hpp"
#include "Components/Subscription/Ssid.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

class ISubscriber;

//----------------------------------------------------------------------------------------------------------------------

class IMessageBroker
{
public:
    virtual ~IMessageBroker() = default;

    [[nodiscard]] virtual bool Subscribe(Subscription::Ssid const& ssid, ISubscriber* const pSubscriber) = 0;
    virtual bool Unsubscribe(Subscription::Ssid const& ssid, ISubscriber* const pSubscriber) = 0;

    // Publishing is fire-and-forget. The returned value is the number of subscribers the message was handed to.
    virtual std::size_t Publish(
        Subscription::Ssid const& ssid, std::string_view channel, Message::Buffer const& payload) = 0;
};

//----------------------------------------------------------------------------------------------------------------------
