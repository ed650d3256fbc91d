//----------------------------------------------------------------------------------------------------------------------
// File: Subscriber.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Message/MessageTypes.hpp"
#include "Components/Subscription/Ssid.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

namespace Node { class Identifier; }

//----------------------------------------------------------------------------------------------------------------------

class ISubscriber
{
public:
    virtual ~ISubscriber() = default;

    [[nodiscard]] virtual Node::Identifier const& GetIdentifier() const = 0;
    [[nodiscard]] virtual Subscription::SubscriberType GetType() const = 0;

    // Note: The broker may invoke this method from any number of threads concurrently.
    [[nodiscard]] virtual bool Send(
        Subscription::Ssid const& ssid, std::string_view channel, Message::Buffer const& payload) = 0;
};

//----------------------------------------------------------------------------------------------------------------------
