//----------------------------------------------------------------------------------------------------------------------
// File: ClusterPeer.hpp
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

//----------------------------------------------------------------------------------------------------------------------
namespace Cluster {
//----------------------------------------------------------------------------------------------------------------------

// The stable address of a node within the cluster, assigned by the membership layer.
using PeerName = std::uint64_t;

//----------------------------------------------------------------------------------------------------------------------
} // Cluster namespace
//----------------------------------------------------------------------------------------------------------------------

class IClusterPeer
{
public:
    virtual ~IClusterPeer() = default;

    [[nodiscard]] virtual Cluster::PeerName GetName() const = 0;
    [[nodiscard]] virtual bool Send(
        Subscription::Ssid const& ssid, std::string_view channel, Message::Buffer const& payload) = 0;
};

//----------------------------------------------------------------------------------------------------------------------
