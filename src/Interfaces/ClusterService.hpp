//----------------------------------------------------------------------------------------------------------------------
// File: ClusterService.hpp
// Description: The capabilities consumed from the cluster membership layer.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "ClusterPeer.hpp"
#include "Components/Subscription/Ssid.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <memory>
//----------------------------------------------------------------------------------------------------------------------

namespace Node { class Identifier; }

//----------------------------------------------------------------------------------------------------------------------

class IClusterService
{
public:
    virtual ~IClusterService() = default;

    [[nodiscard]] virtual std::shared_ptr<IClusterPeer> FindPeer(Cluster::PeerName name) const = 0;
    [[nodiscard]] virtual Cluster::PeerName GetLocalName() const = 0;
    [[nodiscard]] virtual std::size_t GetPeerCount() const = 0;

    // Announces that a local subscriber now carries the subscription such that it may be gossiped to the cluster.
    virtual void NotifySubscribe(Node::Identifier const& identifier, Subscription::Ssid const& ssid) = 0;
};

//----------------------------------------------------------------------------------------------------------------------
