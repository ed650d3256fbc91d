//----------------------------------------------------------------------------------------------------------------------
// File: Handlers.hpp
// Description: Query handlers installed by every node.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Definitions.hpp"
#include "Interfaces/ClusterPeer.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Query {
//----------------------------------------------------------------------------------------------------------------------

class Manager;

//----------------------------------------------------------------------------------------------------------------------
namespace Handlers {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Ping = "ping";
constexpr std::string_view Pong = "pong";
constexpr std::string_view Stats = "stats";

// Answers "ping" queries with "pong".
[[nodiscard]] Handler CreatePingHandler();

// Answers "stats" queries with a JSON object describing the node, e.g. {"name":"a","address":1,"waiting":0}. The
// handler refers to the manager and must only be registered with that manager.
[[nodiscard]] Handler CreateStatsHandler(Manager const& manager, std::string name, Cluster::PeerName address);

//----------------------------------------------------------------------------------------------------------------------
} // Handlers namespace
} // Query namespace
//----------------------------------------------------------------------------------------------------------------------
