//----------------------------------------------------------------------------------------------------------------------
// File: Handlers.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Handlers.hpp"
#include "Manager.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace symbols {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Name = "name";
constexpr std::string_view Address = "address";
constexpr std::string_view Waiting = "waiting";

//----------------------------------------------------------------------------------------------------------------------
} // symbols namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Query::Handler Query::Handlers::CreatePingHandler()
{
    return [] (std::string_view type, Message::Buffer const&) -> std::optional<Message::Buffer> {
        if (type != Ping) { return {}; }
        return Message::ToBuffer(Pong);
    };
}

//----------------------------------------------------------------------------------------------------------------------

Query::Handler Query::Handlers::CreateStatsHandler(Manager const& manager, std::string name, Cluster::PeerName address)
{
    return [pManager = &manager, name = std::move(name), address] (
        std::string_view type, Message::Buffer const&) -> std::optional<Message::Buffer>
    {
        if (type != Stats) { return {}; }

        boost::json::object json;
        json[symbols::Name] = name;
        json[symbols::Address] = static_cast<std::uint64_t>(address);
        json[symbols::Waiting] = static_cast<std::uint64_t>(pManager->Waiting());

        return Message::ToBuffer(boost::json::serialize(json));
    };
}

//----------------------------------------------------------------------------------------------------------------------
