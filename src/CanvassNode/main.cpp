//----------------------------------------------------------------------------------------------------------------------
// File: main.cpp
// Description: Builds an in-process cluster, issues a single query from the first node, and prints the responses.
//----------------------------------------------------------------------------------------------------------------------
#include "ServiceProvider.hpp"
#include "StartupOptions.hpp"
#include "Components/Cluster/Loopback.hpp"
#include "Components/Configuration/Options.hpp"
#include "Components/Configuration/Parser.hpp"
#include "Components/Query/Awaiter.hpp"
#include "Components/Query/Handlers.hpp"
#include "Components/Query/Manager.hpp"
#include "Interfaces/ClusterService.hpp"
#include "Interfaces/MessageBroker.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

struct Member
{
    std::shared_ptr<Cluster::LoopbackNode> spNode;
    std::shared_ptr<Node::ServiceProvider> spServiceProvider;
    std::unique_ptr<Query::Manager> upManager;
};

[[nodiscard]] std::unique_ptr<Configuration::Parser> InitializeConfiguration(Startup::Options const& options);

[[nodiscard]] std::optional<Member> CreateMember(
    std::shared_ptr<Cluster::LoopbackNetwork> const& spNetwork, Cluster::PeerName name, std::string const& alias);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

std::int32_t main(std::int32_t argc, char** argv)
{
    Startup::Options options;
    switch (options.Parse(argc, argv)) {
        case Startup::ParseCode::Success: break;
        // Early return when we don't need initialize the resources (e.g. when "--help" is used).
        case Startup::ParseCode::ExitRequested: return 0;
        default: {
            std::cout << "Unable to parse startup options!" << std::endl;
            return 1;
        }
    }

    Logger::Initialize(options.GetVerbosity());
    auto const logger = Logger::Get(Logger::Name::Core); // From here on we should use the logger for errors.

    auto const upParser = local::InitializeConfiguration(options);
    if (!upParser) { return 1; }

    auto const timeout = options.GetTimeout().value_or(upParser->GetQueryTimeout());

    // The node described by the configuration issues the query, the remaining members are its peers.
    auto const spNetwork = std::make_shared<Cluster::LoopbackNetwork>();
    std::vector<local::Member> members;
    members.reserve(options.GetPeers() + 1);

    try {
        Cluster::PeerName const origin = upParser->GetNodeAddress();
        auto const& name = upParser->GetNodeName();
        auto optMember = local::CreateMember(spNetwork, origin, name.empty() ? "origin" : name);
        if (!optMember) { return 1; }
        members.emplace_back(std::move(*optMember));

        Cluster::PeerName candidate = 0;
        for (std::uint32_t idx = 0; idx < options.GetPeers(); ++idx) {
            if (++candidate == origin) { ++candidate; }
            auto optPeer = local::CreateMember(spNetwork, candidate, "peer-" + std::to_string(idx + 1));
            if (!optPeer) { return 1; }
            members.emplace_back(std::move(*optPeer));
        }
    } catch (std::runtime_error const& error) {
        logger->critical("Failed to initialize the cluster: {}", error.what());
        return 1;
    }

    logger->info("Welcome to Canvass! The cluster contains {} node(s).", spNetwork->GetNodeCount());

    auto const& upOrigin = members.front().upManager;
    auto const spAwaiter = upOrigin->Request(options.GetQuery(), Message::ToBuffer(options.GetPayload()));
    if (!spAwaiter) {
        logger->critical("Failed to issue the \"{}\" query!", options.GetQuery());
        return 1;
    }

    auto const responses = spAwaiter->Gather(timeout);
    for (std::size_t idx = 0; idx < responses.size(); ++idx) {
        std::cout << "[" << (idx + 1) << "] " << Message::ToString(responses[idx]) << std::endl;
    }

    std::cout << "Received " << responses.size() << " of " << spAwaiter->GetMaximum() << " response(s) to \"";
    std::cout << options.GetQuery() << "\"." << std::endl;

    // The managers must withdraw their subscriptions before the cluster is torn down.
    for (auto& member : members) { member.upManager->Stop(); }

    return 0;
}

//----------------------------------------------------------------------------------------------------------------------

std::unique_ptr<Configuration::Parser> local::InitializeConfiguration(Startup::Options const& options)
{
    auto const logger = Logger::Get(Logger::Name::Core);

    // Create a configuration parser to read the configuration file at the provided location. If we fail to read the
    // file log an error and return early.
    auto upParser = (options.UseConfiguration()) ?
        std::make_unique<Configuration::Parser>(options.GetConfigPath(), options) :
        std::make_unique<Configuration::Parser>(options);

    if (auto const [status, message] = upParser->FetchOptions(); status != Configuration::StatusCode::Success) {
        logger->critical("An error occured while processing the configuration file! Reason: {}", message);
        return nullptr;
    }

    return upParser;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<local::Member> local::CreateMember(
    std::shared_ptr<Cluster::LoopbackNetwork> const& spNetwork, Cluster::PeerName name, std::string const& alias)
{
    auto const logger = Logger::Get(Logger::Name::Core);

    auto spNode = spNetwork->Attach(name);
    if (!spNode) {
        logger->critical("Failed to attach \"{}\" to the cluster. [name={}]", alias, name);
        return {};
    }

    auto spServiceProvider = std::make_shared<Node::ServiceProvider>();
    [[maybe_unused]] bool const broker = spServiceProvider->Register<IMessageBroker>(spNode);
    [[maybe_unused]] bool const cluster = spServiceProvider->Register<IClusterService>(spNode);

    auto upManager = std::make_unique<Query::Manager>(spServiceProvider);
    upManager->HandleFunc(Query::Handlers::CreatePingHandler());
    upManager->HandleFunc(Query::Handlers::CreateStatsHandler(*upManager, alias, name));

    if (!upManager->Start()) {
        logger->critical("Failed to start the query manager for \"{}\". [name={}]", alias, name);
        return {};
    }

    return Member{ std::move(spNode), std::move(spServiceProvider), std::move(upManager) };
}

//----------------------------------------------------------------------------------------------------------------------
