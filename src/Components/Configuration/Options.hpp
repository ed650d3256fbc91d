//----------------------------------------------------------------------------------------------------------------------
// File: Options.hpp
// Description: The option groups stored in the configuration file. Each group merges itself from, and writes itself
// to, its own object within the file.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "StatusCode.hpp"
#include "Interfaces/ClusterPeer.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/fwd.hpp>
#include <spdlog/common.h>
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view DefaultCanvassFolder = "/canvass/";
constexpr std::string_view DefaultConfigurationFilename = "config.json";

[[nodiscard]] std::filesystem::path GetDefaultCanvassFolder();
[[nodiscard]] std::filesystem::path GetDefaultConfigurationFilepath();

//----------------------------------------------------------------------------------------------------------------------
namespace Options {
//----------------------------------------------------------------------------------------------------------------------

struct Runtime;
class Details;
class Query;

//----------------------------------------------------------------------------------------------------------------------
} // Options namespace
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------

// Options supplied by the command line that are never written to the configuration file.
struct Configuration::Options::Runtime
{
    spdlog::level::level_enum verbosity;
    bool useFilepathDeduction;
};

//----------------------------------------------------------------------------------------------------------------------

class Configuration::Options::Details
{
public:
    static constexpr std::string_view Symbol = "node";
    static constexpr std::string_view NameSymbol = "name";
    static constexpr std::string_view AddressSymbol = "address";

    static constexpr std::size_t NameSizeLimit = 256;

    Details();
    Details(std::string_view name, Cluster::PeerName address);

    [[nodiscard]] bool operator==(Details const& other) const noexcept = default;

    [[nodiscard]] static constexpr std::string_view GetFieldName() { return Symbol; }

    [[nodiscard]] DeserializationResult Merge(boost::json::object const& json);
    [[nodiscard]] SerializationResult Write(boost::json::object& json) const;
    [[nodiscard]] ValidationResult AreOptionsAllowable() const;

    [[nodiscard]] std::string const& GetName() const;
    [[nodiscard]] Cluster::PeerName GetAddress() const;

    [[nodiscard]] bool SetName(std::string_view name, bool& changed);
    [[nodiscard]] bool SetAddress(Cluster::PeerName address, bool& changed);

private:
    std::string m_name;
    Cluster::PeerName m_address;
};

//----------------------------------------------------------------------------------------------------------------------

class Configuration::Options::Query
{
public:
    static constexpr std::string_view Symbol = "query";
    static constexpr std::string_view TimeoutSymbol = "timeout";

    static constexpr auto MinimumTimeout = std::chrono::milliseconds{ 1 };
    static constexpr auto MaximumTimeout = std::chrono::milliseconds{ 60'000 };

    Query();
    explicit Query(std::chrono::milliseconds const& timeout);

    [[nodiscard]] bool operator==(Query const& other) const noexcept = default;

    [[nodiscard]] static constexpr std::string_view GetFieldName() { return Symbol; }

    [[nodiscard]] DeserializationResult Merge(boost::json::object const& json);
    [[nodiscard]] SerializationResult Write(boost::json::object& json) const;
    [[nodiscard]] ValidationResult AreOptionsAllowable() const;

    [[nodiscard]] std::chrono::milliseconds const& GetTimeout() const;
    [[nodiscard]] bool SetTimeout(std::chrono::milliseconds const& timeout, bool& changed);

private:
    std::chrono::milliseconds m_timeout;
};

//----------------------------------------------------------------------------------------------------------------------
