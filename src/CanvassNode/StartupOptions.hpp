//----------------------------------------------------------------------------------------------------------------------
// File: StartupOptions.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Configuration/Options.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/program_options.hpp>
#include <spdlog/common.h>
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Startup {
//----------------------------------------------------------------------------------------------------------------------

enum class ParseCode : std::uint32_t { Malformed, ExitRequested, Success };

class Options;

//----------------------------------------------------------------------------------------------------------------------
} // Startup namespace
//----------------------------------------------------------------------------------------------------------------------

class Startup::Options
{
public:
    static constexpr std::string_view Help = "help";
    static constexpr std::string_view Version = "version";
    static constexpr std::string_view Verbosity = "verbosity";
    static constexpr std::string_view Quiet = "quiet";
    static constexpr std::string_view ConfigurationFilepath = "config";
    static constexpr std::string_view DisableConfiguration = "disable-config";
    static constexpr std::string_view Peers = "peers";
    static constexpr std::string_view Query = "query";
    static constexpr std::string_view Payload = "payload";
    static constexpr std::string_view Timeout = "timeout";

    static constexpr std::uint32_t DefaultPeers = 3;
    static constexpr std::uint32_t MaximumPeers = 1'024;
    static constexpr std::string_view DefaultQuery = "ping";

    Options();

    [[nodiscard]] ParseCode Parse(std::int32_t argc, char** argv);

    [[nodiscard]] std::string GenerateHelpText(std::int32_t argc, char** argv) const;
    [[nodiscard]] std::string GenerateVersionText(std::int32_t argc, char** argv) const;

    [[nodiscard]] spdlog::level::level_enum GetVerbosity() const;
    [[nodiscard]] std::string const& GetConfigPath() const;
    [[nodiscard]] bool UseConfiguration() const;
    [[nodiscard]] std::uint32_t GetPeers() const;
    [[nodiscard]] std::string const& GetQuery() const;
    [[nodiscard]] std::string const& GetPayload() const;
    [[nodiscard]] std::optional<std::chrono::milliseconds> const& GetTimeout() const;

    [[nodiscard]] operator Configuration::Options::Runtime() const;

private:
    using VerbosityLevels = std::vector<std::pair<std::string, spdlog::level::level_enum>>;

    void SetupDescriptions();

    boost::program_options::options_description m_descriptions;
    boost::program_options::variables_map m_options;
    VerbosityLevels m_levels;

    spdlog::level::level_enum m_verbosity;
    std::string m_configurationFilepath;
    bool m_useConfiguration;
    std::uint32_t m_peers;
    std::string m_query;
    std::string m_payload;
    std::optional<std::chrono::milliseconds> m_optTimeout;
};

//----------------------------------------------------------------------------------------------------------------------
