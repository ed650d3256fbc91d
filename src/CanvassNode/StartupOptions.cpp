//----------------------------------------------------------------------------------------------------------------------
// File: StartupOptions.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "StartupOptions.hpp"
#include "Components/Query/Channel.hpp"
#include "Utilities/Version.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <sys/ioctl.h>
#include <unistd.h>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] std::uint32_t GetTerminalWidth();

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Startup::Options::Options()
    : m_descriptions()
    , m_options()
    , m_levels()
    , m_verbosity(spdlog::level::info)
    , m_configurationFilepath()
    , m_useConfiguration(true)
    , m_peers(DefaultPeers)
    , m_query(DefaultQuery)
    , m_payload()
    , m_optTimeout()
{
    SetupDescriptions();
}

//----------------------------------------------------------------------------------------------------------------------

void Startup::Options::SetupDescriptions()
{
    std::uint32_t const width = local::GetTerminalWidth();
    boost::program_options::options_description general("General Options", width);
    auto AddGeneralOption = general.add_options();

    AddGeneralOption(Help.data(), "Display this help text and exit.");
    AddGeneralOption(Version.data(), "Display the version information and exit.");

    // Option to set the log verbosity level.
    {
        m_levels = {
            { "trace", spdlog::level::trace },
            { "debug", spdlog::level::debug },
            { "info", spdlog::level::info },
            { "warning", spdlog::level::warn },
            { "error", spdlog::level::err },
            { "critical", spdlog::level::critical },
            { "none", spdlog::level::off },
        };

        std::ostringstream oss;
        oss << "Sets the maximum log level for console output. ";
        oss << "Options: [";
        std::size_t idx = 0;
        for (auto const& [name, value] : m_levels) {
            oss << name << ((++idx < m_levels.size()) ? ", " : "");
        }
        oss << "]";
        AddGeneralOption(
            Verbosity.data(),
            boost::program_options::value<std::string>()->value_name("<level>")->default_value("info"),
            oss.str().c_str());
    }

    // Option to disable console logging.
    {
        AddGeneralOption(
            Quiet.data(),
            boost::program_options::bool_switch()->default_value(false),
            "Disables all log output to the console. Query responses are still printed.");
    }

    m_descriptions.add(general);

    boost::program_options::options_description configuration("Configuration Options", width);
    auto AddConfigurationOption = configuration.add_options();

    // Option to set the configuration filepath.
    {
        auto const filepath = Configuration::GetDefaultConfigurationFilepath();
        std::ostringstream oss;
        oss << "Set the configuration filepath. This may specify a complete filepath or ";
        oss << "directory. If a directory is specified \"config.json\" is assumed. ";
        oss << "If a directory is not specified, the default configuration folder will be used.";
        AddConfigurationOption(
            ConfigurationFilepath.data(),
            boost::program_options::value(&m_configurationFilepath)->value_name("<filepath>")->default_value(
                filepath.string()),
            oss.str().c_str());
    }

    // Option to run without a configuration file.
    {
        AddConfigurationOption(
            DisableConfiguration.data(),
            "Disables reading and writing the configuration file. The default options will be used.");
    }

    m_descriptions.add(configuration);

    boost::program_options::options_description query("Query Options", width);
    auto AddQueryOption = query.add_options();

    AddQueryOption(
        Peers.data(),
        boost::program_options::value(&m_peers)->value_name("<count>")->default_value(DefaultPeers),
        "Set the number of peers attached to the in-process cluster.");

    AddQueryOption(
        Query.data(),
        boost::program_options::value(&m_query)->value_name("<type>")->default_value(std::string{ DefaultQuery }),
        "Set the type of the query issued to the cluster (e.g. \"ping\" or \"stats\").");

    AddQueryOption(
        Payload.data(),
        boost::program_options::value(&m_payload)->value_name("<text>"),
        "Set the payload carried by the query.");

    AddQueryOption(
        Timeout.data(),
        boost::program_options::value<std::uint32_t>()->value_name("<milliseconds>"),
        "Set the time to wait for responses. Overrides the configured query timeout.");

    m_descriptions.add(query);
}

//----------------------------------------------------------------------------------------------------------------------

Startup::ParseCode Startup::Options::Parse(std::int32_t argc, char** argv)
{
    constexpr auto IsOptionSupplied = [] (
        boost::program_options::variables_map const& options,
        std::string_view option) -> bool
    {
        return options.count(option.data()) && !options[option.data()].defaulted();
    };

    constexpr auto CheckConflictingOptions = [] (
        boost::program_options::variables_map const& options,
        std::string_view left,
        std::string_view right) -> std::optional<std::string>
    {
        if (options.count(left.data()) && !options[left.data()].defaulted() &&
            options.count(right.data()) && !options[right.data()].defaulted()) {
            std::ostringstream oss;
            oss << "Conflicting options '" << left << "' and '" << right << "'.";
            return oss.str();
        }
        return {};
    };

    try {
        boost::program_options::store(
            boost::program_options::command_line_parser(argc, argv).options(m_descriptions).run(), m_options);
        boost::program_options::notify(m_options);
    } catch (std::exception const& e) {
        std::cout << "An error occured parsing startup options due to: ";
        std::cout << e.what() << "." << std::endl;
        return ParseCode::Malformed;
    }

    if (IsOptionSupplied(m_options, Help)) {
        std::cout << GenerateHelpText(argc, argv) << std::endl;
        return ParseCode::ExitRequested;
    }

    if (IsOptionSupplied(m_options, Version)) {
        std::cout << GenerateVersionText(argc, argv) << std::endl;
        return ParseCode::ExitRequested;
    }

    if (IsOptionSupplied(m_options, Verbosity)) {
        auto const& argument = m_options[Verbosity.data()].as<std::string>();
        auto const itr = std::ranges::find_if(m_levels, [&argument] (auto const& item) -> bool {
            return (argument == item.first);
        });

        if (itr == m_levels.end()) {
            std::cout << "Unrecognized verbosity level!" << std::endl;
            return ParseCode::Malformed;
        }

        m_verbosity = itr->second;
    }

    if (IsOptionSupplied(m_options, Quiet)) { m_verbosity = spdlog::level::off; }
    if (IsOptionSupplied(m_options, DisableConfiguration)) { m_useConfiguration = false; }

    if (m_useConfiguration && m_configurationFilepath.empty()) {
        std::cout << "The configuration filepath cannot be empty." << std::endl;
        return ParseCode::Malformed;
    }

    if (m_peers > MaximumPeers) {
        std::cout << "The number of peers must not exceed " << MaximumPeers << "." << std::endl;
        return ParseCode::Malformed;
    }

    if (m_query.empty() || !::Query::Channel::IsValidType(m_query)) {
        std::cout << "The query type must not be empty or contain '" << ::Query::Channel::Separator << "'." << std::endl;
        return ParseCode::Malformed;
    }

    if (IsOptionSupplied(m_options, Timeout)) {
        auto const timeout = std::chrono::milliseconds{ m_options[Timeout.data()].as<std::uint32_t>() };
        if (timeout < Configuration::Options::Query::MinimumTimeout ||
            timeout > Configuration::Options::Query::MaximumTimeout) {
            std::cout << "The query timeout must be between " << Configuration::Options::Query::MinimumTimeout.count();
            std::cout << " and " << Configuration::Options::Query::MaximumTimeout.count() << " milliseconds.";
            std::cout << std::endl;
            return ParseCode::Malformed;
        }
        m_optTimeout = timeout;
    }

    if (auto const optError = CheckConflictingOptions(m_options, Verbosity, Quiet); optError) {
        std::cout << *optError << std::endl;
        return ParseCode::Malformed;
    }

    if (auto const optError = CheckConflictingOptions(m_options, ConfigurationFilepath, DisableConfiguration); optError) {
        std::cout << *optError << std::endl;
        return ParseCode::Malformed;
    }

    return ParseCode::Success;
}

//----------------------------------------------------------------------------------------------------------------------

std::string Startup::Options::GenerateHelpText([[maybe_unused]] std::int32_t argc, char** argv) const
{
    std::ostringstream oss;
    std::string name = std::filesystem::path(argv[0]).stem().string();
    oss << "Usage: " << name << " [options] \n" << m_descriptions;
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------------------

std::string Startup::Options::GenerateVersionText([[maybe_unused]] std::int32_t argc, char** argv) const
{
    std::ostringstream oss;
    std::string name = std::filesystem::path(argv[0]).stem().string();
    oss << name << " (Canvass) " << Canvass::Version;
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------------------

spdlog::level::level_enum Startup::Options::GetVerbosity() const { return m_verbosity; }

//----------------------------------------------------------------------------------------------------------------------

std::string const& Startup::Options::GetConfigPath() const { return m_configurationFilepath; }

//----------------------------------------------------------------------------------------------------------------------

bool Startup::Options::UseConfiguration() const { return m_useConfiguration; }

//----------------------------------------------------------------------------------------------------------------------

std::uint32_t Startup::Options::GetPeers() const { return m_peers; }

//----------------------------------------------------------------------------------------------------------------------

std::string const& Startup::Options::GetQuery() const { return m_query; }

//----------------------------------------------------------------------------------------------------------------------

std::string const& Startup::Options::GetPayload() const { return m_payload; }

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::chrono::milliseconds> const& Startup::Options::GetTimeout() const { return m_optTimeout; }

//----------------------------------------------------------------------------------------------------------------------

Startup::Options::operator Configuration::Options::Runtime() const
{
    // Package the parsed command line options to the runtime options aggregate.
    return {
        .verbosity = m_verbosity,
        .useFilepathDeduction = true
    };
}

//----------------------------------------------------------------------------------------------------------------------

std::uint32_t local::GetTerminalWidth()
{
    constexpr std::uint32_t DefaultWidth = 80;

    struct winsize size{};
    if (::ioctl(STDOUT_FILENO, TIOCGWINSZ, &size) != 0 || size.ws_col == 0) { return DefaultWidth; }
    return static_cast<std::uint32_t>(size.ws_col);
}

//----------------------------------------------------------------------------------------------------------------------
