//----------------------------------------------------------------------------------------------------------------------
// File: Parser.hpp
// Description: Reads, validates, and writes the node's configuration file.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Options.hpp"
#include "StatusCode.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

class Parser;

//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------

class Configuration::Parser final
{
public:
    static constexpr std::string_view VersionSymbol = "version";

    // Note: Constructing the parser without a filepath disables the filesystem. Options will only be validated.
    explicit Parser(Options::Runtime const& options);
    Parser(std::filesystem::path const& filepath, Options::Runtime const& options);

    // Reads the configuration file, if one exists, and validates the resulting options. When no file exists at the
    // configured path, the default options are validated and written to that path.
    [[nodiscard]] DeserializationResult FetchOptions();
    [[nodiscard]] SerializationResult Serialize();

    [[nodiscard]] std::filesystem::path const& GetFilepath() const;
    void SetFilepath(std::filesystem::path const& filepath);
    void DisableFilesystem();
    [[nodiscard]] bool FilesystemDisabled() const;

    [[nodiscard]] spdlog::level::level_enum GetVerbosity() const;
    [[nodiscard]] bool UseFilepathDeduction() const;
    [[nodiscard]] std::string const& GetVersion() const;
    [[nodiscard]] std::string const& GetNodeName() const;
    [[nodiscard]] Cluster::PeerName GetNodeAddress() const;
    [[nodiscard]] std::chrono::milliseconds const& GetQueryTimeout() const;

    [[nodiscard]] bool Validated() const;
    [[nodiscard]] bool Changed() const;

    void SetVerbosity(spdlog::level::level_enum verbosity);
    [[nodiscard]] bool SetNodeName(std::string_view name);
    [[nodiscard]] bool SetNodeAddress(Cluster::PeerName address);
    [[nodiscard]] bool SetQueryTimeout(std::chrono::milliseconds const& timeout);

private:
    void OnFilepathChanged();
    [[nodiscard]] DeserializationResult ProcessFile();
    [[nodiscard]] DeserializationResult Deserialize();

    [[nodiscard]] ValidationResult ValidateOptions();

    std::shared_ptr<spdlog::logger> m_logger;

    std::string m_version;
    std::filesystem::path m_filepath;

    Options::Runtime m_runtime;
    Options::Details m_details;
    Options::Query m_query;

    bool m_validated;
    bool m_changed;
};

//----------------------------------------------------------------------------------------------------------------------
