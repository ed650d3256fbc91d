//----------------------------------------------------------------------------------------------------------------------
// File: Parser.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Parser.hpp"
#include "Defaults.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <fstream>
#include <sstream>
#include <system_error>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] bool CreateFolderIfNoneExist(std::filesystem::path const& filepath);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: JSON Schema.
//----------------------------------------------------------------------------------------------------------------------
// "version": String,
// "node": {
//     "name": Optional String,
//     "address": Optional Integer
// },
// "query": {
//     "timeout": Optional Integer
// }
//----------------------------------------------------------------------------------------------------------------------

Configuration::Parser::Parser(Options::Runtime const& options)
    : m_logger(Logger::Get(Logger::Name::Core))
    , m_version(Defaults::Version)
    , m_filepath()
    , m_runtime(options)
    , m_details()
    , m_query()
    , m_validated(false)
    , m_changed(false)
{
    assert(m_logger);
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Parser::Parser(std::filesystem::path const& filepath, Options::Runtime const& options)
    : m_logger(Logger::Get(Logger::Name::Core))
    , m_version(Defaults::Version)
    , m_filepath(filepath)
    , m_runtime(options)
    , m_details()
    , m_query()
    , m_validated(false)
    , m_changed(false)
{
    assert(m_logger);
    OnFilepathChanged();
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Parser::FetchOptions()
{
    constexpr std::string_view UpdateError = "Failed to write the configuration file at: {}! Reason: {}";

    if (auto const status = ProcessFile(); status.first != StatusCode::Success) { return status; }
    if (auto const status = ValidateOptions(); status.first != StatusCode::Success) { return status; }

    // Processing the file may have produced options that have not been written (e.g. a file was generated).
    if (m_changed) {
        auto const status = Serialize();
        if (status.first != StatusCode::Success) {
            m_logger->error(UpdateError, m_filepath.string(), status.second);
        }
        return status;
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::SerializationResult Configuration::Parser::Serialize()
{
    // If the options have changed, validate them to ensure they are valid values.
    if (m_changed) {
        if (auto const status = ValidateOptions(); status.first != StatusCode::Success) { return status; }
    }

    // If the filesystem is disabled, there is nothing to do.
    if (m_filepath.empty()) {
        m_changed = false;
        return { StatusCode::Success, "" };
    }

    if (!local::CreateFolderIfNoneExist(m_filepath)) {
        return { StatusCode::FileError, "Failed to create the configuration folder." };
    }

    std::ofstream os(m_filepath, std::ofstream::out | std::ofstream::trunc);
    if (os.fail()) {
        return { StatusCode::FileError, "Failed to open file." };
    }

    boost::json::object json;
    json[VersionSymbol] = m_version;

    if (auto const status = m_details.Write(json); status.first != StatusCode::Success) { return status; }
    if (auto const status = m_query.Write(json); status.first != StatusCode::Success) { return status; }

    os << boost::json::serialize(json) << '\n';
    os.close();
    if (os.fail()) {
        return { StatusCode::FileError, "Failed to write file." };
    }

    m_changed = false; // On success, reset the changed flag to indicate all changes have been processed.
    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Parser::ValidateOptions()
{
    m_validated = false; // Explicitly disable the validation result in case anything fails.

    if (m_version.empty()) {
        return { StatusCode::InputError, CreateInvalidValueMessage(VersionSymbol) };
    }

    if (auto const status = m_details.AreOptionsAllowable(); status.first != StatusCode::Success) { return status; }
    if (auto const status = m_query.AreOptionsAllowable(); status.first != StatusCode::Success) { return status; }

    m_validated = true;
    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path const& Configuration::Parser::GetFilepath() const { return m_filepath; }

//----------------------------------------------------------------------------------------------------------------------

void Configuration::Parser::SetFilepath(std::filesystem::path const& filepath)
{
    m_changed = true; // Setting the changed flag to true, will cause the options to be serialized to the new file.
    m_filepath = filepath;
    OnFilepathChanged();
}

//----------------------------------------------------------------------------------------------------------------------

void Configuration::Parser::DisableFilesystem()
{
    m_filepath.clear(); // This is not considered a change as it does not have serializable side effects.
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::FilesystemDisabled() const { return m_filepath.empty(); }

//----------------------------------------------------------------------------------------------------------------------

spdlog::level::level_enum Configuration::Parser::GetVerbosity() const { return m_runtime.verbosity; }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::UseFilepathDeduction() const { return m_runtime.useFilepathDeduction; }

//----------------------------------------------------------------------------------------------------------------------

std::string const& Configuration::Parser::GetVersion() const { return m_version; }

//----------------------------------------------------------------------------------------------------------------------

std::string const& Configuration::Parser::GetNodeName() const { return m_details.GetName(); }

//----------------------------------------------------------------------------------------------------------------------

Cluster::PeerName Configuration::Parser::GetNodeAddress() const { return m_details.GetAddress(); }

//----------------------------------------------------------------------------------------------------------------------

std::chrono::milliseconds const& Configuration::Parser::GetQueryTimeout() const { return m_query.GetTimeout(); }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::Validated() const { return m_validated && !m_changed; }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::Changed() const { return m_changed; }

//----------------------------------------------------------------------------------------------------------------------

void Configuration::Parser::SetVerbosity(spdlog::level::level_enum verbosity)
{
    m_runtime.verbosity = verbosity; // Runtime options are never serialized.
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::SetNodeName(std::string_view name) { return m_details.SetName(name, m_changed); }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::SetNodeAddress(Cluster::PeerName address)
{
    return m_details.SetAddress(address, m_changed);
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::SetQueryTimeout(std::chrono::milliseconds const& timeout)
{
    return m_query.SetTimeout(timeout, m_changed);
}

//----------------------------------------------------------------------------------------------------------------------

void Configuration::Parser::OnFilepathChanged()
{
    if (m_filepath.empty() || !m_runtime.useFilepathDeduction) { return; }

    // If the filepath does not have a filename, attach the default config.json
    if (!m_filepath.has_filename()) { m_filepath = m_filepath / DefaultConfigurationFilename; }

    // If the filepath does not have a parent path, get and attach the default canvass folder
    if (!m_filepath.has_parent_path()) { m_filepath = GetDefaultCanvassFolder() / m_filepath; }
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Parser::ProcessFile()
{
    constexpr std::string_view ReadingMessage = "Reading configuration file at: {}.";
    constexpr std::string_view GeneratingMessage = "Generating a default configuration file at: {}.";

    if (m_filepath.empty()) { return { StatusCode::Success, "" }; } // If filesystem usage is disabled, there is nothing to do.
    if (m_validated && !m_changed) { return { StatusCode::Success, "" }; } // If there are no changes, there is nothing to do.

    std::error_code error;
    if (std::filesystem::exists(m_filepath, error)) {
        m_logger->debug(ReadingMessage, m_filepath.string());
        return Deserialize();
    }

    if (error) { return { StatusCode::FileError, "Failed to access the configuration file." }; }

    // When no file exists, the current options will be written as the new configuration file.
    m_logger->info(GeneratingMessage, m_filepath.string());
    m_changed = true;
    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Parser::Deserialize()
{
    // If the filepath is empty, filesystem usage has been disabled.
    if (m_filepath.empty()) { return { StatusCode::Success, "" }; }

    std::error_code code;
    if (auto const size = std::filesystem::file_size(m_filepath, code); code || size > Defaults::FileSizeLimit) {
        return { StatusCode::FileError, "The configuration file could not be read or exceeds the size limit." };
    }

    std::stringstream buffer;
    {
        std::ifstream reader{ m_filepath };
        if (reader.fail()) [[unlikely]] {
            return { StatusCode::FileError, "Failed to open configuration file for reading." };
        }
        buffer << reader.rdbuf(); // Read the file into the buffer stream.
    }

    auto const serialized = buffer.str();
    if (serialized.empty()) {
        return { StatusCode::DecodeError, "The configuration file is empty." };
    }

    constexpr boost::json::parse_options ParserOptions{
        .allow_comments = true,
        .allow_trailing_commas = true,
    };

    boost::json::error_code error;
    auto const parsed = boost::json::parse(serialized, error, boost::json::storage_ptr{}, ParserOptions);
    if (error || !parsed.is_object()) {
        return { StatusCode::DecodeError, "Failed to read the configuration file as valid JSON." };
    }

    auto const& json = parsed.get_object();

    // Required field parsing.
    if (auto const itr = json.find(VersionSymbol); itr != json.end()) {
        if (!itr->value().is_string()) {
            return { StatusCode::DecodeError, CreateMismatchedValueTypeMessage("string", VersionSymbol) };
        }

        auto const& version = itr->value().get_string();
        if (version.empty()) {
            return { StatusCode::InputError, CreateInvalidValueMessage(VersionSymbol) };
        }

        m_version.assign(version.data(), version.size());
    } else {
        return { StatusCode::DecodeError, CreateMissingFieldMessage(VersionSymbol) };
    }

    // Optional group parsing.
    if (auto const itr = json.find(Options::Details::GetFieldName()); itr != json.end()) {
        if (!itr->value().is_object()) {
            return {
                StatusCode::DecodeError,
                CreateMismatchedValueTypeMessage("object", Options::Details::GetFieldName())
            };
        }
        if (auto const status = m_details.Merge(itr->value().get_object()); status.first != StatusCode::Success) {
            return status;
        }
    }

    if (auto const itr = json.find(Options::Query::GetFieldName()); itr != json.end()) {
        if (!itr->value().is_object()) {
            return {
                StatusCode::DecodeError,
                CreateMismatchedValueTypeMessage("object", Options::Query::GetFieldName())
            };
        }
        if (auto const status = m_query.Merge(itr->value().get_object()); status.first != StatusCode::Success) {
            return status;
        }
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

bool local::CreateFolderIfNoneExist(std::filesystem::path const& filepath)
{
    auto const base = filepath.parent_path();
    if (base.empty()) { return true; } // The file is relative to the working directory.

    std::error_code error;
    if (std::filesystem::exists(base, error)) { return true; }
    if (error) { return false; }

    // Create any directories in the base path that do not exist. Only the user may access the created folder.
    if (!std::filesystem::create_directories(base, error) || error) { return false; }
    std::filesystem::permissions(base, std::filesystem::perms::owner_all, error);
    return !error;
}

//----------------------------------------------------------------------------------------------------------------------
