//----------------------------------------------------------------------------------------------------------------------
// File: Options.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Options.hpp"
#include "Defaults.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdlib>
#include <limits>
#include <optional>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

// Integers are parsed as signed values unless they exceed the signed range. Negative values are not accepted.
[[nodiscard]] std::optional<std::uint64_t> GetUnsignedValue(boost::json::value const& value);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path Configuration::GetDefaultCanvassFolder()
{
    std::string filepath{ Defaults::FallbackConfigurationFolder }; // Set the filepath root to /etc/ by default

    // Prefer $XDG_CONFIG_HOME as the configuration directory, then the user's $HOME/.config directory.
    if (auto const pConfigHome = std::getenv("XDG_CONFIG_HOME"); pConfigHome && *pConfigHome != '\0') {
        filepath = pConfigHome;
    } else if (auto const pUserHome = std::getenv("HOME"); pUserHome && *pUserHome != '\0') {
        filepath = std::string{ pUserHome } + "/.config";
    }

    filepath += DefaultCanvassFolder;
    return filepath;
}

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path Configuration::GetDefaultConfigurationFilepath()
{
    return GetDefaultCanvassFolder() / DefaultConfigurationFilename; // ../config.json
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Details::Details()
    : m_name(Defaults::NodeName)
    , m_address(Defaults::NodeAddress)
{
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Details::Details(std::string_view name, Cluster::PeerName address)
    : m_name(name)
    , m_address(address)
{
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::Details::Merge(boost::json::object const& json)
{
    // JSON Schema:
    // "node": {
    //     "name": Optional String,
    //     "address": Optional Integer
    // },

    if (auto const itr = json.find(NameSymbol); itr != json.end()) {
        if (!itr->value().is_string()) {
            return { StatusCode::DecodeError, CreateMismatchedValueTypeMessage("string", Symbol, NameSymbol) };
        }

        auto const& name = itr->value().get_string();
        if (name.size() > NameSizeLimit) {
            return { StatusCode::InputError, CreateExceededCharacterLimitMessage(NameSizeLimit, Symbol, NameSymbol) };
        }

        m_name.assign(name.data(), name.size());
    }

    if (auto const itr = json.find(AddressSymbol); itr != json.end()) {
        if (!itr->value().is_number()) {
            return { StatusCode::DecodeError, CreateMismatchedValueTypeMessage("integer", Symbol, AddressSymbol) };
        }

        auto const optAddress = local::GetUnsignedValue(itr->value());
        if (!optAddress || *optAddress == 0) {
            return { StatusCode::InputError, CreateInvalidValueMessage(Symbol, AddressSymbol) };
        }

        m_address = *optAddress;
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::SerializationResult Configuration::Options::Details::Write(boost::json::object& json) const
{
    boost::json::object group;
    if (!m_name.empty()) { group[NameSymbol] = m_name; }
    group[AddressSymbol] = m_address;
    json.emplace(Symbol, std::move(group));
    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Options::Details::AreOptionsAllowable() const
{
    if (m_name.size() > NameSizeLimit) {
        return { StatusCode::InputError, CreateExceededCharacterLimitMessage(NameSizeLimit, Symbol, NameSymbol) };
    }

    if (m_address == 0) {
        return { StatusCode::InputError, CreateInvalidValueMessage(Symbol, AddressSymbol) };
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

std::string const& Configuration::Options::Details::GetName() const { return m_name; }

//----------------------------------------------------------------------------------------------------------------------

Cluster::PeerName Configuration::Options::Details::GetAddress() const { return m_address; }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Details::SetName(std::string_view name, bool& changed)
{
    if (name.size() > NameSizeLimit) { return false; }
    if (name == m_name) { return true; }
    m_name = name;
    changed = true;
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Details::SetAddress(Cluster::PeerName address, bool& changed)
{
    if (address == 0) { return false; }
    if (address == m_address) { return true; }
    m_address = address;
    changed = true;
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Query::Query()
    : m_timeout(Defaults::QueryTimeout)
{
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Query::Query(std::chrono::milliseconds const& timeout)
    : m_timeout(timeout)
{
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::Query::Merge(boost::json::object const& json)
{
    // JSON Schema:
    // "query": {
    //     "timeout": Optional Integer (milliseconds)
    // },

    if (auto const itr = json.find(TimeoutSymbol); itr != json.end()) {
        if (!itr->value().is_number()) {
            return { StatusCode::DecodeError, CreateMismatchedValueTypeMessage("integer", Symbol, TimeoutSymbol) };
        }

        auto const optTimeout = local::GetUnsignedValue(itr->value());
        bool const allowable = optTimeout &&
            *optTimeout >= static_cast<std::uint64_t>(MinimumTimeout.count()) &&
            *optTimeout <= static_cast<std::uint64_t>(MaximumTimeout.count());

        if (!allowable) {
            return {
                StatusCode::InputError,
                CreateValueRangeMessage(MinimumTimeout.count(), MaximumTimeout.count(), Symbol, TimeoutSymbol)
            };
        }

        m_timeout = std::chrono::milliseconds{ static_cast<std::chrono::milliseconds::rep>(*optTimeout) };
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::SerializationResult Configuration::Options::Query::Write(boost::json::object& json) const
{
    boost::json::object group;
    group[TimeoutSymbol] = static_cast<std::int64_t>(m_timeout.count());
    json.emplace(Symbol, std::move(group));
    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Options::Query::AreOptionsAllowable() const
{
    if (m_timeout < MinimumTimeout || m_timeout > MaximumTimeout) {
        return {
            StatusCode::InputError,
            CreateValueRangeMessage(MinimumTimeout.count(), MaximumTimeout.count(), Symbol, TimeoutSymbol)
        };
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

std::chrono::milliseconds const& Configuration::Options::Query::GetTimeout() const { return m_timeout; }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Query::SetTimeout(std::chrono::milliseconds const& timeout, bool& changed)
{
    if (timeout < MinimumTimeout || timeout > MaximumTimeout) { return false; }
    if (timeout == m_timeout) { return true; }
    m_timeout = timeout;
    changed = true;
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::uint64_t> local::GetUnsignedValue(boost::json::value const& value)
{
    if (value.is_uint64()) { return value.get_uint64(); }
    if (value.is_int64()) {
        auto const number = value.get_int64();
        if (number < 0) { return {}; }
        return static_cast<std::uint64_t>(number);
    }
    return {}; // Fractional values are not accepted.
}

//----------------------------------------------------------------------------------------------------------------------
