//----------------------------------------------------------------------------------------------------------------------
// File: Defaults.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration::Defaults {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::uint32_t FileSizeLimit = 12'000; // Limit the configuration files to 12KB

std::filesystem::path const FallbackConfigurationFolder = "/etc/";

constexpr std::string_view Version = "0.1.0";

constexpr std::string_view NodeName = "";
constexpr std::uint64_t NodeAddress = 1;

constexpr auto QueryTimeout = std::chrono::milliseconds{ 1'500 };

//----------------------------------------------------------------------------------------------------------------------
} // Configuration::Defaults namespace
//----------------------------------------------------------------------------------------------------------------------
