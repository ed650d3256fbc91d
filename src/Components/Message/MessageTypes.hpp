//----------------------------------------------------------------------------------------------------------------------
// File: MessageTypes.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Message {
//----------------------------------------------------------------------------------------------------------------------

using Buffer = std::vector<std::uint8_t>;
using BufferView = std::span<std::uint8_t const>;

[[nodiscard]] inline Buffer ToBuffer(std::string_view value) { return Buffer{ value.begin(), value.end() }; }
[[nodiscard]] inline std::string ToString(BufferView buffer) { return std::string{ buffer.begin(), buffer.end() }; }

//----------------------------------------------------------------------------------------------------------------------
} // Message namespace
//----------------------------------------------------------------------------------------------------------------------
