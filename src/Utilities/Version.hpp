//----------------------------------------------------------------------------------------------------------------------
// File: Version.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Canvass {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Version = "0.1.0";

//----------------------------------------------------------------------------------------------------------------------
} // Canvass namespace
//----------------------------------------------------------------------------------------------------------------------
