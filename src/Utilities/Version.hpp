//----------------------------------------------------------------------------------------------------------------------
// File: Version.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Ferry {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Version = "0.3.0";

//----------------------------------------------------------------------------------------------------------------------
} // Ferry namespace
//----------------------------------------------------------------------------------------------------------------------
