//----------------------------------------------------------------------------------------------------------------------
// File: ExecutionStatus.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
//----------------------------------------------------------------------------------------------------------------------

enum class ExecutionStatus : std::uint32_t
{
    Standby,
    Executing,
    AlreadyStarted,
    InitializationFailed,
    RequestedShutdown,
    ResourceShutdown,
    UnexpectedShutdown
};

//----------------------------------------------------------------------------------------------------------------------
