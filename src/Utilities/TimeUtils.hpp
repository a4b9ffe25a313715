//----------------------------------------------------------------------------------------------------------------------
// File: TimeUtils.hpp
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <string>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace TimeUtils {
//----------------------------------------------------------------------------------------------------------------------

using Timestamp = std::chrono::milliseconds;
using Timepoint = std::chrono::time_point<std::chrono::system_clock, Timestamp>;

[[nodiscard]] Timepoint GetSystemTimepoint();
[[nodiscard]] Timestamp GetSystemTimestamp();
[[nodiscard]] Timestamp TimepointToTimestamp(Timepoint const& time);
[[nodiscard]] std::string TimestampToString(Timestamp const& timestamp);

//----------------------------------------------------------------------------------------------------------------------
} // TimeUtils namespace
//----------------------------------------------------------------------------------------------------------------------

inline TimeUtils::Timepoint TimeUtils::GetSystemTimepoint()
{
    return std::chrono::time_point_cast<Timestamp>(std::chrono::system_clock::now());
}

//----------------------------------------------------------------------------------------------------------------------

inline TimeUtils::Timestamp TimeUtils::GetSystemTimestamp()
{
    return TimepointToTimestamp(GetSystemTimepoint());
}

//----------------------------------------------------------------------------------------------------------------------

inline TimeUtils::Timestamp TimeUtils::TimepointToTimestamp(Timepoint const& timepoint)
{
    return std::chrono::duration_cast<Timestamp>(timepoint.time_since_epoch());
}

//----------------------------------------------------------------------------------------------------------------------

inline std::string TimeUtils::TimestampToString(Timestamp const& timestamp)
{
    return std::to_string(timestamp.count());
}

//----------------------------------------------------------------------------------------------------------------------
