#pragma once

#include <bsoncxx/types.hpp>

#include <chrono>

namespace migrate::util {

/*
  Time utilities. Single place to control clock source later.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

bsoncxx::types::b_date ToBsonDate(TimePoint tp);

} // namespace migrate::util
