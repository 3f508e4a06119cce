#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace pagewise::util {

/*
  Audio position parsing.

  Accepted forms: "SS", "MM:SS", "HH:MM:SS". Minutes and seconds after the
  leading field must be below 60. Anything else throws InvalidRawValue.
*/
std::chrono::seconds ParseDuration(std::string_view text);

// "HH:MM:SS"; hours are not wrapped at 24.
std::string FormatDuration(std::chrono::seconds value);

} // namespace pagewise::util
