#pragma once

#include <chrono>
#include <string>

namespace kbengine::time {

// Returns the current UTC time formatted as ISO-8601 with millisecond precision.
std::string current_time_iso8601();

long long elapsed_ms(std::chrono::steady_clock::time_point since);

}  // namespace kbengine::time
