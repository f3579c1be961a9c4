#pragma once

#include <functional>
#include <string_view>

namespace kbengine::log {

enum class Level { Info, Warn, Error };

// Receives every line at or above the minimum level, already formatted.
using Sink = std::function<void(Level level, std::string_view line)>;

// "info", "warn" or "error", case-insensitive. Throws ConfigurationError otherwise.
Level parse_level(std::string_view value);
const char* to_string(Level level);

void set_min_level(Level level);
Level min_level();

// Replaces the console sink; an empty sink restores it. A custom sink is called
// without the logger lock held and must synchronize itself.
void set_sink(Sink sink);

void write(Level level, std::string_view message);
void info(std::string_view message);
void warn(std::string_view message);
void error(std::string_view message);

}  // namespace kbengine::log
