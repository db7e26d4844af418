/**
 * Leveled diagnostic logging to stderr.
 *
 * Lines are written as "[LEVEL] message". A sink can be installed to
 * capture lines instead (tests, tick-report diagnostics).
 */

#ifndef SKYSHIELD_UTIL_LOG_HPP
#define SKYSHIELD_UTIL_LOG_HPP

#include <functional>
#include <string>

namespace skyshield::log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

using Sink = std::function<void(Level, const std::string&)>;

void set_level(Level lvl);
Level level();

/**
 * Parse "debug", "info", "warn", "error" or "off".
 * @throws std::runtime_error on anything else
 */
Level parse_level(const std::string& name);
const char* level_name(Level lvl);

// Replace the stderr writer; pass nullptr to restore it
void set_sink(Sink sink);

void debug(const std::string& msg);
void info(const std::string& msg);
void warn(const std::string& msg);
void error(const std::string& msg);

} // namespace skyshield::log

#endif // SKYSHIELD_UTIL_LOG_HPP
