#ifndef LOGGING_HPP
#define LOGGING_HPP

#include <string>

namespace logging {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3 };

void setLevel(Level level);
Level level();

// Accepts "debug", "info", "warn", "error" (case-insensitive). Returns false on anything else.
bool parseLevel(const std::string& name, Level& out);

// Lines look like "[Tag] [WARN] message". Debug/info go to stdout, warn/error to stderr.
void debug(const std::string& tag, const std::string& msg);
void info(const std::string& tag, const std::string& msg);
void warn(const std::string& tag, const std::string& msg);
void error(const std::string& tag, const std::string& msg);

} // namespace logging

#endif
