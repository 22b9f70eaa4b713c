#include "core/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace logging {

static std::atomic<int> g_level{(int)Level::Info};
static std::mutex g_mutex;

static void emit(Level lvl, const char* name, const std::string& tag, const std::string& msg) {
    if ((int)lvl < g_level.load()) return;

    std::lock_guard<std::mutex> lock(g_mutex);
    std::ostream& out = (lvl >= Level::Warn) ? std::cerr : std::cout;
    out << "[" << tag << "] ";
    if (lvl != Level::Info) out << "[" << name << "] ";
    out << msg << std::endl;
}

void setLevel(Level level) { g_level.store((int)level); }

Level level() { return (Level)g_level.load(); }

bool parseLevel(const std::string& name, Level& out) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });

    if (lower == "debug") out = Level::Debug;
    else if (lower == "info") out = Level::Info;
    else if (lower == "warn" || lower == "warning") out = Level::Warn;
    else if (lower == "error") out = Level::Error;
    else return false;
    return true;
}

void debug(const std::string& tag, const std::string& msg) { emit(Level::Debug, "DEBUG", tag, msg); }
void info(const std::string& tag, const std::string& msg) { emit(Level::Info, "INFO", tag, msg); }
void warn(const std::string& tag, const std::string& msg) { emit(Level::Warn, "WARN", tag, msg); }
void error(const std::string& tag, const std::string& msg) { emit(Level::Error, "ERROR", tag, msg); }

} // namespace logging
