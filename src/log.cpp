#include "log.hpp"
#include "error.hpp"
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace txproof {

namespace {

std::atomic<LogLevel> g_min_level{LogLevel::Info};
std::mutex g_write_mutex;

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO ";
        case LogLevel::Warn:  return "WARN ";
        case LogLevel::Error: return "ERROR";
    }
    return "?????";
}

} // namespace

void Log::set_level(LogLevel level) {
    g_min_level.store(level);
}

LogLevel Log::level() {
    return g_min_level.load();
}

LogLevel Log::parse_level(const std::string& name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    throw ProofError(ErrorKind::InvalidArgument, "Unknown log level: " + name);
}

void Log::write(LogLevel level, const std::string& message) {
    if (level < g_min_level.load()) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    // Format the whole line first so the locked section is a single write
    std::ostringstream line;
    line << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
         << '.' << std::setw(3) << std::setfill('0') << millis << "Z "
         << level_tag(level) << ' ' << message << '\n';

    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::cerr << line.str();
    std::cerr.flush();
}

} // namespace txproof
