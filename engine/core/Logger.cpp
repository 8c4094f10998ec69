#include "Logger.h"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace Engine {

namespace {
std::atomic<int> gMinimumLevel{static_cast<int>(LogLevel::Info)};
std::mutex gWriteMutex;

std::string_view toLabel(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warning:
            return "WARN";
        case LogLevel::Error:
        default:
            return "ERROR";
    }
}
}  // namespace

void Logger::setMinimumLevel(LogLevel level) { gMinimumLevel.store(static_cast<int>(level)); }

LogLevel Logger::minimumLevel() { return static_cast<LogLevel>(gMinimumLevel.load()); }

void Logger::log(LogLevel level, std::string_view message) {
    using namespace std::chrono;

    if (static_cast<int>(level) < gMinimumLevel.load()) return;

    const auto now = system_clock::now();
    const auto t = system_clock::to_time_t(now);
    const auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif

    std::ostringstream oss;
    oss << '[' << std::put_time(&tm, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms.count()
        << "] [" << toLabel(level) << "] " << message << '\n';

    // Matching workers may log concurrently; keep lines whole.
    std::lock_guard<std::mutex> lock(gWriteMutex);
    std::ostream& out = (level >= LogLevel::Warning) ? std::cerr : std::cout;
    out << oss.str();
}

}  // namespace Engine
