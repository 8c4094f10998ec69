// Console logger shared by the engine and catalog layers.
#pragma once

#include <string_view>

namespace Engine {

enum class LogLevel { Debug, Info, Warning, Error };

class Logger {
public:
    static void log(LogLevel level, std::string_view message);

    // Messages below this level are dropped. Defaults to Info.
    static void setMinimumLevel(LogLevel level);
    static LogLevel minimumLevel();
};

inline void logDebug(std::string_view msg) { Logger::log(LogLevel::Debug, msg); }
inline void logInfo(std::string_view msg) { Logger::log(LogLevel::Info, msg); }
inline void logWarn(std::string_view msg) { Logger::log(LogLevel::Warning, msg); }
inline void logError(std::string_view msg) { Logger::log(LogLevel::Error, msg); }

}  // namespace Engine
