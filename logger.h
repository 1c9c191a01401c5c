#include <string>

#pragma once

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

// Пустой filePath: писать только в stderr
void configureLogging(const std::string& filePath, LogLevel minLevel);

bool logLevelFromString(const std::string& s, LogLevel& out);

void logMessage(LogLevel level, const std::string& msg);

void logInfo(const std::string& msg);
void logWarning(const std::string& msg);
void logError(const std::string& msg);
void logDebug(const std::string& msg);
