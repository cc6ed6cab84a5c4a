#pragma once

#include <string>
#include <string_view>

namespace archivedir::log {

enum class Level {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

// Parses "debug", "info", "warn", "error" or "off"; unknown values yield Info.
Level ParseLevel(std::string_view name);

void SetLevel(Level level);
Level GetLevel();

// Appends every emitted line to `path` as well as the console.
void SetLogFile(const std::string& path);

// Reads ARCHIVEDIR_LOG_LEVEL once; explicit SetLevel calls win.
void InitFromEnvironment();

void Write(Level level, const std::string& message);

inline void Debug(const std::string& message) { Write(Level::Debug, message); }
inline void Info(const std::string& message) { Write(Level::Info, message); }
inline void Warn(const std::string& message) { Write(Level::Warn, message); }
inline void Error(const std::string& message) { Write(Level::Error, message); }

}  // namespace archivedir::log
