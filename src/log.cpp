#include "archivedir/log.hpp"

#include "archivedir/cli_colors.hpp"
#include "archivedir/env.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace archivedir::log {

namespace {

class Logger {
public:
    static Logger& Get() {
        static Logger instance;
        return instance;
    }

    void SetLevel(Level level) { level_.store(level); }
    Level GetLevel() const { return level_.load(); }

    void SetLogFile(const std::string& path) {
        std::lock_guard<std::mutex> lk(mutex_);
        if (file_.is_open()) {
            file_.close();
        }
        file_.open(path, std::ios::app);
        if (!file_) {
            std::cerr << "warning: cannot open log file " << path << "\n";
        }
    }

    void Write(Level level, const std::string& message) {
        if (level < level_.load() || level == Level::Off) {
            return;
        }
        std::string stamp = Timestamp();
        std::ostream& os = level >= Level::Warn ? std::cerr : std::cout;
        std::string tag = archivedir::cli::Colorize(LevelTag(level), LevelColor(level), os);
        std::lock_guard<std::mutex> lk(mutex_);
        os << archivedir::cli::Colorize(stamp, archivedir::cli::color::BRIGHT_BLACK, os)
           << " [" << tag << "] " << message << "\n";
        if (level >= Level::Warn) {
            os.flush();
        }
        if (file_.is_open()) {
            file_ << stamp << " [" << LevelTag(level) << "] " << message << "\n";
            file_.flush();
        }
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() : level_(Level::Info) {}

    static std::string Timestamp() {
        auto now = std::chrono::system_clock::now();
        std::time_t tt = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
        std::tm tm{};
        localtime_r(&tt, &tm);
        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return ss.str();
    }

    static const char* LevelTag(Level level) {
        switch (level) {
            case Level::Debug: return "DEBUG";
            case Level::Info:  return "INFO ";
            case Level::Warn:  return "WARN ";
            case Level::Error: return "ERROR";
            case Level::Off:   break;
        }
        return "?????";
    }

    static const char* LevelColor(Level level) {
        switch (level) {
            case Level::Debug: return archivedir::cli::color::BRIGHT_BLACK;
            case Level::Info:  return archivedir::cli::color::CYAN;
            case Level::Warn:  return archivedir::cli::color::YELLOW;
            case Level::Error: return archivedir::cli::color::BOLD_RED;
            case Level::Off:   break;
        }
        return archivedir::cli::color::RESET;
    }

    std::mutex mutex_;
    std::atomic<Level> level_;
    std::ofstream file_;
};

std::string ToLower(std::string_view value) {
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return out;
}

}  // namespace

Level ParseLevel(std::string_view name) {
    std::string lower = ToLower(name);
    if (lower == "debug") {
        return Level::Debug;
    }
    if (lower == "warn" || lower == "warning") {
        return Level::Warn;
    }
    if (lower == "error") {
        return Level::Error;
    }
    if (lower == "off" || lower == "none") {
        return Level::Off;
    }
    return Level::Info;
}

void SetLevel(Level level) {
    Logger::Get().SetLevel(level);
}

Level GetLevel() {
    return Logger::Get().GetLevel();
}

void SetLogFile(const std::string& path) {
    Logger::Get().SetLogFile(path);
}

void InitFromEnvironment() {
    std::string raw = archivedir::env::Get("ARCHIVEDIR_LOG_LEVEL");
    if (!raw.empty()) {
        Logger::Get().SetLevel(ParseLevel(raw));
    }
}

void Write(Level level, const std::string& message) {
    Logger::Get().Write(level, message);
}

}  // namespace archivedir::log
