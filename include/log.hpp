#pragma once

#include <unistd.h>
#include <atomic>
#include <cstdlib>
#include <mutex>
#include <string>
#include <string_view>

namespace httpfile::log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

inline Level parse_level(std::string_view name, Level fallback = Level::Warn) {
    if (name == "debug") return Level::Debug;
    if (name == "info") return Level::Info;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "error") return Level::Error;
    if (name == "off" || name == "none") return Level::Off;
    return fallback;
}

// Lightweight stderr writer; level comes from HTTPFILE_LOG unless set explicitly.
class Writer {
public:
    static Level level() {
        return state().level.load(std::memory_order_relaxed);
    }

    static void set_level(Level level) {
        state().level.store(level, std::memory_order_relaxed);
    }

    static bool enabled(Level level) {
        return level >= Writer::level() && level != Level::Off;
    }

    static void write(Level level, std::string_view msg) {
        if (!enabled(level)) return;
        std::string line;
        line.reserve(msg.size() + 16);
        line += "[httpfile] ";
        line += tag(level);
        line += ' ';
        line += msg;
        line += '\n';
        std::lock_guard<std::mutex> lock(state().mutex);
        [[maybe_unused]] auto written = ::write(STDERR_FILENO, line.data(), line.size());
    }

private:
    struct State {
        std::mutex mutex;
        std::atomic<Level> level;

        State() {
            const char* env = std::getenv("HTTPFILE_LOG");
            level.store(env ? parse_level(env) : Level::Warn);
        }
    };

    static State& state() {
        static State s;
        return s;
    }

    static std::string_view tag(Level level) {
        switch (level) {
            case Level::Debug: return "debug:";
            case Level::Info: return "info:";
            case Level::Warn: return "warn:";
            case Level::Error: return "error:";
            case Level::Off: break;
        }
        return "";
    }
};

inline void debug(std::string_view msg) { Writer::write(Level::Debug, msg); }
inline void info(std::string_view msg) { Writer::write(Level::Info, msg); }
inline void warn(std::string_view msg) { Writer::write(Level::Warn, msg); }
inline void error(std::string_view msg) { Writer::write(Level::Error, msg); }

} // namespace httpfile::log
