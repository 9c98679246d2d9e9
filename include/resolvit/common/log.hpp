#pragma once

#include <atomic>
#include <functional>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace resolvit::log {

    enum class Level : int {
        Debug = 0,
        Info = 1,
        Warn = 2,
        Error = 3,
        Off = 4,
    };

    inline const char *levelName(Level level) {
        switch (level) {
        case Level::Debug:
            return "DEBUG";
        case Level::Info:
            return "INFO";
        case Level::Warn:
            return "WARN";
        case Level::Error:
            return "ERROR";
        default:
            return "OFF";
        }
    }

    /// Receives every message at or above the threshold
    using Sink = std::function<void(Level, const std::string &component, const std::string &message)>;

    namespace detail {
        inline std::atomic<int> &threshold() {
            static std::atomic<int> value{static_cast<int>(Level::Info)};
            return value;
        }

        inline std::mutex &sinkMutex() {
            static std::mutex m;
            return m;
        }

        inline Sink &sink() {
            static Sink s;
            return s;
        }
    } // namespace detail

    inline void setLevel(Level level) { detail::threshold().store(static_cast<int>(level)); }

    inline Level level() { return static_cast<Level>(detail::threshold().load()); }

    inline bool enabled(Level lvl) { return lvl != Level::Off && static_cast<int>(lvl) >= detail::threshold().load(); }

    /// Replace the output sink (pass an empty function to restore stderr)
    inline void setSink(Sink sink) {
        std::lock_guard<std::mutex> lock(detail::sinkMutex());
        detail::sink() = std::move(sink);
    }

    inline void write(Level lvl, const std::string &component, const std::string &message) {
        if (!enabled(lvl))
            return;
        std::lock_guard<std::mutex> lock(detail::sinkMutex());
        if (detail::sink()) {
            detail::sink()(lvl, component, message);
            return;
        }
        std::cerr << "[" << levelName(lvl) << "] " << component << ": " << message << std::endl;
    }

    inline void debug(const std::string &component, const std::string &message) {
        write(Level::Debug, component, message);
    }

    inline void info(const std::string &component, const std::string &message) {
        write(Level::Info, component, message);
    }

    inline void warn(const std::string &component, const std::string &message) {
        write(Level::Warn, component, message);
    }

    inline void error(const std::string &component, const std::string &message) {
        write(Level::Error, component, message);
    }

} // namespace resolvit::log
