#pragma once
#include <format>
#include <iostream>
#include <string_view>

enum eLogLevel {
    TRACE = 0,
    INFO,
    LOG,
    WARN,
    ERR,
    CRIT,
    NONE
};

namespace Debug {
    // -v opens everything up, -q leaves only errors. Warnings show by default.
    inline bool quiet   = false;
    inline bool verbose = false;

    inline bool enabled(eLogLevel level) {
        if (quiet)
            return level >= ERR;
        return verbose || level >= WARN;
    }

    inline std::string_view levelName(eLogLevel level) {
        switch (level) {
            case TRACE: return "TRACE";
            case INFO: return "INFO";
            case LOG: return "LOG";
            case WARN: return "WARN";
            case ERR: return "ERR";
            case CRIT: return "CRITICAL";
            default: return "";
        }
    }

    // stdout carries nothing but the picked path, so all of this goes to stderr
    template <typename... Args>
    void log(eLogLevel level, std::format_string<Args...> fmt, Args&&... args) {
        if (!enabled(level))
            return;

        std::cerr << "randpaper: ";

        if (level != NONE)
            std::cerr << '[' << levelName(level) << "] ";

        std::cerr << std::format(fmt, std::forward<Args>(args)...) << std::endl;
    }
};
