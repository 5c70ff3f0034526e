#pragma once

#include <atomic>
#include <iostream>
#include <string_view>

namespace avail::log {
    inline std::atomic<bool> enabled{true}; // master switch
    inline std::atomic<bool> verbose{false}; // print info lines

    inline bool on() noexcept {
        return enabled.load(std::memory_order_relaxed);
    }

    inline bool verbose_on() noexcept {
        return on() && verbose.load(std::memory_order_relaxed);
    }

    inline void info(std::string_view tag, std::string_view msg) {
        if (!verbose_on()) return;
        std::clog << "[" << tag << "] " << msg << "\n";
    }

    inline void warn(std::string_view tag, std::string_view msg) {
        if (!on()) return;
        std::cerr << "[" << tag << "][WARN] " << msg << "\n";
    }

    inline void error(std::string_view tag, std::string_view msg) {
        if (!on()) return;
        std::cerr << "[" << tag << "][ERR] " << msg << "\n";
    }
}
