#include "stratus/core/Log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>

namespace stratus::log {

namespace {

std::atomic<int>& threshold() {
    static std::atomic<int> lvl{static_cast<int>(Level::INFO)};
    return lvl;
}

}

void setLevel(Level lvl) {
    threshold().store(static_cast<int>(lvl), std::memory_order_relaxed);
}

Level level() {
    return static_cast<Level>(threshold().load(std::memory_order_relaxed));
}

bool setLevel(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (n == "debug")                   setLevel(Level::DEBUG);
    else if (n == "info")               setLevel(Level::INFO);
    else if (n == "warn" || n == "warning") setLevel(Level::WARN);
    else if (n == "error")              setLevel(Level::ERROR);
    else if (n == "off" || n == "none") setLevel(Level::OFF);
    else return false;
    return true;
}

const char* level_str(Level lvl) noexcept {
    switch (lvl) {
        case Level::DEBUG: return "DEBUG";
        case Level::INFO:  return "INFO";
        case Level::WARN:  return "WARN";
        case Level::ERROR: return "ERROR";
        case Level::OFF:   return "OFF";
        default: return "UNKNOWN";
    }
}

}
