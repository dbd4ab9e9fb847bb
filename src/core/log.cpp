// log.cpp — stderr sink

#include "core/log.hpp"

#include <iostream>
#include <mutex>

namespace core {
namespace log {

namespace {
std::mutex& sink_mutex() { static std::mutex m; return m; }

const char* level_name(Level level) noexcept {
    switch (level) {
        case Level::Warning: return "WARNING";
        case Level::Info:    return "INFO";
        case Level::Debug:   return "DEBUG";
    }
    return "LOG";
}
} // namespace

void write(Level level, std::string_view message) {
    std::lock_guard<std::mutex> lock(sink_mutex());
    std::cerr << level_name(level) << ": " << message << "\n";
}

} // namespace log
} // namespace core
