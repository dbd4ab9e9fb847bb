// log.hpp — leveled stderr logging with a program-wide verbosity
#pragma once

#include <cstddef>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace core {
namespace log {

enum class Level : int { Warning = 0, Info = 1, Debug = 2 };

/**
 * @brief Program-wide verbosity (initialize once at program startup).
 */
inline Level program_level = Level::Warning;
inline bool program_level_initialized = false;

/**
 * @brief Initialize program-wide verbosity once; subsequent calls are no-ops.
 */
static inline void init_program_level(Level level) noexcept {
    if (!program_level_initialized) {
        program_level = level;
        program_level_initialized = true;
    }
}

/**
 * @brief Map a repeat count of -v to a level (0 -> Warning, 1 -> Info, 2+ -> Debug).
 */
static inline Level level_from_verbosity(std::size_t count) noexcept {
    if (count >= 2) return Level::Debug;
    return count == 1 ? Level::Info : Level::Warning;
}

static inline bool enabled(Level level) noexcept {
    return static_cast<int>(level) <= static_cast<int>(program_level);
}

/**
 * @brief Write "LEVEL: message" to stderr; serialized across threads.
 */
void write(Level level, std::string_view message);

template <class... Args>
inline void emit(Level level, Args&&... args) {
    if (!enabled(level)) return;
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    write(level, oss.str());
}

template <class... Args> inline void warn(Args&&... args)  { emit(Level::Warning, std::forward<Args>(args)...); }
template <class... Args> inline void info(Args&&... args)  { emit(Level::Info,    std::forward<Args>(args)...); }
template <class... Args> inline void debug(Args&&... args) { emit(Level::Debug,   std::forward<Args>(args)...); }

} // namespace log
} // namespace core
