#pragma once

#include <memory>
#include <ostream>

namespace obix {
namespace logging {

// ─── Markers ───────────────────────────────────────────────────
// A marker tags a log line with a level. Each marker can be switched
// at process start with OBIX_LOG_MARKER_<NAME>_ENABLED=true|false.

class Marker {
public:
    const char* name;
    bool isEnabled;
    Marker(const char* name, bool defaultEnabled) noexcept;
};

extern const Marker WARN;
extern const Marker INFO;
extern const Marker DEBUG;
extern const Marker TRACE;

struct NullStream : std::ostream {
    NullStream() : std::ios(nullptr), std::ostream(nullptr) {}
};

extern NullStream null_out;

// ─── Logger ────────────────────────────────────────────────────
// Writes "[name][MARKER]: ..." lines to stderr, or to the file named
// by OBIX_LOG_FILE. Callers terminate the line themselves.

class Logger {
public:
    explicit Logger(const char* name) noexcept;

    template <typename... Args>
    std::ostream& log(const Marker& marker, const Args&... args) const {
        if (!marker.isEnabled) return null_out;
        *os_ << "[" << name_ << "][" << marker.name << "]: ";
        ((*os_ << args), ...);
        return *os_;
    }

    template <typename... Args>
    std::ostream& warn(const Args&... args) const { return log(WARN, args...); }

    template <typename... Args>
    std::ostream& info(const Args&... args) const { return log(INFO, args...); }

    template <typename... Args>
    std::ostream& debug(const Args&... args) const { return log(DEBUG, args...); }

    template <typename... Args>
    std::ostream& trace(const Args&... args) const { return log(TRACE, args...); }

private:
    const char* name_;
    std::ostream* os_;
    std::unique_ptr<std::ostream> owned_;
};

extern const Logger OBIX;

} // namespace logging
} // namespace obix
