#pragma once

#include <atomic>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string_view>

namespace cloudbridge::log {

namespace detail {

inline std::mutex& line_mutex() {
    static std::mutex mu;
    return mu;
}

inline std::atomic<bool>& quiet_flag() {
    static std::atomic<bool> quiet{false};
    return quiet;
}

template <typename... Args>
void write_line(std::ostream& os, std::string_view tag, const Args&... args) {
    std::ostringstream line;
    line << '[' << tag << "] ";
    (line << ... << args);
    line << '\n';

    std::lock_guard<std::mutex> lk(line_mutex());
    os << line.str();
}

} // namespace detail

// Silences info() output; errors are always written.
inline void set_quiet(bool quiet) noexcept { detail::quiet_flag() = quiet; }
inline bool quiet() noexcept { return detail::quiet_flag(); }

template <typename... Args>
void info(std::string_view tag, const Args&... args) {
    if (quiet()) return;
    detail::write_line(std::cout, tag, args...);
}

template <typename... Args>
void error(std::string_view tag, const Args&... args) {
    detail::write_line(std::cerr, tag, args...);
}

} // namespace cloudbridge::log
