#pragma once

#include <fmt/format.h>

#include <cstdio>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace safe_io {
    enum class Level
    {
        Debug,
        Info,
        Warning,
        Silent,
    };

    namespace detail {
        void configure_console() noexcept;
        std::mutex& output_mutex() noexcept;
        void write_line(std::FILE* stream, std::string_view line) noexcept;
    }

    void set_level(Level level) noexcept;
    [[nodiscard]] Level level() noexcept;

    // Print to stdout
    template <class... Args>
    inline void print(fmt::format_string<Args...> fmt_str, Args&&... args) {
        detail::write_line(stdout, fmt::format(fmt_str, std::forward<Args>(args)...));
    }

    // Print to stderr
    template <class... Args>
    inline void eprint(fmt::format_string<Args...> fmt_str, Args&&... args) {
        detail::write_line(stderr, fmt::format(fmt_str, std::forward<Args>(args)...));
    }

    template <class... Args>
    inline void debug(fmt::format_string<Args...> fmt_str, Args&&... args) {
        if (level() <= Level::Debug) {
            detail::write_line(stdout, "[debug] " + fmt::format(fmt_str, std::forward<Args>(args)...));
        }
    }

    template <class... Args>
    inline void info(fmt::format_string<Args...> fmt_str, Args&&... args) {
        if (level() <= Level::Info) {
            detail::write_line(stdout, "[info] " + fmt::format(fmt_str, std::forward<Args>(args)...));
        }
    }

    // Warnings go to stderr so they survive redirected result output.
    template <class... Args>
    inline void warn(fmt::format_string<Args...> fmt_str, Args&&... args) {
        if (level() <= Level::Warning) {
            detail::write_line(stderr, "[warning] " + fmt::format(fmt_str, std::forward<Args>(args)...));
        }
    }
} // namespace safe_io
