#include "safe_io/utils.hpp"

#include <atomic>
#include <cstdio>

#ifdef _WIN32
#    include <Windows.h>
#    include <fcntl.h>
#    include <io.h>
#endif

namespace safe_io
{
    namespace
    {
        std::atomic<Level> g_level{Level::Info};
    } // namespace

    namespace detail
    {
        void configure_console() noexcept
        {
#ifdef _WIN32
            static const bool configured = [] {
                if (!_isatty(_fileno(stdout)))
                {
                    return true;
                }

                ::SetConsoleOutputCP(CP_UTF8);
                ::SetConsoleCP(CP_UTF8);

                const HANDLE handle = ::GetStdHandle(STD_OUTPUT_HANDLE);
                if (handle != INVALID_HANDLE_VALUE)
                {
                    DWORD mode = 0;
                    if (::GetConsoleMode(handle, &mode))
                    {
                        ::SetConsoleMode(handle, mode | ENABLE_PROCESSED_OUTPUT | ENABLE_VIRTUAL_TERMINAL_PROCESSING);
                    }
                }
                return true;
            }();
            (void)configured;
#endif
        }

        std::mutex& output_mutex() noexcept
        {
            static std::mutex mutex;
            return mutex;
        }

        void write_line(std::FILE* stream, std::string_view line) noexcept
        {
            configure_console();
            const std::lock_guard<std::mutex> lock(output_mutex());
            std::fwrite(line.data(), 1, line.size(), stream);
            std::fputc('\n', stream);
            std::fflush(stream);
        }
    } // namespace detail

    void set_level(Level level) noexcept
    {
        g_level.store(level, std::memory_order_relaxed);
    }

    Level level() noexcept
    {
        return g_level.load(std::memory_order_relaxed);
    }
} // namespace safe_io
