#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <exception>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace ft::log
{

// Non-templated file append (defined in Log.cpp).
void append_log_line_to_file(std::string const &line);

// FT_ENABLE_LOGGING=1 takes precedence over FT_BUILD_MINIMAL so release
// builds can still be switched into a diagnostic mode.
#if defined(FT_ENABLE_LOGGING) && (FT_ENABLE_LOGGING)
#define FT_LOGGING_ACTIVE 1
#elif !defined(FT_BUILD_MINIMAL)
#define FT_LOGGING_ACTIVE 1
#else
#define FT_LOGGING_ACTIVE 0
#endif

#if FT_LOGGING_ACTIVE
template <typename... Args>
inline void write_line(char level, std::string_view fmt, Args &&...args)
{
    const auto now = std::chrono::system_clock::now();
    auto const millis = static_cast<long long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch())
            .count() %
        1000);
    auto const time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&time, &tm);
    char time_buffer[16]{};
    std::strftime(time_buffer, sizeof(time_buffer), "%H:%M:%S", &tm);

    std::string message;
    try
    {
        message = fmt::vformat(fmt, fmt::make_format_args(args...));
    }
    catch (fmt::format_error const &)
    {
        message.assign(fmt);
    }
    char millis_buf[8] = {};
    std::snprintf(millis_buf, sizeof(millis_buf), "%03lld", millis);
    std::string final;
    final.reserve(64 + message.size());
    final.push_back('[');
    final.push_back(level);
    final.push_back(' ');
    final.append(time_buffer);
    final.push_back('.');
    final.append(millis_buf);
    final.append("] ");
    final.append(message);
    if (stderr)
    {
        std::fprintf(stderr, "%s\n", final.c_str());
        std::fflush(stderr);
    }
    try
    {
        append_log_line_to_file(final);
    }
    catch (std::exception const &)
    {
        // stderr already carries the line
    }
}
#else
template <typename... Args>
inline void write_line(char, std::string_view, Args &&...) noexcept
{
}
#endif

template <typename... Args>
inline void print_status(std::string_view fmt, Args &&...args)
{
    auto const message = fmt::vformat(fmt, fmt::make_format_args(args...));
    std::fputs(message.c_str(), stdout);
    std::fputc('\n', stdout);
    std::fflush(stdout);
}

} // namespace ft::log

#if FT_LOGGING_ACTIVE
#define FT_LOG_INFO(fmt, ...) ft::log::write_line('I', fmt, ##__VA_ARGS__)
#define FT_LOG_DEBUG(fmt, ...) ft::log::write_line('D', fmt, ##__VA_ARGS__)
#define FT_LOG_WARN(fmt, ...) ft::log::write_line('W', fmt, ##__VA_ARGS__)
#define FT_LOG_ERROR(fmt, ...) ft::log::write_line('E', fmt, ##__VA_ARGS__)
#else
#define FT_LOG_INFO(fmt, ...) (void)0
#define FT_LOG_DEBUG(fmt, ...) (void)0
#define FT_LOG_WARN(fmt, ...) (void)0
#define FT_LOG_ERROR(fmt, ...) (void)0
#endif
