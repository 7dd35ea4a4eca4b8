#pragma once

#include <fmt/format.h>

#include <functional>
#include <string>

namespace bgtask {

inline namespace v1 {

//! The severity of a log message
enum class log_level {
    trace,
    debug,
    info,
    warning,
    error,
    off, //!< Used only as a threshold; disables all the messages
};

//! Type of function that receives the log messages produced by bgtask
using log_handler_t = std::function<void(log_level, const std::string&)>;

/**
 * @brief      Sets the minimum level of the messages that are logged
 *
 * @param      level  The threshold; messages below this level are discarded without being formatted
 *
 * The default threshold is `log_level::warning`. Can be called at any time, from any thread.
 */
void set_log_level(log_level level) noexcept;

//! Returns the current log threshold
log_level get_log_level() noexcept;

/**
 * @brief      Sets the function that receives the log messages
 *
 * @param      handler  The new handler; an empty function restores the default handler
 *
 * The default handler writes the messages to `stderr`. The handler can be called concurrently from
 * multiple worker threads; it must be thread-safe.
 */
void set_log_handler(log_handler_t handler);

//! Returns the printable name of the log level
const char* to_string(log_level level) noexcept;

} // namespace v1

namespace detail {

//! Checks if the messages of the given level need to be logged
bool is_log_enabled(log_level level) noexcept;

//! Sends an already formatted message to the log handler. Never throws.
void log_message(log_level level, const std::string& msg) noexcept;

//! Formats the message and sends it to the log handler. Never throws.
template <typename... Args>
void log(log_level level, const char* format, const Args&... args) noexcept {
    try {
        log_message(level, fmt::vformat(format, fmt::make_format_args(args...)));
    } catch (const std::exception&) {
        log_message(level, std::string{"(cannot format log message) "} + format);
    }
}

} // namespace detail
} // namespace bgtask

//! Logs a message through the bgtask log handler, if the level is enabled
#define BGTASK_LOG(level, ...)                                                                     \
    do {                                                                                           \
        if (::bgtask::detail::is_log_enabled(level))                                               \
            ::bgtask::detail::log(level, __VA_ARGS__);                                             \
    } while (false)
