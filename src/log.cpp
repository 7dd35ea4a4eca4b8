#include "bgtask/log.hpp"

#include <fmt/format.h>

#include <atomic>
#include <cstdio>
#include <exception>
#include <memory>
#include <mutex>

namespace bgtask {
namespace detail {

//! The current log threshold
static std::atomic<log_level> g_log_level{log_level::warning};

//! Protects the handler; the handler itself is called outside the lock
static std::mutex g_handler_bottleneck;
//! The user-installed handler; null means that we use the default one
static std::shared_ptr<const log_handler_t> g_handler;

//! Default log handler: write everything to stderr
static void default_log_handler(log_level level, const std::string& msg) {
    fmt::print(stderr, "[bgtask] [{}] {}\n", to_string(level), msg);
}

bool is_log_enabled(log_level level) noexcept {
    return level != log_level::off && level >= g_log_level.load(std::memory_order_relaxed);
}

void log_message(log_level level, const std::string& msg) noexcept {
    std::shared_ptr<const log_handler_t> handler;
    {
        std::lock_guard<std::mutex> lock{g_handler_bottleneck};
        handler = g_handler;
    }
    try {
        if (handler)
            (*handler)(level, msg);
        else
            default_log_handler(level, msg);
    } catch (const std::exception& e) {
        std::fputs("[bgtask] log handler failed: ", stderr);
        std::fputs(e.what(), stderr);
        std::fputs("\n", stderr);
    } catch (...) {
        std::fputs("[bgtask] log handler failed with an unknown exception\n", stderr);
    }
}

} // namespace detail

inline namespace v1 {

void set_log_level(log_level level) noexcept {
    detail::g_log_level.store(level, std::memory_order_relaxed);
}

log_level get_log_level() noexcept { return detail::g_log_level.load(std::memory_order_relaxed); }

void set_log_handler(log_handler_t handler) {
    std::shared_ptr<const log_handler_t> new_handler;
    if (handler)
        new_handler = std::make_shared<const log_handler_t>(std::move(handler));
    std::lock_guard<std::mutex> lock{detail::g_handler_bottleneck};
    detail::g_handler = std::move(new_handler);
}

const char* to_string(log_level level) noexcept {
    switch (level) {
    case log_level::trace:
        return "trace";
    case log_level::debug:
        return "debug";
    case log_level::info:
        return "info";
    case log_level::warning:
        return "warning";
    case log_level::error:
        return "error";
    case log_level::off:
        return "off";
    }
    return "unknown";
}

} // namespace v1
} // namespace bgtask
