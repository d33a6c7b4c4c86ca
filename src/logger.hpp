#ifndef WSGATE_LOGGER_HPP
#define WSGATE_LOGGER_HPP

#include <iostream>
#include <string_view>
#include <format>
#include <syncstream>
#include <thread>
#include <string>
#include <atomic>
#include <optional>
#include <algorithm>
#include <cctype>
#include <utility>

#ifdef USE_STACKTRACE
#include <stacktrace>
#endif

namespace wsgate::log {

// --- Thread-local log context ---

// Text shown in the prefix of every line logged by this thread, e.g. the
// delta being guarded or the origin being checked. Empty when unset.
inline thread_local std::string g_context;

/**
 * @class context_scope
 * @brief Tags the lines logged by the current thread until the scope ends.
 *
 * Scopes nest: the enclosing context is restored on destruction.
 */
class context_scope {
public:
    explicit context_scope(std::string context) noexcept
        : m_previous(std::exchange(g_context, std::move(context))) {}
    ~context_scope() {
        g_context = std::move(m_previous);
    }
    context_scope(const context_scope&) = delete;
    context_scope& operator=(const context_scope&) = delete;
    context_scope(context_scope&&) = delete;
    context_scope& operator=(context_scope&&) = delete;

private:
    std::string m_previous;
};


// --- Compile-time configuration for debug logging ---
#ifdef ENABLE_DEBUG_LOGS
constexpr bool debug_logging_enabled = true;
#else
constexpr bool debug_logging_enabled = false;
#endif


// Defines the severity level of a log message.
enum class Level {
    Debug,
    Info,
    Warning,
    Error,
    Critical
};

[[nodiscard]] constexpr std::string_view to_string(Level level) noexcept {
    switch (level) {
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warning: return "WARN";
        case Level::Error: return "ERROR";
        case Level::Critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

/**
 * @brief Parses a level name as written in the `logger.level` option.
 * @return The level, or std::nullopt if the name is not recognised.
 */
[[nodiscard]] inline std::optional<Level> parse_level(std::string_view name) noexcept {
    std::string lowered(name);
    std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "debug") return Level::Debug;
    if (lowered == "info") return Level::Info;
    if (lowered == "warning" || lowered == "warn") return Level::Warning;
    if (lowered == "error") return Level::Error;
    if (lowered == "critical") return Level::Critical;
    return std::nullopt;
}

namespace detail {
    inline std::atomic<Level>& min_level() noexcept {
        static std::atomic<Level> g_min_level{Level::Info};
        return g_min_level;
    }

    inline void vprint(
        const Level level,
        const std::string_view fmt,
        std::format_args args)
    {
        if (level < min_level().load(std::memory_order_relaxed)) {
            return;
        }
        const auto log_prefix = std::format(
            "[{:^8}] [Thread: {}] [{}] ",
            to_string(level),
            std::this_thread::get_id(),
            g_context.empty() ? std::string_view{"--------"} : std::string_view{g_context}
        );
        std::osyncstream synced_out((level == Level::Error || level == Level::Critical) ? std::cerr : std::cout);
        synced_out << log_prefix;
        synced_out << std::vformat(fmt, args);
        synced_out << '\n';
        #ifdef USE_STACKTRACE
        if (level == Level::Error || level == Level::Critical) {
            synced_out << "--- Stack Trace ---\n" << std::stacktrace::current() << "-------------------\n";
        }
        #endif
    }
} // namespace detail

// Messages below this level are discarded at runtime.
inline void set_level(Level level) noexcept {
    detail::min_level().store(level, std::memory_order_relaxed);
}

[[nodiscard]] inline Level get_level() noexcept {
    return detail::min_level().load(std::memory_order_relaxed);
}

// --- Public-facing convenience functions ---

template<typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args) {
    if constexpr (debug_logging_enabled) {
        detail::vprint(Level::Debug, fmt.get(), std::make_format_args(args...));
    }
}

template<typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args) {
    detail::vprint(Level::Info, fmt.get(), std::make_format_args(args...));
}

template<typename... Args>
void warn(std::format_string<Args...> fmt, Args&&... args) {
    detail::vprint(Level::Warning, fmt.get(), std::make_format_args(args...));
}

template<typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args) {
    detail::vprint(Level::Error, fmt.get(), std::make_format_args(args...));
}

template<typename... Args>
void critical(std::format_string<Args...> fmt, Args&&... args) {
    detail::vprint(Level::Critical, fmt.get(), std::make_format_args(args...));
}
} // namespace wsgate::log
#endif // WSGATE_LOGGER_HPP
