#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <format>
#include <functional>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

/*! Minimal logging front-end for the engine wrapper libraries.
 *
 * The wrappers are built as separate shared libraries and do not link
 * logfault. They log through this header, and the application installs a
 * callback that forwards each line to logfault.
 */

namespace logfault_fwd {

// Same order and values as logfault::LogLevel
enum class Level { NONE, ERROR, WARN, NOTICE, INFO, DEBUG, TRACE };

struct SourceLoc {
    const char* file{};
    int line{};
    const char* func{};
};

using logfault_callback_t = std::function<void(Level lvl, SourceLoc loc, std::string_view msg, std::string_view tag)>;

inline std::string_view to_name(Level l) {
    constexpr static auto names = std::to_array<std::string_view>({
        "", "ERROR", "WARN", "NOTICE", "INFO", "DEBUG", "TRACE"
    });

    return names.at(static_cast<size_t>(l));
}

struct Instance {
    std::mutex mutex;
    logfault_callback_t cb;
    std::string tag;
    std::atomic<Level> level{Level::INFO};
};

inline Instance& instance() {
    static Instance s;
    return s;
}

inline void setCallback(logfault_callback_t cb, std::string_view tag) {
    auto& i = instance();
    std::lock_guard lock{i.mutex};
    i.tag = tag;
    i.cb = std::move(cb);
}

inline void setLevel(Level lvl) noexcept {
    instance().level = lvl;
}

inline Level level() noexcept {
    return instance().level.load(std::memory_order_relaxed);
}

class Log {
public:
    Log(Level lvl, SourceLoc loc) : lvl_(lvl), loc_(loc) {}
    ~Log() { flush(); }

    Log(const Log&) = delete;
    Log& operator=(const Log&) = delete;

    std::ostream& Line() { return ss_; }

private:
    void flush() noexcept {
        const auto msg = ss_.str();
        if (msg.empty()) {
            return;
        }

        auto& i = instance();
        std::lock_guard lock{i.mutex};
        if (i.cb) {
            i.cb(lvl_, loc_, msg, i.tag);
            return;
        }

        // No callback installed yet. Write straight to the console.
        const auto now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
        std::clog << std::format("{:%FT%T} {} [{}] {}", now, to_name(lvl_), i.tag, msg) << std::endl;
    }

    Level lvl_;
    SourceLoc loc_;
    std::ostringstream ss_;
};

#ifdef _LOGFAULT_H
/*! Callback for logfault_fwd::setCallback() that writes to logfault.
 *
 * Only available in translation units that included logfault.h first.
 */
inline void forward_to_logfault(Level lvl, SourceLoc loc, std::string_view msg, std::string_view tag) {
    const auto lf_level = static_cast<logfault::LogLevel>(lvl);
    if (::logfault::LogManager::Instance().IsRelevant(lf_level)) {
        ::logfault::Log(lf_level, loc.file, loc.line, loc.func).Line() << '[' << tag << "] " << msg;
    }
}
#endif

} // namespace logfault_fwd

#if defined(LOGFAULT_FWD_ENABLE_LOGGING) && LOGFAULT_FWD_ENABLE_LOGGING

#if defined(__GNUC__) || defined(__clang__)
#define LOGFAULT_FWD_FUNC __PRETTY_FUNCTION__
#else
#define LOGFAULT_FWD_FUNC __func__
#endif

#define LOGFAULT_FWD_RELEVANT(lvl) \
    (lvl <= logfault_fwd::level())

#define LOGFAULT_FWD_LOG(lvl) \
    LOGFAULT_FWD_RELEVANT(logfault_fwd::Level::lvl) && logfault_fwd::Log(logfault_fwd::Level::lvl, {__FILE__, __LINE__, LOGFAULT_FWD_FUNC}).Line()

#define LOG_ERROR   LOGFAULT_FWD_LOG(ERROR)
#define LOG_WARN    LOGFAULT_FWD_LOG(WARN)
#define LOG_NOTICE  LOGFAULT_FWD_LOG(NOTICE)
#define LOG_INFO    LOGFAULT_FWD_LOG(INFO)
#define LOG_DEBUG   LOGFAULT_FWD_LOG(DEBUG)
#define LOG_TRACE   LOGFAULT_FWD_LOG(TRACE)

#endif // LOGFAULT_FWD_ENABLE_LOGGING
