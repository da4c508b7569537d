// SPDX-License-Identifier: Apache-2.0
// Asynchronous structured logger (header-only).
// A dedicated background thread drains a queue of formatted lines so that the
// tick loop and connection coroutines never block on stderr. Provides:
//  - Level filtering via REEF_LOG_LEVEL (debug|info|warn|error)
//  - JSON lines via REEF_LOG_JSON presence
//  - Optional instance tag via REEF_LOG_APP_ID
//  - {} placeholder formatting for the variadic wrappers

#pragma once

#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <ctime>
#include <deque>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>

namespace reef::log {

enum class level
{
    debug = 0,
    info = 1,
    warn = 2,
    error = 3
};

namespace detail {
struct item
{
    level lv;
    std::string msg;
    std::chrono::system_clock::time_point ts;
};

inline std::atomic<int> g_level{static_cast<int>(level::info)};
inline std::atomic<bool> g_json{false};
inline std::atomic<bool> g_started{false};
inline std::atomic<bool> g_running{false};
inline std::atomic<bool> g_app_id_enabled{false};
inline std::string g_app_id; // guarded by g_io_mtx
inline std::mutex g_q_mtx;
inline std::condition_variable g_q_cv;
inline std::deque<item> g_queue;
inline std::mutex g_io_mtx;

inline const char *level_name(level lv)
{
    switch (lv) {
        case level::debug:
            return "debug";
        case level::info:
            return "info";
        case level::warn:
            return "warn";
        case level::error:
            return "error";
    }
    return "info";
}

inline int parse_level(std::string_view s)
{
    std::string v;
    v.reserve(s.size());
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "debug")
        return (int)level::debug;
    if (v == "warn" || v == "warning")
        return (int)level::warn;
    if (v == "error" || v == "err")
        return (int)level::error;
    return (int)level::info;
}
} // namespace detail

namespace detail_format {
template <typename T>
inline std::string to_string_any(const T &v)
{
    using D = std::decay_t<T>;
    if constexpr (std::is_same_v<D, std::string>)
        return v;
    else if constexpr (std::is_same_v<D, const char *> || std::is_same_v<D, char *>)
        return v ? std::string(v) : std::string();
    else if constexpr (std::is_convertible_v<T, std::string_view>)
        return std::string(std::string_view(v));
    else if constexpr (std::is_same_v<D, bool>)
        return v ? "true" : "false";
    else if constexpr (std::is_floating_point_v<D>) {
        std::ostringstream oss;
        oss.setf(std::ios::fixed, std::ios::floatfield);
        oss.precision(2);
        oss << v;
        return oss.str();
    } else if constexpr (std::is_arithmetic_v<D>)
        return std::to_string(v);
    else {
        std::ostringstream oss;
        oss << v;
        return oss.str();
    }
}

template <typename... Args>
inline std::string tiny_format(std::string_view fmt, Args &&...args)
{
    if constexpr (sizeof...(Args) == 0) {
        return std::string(fmt);
    } else {
        constexpr size_t N = sizeof...(Args);
        std::array<std::string, N> values{to_string_any(std::forward<Args>(args))...};
        std::string out;
        out.reserve(fmt.size() + N * 8);
        size_t search_pos = 0;
        size_t idx = 0;
        while (idx < N) {
            size_t p = fmt.find("{}", search_pos);
            if (p == std::string_view::npos)
                break;
            out.append(fmt.substr(search_pos, p - search_pos));
            out += values[idx++];
            search_pos = p + 2;
        }
        out.append(fmt.substr(search_pos));
        // surplus arguments are appended space separated
        for (; idx < N; ++idx) {
            out.push_back(' ');
            out += values[idx];
        }
        return out;
    }
}
} // namespace detail_format

namespace detail {
inline void format_and_write(level lv, const std::string &m, std::chrono::system_clock::time_point tp)
{
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&tt, &tm);
    std::lock_guard lk(g_io_mtx);
    if (g_json.load(std::memory_order_relaxed)) {
        std::cerr << '{' << "\"ts\":\"" << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << "\",\"level\":\""
                  << level_name(lv) << "\",";
        if (g_app_id_enabled.load(std::memory_order_relaxed) && !g_app_id.empty())
            std::cerr << "\"app\":\"" << g_app_id << "\",";
        std::cerr << "\"msg\":\"";
        for (char c : m) {
            if (c == '"' || c == '\\')
                std::cerr << '\\' << c;
            else if (c == '\n')
                std::cerr << "\\n";
            else
                std::cerr << c;
        }
        std::cerr << "\"}" << std::endl;
    } else {
        char buf[16];
        std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
        const char *tag = lv == level::debug ? "D" : lv == level::info ? "I" : lv == level::warn ? "W" : "E";
        if (g_app_id_enabled.load(std::memory_order_relaxed) && !g_app_id.empty())
            std::cerr << g_app_id << ' ';
        std::cerr << '[' << tag << ' ' << buf << "] " << m << std::endl;
    }
}

inline std::thread g_thread;

inline void consumer_thread()
{
    while (g_running.load(std::memory_order_acquire)) {
        std::deque<item> local;
        {
            std::unique_lock lk(g_q_mtx);
            g_q_cv.wait(lk, [] { return !g_running.load(std::memory_order_acquire) || !g_queue.empty(); });
            local.swap(g_queue);
        }
        for (auto &it : local)
            format_and_write(it.lv, it.msg, it.ts);
    }
    std::deque<item> rest;
    {
        std::lock_guard lk(g_q_mtx);
        rest.swap(g_queue);
    }
    for (auto &it : rest)
        format_and_write(it.lv, it.msg, it.ts);
}

inline void shutdown()
{
    if (!g_started.load(std::memory_order_acquire))
        return;
    if (!g_running.exchange(false, std::memory_order_acq_rel))
        return;
    g_q_cv.notify_all();
    if (g_thread.joinable())
        g_thread.join();
}

inline void start()
{
    if (g_started.load(std::memory_order_acquire))
        return;
    if (const char *lvl = std::getenv("REEF_LOG_LEVEL"))
        g_level.store(parse_level(lvl), std::memory_order_relaxed);
    if (std::getenv("REEF_LOG_JSON"))
        g_json.store(true, std::memory_order_relaxed);
    if (const char *app = std::getenv("REEF_LOG_APP_ID")) {
        if (*app) {
            std::lock_guard lk(g_io_mtx);
            g_app_id.assign(app);
            g_app_id_enabled.store(true, std::memory_order_relaxed);
        }
    }
    if (!g_started.exchange(true, std::memory_order_acq_rel)) {
        g_running.store(true, std::memory_order_release);
        g_thread = std::thread([] { consumer_thread(); });
        std::atexit([] { shutdown(); });
    }
}
} // namespace detail

inline void init()
{
    detail::start();
}

inline void set_level(level lv) noexcept
{
    detail::g_level.store(static_cast<int>(lv), std::memory_order_relaxed);
}

inline void set_level(std::string_view name) noexcept
{
    detail::g_level.store(detail::parse_level(name), std::memory_order_relaxed);
}

inline void set_json(bool on) noexcept
{
    detail::g_json.store(on, std::memory_order_relaxed);
}

inline bool enabled(level lv) noexcept
{
    return (int)lv >= detail::g_level.load(std::memory_order_relaxed);
}

inline void write(level lv, std::string_view msg)
{
    if (!enabled(lv))
        return;
    detail::start();
    auto tp = std::chrono::system_clock::now();
    {
        std::lock_guard lk(detail::g_q_mtx);
        detail::g_queue.push_back(detail::item{lv, std::string(msg), tp});
    }
    detail::g_q_cv.notify_one();
}

template <typename... Args>
inline void debug(const char *fmt, Args &&...args)
{
    if (enabled(level::debug))
        write(level::debug, detail_format::tiny_format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
inline void info(const char *fmt, Args &&...args)
{
    if (enabled(level::info))
        write(level::info, detail_format::tiny_format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
inline void warn(const char *fmt, Args &&...args)
{
    if (enabled(level::warn))
        write(level::warn, detail_format::tiny_format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
inline void error(const char *fmt, Args &&...args)
{
    if (enabled(level::error))
        write(level::error, detail_format::tiny_format(fmt, std::forward<Args>(args)...));
}

} // namespace reef::log
