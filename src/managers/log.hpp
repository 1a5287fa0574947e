#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <mutex>
#include <filesystem>
#include <core/types.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

namespace warden_log_detail {

inline std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

inline std::string& log_path_ref() {
    static std::string path = (platform::temp_dir() / "warden_debug.log").string();
    return path;
}

} // namespace warden_log_detail

inline std::string warden_log_path() {
    std::lock_guard<std::mutex> lock(warden_log_detail::log_mutex());
    return warden_log_detail::log_path_ref();
}

// Redirect the engine log. Parent directories are created.
inline void set_warden_log_path(const std::string& path) {
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);
    std::lock_guard<std::mutex> lock(warden_log_detail::log_mutex());
    warden_log_detail::log_path_ref() = path;
}

inline void warden_log(const std::string& msg) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));

    std::lock_guard<std::mutex> lock(warden_log_detail::log_mutex());
    std::ofstream out(warden_log_detail::log_path_ref(), std::ios::app);
    if (!out) return;
    out << "[" << ts << "] " << msg << "\n";
}

inline void warden_log_cmd(const std::string& label, const std::string& cmd,
                           const CommandOutput& r) {
    warden_log(fmt::format("{} CMD: {}", label, cmd));
    warden_log(fmt::format("{} exit={}{} stdout({})={}", label, r.exit_code,
                           r.timed_out ? " (timed out)" : "",
                           r.stdout_data.size(), r.stdout_data.substr(0, 500)));
    if (!r.stderr_data.empty())
        warden_log(fmt::format("{} stderr={}", label, r.stderr_data.substr(0, 500)));
}
