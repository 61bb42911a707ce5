#include "log.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <chrono>
#include <ctime>
#include <fstream>
#include <mutex>
#include <fmt/format.h>

namespace {

std::mutex g_log_mutex;
bool g_log_enabled = true;
std::string g_log_path;

} // namespace

void configure_log(const LogConfig& cfg) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_enabled = cfg.enabled;
    g_log_path = cfg.path;
}

std::string rterm_log_path() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_path.empty()) {
        g_log_path = (platform::temp_dir() / LOG_FILE_NAME).string();
    }
    return g_log_path;
}

void rterm_log(const std::string& msg) {
    std::string path = rterm_log_path();

    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (!g_log_enabled) return;

    std::ofstream out(path, std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    out << fmt::format("[{:02}:{:02}:{:02}.{:03}] {}\n",
                       tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                       static_cast<int>(ms.count()), msg);
}
