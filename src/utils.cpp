#include "utils.hpp"

#include <atomic>
#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <system_error>
#include <vector>

namespace {
    std::mutex g_log_mutex;
    std::FILE* g_log_file = nullptr;
    std::atomic<bool> g_debug{false};
}

void log_message(const char* level, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    va_list sizing;
    va_copy(sizing, args);
    int len = vsnprintf(nullptr, 0, fmt, sizing);
    va_end(sizing);
    std::vector<char> line(len > 0 ? static_cast<size_t>(len) + 1 : 1, '\0');
    if (len > 0) {
        vsnprintf(line.data(), line.size(), fmt, args);
    }
    va_end(args);

    std::string stamp = get_timestamp();
    std::lock_guard<std::mutex> lock(g_log_mutex);
    fprintf(stderr, "[%s] [%s] %s\n", stamp.c_str(), level, line.data());
    if (g_log_file) {
        fprintf(g_log_file, "[%s] [%s] %s\n", stamp.c_str(), level, line.data());
        fflush(g_log_file);
    }
}

bool debug_enabled() {
    return g_debug.load(std::memory_order_relaxed);
}

std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};
    localtime_r(&in_time_t, &tm_buf);

    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %X");
    return ss.str();
}

void initialize_logging(const std::string& path, bool debug) {
    g_debug.store(debug, std::memory_order_relaxed);
    if (path.empty()) {
        return;
    }

    std::FILE* f = std::fopen(path.c_str(), "a");
    if (!f) {
        LOG_WARN("cannot open log file %s: %s", path.c_str(), error_to_string(errno).c_str());
        return;
    }
    {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        if (g_log_file) {
            std::fclose(g_log_file);
        }
        g_log_file = f;
    }
    LOG_INFO("Logging initialized%s", debug ? " (debug)" : "");
}

std::string error_to_string(int errnum) {
    return std::system_category().message(errnum);
}
