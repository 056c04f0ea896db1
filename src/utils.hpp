#pragma once

#include <string>

#define LOG_INFO(fmt, ...) log_message("INFO", fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) log_message("ERROR", fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...) log_message("WARN", fmt, ##__VA_ARGS__)
#define LOG_DEBUG(fmt, ...) do { if (debug_enabled()) log_message("DEBUG", fmt, ##__VA_ARGS__); } while (0)

void log_message(const char* level, const char* fmt, ...);

bool debug_enabled();

std::string get_timestamp();

void initialize_logging(const std::string& path, bool debug);

std::string error_to_string(int errnum);
