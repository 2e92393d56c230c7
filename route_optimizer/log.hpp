#pragma once
#include <string>

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

void set_log_level(LogLevel level);
bool parse_log_level(const std::string& name, LogLevel& out);

void log_error(const std::string& msg);
void log_warn(const std::string& msg);
void log_info(const std::string& msg);
void log_debug(const std::string& msg);
