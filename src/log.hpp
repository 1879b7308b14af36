#pragma once

#include <string>

namespace smap {

enum class LogLevel { Error = 0, Warning = 1, Info = 2, Debug = 3 };

void set_log_level(LogLevel level);

void log_error(const std::string& msg);
void log_warning(const std::string& msg);
void log_info(const std::string& msg);
void log_debug(const std::string& msg);

} // namespace smap
