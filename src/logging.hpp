#pragma once
#include <string>

bool init_logging(const std::string& path, const std::string& level, std::string& msg);
bool set_log_level(const std::string& level, std::string& msg);
void disable_logging();
