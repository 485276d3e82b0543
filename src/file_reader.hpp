#pragma once
#include <vector>
#include <string>
#include <filesystem>

bool read_lines(const std::filesystem::path& path,
                std::vector<std::string>& out_lines,
                std::string& msg);

std::vector<std::string> rc_command_lines(const std::vector<std::string>& lines);
