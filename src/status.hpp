#pragma once
#include <string>

namespace polygate {
int cmd_init(const std::string& config_path);
int cmd_status(const std::string& config_path);
int cmd_sessions(const std::string& config_path, const std::string& subcmd, const std::string& arg);
} // namespace polygate
