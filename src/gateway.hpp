#pragma once
#include <string>

namespace polygate {
// Serves until SIGINT/SIGTERM; SIGHUP reloads the config file. Empty host or port 0 keep the configured values.
int cmd_gateway(const std::string& config_path, const std::string& host, int port);
} // namespace polygate
