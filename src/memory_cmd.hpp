#pragma once
#include <string>
#include <vector>

namespace polygate {
// polygate memory search <query> | core [name [text]] | history <id> | stats
int cmd_memory(const std::string& config_path, const std::vector<std::string>& args);
} // namespace polygate
