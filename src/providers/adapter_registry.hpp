#pragma once
#include "adapter.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace polygate {

using AdapterFactory = std::function<std::unique_ptr<ProviderAdapter>(const ProviderConfig&)>;

// Identifier -> factory. Lookup is exact after lower-casing; aliases map to the same factory.
class AdapterRegistry {
public:
    static AdapterRegistry with_builtin_adapters();

    void register_adapter(const std::string& id, AdapterFactory factory,
                          const std::vector<std::string>& aliases = {});

    bool knows(const std::string& id) const;

    // Throws ConfigurationError for an unknown identifier
    std::unique_ptr<ProviderAdapter> create(const std::string& id, const ProviderConfig& cfg) const;

    std::vector<std::string> identifiers() const;

private:
    std::map<std::string, AdapterFactory> factories_;
    std::map<std::string, std::string> aliases_;
};

} // namespace polygate
