#pragma once
#include "types.hpp"
#include <string>
#include <vector>

namespace fsgate {

/// The fixed set of tools advertised by tools/list.
class ToolCatalog {
public:
    [[nodiscard]] static const std::vector<ToolDefinition>& tools();
    [[nodiscard]] static const ToolDefinition* find(const std::string& name);
};

} // namespace fsgate
