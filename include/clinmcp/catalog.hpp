#pragma once
#include "tool.hpp"
#include <vector>

namespace clinmcp {

/// Every tools/*.cpp compiled into this build, in file name order. The table
/// is generated at configure time.
std::vector<ToolModule> builtin_tool_modules();

} // namespace clinmcp
