#pragma once

#include <optional>
#include <string>
#include <vector>

namespace sysscope {

// Runs a read-only query tool and returns its standard output. Yields
// nullopt when the program is missing, times out, exits non-zero or
// prints nothing.
std::optional<std::string> runTool(const std::string& program,
                                   const std::vector<std::string>& arguments,
                                   int timeoutMs);

bool isToolAvailable(const std::string& program);

} // namespace sysscope
