#pragma once

#include <string>
#include <unordered_map>

namespace envfile {

/// Read-only snapshot of process environment variables. Names compare
/// case-sensitively.
using Environment = std::unordered_map<std::string, std::string>;

/// Copy the current process environment.
auto snapshot_environment() -> Environment;

} // namespace envfile
