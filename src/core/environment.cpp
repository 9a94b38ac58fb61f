#include "envfile/core/environment.hpp"

#include <string_view>

#include <unistd.h>

extern char** environ;

namespace envfile {

auto snapshot_environment() -> Environment {
    Environment env;
    if (environ == nullptr) return env;

    for (char** entry = environ; *entry != nullptr; ++entry) {
        std::string_view kv(*entry);
        auto eq = kv.find('=');
        if (eq == std::string_view::npos || eq == 0) continue;
        env.emplace(std::string(kv.substr(0, eq)), std::string(kv.substr(eq + 1)));
    }
    return env;
}

} // namespace envfile
