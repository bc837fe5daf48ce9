#include <cstdlib>
#include <cstring>
#include <optional>
#include <string>

#include <envconst/read_envvar.hpp>

extern char** environ;

namespace envconst {

environment environment::from_process() {
    environment env;
    for (char** e = environ; e && *e; ++e) {
        const char* entry = *e;
        const char* eq = std::strchr(entry, '=');
        if (!eq) continue;

        // First definition wins, as with getenv.
        env.vars_.emplace(std::string(entry, eq), std::string(eq+1));
    }
    return env;
}

std::optional<std::string> environment::lookup(const std::string& name) const {
    auto i = vars_.find(name);
    if (i==vars_.end()) return std::nullopt;
    return i->second;
}

std::optional<std::string> read_env(const char* name) {
    const char* str = std::getenv(name);
    if (!str || !*str) return std::nullopt;
    return std::string(str);
}

std::optional<std::string> read_env(const environment& env, const std::string& name) {
    auto value = env.lookup(name);
    if (!value || value->empty()) return std::nullopt;
    return value;
}

} // namespace envconst
