#pragma once

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace envconst {

// Read-only snapshot of name-value environment entries.

class environment {
public:
    environment() = default;
    environment(std::initializer_list<std::pair<const std::string, std::string>> entries):
        vars_(entries)
    {}

    // Capture the current process environment.
    static environment from_process();

    // Raw lookup: returns the entry as stored, including empty values.
    std::optional<std::string> lookup(const std::string& name) const;

    std::size_t size() const { return vars_.size(); }

private:
    std::unordered_map<std::string, std::string> vars_;
};

// Return the value of the supplied environment variable.
// If the variable is unset or set to the empty string, return std::nullopt.
// The value is otherwise returned verbatim: no trimming is performed.

std::optional<std::string> read_env(const char* name);

std::optional<std::string> read_env(const environment& env, const std::string& name);

} // namespace envconst
