#pragma once

#include <stdexcept>
#include <string>

// envconst-specific exception hierarchy.

namespace envconst {

struct resolve_error;

// Common base-class for envconst errors.

struct envconst_exception: std::runtime_error {
    envconst_exception(const std::string& what_arg):
        std::runtime_error(what_arg)
    {}
};

// A setting declaration is inconsistent: empty name, empty range,
// bounds or default outside the target type or range, or a default
// supplied with the wrong mode.

struct bad_setting: envconst_exception {
    bad_setting(const std::string& setting, const std::string& why);
    std::string setting_name;
};

// Environment variable value errors.

struct invalid_env_value: envconst_exception {
    invalid_env_value(const std::string& variable, const std::string& value);
    std::string env_variable;
    std::string env_value;

protected:
    invalid_env_value(const std::string& what_arg, const std::string& variable, const std::string& value);
};

// Exceptions for a failed resolution; what() is describe(error).

struct missing_env_value: invalid_env_value {
    explicit missing_env_value(const resolve_error& error);
};

struct malformed_env_value: invalid_env_value {
    explicit malformed_env_value(const resolve_error& error);
    std::string type_name;
};

struct env_value_overflow: invalid_env_value {
    explicit env_value_overflow(const resolve_error& error);
    std::string type_name;
};

struct env_value_out_of_range: invalid_env_value {
    explicit env_value_out_of_range(const resolve_error& error);
    std::string bound;
};

} // namespace envconst
