#include <string>

#include <envconst/envconstexcept.hpp>
#include <envconst/resolve.hpp>

using namespace std::literals;

namespace envconst {

bad_setting::bad_setting(const std::string& setting, const std::string& why):
    envconst_exception("bad setting \""s + setting + "\": " + why),
    setting_name(setting)
{}

invalid_env_value::invalid_env_value(const std::string& variable, const std::string& value):
    envconst_exception("environment variable \""s + variable + R"(" has invalid value ")" + value + "\""s),
    env_variable(variable),
    env_value(value)
{}

invalid_env_value::invalid_env_value(const std::string& what_arg, const std::string& variable, const std::string& value):
    envconst_exception(what_arg),
    env_variable(variable),
    env_value(value)
{}

missing_env_value::missing_env_value(const resolve_error& error):
    invalid_env_value(describe(error), error.setting, "")
{}

malformed_env_value::malformed_env_value(const resolve_error& error):
    invalid_env_value(describe(error), error.setting, error.raw.value_or("")),
    type_name(error.type_name)
{}

env_value_overflow::env_value_overflow(const resolve_error& error):
    invalid_env_value(describe(error), error.setting, error.raw.value_or("")),
    type_name(error.type_name)
{}

env_value_out_of_range::env_value_out_of_range(const resolve_error& error):
    invalid_env_value(describe(error), error.setting, error.raw.value_or("")),
    bound(error.bound)
{}

} // namespace envconst
