#pragma once

// Resolution of settings whose target type is only known at run time,
// e.g. when read from a generator manifest.

#include <optional>
#include <ostream>
#include <string>
#include <variant>

#include <envconst/numeric_kind.hpp>
#include <envconst/read_envvar.hpp>
#include <envconst/resolve.hpp>
#include <envconst/util/expected.hpp>

namespace envconst {

// Signed kinds are carried as long long, unsigned kinds as unsigned long long.
using integer_value = std::variant<long long, unsigned long long>;

std::string to_string(const integer_value&);

std::ostream& operator<<(std::ostream&, const integer_value&);

// Limits of the C++ type corresponding to a kind.
integer_value kind_min(numeric_kind);
integer_value kind_max(numeric_kind);

struct range_spec {
    integer_value min;
    integer_value max;
    bool inclusive = false;
};

struct setting_spec {
    std::string name;       // Environment variable name.
    std::string constant;   // Identifier of the generated constant.
    numeric_kind kind = numeric_kind::int_;
    std::optional<range_spec> range;
    std::optional<integer_value> default_value;
    bool optional = false;

    // Throws bad_setting if both a default and optional are requested.
    resolve_mode mode() const;
};

struct resolved_setting {
    setting_spec spec;
    std::optional<std::string> raw; // As read from the environment.

    // Declared range, with bounds carried in the alternative matching the
    // signedness of the kind.
    std::optional<range_spec> range;

    util::expected<std::optional<integer_value>, resolve_error> outcome;
};

// Throws bad_setting if the range or default is not representable in the
// setting's kind, or if the declaration is otherwise inconsistent.
resolved_setting resolve(const setting_spec&, const environment&);

} // namespace envconst
