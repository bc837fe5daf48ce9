#pragma once

#include <string>
#include <vector>

#include <envconst/numeric_kind.hpp>
#include <envconst/resolve_setting.hpp>

namespace envgen {

struct printer_options {
    std::string cpp_namespace;
    std::vector<std::string> sources; // Manifest names, for the banner.
};

// Text safe inside a C++ string literal or a '//' comment: quotes and
// backslashes escaped, control characters as escape sequences.
std::string escape_string(const std::string& s);

// C++ literal for v that is a constant expression of the same value,
// e.g. "64u" or "(-9223372036854775807-1)". Unsigned values carry a 'u'
// suffix so that comparisons against unsigned constants stay unsigned.
std::string integer_literal(const envconst::integer_value& v);

// Header declaring one constexpr constant per setting. Every setting must
// have resolved successfully.
std::string emit_header(const std::vector<envconst::resolved_setting>& settings, const printer_options& opt);

} // namespace envgen
