#include <iterator>
#include <limits>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include <envconst/numeric_kind.hpp>
#include <envconst/resolve_setting.hpp>

#include "printer.hpp"

namespace envgen {

using envconst::integer_value;
using envconst::range_spec;
using envconst::resolved_setting;

namespace {

std::string range_string(const range_spec& r) {
    return fmt::format("[{}, {}{}", envconst::to_string(r.min), envconst::to_string(r.max), r.inclusive? "]": ")");
}

std::string join(const std::vector<std::string>& parts, const char* sep) {
    std::string out;
    for (const auto& p: parts) {
        if (!out.empty()) out += sep;
        out += p;
    }
    return out;
}

std::string describe_setting(const resolved_setting& s) {
    const auto& spec = s.spec;

    std::string what = spec.optional? "optional ": "";
    what += kind_name(spec.kind);
    if (s.range) what += " in " + range_string(*s.range);
    if (spec.default_value) what += ", default " + envconst::to_string(*spec.default_value);

    std::string how = s.raw?
        fmt::format("set to \"{}\"", escape_string(*s.raw)):
        spec.default_value? "not set, using default": "not set";

    return fmt::format("// {} ({}): {}\n", escape_string(spec.name), what, how);
}

// Condition on expression x checking the declared range, or empty if the
// range admits every value of the type.
std::string range_condition(const resolved_setting& s, const std::string& x) {
    const auto& r = *s.range;
    std::vector<std::string> terms;

    if (r.min!=envconst::kind_min(s.spec.kind)) {
        terms.push_back(fmt::format("{}<={}", integer_literal(r.min), x));
    }
    if (!r.inclusive) {
        terms.push_back(fmt::format("{}<{}", x, integer_literal(r.max)));
    }
    else if (r.max!=envconst::kind_max(s.spec.kind)) {
        terms.push_back(fmt::format("{}<={}", x, integer_literal(r.max)));
    }

    return join(terms, " && ");
}

} // anonymous namespace

std::string escape_string(const std::string& s) {
    std::string out;
    for (unsigned char c: s) {
        switch (c) {
        case '"':  out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\t': out += "\\t"; break;
        default:
            if (c<0x20 || c==0x7f) {
                out += fmt::format("\\{:03o}", c);
            }
            else {
                out += c;
            }
        }
    }
    return out;
}

std::string integer_literal(const integer_value& v) {
    if (auto u = std::get_if<unsigned long long>(&v)) {
        return fmt::format("{}u", *u);
    }

    long long s = std::get<long long>(v);
    if (s==std::numeric_limits<long long>::min()) {
        // The magnitude of the minimum is not itself a long long literal.
        return fmt::format("({}-1)", s+1);
    }
    return fmt::format("{}", s);
}

std::string emit_header(const std::vector<resolved_setting>& settings, const printer_options& opt) {
    std::string out;
    auto it = std::back_inserter(out);

    bool any_optional = false;
    for (const auto& s: settings) {
        if (!s.outcome) {
            throw std::invalid_argument(fmt::format("setting \"{}\" did not resolve", s.spec.name));
        }
        any_optional |= s.spec.optional;
    }

    out += "// Automatically generated by envgen";
    if (!opt.sources.empty()) {
        fmt::format_to(it, " from {}", join(opt.sources, ", "));
    }
    out += "\n"
           "//\n"
           "// Values are resolved from the build environment: do not edit.\n"
           "\n"
           "#pragma once\n"
           "\n"
           "#include <cstddef>\n"
           "#include <cstdint>\n";
    if (any_optional) {
        out += "#include <optional>\n";
    }
    out += "\n";

    if (!opt.cpp_namespace.empty()) {
        fmt::format_to(it, "namespace {} {{\n\n", opt.cpp_namespace);
    }

    for (const auto& s: settings) {
        const auto& spec = s.spec;
        const auto& value = *s.outcome;
        auto type = cxx_type_name(spec.kind);

        out += describe_setting(s);

        if (spec.optional) {
            fmt::format_to(it, "inline constexpr std::optional<{}> {} = {};\n",
                type, spec.constant, value? integer_literal(*value): "std::nullopt");
        }
        else {
            fmt::format_to(it, "inline constexpr {} {} = {};\n",
                type, spec.constant, integer_literal(*value));
        }

        if (s.range) {
            auto x = spec.optional? "*"+spec.constant: spec.constant;
            auto cond = range_condition(s, x);
            if (!cond.empty()) {
                if (spec.optional) cond = fmt::format("!{} || ({})", spec.constant, cond);
                fmt::format_to(it, "static_assert({}, \"{} outside of {}\");\n",
                    cond, escape_string(spec.name), range_string(*s.range));
            }
        }
        out += "\n";
    }

    if (!opt.cpp_namespace.empty()) {
        fmt::format_to(it, "}} // namespace {}\n", opt.cpp_namespace);
    }
    return out;
}

} // namespace envgen
