#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <envconst/numeric_kind.hpp>
#include <envconst/resolve_setting.hpp>

#include "io/bulkio.hpp"
#include "manifest.hpp"

namespace envgen {

using nlohmann::json;
using envconst::integer_value;
using envconst::range_spec;
using envconst::setting_spec;

manifest_error::manifest_error(const std::string& source, const std::string& what):
    envconst::envconst_exception(source + ": " + what),
    source(source)
{}

namespace {

// Search a json object for an entry with a given name.
// If found, return the value and remove from json object.
template <typename T>
std::optional<T> find_and_remove_json(const char* name, json& j) {
    auto it = j.find(name);
    if (it==j.end()) {
        return std::nullopt;
    }
    T value = it->template get<T>();
    j.erase(name);
    return value;
}

std::string lower_case(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

integer_value integer_from_json(const json& v, const std::string& what, const std::string& source) {
    if (v.is_number_unsigned()) {
        return integer_value(std::in_place_index<1>, v.get<unsigned long long>());
    }
    if (v.is_number_integer()) {
        return integer_value(std::in_place_index<0>, v.get<long long>());
    }
    throw manifest_error(source, fmt::format("{} must be an integer, not {}", what, v.dump()));
}

void warn_unused(const json& j, const std::string& what, const std::string& source, std::vector<std::string>& warnings) {
    for (auto it = j.begin(); it!=j.end(); ++it) {
        warnings.push_back(fmt::format("{}: {}: unrecognised key \"{}\"", source, what, it.key()));
    }
}

range_spec parse_range(json r, const std::string& what, const std::string& source, std::vector<std::string>& warnings) {
    if (!r.is_object()) {
        throw manifest_error(source, fmt::format("{}: \"range\" must be an object with \"min\" and \"max\"", what));
    }

    auto lo = find_and_remove_json<json>("min", r);
    auto hi = find_and_remove_json<json>("max", r);
    if (!lo || !hi) {
        throw manifest_error(source, fmt::format("{}: \"range\" requires both \"min\" and \"max\"", what));
    }

    range_spec range{
        integer_from_json(*lo, what+": range minimum", source),
        integer_from_json(*hi, what+": range maximum", source),
        find_and_remove_json<bool>("inclusive", r).value_or(false)
    };

    warn_unused(r, what+": range", source, warnings);
    return range;
}

setting_spec parse_setting(json j, std::size_t index, const std::string& source, std::vector<std::string>& warnings) {
    std::string what = fmt::format("settings[{}]", index);
    if (!j.is_object()) {
        throw manifest_error(source, what+": expected an object");
    }

    try {
        setting_spec s;

        auto name = find_and_remove_json<std::string>("name", j);
        if (!name || name->empty()) {
            throw manifest_error(source, what+": missing \"name\"");
        }
        if (!is_name(*name)) {
            // The name itself may not be printable.
            throw manifest_error(source, what+": \"name\" must be letters, digits and underscores, not starting with a digit");
        }
        s.name = *name;
        what = fmt::format("setting \"{}\"", s.name);

        auto type = find_and_remove_json<std::string>("type", j);
        if (!type) {
            throw manifest_error(source, what+": missing \"type\"");
        }
        auto kind = envconst::kind_from_name(*type);
        if (!kind) {
            throw manifest_error(source, fmt::format("{}: unsupported type \"{}\"", what, *type));
        }
        s.kind = *kind;

        s.constant = find_and_remove_json<std::string>("constant", j).value_or(lower_case(s.name));
        if (!is_identifier(s.constant)) {
            throw manifest_error(source, fmt::format("{}: \"{}\" is not a valid constant name", what, s.constant));
        }

        if (auto d = find_and_remove_json<json>("default", j)) {
            s.default_value = integer_from_json(*d, what+": default", source);
        }
        s.optional = find_and_remove_json<bool>("optional", j).value_or(false);

        if (auto r = find_and_remove_json<json>("range", j)) {
            s.range = parse_range(std::move(*r), what, source, warnings);
        }

        warn_unused(j, what, source, warnings);
        return s;
    }
    catch (json::type_error& e) {
        throw manifest_error(source, fmt::format("{}: {}", what, e.what()));
    }
}

} // anonymous namespace

bool is_name(const std::string& s) {
    if (s.empty()) return false;
    if (!std::isalpha(static_cast<unsigned char>(s[0])) && s[0]!='_') return false;
    return std::all_of(s.begin()+1, s.end(),
        [](unsigned char c) { return std::isalnum(c) || c=='_'; });
}

bool is_keyword(const std::string& s) {
    static const std::unordered_set<std::string> keywords = {
        "alignas", "alignof", "and", "and_eq", "asm", "auto", "bitand",
        "bitor", "bool", "break", "case", "catch", "char", "char8_t",
        "char16_t", "char32_t", "class", "compl", "concept", "const",
        "consteval", "constexpr", "constinit", "const_cast", "continue",
        "co_await", "co_return", "co_yield", "decltype", "default", "delete",
        "do", "double", "dynamic_cast", "else", "enum", "explicit", "export",
        "extern", "false", "float", "for", "friend", "goto", "if", "inline",
        "int", "long", "mutable", "namespace", "new", "noexcept", "not",
        "not_eq", "nullptr", "operator", "or", "or_eq", "private",
        "protected", "public", "register", "reinterpret_cast", "requires",
        "return", "short", "signed", "sizeof", "static", "static_assert",
        "static_cast", "struct", "switch", "template", "this",
        "thread_local", "throw", "true", "try", "typedef", "typeid",
        "typename", "union", "unsigned", "using", "virtual", "void",
        "volatile", "wchar_t", "while", "xor", "xor_eq"
    };
    return keywords.count(s);
}

bool is_reserved(const std::string& s) {
    if (s.size()>1 && s[0]=='_' && std::isupper(static_cast<unsigned char>(s[1]))) return true;
    return s.find("__")!=std::string::npos;
}

bool is_identifier(const std::string& s) {
    return is_name(s) && !is_keyword(s) && !is_reserved(s);
}

bool is_namespace(const std::string& s) {
    if (s.empty()) return true;

    std::string::size_type b = 0;
    for (;;) {
        auto e = s.find("::", b);
        if (!is_identifier(s.substr(b, e==std::string::npos? e: e-b))) return false;
        if (e==std::string::npos) return true;
        b = e+2;
    }
}

manifest parse_manifest(const std::string& text, const std::string& source) {
    json j;
    try {
        j = json::parse(text);
    }
    catch (json::parse_error& e) {
        throw manifest_error(source, e.what());
    }

    if (!j.is_object()) {
        throw manifest_error(source, "expected a JSON object at top level");
    }

    manifest m;
    m.source = source;

    try {
        m.cpp_namespace = find_and_remove_json<std::string>("namespace", j);
        if (m.cpp_namespace && !is_namespace(*m.cpp_namespace)) {
            throw manifest_error(source, fmt::format("\"{}\" is not a valid namespace", *m.cpp_namespace));
        }

        auto settings = find_and_remove_json<json>("settings", j);
        if (!settings || !settings->is_array()) {
            throw manifest_error(source, "expected a \"settings\" array");
        }

        std::size_t index = 0;
        for (auto& entry: *settings) {
            m.settings.push_back(parse_setting(entry, index++, source, m.warnings));
        }
    }
    catch (json::type_error& e) {
        throw manifest_error(source, e.what());
    }

    warn_unused(j, "manifest", source, m.warnings);
    check_unique(m.settings, source);
    return m;
}

manifest load_manifest(const std::string& filename) {
    return parse_manifest(io::read_all(filename), filename);
}

void check_unique(const std::vector<setting_spec>& settings, const std::string& source) {
    std::unordered_set<std::string> names, constants;
    for (const auto& s: settings) {
        if (!names.insert(s.name).second) {
            throw manifest_error(source, fmt::format("setting \"{}\" is declared more than once", s.name));
        }
        if (!constants.insert(s.constant).second) {
            throw manifest_error(source, fmt::format("constant \"{}\" is declared more than once", s.constant));
        }
    }
}

} // namespace envgen
