#pragma once

// Resolution of a named environment setting into a typed, range-checked
// value.
//
// A setting is declared with a target integer type T, an optional range
// over T, an optional default and a mode:
//
//   required               absence is a failure;
//   required_with_default  absence yields the default;
//   optional               absence yields "no value" (a disengaged optional).
//
// A value present in the environment is always parsed and range checked,
// whatever the mode: text that does not parse, does not fit T, or lies
// outside the range is a failure, never a silent fallback to the default
// or to "no value".

#include <limits>
#include <optional>
#include <ostream>
#include <string>
#include <utility>

#include <envconst/envconstexcept.hpp>
#include <envconst/numeric_kind.hpp>
#include <envconst/parse.hpp>
#include <envconst/read_envvar.hpp>
#include <envconst/util/expected.hpp>

namespace envconst {

enum class resolve_mode {
    required,
    required_with_default,
    optional
};

std::ostream& operator<<(std::ostream&, resolve_mode);

// Range [lo, hi) if exclusive, [lo, hi] if inclusive.

template <typename T>
struct value_range {
    T lo;
    T hi;
    bool inclusive = false;

    static value_range half_open(T lo, T hi) { return {lo, hi, false}; }
    static value_range closed(T lo, T hi) { return {lo, hi, true}; }

    // The full range of T.
    static value_range domain() {
        return closed(std::numeric_limits<T>::min(), std::numeric_limits<T>::max());
    }

    bool empty() const { return inclusive? lo>hi: lo>=hi; }
    bool contains(T v) const { return lo<=v && (inclusive? v<=hi: v<hi); }

    bool operator==(const value_range& other) const {
        return lo==other.lo && hi==other.hi && inclusive==other.inclusive;
    }
};

// Integer formatting that does not treat (u)int8_t as a character.
template <typename T>
std::string integer_to_string(T v) {
    return std::to_string(+v);
}

template <typename T>
std::string to_string(const value_range<T>& r) {
    return "[" + integer_to_string(r.lo) + ", " + integer_to_string(r.hi) + (r.inclusive? "]": ")");
}

template <typename T>
std::ostream& operator<<(std::ostream& out, const value_range<T>& r) {
    return out << to_string(r);
}

template <typename T>
value_range<T> effective_range(const std::optional<value_range<T>>& range) {
    return range? *range: value_range<T>::domain();
}

template <typename T>
struct setting {
    std::string name;
    std::optional<value_range<T>> range;
    std::optional<T> default_value;
    resolve_mode mode = resolve_mode::required;
};

template <typename T>
setting<T> required_setting(std::string name, std::optional<value_range<T>> range = std::nullopt) {
    return {std::move(name), range, std::nullopt, resolve_mode::required};
}

template <typename T>
setting<T> defaulted_setting(std::string name, T dflt, std::optional<value_range<T>> range = std::nullopt) {
    return {std::move(name), range, dflt, resolve_mode::required_with_default};
}

template <typename T>
setting<T> optional_setting(std::string name, std::optional<value_range<T>> range = std::nullopt) {
    return {std::move(name), range, std::nullopt, resolve_mode::optional};
}

// Throws bad_setting if the declaration itself is inconsistent.

template <typename T>
void validate_setting(const setting<T>& s) {
    if (s.name.empty()) {
        throw bad_setting(s.name, "setting name is empty");
    }
    if (s.range && s.range->empty()) {
        throw bad_setting(s.name, "range " + to_string(*s.range) + " is empty");
    }

    bool wants_default = s.mode==resolve_mode::required_with_default;
    if (wants_default && !s.default_value) {
        throw bad_setting(s.name, "no default value supplied");
    }
    if (!wants_default && s.default_value) {
        throw bad_setting(s.name, "default value supplied for a setting without a default");
    }

    if (s.default_value && !effective_range(s.range).contains(*s.default_value)) {
        throw bad_setting(s.name, "default value " + integer_to_string(*s.default_value)
            + " is outside of the range " + to_string(effective_range(s.range)));
    }
}

enum class failure_kind {
    missing_required,
    malformed_text,
    numeric_overflow,
    out_of_range
};

std::ostream& operator<<(std::ostream&, failure_kind);

struct resolve_error {
    failure_kind kind;
    std::string setting;
    std::optional<std::string> raw;   // Offending text; absent for missing_required.
    std::string type_name;            // e.g. "uint8_t".
    std::string bound;                // Violated range, for out_of_range.
    std::optional<parse_error> cause; // For malformed_text and numeric_overflow.

    bool operator==(const resolve_error& other) const {
        return kind==other.kind && setting==other.setting && raw==other.raw
            && type_name==other.type_name && bound==other.bound && cause==other.cause;
    }
    bool operator!=(const resolve_error& other) const { return !(*this==other); }
};

// One line description naming the setting, the problem, and the offending
// text and bound where applicable.
std::string describe(const resolve_error&);

std::ostream& operator<<(std::ostream&, const resolve_error&);

// Throw the invalid_env_value subclass corresponding to the error kind.
[[noreturn]] void throw_resolve_error(const resolve_error&);

// Engaged value, or std::nullopt for an absent optional setting.
template <typename T>
using resolution = util::expected<std::optional<T>, resolve_error>;

template <typename T>
resolution<T> resolve(const setting<T>& s, const std::optional<std::string>& raw) {
    using util::unexpected;

    validate_setting(s);
    auto range = effective_range(s.range);

    if (raw) {
        auto parsed = parse_integer<T>(*raw);
        if (!parsed) {
            auto kind = parsed.error()==parse_error::overflow?
                failure_kind::numeric_overflow:
                failure_kind::malformed_text;
            return unexpected(resolve_error{kind, s.name, *raw, integer_type_name<T>(), {}, parsed.error()});
        }
        if (!range.contains(*parsed)) {
            return unexpected(resolve_error{failure_kind::out_of_range, s.name, *raw, integer_type_name<T>(), to_string(range), std::nullopt});
        }
        return std::optional<T>(*parsed);
    }

    switch (s.mode) {
    case resolve_mode::required_with_default:
        return std::optional<T>(*s.default_value);
    case resolve_mode::optional:
        return std::optional<T>();
    case resolve_mode::required:
        break;
    }
    return unexpected(resolve_error{failure_kind::missing_required, s.name, std::nullopt, integer_type_name<T>(), {}, std::nullopt});
}

template <typename T>
resolution<T> resolve(const std::string& name,
                      const std::optional<std::string>& raw,
                      std::optional<value_range<T>> range,
                      std::optional<T> dflt,
                      resolve_mode mode)
{
    return resolve(setting<T>{name, range, dflt, mode}, raw);
}

template <typename T>
resolution<T> resolve(const setting<T>& s, const environment& env) {
    return resolve(s, read_env(env, s.name));
}

// Resolve against the current process environment.
template <typename T>
resolution<T> resolve(const setting<T>& s) {
    return resolve(s, read_env(s.name.c_str()));
}

// Unwrapped resolution: throws bad_setting or an invalid_env_value subclass.
template <typename T>
std::optional<T> resolve_or_throw(const setting<T>& s, const std::optional<std::string>& raw) {
    auto r = resolve(s, raw);
    if (!r) throw_resolve_error(r.error());
    return *r;
}

} // namespace envconst
