#include <limits>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <variant>

#include <envconst/envconstexcept.hpp>
#include <envconst/resolve.hpp>
#include <envconst/resolve_setting.hpp>

namespace envconst {

namespace {

// Convert to T if representable.
template <typename T>
std::optional<T> narrow(const integer_value& v) {
    return std::visit(
        [](auto x) -> std::optional<T> {
            using X = decltype(x);
            if constexpr (std::is_signed<X>::value) {
                if constexpr (std::is_signed<T>::value) {
                    if (x<std::numeric_limits<T>::min() || x>std::numeric_limits<T>::max()) return std::nullopt;
                }
                else {
                    if (x<0 || static_cast<unsigned long long>(x)>static_cast<unsigned long long>(std::numeric_limits<T>::max())) return std::nullopt;
                }
            }
            else {
                if (x>static_cast<unsigned long long>(std::numeric_limits<T>::max())) return std::nullopt;
            }
            return static_cast<T>(x);
        },
        v);
}

template <typename T>
integer_value widen(T v) {
    if constexpr (std::is_signed<T>::value) {
        return integer_value(std::in_place_index<0>, static_cast<long long>(v));
    }
    else {
        return integer_value(std::in_place_index<1>, static_cast<unsigned long long>(v));
    }
}

template <typename T>
setting<T> typed_setting(const setting_spec& spec) {
    setting<T> s;
    s.name = spec.name;
    s.mode = spec.mode();

    if (spec.range) {
        auto lo = narrow<T>(spec.range->min);
        auto hi = narrow<T>(spec.range->max);
        if (!lo) throw bad_setting(spec.name, "range bound " + to_string(spec.range->min) + " is not representable in " + kind_name(spec.kind));
        if (!hi) throw bad_setting(spec.name, "range bound " + to_string(spec.range->max) + " is not representable in " + kind_name(spec.kind));
        s.range = value_range<T>{*lo, *hi, spec.range->inclusive};
    }

    if (spec.default_value) {
        auto d = narrow<T>(*spec.default_value);
        if (!d) throw bad_setting(spec.name, "default value " + to_string(*spec.default_value) + " is not representable in " + kind_name(spec.kind));
        s.default_value = *d;
    }

    return s;
}

} // anonymous namespace

std::string to_string(const integer_value& v) {
    return std::visit([](auto x) { return std::to_string(x); }, v);
}

std::ostream& operator<<(std::ostream& out, const integer_value& v) {
    return out << to_string(v);
}

integer_value kind_min(numeric_kind k) {
    return visit_kind(k, [](auto tag) {
        using T = typename decltype(tag)::type;
        return widen(std::numeric_limits<T>::min());
    });
}

integer_value kind_max(numeric_kind k) {
    return visit_kind(k, [](auto tag) {
        using T = typename decltype(tag)::type;
        return widen(std::numeric_limits<T>::max());
    });
}

resolve_mode setting_spec::mode() const {
    if (optional && default_value) {
        throw bad_setting(name, "an optional setting cannot have a default value");
    }
    if (default_value) return resolve_mode::required_with_default;
    return optional? resolve_mode::optional: resolve_mode::required;
}

resolved_setting resolve(const setting_spec& spec, const environment& env) {
    return visit_kind(spec.kind, [&](auto tag) -> resolved_setting {
        using T = typename decltype(tag)::type;

        auto s = typed_setting<T>(spec);
        auto raw = read_env(env, spec.name);

        std::optional<range_spec> range;
        if (s.range) {
            range = range_spec{widen(s.range->lo), widen(s.range->hi), s.range->inclusive};
        }

        auto r = resolve(s, raw);
        if (!r) {
            return {spec, raw, range, util::unexpected(r.error())};
        }
        if (!*r) {
            return {spec, raw, range, std::optional<integer_value>()};
        }
        return {spec, raw, range, std::optional<integer_value>(widen(**r))};
    });
}

} // namespace envconst
