#pragma once

// Integer types a setting may resolve to, and runtime dispatch over them.

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace envconst {

enum class numeric_kind {
    int8, uint8,
    int16, uint16,
    int32, uint32,
    int64, uint64,
    size, ptrdiff,
    int_, unsigned_
};

template <typename T>
struct type_tag { using type = T; };

// Call f(type_tag<T>{}) with T the C++ type corresponding to kind k.

template <typename F>
decltype(auto) visit_kind(numeric_kind k, F&& f) {
    switch (k) {
    case numeric_kind::int8:      return f(type_tag<std::int8_t>{});
    case numeric_kind::uint8:     return f(type_tag<std::uint8_t>{});
    case numeric_kind::int16:     return f(type_tag<std::int16_t>{});
    case numeric_kind::uint16:    return f(type_tag<std::uint16_t>{});
    case numeric_kind::int32:     return f(type_tag<std::int32_t>{});
    case numeric_kind::uint32:    return f(type_tag<std::uint32_t>{});
    case numeric_kind::int64:     return f(type_tag<std::int64_t>{});
    case numeric_kind::uint64:    return f(type_tag<std::uint64_t>{});
    case numeric_kind::size:      return f(type_tag<std::size_t>{});
    case numeric_kind::ptrdiff:   return f(type_tag<std::ptrdiff_t>{});
    case numeric_kind::int_:      return f(type_tag<int>{});
    case numeric_kind::unsigned_: return f(type_tag<unsigned>{});
    }
    throw std::invalid_argument("invalid numeric_kind");
}

// Spelling of the kind as it appears in generated C++, e.g. "std::uint32_t".
std::string cxx_type_name(numeric_kind k);

// Spelling of the kind in a manifest, e.g. "uint32_t".
std::string kind_name(numeric_kind k);

// Accepts the manifest spellings, with or without a leading "std::".
std::optional<numeric_kind> kind_from_name(const std::string& name);

std::ostream& operator<<(std::ostream&, numeric_kind);

// Human readable description of an integer type by signedness and width,
// e.g. "uint8_t", used in diagnostics.

template <typename T>
std::string integer_type_name() {
    static_assert(std::is_integral<T>::value && !std::is_same<T, bool>::value, "integer type required");
    constexpr int bits = std::numeric_limits<T>::digits + std::numeric_limits<T>::is_signed;
    return std::string(std::is_signed<T>::value? "int": "uint") + std::to_string(bits) + "_t";
}

} // namespace envconst
