#pragma once

// Parse setting text as an integer of a given type.
//
// Accepted grammar, matched against the whole text:
//
//     integer: ('+' | '-')? digit+
//     digit:   [0-9]
//
// No surrounding whitespace, digit separators, radix prefixes or type
// suffixes are accepted. Leading zeros are permitted. A '-' sign is
// rejected for unsigned types regardless of the digits that follow.

#include <charconv>
#include <ostream>
#include <string_view>
#include <system_error>
#include <type_traits>

#include <envconst/util/expected.hpp>

namespace envconst {

enum class parse_error {
    empty,            // no characters at all
    unexpected_sign,  // '-' on an unsigned type
    no_digits,        // a sign with nothing after it
    invalid_digit,    // a character outside [0-9] after the optional sign
    overflow          // well-formed, but not representable in the type
};

std::ostream& operator<<(std::ostream&, parse_error);

template <typename T>
util::expected<T, parse_error> parse_integer(std::string_view text) {
    static_assert(std::is_integral<T>::value && !std::is_same<T, bool>::value, "integer type required");
    using util::unexpected;

    if (text.empty()) return unexpected(parse_error::empty);

    std::size_t pos = 0;
    bool negative = false;
    if (text[0]=='+' || text[0]=='-') {
        negative = text[0]=='-';
        if (negative && std::is_unsigned<T>::value) return unexpected(parse_error::unexpected_sign);
        ++pos;
    }

    if (pos==text.size()) return unexpected(parse_error::no_digits);

    for (std::size_t i = pos; i<text.size(); ++i) {
        if (text[i]<'0' || text[i]>'9') return unexpected(parse_error::invalid_digit);
    }

    // std::from_chars takes a '-' but not a '+'.
    const char* b = text.data() + (negative? 0: pos);
    const char* e = text.data() + text.size();

    T value{};
    auto [p, ec] = std::from_chars(b, e, value, 10);
    if (ec==std::errc::result_out_of_range) return unexpected(parse_error::overflow);
    if (ec!=std::errc{} || p!=e) return unexpected(parse_error::invalid_digit);

    return value;
}

} // namespace envconst
