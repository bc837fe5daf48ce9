#include <ostream>

#include <envconst/parse.hpp>

namespace envconst {

std::ostream& operator<<(std::ostream& out, parse_error e) {
    switch (e) {
    case parse_error::empty:           return out << "empty value";
    case parse_error::unexpected_sign: return out << "negative sign on unsigned value";
    case parse_error::no_digits:       return out << "sign without digits";
    case parse_error::invalid_digit:   return out << "invalid decimal digit";
    case parse_error::overflow:        return out << "value too large for type";
    }
    return out << "unknown parse error";
}

} // namespace envconst
