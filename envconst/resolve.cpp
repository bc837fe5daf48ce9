#include <ostream>
#include <sstream>
#include <string>

#include <envconst/envconstexcept.hpp>
#include <envconst/resolve.hpp>

namespace envconst {

std::ostream& operator<<(std::ostream& out, resolve_mode m) {
    switch (m) {
    case resolve_mode::required:              return out << "required";
    case resolve_mode::required_with_default: return out << "required-with-default";
    case resolve_mode::optional:              return out << "optional";
    }
    return out;
}

std::ostream& operator<<(std::ostream& out, failure_kind k) {
    switch (k) {
    case failure_kind::missing_required: return out << "missing";
    case failure_kind::malformed_text:   return out << "malformed";
    case failure_kind::numeric_overflow: return out << "overflow";
    case failure_kind::out_of_range:     return out << "out of range";
    }
    return out;
}

std::string describe(const resolve_error& e) {
    std::stringstream s;
    s << "environment variable \"" << e.setting << "\"";

    switch (e.kind) {
    case failure_kind::missing_required:
        s << " is required but not set, and has no default";
        break;
    case failure_kind::malformed_text:
        s << " has value \"" << e.raw.value_or("") << "\" which is not a valid " << e.type_name;
        if (e.cause) s << " (" << *e.cause << ")";
        break;
    case failure_kind::numeric_overflow:
        s << " has value \"" << e.raw.value_or("") << "\" which does not fit in " << e.type_name;
        break;
    case failure_kind::out_of_range:
        s << " has value \"" << e.raw.value_or("") << "\" outside of the range " << e.bound;
        break;
    }
    return s.str();
}

std::ostream& operator<<(std::ostream& out, const resolve_error& e) {
    return out << describe(e);
}

void throw_resolve_error(const resolve_error& e) {
    switch (e.kind) {
    case failure_kind::missing_required:
        throw missing_env_value(e);
    case failure_kind::malformed_text:
        throw malformed_env_value(e);
    case failure_kind::numeric_overflow:
        throw env_value_overflow(e);
    case failure_kind::out_of_range:
        throw env_value_out_of_range(e);
    }
    throw invalid_env_value(e.setting, e.raw.value_or(""));
}

} // namespace envconst
