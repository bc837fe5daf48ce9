#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include <envconst/numeric_kind.hpp>

namespace envconst {

namespace {
struct kind_names {
    const char* manifest;
    const char* cxx;
};

kind_names names_of(numeric_kind k) {
    switch (k) {
    case numeric_kind::int8:      return {"int8_t",    "std::int8_t"};
    case numeric_kind::uint8:     return {"uint8_t",   "std::uint8_t"};
    case numeric_kind::int16:     return {"int16_t",   "std::int16_t"};
    case numeric_kind::uint16:    return {"uint16_t",  "std::uint16_t"};
    case numeric_kind::int32:     return {"int32_t",   "std::int32_t"};
    case numeric_kind::uint32:    return {"uint32_t",  "std::uint32_t"};
    case numeric_kind::int64:     return {"int64_t",   "std::int64_t"};
    case numeric_kind::uint64:    return {"uint64_t",  "std::uint64_t"};
    case numeric_kind::size:      return {"size_t",    "std::size_t"};
    case numeric_kind::ptrdiff:   return {"ptrdiff_t", "std::ptrdiff_t"};
    case numeric_kind::int_:      return {"int",       "int"};
    case numeric_kind::unsigned_: return {"unsigned",  "unsigned"};
    }
    throw std::invalid_argument("invalid numeric_kind");
}
} // anonymous namespace

std::string cxx_type_name(numeric_kind k) {
    return names_of(k).cxx;
}

std::string kind_name(numeric_kind k) {
    return names_of(k).manifest;
}

std::optional<numeric_kind> kind_from_name(const std::string& name) {
    static const std::unordered_map<std::string, numeric_kind> kinds = {
        {"int8_t",    numeric_kind::int8},
        {"uint8_t",   numeric_kind::uint8},
        {"int16_t",   numeric_kind::int16},
        {"uint16_t",  numeric_kind::uint16},
        {"int32_t",   numeric_kind::int32},
        {"uint32_t",  numeric_kind::uint32},
        {"int64_t",   numeric_kind::int64},
        {"uint64_t",  numeric_kind::uint64},
        {"size_t",    numeric_kind::size},
        {"ptrdiff_t", numeric_kind::ptrdiff},
        {"int",       numeric_kind::int_},
        {"unsigned",  numeric_kind::unsigned_},
    };

    std::string key = name;
    if (key.rfind("std::", 0)==0) {
        // Only the <cstdint>/<cstddef> typedefs live in std.
        key = key.substr(5);
        if (key.size()<2 || key.compare(key.size()-2, 2, "_t")) return std::nullopt;
    }

    auto i = kinds.find(key);
    if (i==kinds.end()) return std::nullopt;
    return i->second;
}

std::ostream& operator<<(std::ostream& out, numeric_kind k) {
    return out << kind_name(k);
}

} // namespace envconst
