#pragma once

// Settings manifest: JSON description of the settings a project consumes.
//
// {
//   "namespace": "demo::config",
//   "settings": [
//     { "name": "DEMO_MAX_LEN", "type": "uint32_t", "default": 64 },
//     { "name": "DEMO_LOG2", "type": "uint32_t", "range": { "min": 1, "max": 32 }, "optional": true }
//   ]
// }

#include <optional>
#include <string>
#include <vector>

#include <envconst/envconstexcept.hpp>
#include <envconst/resolve_setting.hpp>

namespace envgen {

struct manifest_error: envconst::envconst_exception {
    manifest_error(const std::string& source, const std::string& what);
    std::string source;
};

struct manifest {
    std::string source;
    std::optional<std::string> cpp_namespace;
    std::vector<envconst::setting_spec> settings;

    // Unrecognised keys and similar non-fatal findings.
    std::vector<std::string> warnings;
};

// Parse manifest text; source names it in diagnostics.
manifest parse_manifest(const std::string& text, const std::string& source);

// Read and parse a manifest file.
manifest load_manifest(const std::string& filename);

// Throw manifest_error on repeated setting names or constant identifiers.
void check_unique(const std::vector<envconst::setting_spec>& settings, const std::string& source);

// Letters, digits and underscores, not starting with a digit. Setting
// names must have this form to be settable from a shell.
bool is_name(const std::string& s);

bool is_keyword(const std::string& s);

// Reserved to the implementation: a leading underscore and capital, or
// a double underscore anywhere.
bool is_reserved(const std::string& s);

// A name usable as a C++ identifier: not a keyword, not reserved.
bool is_identifier(const std::string& s);

// True for empty (global) or '::'-separated identifiers.
bool is_namespace(const std::string& s);

} // namespace envgen
