#include <exception>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <tinyopt/tinyopt.h>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <envconst/envconstexcept.hpp>
#include <envconst/read_envvar.hpp>
#include <envconst/resolve_setting.hpp>

#include "envgenutil.hpp"
#include "io/bulkio.hpp"
#include "manifest.hpp"
#include "printer.hpp"

using std::cout;
using std::cerr;

// Options and option parsing:

int report_error(const std::string& message) {
    cerr << red("error: ") << message << "\n";
    return 1;
}

void report_warning(const std::string& message) {
    cerr << yellow("warning: ") << message << "\n";
}

int report_ice(const std::string& message) {
    cerr << red("internal error:\n") << message << "\n"
         << "\nPlease report this error to the envconst developers.\n";
    return 1;
}

struct Options {
    std::string output;
    std::vector<std::string> manifests;
    std::optional<std::string> cpp_namespace;
    bool verbose = false;
    bool dry_run = false;
};

// Helper for formatting tabulated output (option reporting).
struct table_prefix { std::string text; };
std::ostream& operator<<(std::ostream& out, const table_prefix& tb) {
    return out << cyan("| "+tb.text) << std::right << std::setw(58-tb.text.size());
}

std::ostream& operator<<(std::ostream& out, const Options& opt) {
    static const char* noyes[2] = {"no", "yes"};
    static const std::string line_end = cyan(" |") + "\n";

    for (const auto& f: opt.manifests) {
        out << table_prefix{"manifest"} << f << line_end;
    }
    out << table_prefix{"output"} << (opt.output.empty()? "-": opt.output) << line_end <<
        table_prefix{"namespace"} << opt.cpp_namespace.value_or("(from manifest)") << line_end <<
        table_prefix{"verbose"} << noyes[opt.verbose] << line_end <<
        table_prefix{"dry run"} << noyes[opt.dry_run] << line_end;
    return out;
}

const char* usage_str =
        "\n"
        "-o|--output            [Header file to write; standard output if omitted]\n"
        "-N|--namespace         [Namespace for generated constants, overriding the manifest]\n"
        "-n|--dry-run           [Resolve and report settings without writing output]\n"
        "-V|--verbose           [Toggle verbose mode]\n"
        "--no-color             [Plain diagnostics without ANSI colours]\n"
        "<manifests>            [JSON settings manifests]\n";

int main(int argc, char **argv) {
    Options opt;
    try {
        auto help = [argv0 = argv[0]] {
            to::usage(argv0, usage_str);
        };

        auto set_namespace = [&opt](std::string ns) { opt.cpp_namespace = std::move(ns); };
        auto no_color = [] { color_printing() = false; };

        to::option options[] = {
                { to::push_back(opt.manifests)},
                { opt.output,                                 "-o", "--output" },
                { to::action(set_namespace),                  "-N", "--namespace" },
                { to::set(opt.dry_run), to::flag,             "-n", "--dry-run" },
                { to::set(opt.verbose), to::flag,             "-V", "--verbose" },
                { to::action(no_color), to::flag,             "--no-color" },
                { to::action(help), to::flag, to::exit,       "-h", "--help" }
        };

        if (!to::run(options, argc, argv+1)) return 0;
    }
    catch (to::option_error& e) {
        to::usage_error(argv[0], usage_str, e.what());
        return 1;
    }

    if (opt.manifests.empty()) {
        to::usage_error(argv[0], usage_str, "no manifest supplied");
        return 1;
    }

    // Keep standard output clean when the header is written there.
    std::ostream& vout = opt.output.empty()? cerr: cout;

    if (opt.verbose) {
        static const std::string tableline = cyan("."+std::string(60, '-')+".")+"\n";
        vout << tableline;
        vout << opt;
        vout << tableline;
    }

    try {
        // Load manifests; settings from all of them share one header.

        envgen::printer_options popt;
        std::vector<envconst::setting_spec> specs;
        std::optional<std::string> manifest_namespace;

        for (const auto& filename: opt.manifests) {
            auto m = envgen::load_manifest(filename);
            for (const auto& w: m.warnings) {
                report_warning(w);
            }

            if (m.cpp_namespace && !opt.cpp_namespace) {
                if (manifest_namespace && *manifest_namespace!=*m.cpp_namespace) {
                    return report_error(fmt::format("{}: namespace \"{}\" conflicts with \"{}\" from an earlier manifest",
                        filename, *m.cpp_namespace, *manifest_namespace));
                }
                manifest_namespace = m.cpp_namespace;
            }
            popt.sources.push_back(filename);
            specs.insert(specs.end(), m.settings.begin(), m.settings.end());
        }

        if (opt.cpp_namespace) {
            if (!envgen::is_namespace(*opt.cpp_namespace)) {
                return report_error(fmt::format("\"{}\" is not a valid namespace", *opt.cpp_namespace));
            }
            popt.cpp_namespace = *opt.cpp_namespace;
        }
        else {
            popt.cpp_namespace = manifest_namespace.value_or("");
        }

        // Names must also be unique across manifests.
        envgen::check_unique(specs, fmt::format("{}", fmt::join(popt.sources, ", ")));

        // Resolve every setting, reporting all failures before giving up.

        auto env = envconst::environment::from_process();
        std::vector<envconst::resolved_setting> resolved;
        unsigned n_failed = 0;

        for (const auto& spec: specs) {
            try {
                auto r = envconst::resolve(spec, env);
                if (!r.outcome) {
                    report_error(describe(r.outcome.error()));
                    ++n_failed;
                }
                else if (opt.verbose) {
                    const auto& v = *r.outcome;
                    vout << green("[") << spec.name << green("]") << " "
                         << (v? envconst::to_string(*v): "no value")
                         << (r.raw? " (environment)": v? " (default)": "") << "\n";
                }
                resolved.push_back(std::move(r));
            }
            catch (envconst::bad_setting& e) {
                report_error(e.what());
                ++n_failed;
            }
        }

        if (n_failed) {
            cerr << red(fmt::format("{} of {} setting{} failed to resolve\n",
                n_failed, specs.size(), specs.size()==1? "": "s"));
            return 1;
        }

        if (opt.dry_run) return 0;

        auto header = envgen::emit_header(resolved, popt);
        if (opt.output.empty()) {
            io::write_all(header, cout);
        }
        else if (io::write_if_changed(header, opt.output) && opt.verbose) {
            vout << green("wrote ") << opt.output << "\n";
        }
    }
    catch (io::bulkio_error& e) {
        return report_error(e.what());
    }
    catch (envgen::manifest_error& e) {
        return report_error(e.what());
    }
    catch (std::exception& e) {
        return report_ice(e.what());
    }

    return 0;
}
