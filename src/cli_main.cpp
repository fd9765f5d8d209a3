#include <cxxopts.hpp>
#include <iostream>
#include <string>
#include <vector>
#include "remold/Changelog.hpp"
#include "remold/Config.hpp"
#include "remold/DocumentMerge.hpp"
#include "remold/Errors.hpp"
#include "remold/Loader.hpp"
#include "remold/Normalize.hpp"
#include "remold/Report.hpp"
#include "remold/ScriptScanner.hpp"
#include "remold/Splice.hpp"
#include "remold/TitleSymbol.hpp"
#include "remold/Util.hpp"

using namespace remold;

namespace {

const char* const kCommands =
    "Commands:\n"
    "  markdown TEMPLATE DEST        merge a document, keeping preserved sections\n"
    "  changelog TEMPLATE DEST       rebuild the changelog's unreleased section\n"
    "  fields SCRIPT FIELDS_JSON     set script fields, e.g. '{\"version\":\"1.0\"}'\n"
    "  remove-dep SCRIPT NAME        remove dependency declarations of NAME\n"
    "  ensure-deps SCRIPT DEPS_JSON  set dependency lines, e.g. '{\"rake\":\"spec.add_dependency \\\"rake\\\"\"}'\n"
    "  sync-symbol README SCRIPT     copy the script's leading symbol into the README title\n"
    "  config                        print the effective configuration\n";

Value parse_json_argument(const std::string& what, const std::string& text) {
    Value v = Value::parse(text, nullptr, false);
    if (v.is_discarded() || !v.is_object()) {
        throw RemoldError(what + " must be a JSON object");
    }
    return v;
}

FieldMap to_field_map(const Value& obj) {
    FieldMap fields;
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (!is_field_literal(it.value())) {
            throw ConfigValueError(it.key(), "string or array of strings", type_name(it.value()));
        }
        fields.emplace_back(it.key(), it.value());
    }
    return fields;
}

DependencyLines to_dependency_lines(const Value& obj) {
    DependencyLines lines;
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (!it.value().is_string()) {
            throw ConfigValueError(it.key(), "string", type_name(it.value()));
        }
        lines.emplace_back(it.key(), it.value().get<std::string>());
    }
    return lines;
}

void print_diagnostics(const Report& report, bool verbose) {
    for (const auto& d : report.diagnostics()) {
        if (d.severity == Severity::Debug && !verbose) continue;
        std::cerr << "[" << severity_name(d.severity) << "] " << d.operation << ": " << d.message << "\n";
    }
}

// Every text input is read with '\n' line endings.
std::string read_input(const std::string& path) {
    return normalize_newlines(read_text_file(path));
}

std::string read_input_or_empty(const std::string& path) {
    return normalize_newlines(read_text_file_or_empty(path));
}

// Write to --out (skipping identical content) or to stdout.
void emit(const std::string& text, const std::string& out, Report& report) {
    if (out.empty()) {
        std::cout << text;
        return;
    }
    const std::string existing = read_text_file_or_empty(out);
    if (!existing.empty() && existing == text) {
        report.record(out, TemplateAction::Skip);
        return;
    }
    report.record(out, existing.empty() ? TemplateAction::Create : TemplateAction::Replace);
    write_text_file(out, text);
}

} // namespace

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("remold-cli", "Reconcile project files with their templates");
        options.positional_help("COMMAND [ARGS]");

        // Global options
        options.add_options()
            ("c,config", "Path to JSON/TOML config", cxxopts::value<std::string>())
            ("set", "Override a config key: dot.key:VALUE (repeatable)", cxxopts::value<std::vector<std::string>>())
            ("o,out", "Write the result to FILE instead of stdout", cxxopts::value<std::string>())
            ("v,verbose", "Also print debug diagnostics")
            ("h,help", "Show help");

        // Command + arguments captured as positional strings
        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n" << kCommands;
            return 0;
        }

        LoadOptions load;
        if (result.count("config")) load.file_path = result["config"].as<std::string>();
        if (result.count("set")) {
            for (const auto& spec : result["set"].as<std::vector<std::string>>()) {
                std::pair<std::string, Value> kv;
                if (!parse_override(spec, kv)) {
                    std::cerr << "Error: invalid --set '" << spec << "' (expected KEY:VALUE)\n";
                    return 1;
                }
                load.overrides.push_back(std::move(kv));
            }
        }
        const std::string out = result.count("out") ? result["out"].as<std::string>() : std::string();
        const bool verbose = result.count("verbose") > 0;

        auto cmdv = result["command"].as<std::vector<std::string>>();
        const std::string cmd = cmdv[0];

        MergeConfig cfg = MergeConfig::load(load);
        Report report;
        ScriptScanner scanner;
        ScriptSplicer splicer(scanner, cfg.script);

        auto expect_args = [&](size_t want) {
            if (cmdv.size() < want) {
                std::cerr << "Error: insufficient arguments for command '" << cmd << "'\n";
                return false;
            }
            return true;
        };

        std::string text;
        if (cmd == "markdown") {
            if (!expect_args(3)) return 1;
            text = merge_document(read_input(cmdv[1]), read_input_or_empty(cmdv[2]),
                                  cfg.markdown.document_options(), &report);
            if (cfg.markdown.normalize_heading_spacing) {
                text = normalize_heading_spacing(text);
            }
        } else if (cmd == "changelog") {
            if (!expect_args(3)) return 1;
            text = merge_changelog(read_input(cmdv[1]), read_input_or_empty(cmdv[2]),
                                   cfg.changelog, &report);
        } else if (cmd == "fields") {
            if (!expect_args(3)) return 1;
            const FieldMap fields = to_field_map(parse_json_argument("FIELDS_JSON", cmdv[2]));
            text = collapse_magic_comments(splicer.replace_fields(read_input(cmdv[1]), fields, &report));
        } else if (cmd == "remove-dep") {
            if (!expect_args(3)) return 1;
            text = collapse_magic_comments(splicer.remove_dependency(read_input(cmdv[1]), cmdv[2], &report));
        } else if (cmd == "ensure-deps") {
            if (!expect_args(3)) return 1;
            const DependencyLines deps = to_dependency_lines(parse_json_argument("DEPS_JSON", cmdv[2]));
            text = collapse_magic_comments(splicer.ensure_dependencies(read_input(cmdv[1]), deps, &report));
        } else if (cmd == "sync-symbol") {
            if (!expect_args(3)) return 1;
            text = sync_readme_h1_symbol(read_input(cmdv[1]), read_input(cmdv[2]),
                                         scanner, cfg.script, &report);
        } else if (cmd == "config") {
            text = cfg.to_value().dump(2);
        } else {
            std::cerr << "Unknown command: " << cmd << "\n" << kCommands;
            return 1;
        }

        emit(ensure_trailing_newline(text), out, report);
        print_diagnostics(report, verbose);
        if (verbose && !out.empty()) {
            if (const TemplateAction* action = report.action_for(out)) {
                std::cerr << "[" << action_name(*action) << "] " << out << "\n";
            }
        }
        return 0;

    } catch (const ConfigParseError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
