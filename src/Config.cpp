#include "remold/Config.hpp"
#include "remold/DotPath.hpp"
#include "remold/Errors.hpp"
#include "remold/Loader.hpp"
#include "remold/Merge.hpp"
#include "remold/Sections.hpp"

namespace remold {

namespace {

void read_string(const Value& tree, const std::string& key, std::string& out) {
    const Value* v = find_by_dot(tree, key);
    if (!v) return;
    if (!v->is_string()) throw ConfigValueError(key, "string", type_name(*v));
    out = v->get<std::string>();
}

void read_bool(const Value& tree, const std::string& key, bool& out) {
    const Value* v = find_by_dot(tree, key);
    if (!v) return;
    if (!v->is_boolean()) throw ConfigValueError(key, "boolean", type_name(*v));
    out = v->get<bool>();
}

void read_string_list(const Value& tree, const std::string& key, std::vector<std::string>& out) {
    const Value* v = find_by_dot(tree, key);
    if (!v) return;
    if (!is_string_array(*v)) throw ConfigValueError(key, "array of strings", type_name(*v));
    out = v->get<std::vector<std::string>>();
}

} // namespace

DocumentMergeOptions MarkdownSettings::document_options() const {
    DocumentMergeOptions opts;
    opts.preserved_keys.clear();
    for (const auto& name : preserve_sections) {
        // "Basic Usage" and "## Basic Usage" both name the same section
        opts.preserved_keys.insert(section_key(name));
    }
    if (!preserve_prefixes.empty()) {
        opts.preserved_predicate = prefix_predicate(preserve_prefixes);
    }
    opts.preserve_h1 = preserve_h1;
    return opts;
}

Value MergeConfig::default_tree() {
    return MergeConfig{}.to_value();
}

MergeConfig MergeConfig::from_value(const Value& tree) {
    MergeConfig cfg;
    if (!tree.is_object()) {
        throw ConfigValueError("<root>", "object", type_name(tree));
    }

    read_string_list(tree, "markdown.preserve_sections", cfg.markdown.preserve_sections);
    read_string_list(tree, "markdown.preserve_prefixes", cfg.markdown.preserve_prefixes);
    read_bool(tree, "markdown.preserve_h1", cfg.markdown.preserve_h1);
    read_bool(tree, "markdown.normalize_heading_spacing", cfg.markdown.normalize_heading_spacing);

    read_string(tree, "changelog.section", cfg.changelog.section);
    read_string_list(tree, "changelog.categories", cfg.changelog.categories);

    read_string(tree, "script.receiver", cfg.script.receiver);
    read_string(tree, "script.constructor", cfg.script.constructor);
    read_string(tree, "script.default_param", cfg.script.default_param);
    read_string_list(tree, "script.freeform_fields", cfg.script.freeform_fields);
    read_string(tree, "script.anchor_field", cfg.script.anchor_field);
    read_string_list(tree, "script.dependency_methods", cfg.script.dependency_methods);

    return cfg;
}

MergeConfig MergeConfig::load(const LoadOptions& opts) {
    std::vector<Value> layers{default_tree()};
    if (opts.file_path.has_value()) {
        layers.push_back(load_config_file(*opts.file_path));
    }
    Value merged = deep_merge_all(layers);

    for (const auto& [key, value] : opts.overrides) {
        set_by_dot(merged, key, value);
    }

    return from_value(merged);
}

Value MergeConfig::to_value() const {
    Value tree = Value::object();
    tree["markdown"] = {
        {"preserve_sections", markdown.preserve_sections},
        {"preserve_prefixes", markdown.preserve_prefixes},
        {"preserve_h1", markdown.preserve_h1},
        {"normalize_heading_spacing", markdown.normalize_heading_spacing},
    };
    tree["changelog"] = {
        {"section", changelog.section},
        {"categories", changelog.categories},
    };
    tree["script"] = {
        {"receiver", script.receiver},
        {"constructor", script.constructor},
        {"default_param", script.default_param},
        {"freeform_fields", script.freeform_fields},
        {"anchor_field", script.anchor_field},
        {"dependency_methods", script.dependency_methods},
    };
    return tree;
}

} // namespace remold
