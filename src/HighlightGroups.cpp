#include "HighlightGroups.h"
#include "Constants.h"
#include "Utils.h"

HighlightGroupResolver::HighlightGroupResolver(const std::vector<std::string>& available_groups)
    : groups_(available_groups.begin(), available_groups.end()) {}

GroupResolution HighlightGroupResolver::resolve(const std::string& token_type,
                                                const std::vector<std::string>& modifiers) const {
    const std::string prefix = HLGROUP_PREFIX;
    const std::string type_part = upper_first(token_type);

    for (const auto& modifier : modifiers) {
        std::string name = prefix + upper_first(modifier) + type_part;
        if (groups_.contains(name)) {
            return {name, contains(combined_modifiers_, modifier)};
        }
    }

    for (const auto& modifier : modifiers) {
        std::string name = prefix + upper_first(modifier);
        if (groups_.contains(name)) {
            return {name, contains(combined_modifiers_, modifier)};
        }
    }

    std::string name = prefix + type_part;
    if (!token_type.empty() && groups_.contains(name)) {
        return {name, false};
    }
    return {};
}

const std::vector<std::string>& standard_token_types() {
    static const std::vector<std::string> types = {
        "namespace", "type", "class", "enum", "interface", "struct", "typeParameter",
        "parameter", "variable", "property", "enumMember", "event", "function", "method",
        "macro", "keyword", "modifier", "comment", "string", "number", "regexp", "operator",
        "decorator"
    };
    return types;
}

const std::vector<std::string>& standard_token_modifiers() {
    static const std::vector<std::string> modifiers = {
        "declaration", "definition", "readonly", "static", "deprecated", "abstract",
        "async", "modification", "documentation", "defaultLibrary"
    };
    return modifiers;
}

std::vector<std::string> default_highlight_groups() {
    std::vector<std::string> groups;
    for (const auto& type : standard_token_types()) {
        groups.push_back(HLGROUP_PREFIX + upper_first(type));
    }
    for (const auto& modifier : standard_token_modifiers()) {
        groups.push_back(HLGROUP_PREFIX + upper_first(modifier));
    }
    return groups;
}
