#include "LanguageRegistry.h"
#include "HighlightGroups.h"
#include "Constants.h"
#include <SDL2/SDL.h>
#include <algorithm>
#include <cstring>

extern "C" const TSLanguage* tree_sitter_cpp();
extern "C" const TSLanguage* tree_sitter_c();

namespace {

struct CaptureSpec {
    const char* type;
    std::vector<const char*> modifiers;
};

const std::unordered_map<std::string, CaptureSpec> CAPTURE_NAME_TO_TOKEN = {
    {"comment", {"comment", {}}},
    {"string", {"string", {}}},
    {"number", {"number", {}}},
    {"keyword", {"keyword", {}}},
    {"operator", {"operator", {}}},
    {"macro", {"macro", {}}},
    {"macro.definition", {"macro", {"declaration"}}},
    {"function", {"function", {}}},
    {"function.definition", {"function", {"declaration"}}},
    {"function.builtin", {"function", {"defaultLibrary"}}},
    {"method", {"method", {}}},
    {"method.definition", {"method", {"declaration"}}},
    {"variable", {"variable", {}}},
    {"variable.declaration", {"variable", {"declaration"}}},
    {"variable.parameter", {"parameter", {}}},
    {"variable.builtin", {"variable", {"defaultLibrary"}}},
    {"constant", {"variable", {"readonly"}}},
    {"constant.builtin", {"variable", {"readonly", "defaultLibrary"}}},
    {"enumMember", {"enumMember", {}}},
    {"class", {"class", {}}},
    {"class.definition", {"class", {"declaration"}}},
    {"struct", {"struct", {}}},
    {"struct.definition", {"struct", {"declaration"}}},
    {"enum", {"enum", {}}},
    {"enum.definition", {"enum", {"declaration"}}},
    {"type", {"type", {}}},
    {"type.builtin", {"type", {"defaultLibrary"}}},
    {"type.definition", {"type", {"declaration"}}},
    {"namespace", {"namespace", {}}},
    {"property", {"property", {}}},
};

std::optional<uint32_t> index_of(const std::vector<std::string>& list, const char* name) {
    auto it = std::find(list.begin(), list.end(), name);
    if (it == list.end()) return std::nullopt;
    return static_cast<uint32_t>(it - list.begin());
}

// Earlier patterns win where captures overlap, so the specific ones come first.
constexpr const char* CPP_QUERY = R"scm(
(comment) @comment
(string_literal) @string
(raw_string_literal) @string
(system_lib_string) @string
(char_literal) @string
(number_literal) @number

(preproc_def name: (identifier) @macro.definition)
(preproc_function_def name: (identifier) @macro.definition)

(function_declarator declarator: (identifier) @function.definition)
(function_declarator declarator: (qualified_identifier name: (identifier) @function.definition))
(function_declarator declarator: (field_identifier) @method.definition)
(call_expression function: (identifier) @function)
(call_expression function: (qualified_identifier name: (identifier) @function))
(call_expression function: (field_expression field: (field_identifier) @method))
(template_function name: (identifier) @function)
(template_method name: (field_identifier) @method)

(parameter_declaration declarator: (identifier) @variable.parameter)
(parameter_declaration declarator: (pointer_declarator declarator: (identifier) @variable.parameter))
(parameter_declaration declarator: (reference_declarator (identifier) @variable.parameter))
(enumerator name: (identifier) @enumMember)

(class_specifier name: (type_identifier) @class.definition)
(struct_specifier name: (type_identifier) @struct.definition)
(enum_specifier name: (type_identifier) @enum.definition)
(type_definition declarator: (type_identifier) @type.definition)

(primitive_type) @type.builtin
(sized_type_specifier) @type.builtin
(type_identifier) @type
(auto) @type.builtin

(namespace_identifier) @namespace
(field_identifier) @property
(init_declarator declarator: (identifier) @variable.declaration)
(identifier) @variable

(this) @variable.builtin
(true) @constant.builtin
(false) @constant.builtin

[
  "catch" "class" "constexpr" "delete" "explicit" "final" "friend" "mutable" "namespace"
  "noexcept" "new" "override" "private" "protected" "public" "template"
  "throw" "try" "typename" "using" "virtual"
  "if" "else" "for" "while" "do" "switch" "case" "default"
  "break" "continue" "return" "goto"
  "struct" "union" "enum" "static" "extern" "inline" "const" "volatile" "typedef"
] @keyword
)scm";

constexpr const char* C_QUERY = R"scm(
(comment) @comment
(string_literal) @string
(system_lib_string) @string
(char_literal) @string
(number_literal) @number

(preproc_def name: (identifier) @macro.definition)
(preproc_function_def name: (identifier) @macro.definition)

(function_declarator declarator: (identifier) @function.definition)
(call_expression function: (identifier) @function)
(call_expression function: (field_expression field: (field_identifier) @function))

(parameter_declaration declarator: (identifier) @variable.parameter)
(parameter_declaration declarator: (pointer_declarator declarator: (identifier) @variable.parameter))
(enumerator name: (identifier) @enumMember)

(struct_specifier name: (type_identifier) @struct.definition)
(enum_specifier name: (type_identifier) @enum.definition)
(type_definition declarator: (type_identifier) @type.definition)

(primitive_type) @type.builtin
(sized_type_specifier) @type.builtin
(type_identifier) @type

(field_identifier) @property
(init_declarator declarator: (identifier) @variable.declaration)
(identifier) @variable

(true) @constant.builtin
(false) @constant.builtin

[
  "break" "case" "const" "continue" "default" "do" "else" "enum"
  "extern" "for" "if" "inline" "return" "sizeof" "static" "struct"
  "switch" "typedef" "union" "volatile" "while" "goto" "register"
] @keyword
)scm";

}

std::optional<CaptureToken> capture_to_token(const std::string& capture_name) {
    std::string name = capture_name;
    while (!name.empty()) {
        auto it = CAPTURE_NAME_TO_TOKEN.find(name);
        if (it != CAPTURE_NAME_TO_TOKEN.end()) {
            auto type = index_of(standard_token_types(), it->second.type);
            if (!type) return std::nullopt;
            CaptureToken token{.type = *type};
            for (const char* modifier : it->second.modifiers) {
                if (auto bit = index_of(standard_token_modifiers(), modifier)) {
                    token.modifiers |= 1u << *bit;
                }
            }
            return token;
        }
        size_t dot_pos = name.rfind('.');
        if (dot_pos == std::string::npos) break;
        name.resize(dot_pos);
    }
    return std::nullopt;
}

LanguageRegistry::~LanguageRegistry() {
    unload_all();
}

LanguageRegistry& LanguageRegistry::instance() {
    static LanguageRegistry registry;
    return registry;
}

void LanguageRegistry::register_language(LanguageDefinition def) {
    for (const auto& filetype : def.filetypes) {
        filetype_to_id_[filetype] = def.id;
    }
    definitions_.push_back(std::move(def));
}

const LanguageDefinition* LanguageRegistry::find_by_filetype(const std::string& filetype) const {
    auto it = filetype_to_id_.find(filetype);
    if (it == filetype_to_id_.end()) return nullptr;
    for (const auto& def : definitions_) {
        if (def.id == it->second) return &def;
    }
    return nullptr;
}

void LanguageRegistry::build_capture_map(LoadedLanguage& lang) {
    if (!lang.query) return;

    uint32_t capture_count = ts_query_capture_count(lang.query);
    lang.capture_map.assign(capture_count, std::nullopt);

    for (uint32_t i = 0; i < capture_count; i++) {
        uint32_t len;
        const char* name = ts_query_capture_name_for_id(lang.query, i, &len);
        std::string capture_name(name, len);

        lang.capture_map[i] = capture_to_token(capture_name);
        if (!lang.capture_map[i]) {
            SDL_LogDebug(LOG_CATEGORY_SEMANTIC, "%s: capture @%s has no token type",
                         lang.config.name.c_str(), capture_name.c_str());
        }
    }
}

LoadedLanguage* LanguageRegistry::get_or_load(const std::string& language_id) {
    auto it = loaded_.find(language_id);
    if (it != loaded_.end()) {
        return it->second.get();
    }

    const LanguageDefinition* def = nullptr;
    for (const auto& d : definitions_) {
        if (d.id == language_id) {
            def = &d;
            break;
        }
    }
    if (!def) return nullptr;

    auto loaded = std::make_unique<LoadedLanguage>();
    loaded->config = def->config_factory();

    uint32_t error_offset;
    TSQueryError error_type;
    loaded->query_owned.reset(ts_query_new(
        loaded->config.factory(),
        loaded->config.query_source,
        static_cast<uint32_t>(strlen(loaded->config.query_source)),
        &error_offset,
        &error_type
    ));
    loaded->query = loaded->query_owned.get();

    if (!loaded->query) {
        SDL_LogError(LOG_CATEGORY_SEMANTIC, "Query compilation error for %s at offset %u, type %d",
                     language_id.c_str(), error_offset, static_cast<int>(error_type));
    } else {
        build_capture_map(*loaded);
    }

    LoadedLanguage* ptr = loaded.get();
    loaded_[language_id] = std::move(loaded);
    return ptr;
}

void LanguageRegistry::unload_all() {
    loaded_.clear();
}

void register_all_languages() {
    LanguageRegistry& registry = LanguageRegistry::instance();
    if (registry.find_by_filetype("cpp")) return;

    registry.register_language({
        "cpp",
        {"cpp", "cxx", "hpp"},
        []() -> LanguageConfig {
            return {"cpp", tree_sitter_cpp, CPP_QUERY};
        }
    });

    registry.register_language({
        "c",
        {"c"},
        []() -> LanguageConfig {
            return {"c", tree_sitter_c, C_QUERY};
        }
    });
}
