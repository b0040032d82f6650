#pragma once

#include "Types.h"
#include "HandleTypes.h"
#include <string>
#include <unordered_map>
#include <vector>
#include <functional>
#include <memory>
#include <optional>

using LanguageFactory = const TSLanguage* (*)();

struct LanguageConfig {
    std::string name;
    LanguageFactory factory;
    const char* query_source;
};

struct LanguageDefinition {
    std::string id;
    std::vector<std::string> filetypes;
    std::function<LanguageConfig()> config_factory;
};

// Legend indices a query capture encodes to.
struct CaptureToken {
    uint32_t type = 0;
    uint32_t modifiers = 0;
};

struct LoadedLanguage {
    LanguageConfig config;
    TSQuery* query = nullptr;
    TSQueryPtr query_owned;
    std::vector<std::optional<CaptureToken>> capture_map;
};

class LanguageRegistry {
public:
    static LanguageRegistry& instance();

    void register_language(LanguageDefinition def);
    const LanguageDefinition* find_by_filetype(const std::string& filetype) const;
    LoadedLanguage* get_or_load(const std::string& language_id);
    void unload_all();

private:
    LanguageRegistry() = default;
    ~LanguageRegistry();
    LanguageRegistry(const LanguageRegistry&) = delete;
    LanguageRegistry& operator=(const LanguageRegistry&) = delete;

    std::vector<LanguageDefinition> definitions_;
    std::unordered_map<std::string, std::string> filetype_to_id_;
    std::unordered_map<std::string, std::unique_ptr<LoadedLanguage>> loaded_;

    void build_capture_map(LoadedLanguage& lang);
};

// Maps a capture name such as "function.builtin" to legend indices, falling
// back to shorter dotted prefixes.
std::optional<CaptureToken> capture_to_token(const std::string& capture_name);

void register_all_languages();
