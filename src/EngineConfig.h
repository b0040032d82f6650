#pragma once

#include "ConfigStore.h"
#include "Constants.h"
#include <string>
#include <vector>
#include <optional>

// Reloadable per-document settings of the semanticTokens feature.
struct EngineConfig {
    bool enable = false;
    int highlight_priority = DEFAULT_HIGHLIGHT_PRIORITY;
    std::vector<std::string> increment_types = {"variable", "string", "parameter"};
    std::vector<std::string> combined_modifiers = {"deprecated"};

    static EngineConfig from_store(const ConfigStore& store, const std::string& filetype);
};

// Fixed for the lifetime of the service.
struct StaticConfig {
    // When set, overrides `enable`. "*" matches every filetype.
    std::optional<std::vector<std::string>> filetypes;
    std::vector<std::string> highlight_groups;

    static StaticConfig from_store(const ConfigStore& store);
};

struct HostEnvironment {
    // Host can update highlights incrementally.
    bool update_highlight = true;
};
