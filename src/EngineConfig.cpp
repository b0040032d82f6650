#include "EngineConfig.h"
#include "HighlightGroups.h"

EngineConfig EngineConfig::from_store(const ConfigStore& store, const std::string& filetype) {
    EngineConfig defaults;
    EngineConfig config;
    config.enable = store.get_bool(CONFIG_SECTION, filetype, "enable", defaults.enable);
    config.highlight_priority = store.get_int(CONFIG_SECTION, filetype, "highlightPriority",
                                              defaults.highlight_priority);
    config.increment_types = store.get_list(CONFIG_SECTION, filetype, "incrementTypes",
                                            defaults.increment_types);
    config.combined_modifiers = store.get_list(CONFIG_SECTION, filetype, "combinedModifiers",
                                               defaults.combined_modifiers);
    return config;
}

StaticConfig StaticConfig::from_store(const ConfigStore& store) {
    StaticConfig config;
    if (store.has(CONFIG_SECTION, "", "filetypes")) {
        config.filetypes = store.get_list(CONFIG_SECTION, "", "filetypes", {});
    }
    config.highlight_groups = store.get_list(CONFIG_SECTION, "", "highlightGroups", default_highlight_groups());
    return config;
}
