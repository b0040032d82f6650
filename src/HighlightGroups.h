#pragma once

#include "Types.h"
#include <string>
#include <vector>
#include <unordered_set>
#include <optional>

struct GroupResolution {
    std::optional<std::string> group;
    bool combine = false;
};

// Picks a highlight group for a token. Most specific wins:
// prefix+Modifier+Type, then prefix+Modifier, then prefix+Type.
class HighlightGroupResolver {
public:
    explicit HighlightGroupResolver(const std::vector<std::string>& available_groups);

    void set_combined_modifiers(std::vector<std::string> modifiers) { combined_modifiers_ = std::move(modifiers); }
    const std::vector<std::string>& combined_modifiers() const { return combined_modifiers_; }

    GroupResolution resolve(const std::string& token_type, const std::vector<std::string>& modifiers) const;

    bool has_group(const std::string& name) const { return groups_.contains(name); }
    bool empty() const { return groups_.empty(); }

private:
    std::unordered_set<std::string> groups_;
    std::vector<std::string> combined_modifiers_;
};

const std::vector<std::string>& standard_token_types();
const std::vector<std::string>& standard_token_modifiers();
std::vector<std::string> default_highlight_groups();
