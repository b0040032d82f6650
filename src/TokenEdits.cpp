#include "TokenEdits.h"
#include <format>
#include <algorithm>

std::expected<std::vector<uint32_t>, std::string> apply_token_edits(
    std::vector<uint32_t> tokens, const std::vector<SemanticTokensEdit>& edits) {
    for (const auto& edit : edits) {
        size_t size = tokens.size();
        if (edit.start > size || static_cast<size_t>(edit.start) + edit.delete_count > size) {
            return std::unexpected(std::format("edit [{}, +{}) out of bounds for {} tokens",
                                               edit.start, edit.delete_count, size));
        }
        auto first = tokens.begin() + edit.start;
        first = tokens.erase(first, first + edit.delete_count);
        tokens.insert(first, edit.data.begin(), edit.data.end());
    }
    return tokens;
}

std::vector<SemanticTokensEdit> compute_token_edits(const std::vector<uint32_t>& old_tokens,
                                                    const std::vector<uint32_t>& new_tokens) {
    size_t prefix = 0;
    size_t max_prefix = std::min(old_tokens.size(), new_tokens.size());
    while (prefix < max_prefix && old_tokens[prefix] == new_tokens[prefix]) {
        prefix++;
    }
    if (prefix == old_tokens.size() && prefix == new_tokens.size()) {
        return {};
    }

    size_t suffix = 0;
    size_t max_suffix = max_prefix - prefix;
    while (suffix < max_suffix &&
           old_tokens[old_tokens.size() - 1 - suffix] == new_tokens[new_tokens.size() - 1 - suffix]) {
        suffix++;
    }

    SemanticTokensEdit edit;
    edit.start = static_cast<uint32_t>(prefix);
    edit.delete_count = static_cast<uint32_t>(old_tokens.size() - prefix - suffix);
    edit.data.assign(new_tokens.begin() + prefix, new_tokens.end() - suffix);
    return {edit};
}
