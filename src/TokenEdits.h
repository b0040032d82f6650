#pragma once

#include "Types.h"
#include <vector>
#include <string>
#include <expected>

// Splices each edit into the array in order. Fails when an edit reaches past
// the end of the array it is applied to.
std::expected<std::vector<uint32_t>, std::string> apply_token_edits(
    std::vector<uint32_t> tokens, const std::vector<SemanticTokensEdit>& edits);

// Single splice turning old_tokens into new_tokens, empty when they match.
std::vector<SemanticTokensEdit> compute_token_edits(const std::vector<uint32_t>& old_tokens,
                                                    const std::vector<uint32_t>& new_tokens);
