#pragma once

#include "Types.h"
#include <vector>
#include <cstdint>

// Single-line token with UTF-16 columns and legend indices.
struct EncodedToken {
    uint32_t start = 0;
    uint32_t end = 0;
    uint32_t type = 0;
    uint32_t modifiers = 0;
};

// Collects absolute tokens and encodes them into the five-integer relative
// form. A token overlapping ones already added on its line is sliced around
// them, so the first token added for a cell wins.
class SemanticTokenBuilder {
public:
    explicit SemanticTokenBuilder(LineIdx line_count);

    void add(LineIdx line, EncodedToken token);
    std::vector<uint32_t> build();
    size_t size() const { return count_; }

private:
    std::vector<std::vector<EncodedToken>> tokens_by_line_;
    size_t count_ = 0;
};
