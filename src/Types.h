#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

using LineIdx = int32_t;
using ColIdx = int32_t;
using DocVersion = int64_t;
using BufferId = int32_t;

struct TextPos {
    LineIdx line = 0;
    ColIdx col = 0;

    auto operator<=>(const TextPos&) const = default;
};

struct TextRange {
    TextPos start;
    TextPos end;

    auto operator<=>(const TextRange&) const = default;

    bool is_empty() const { return start == end; }
};

// Half-open [start, end) line interval.
struct LineRange {
    LineIdx start = 0;
    LineIdx end = 0;

    auto operator<=>(const LineRange&) const = default;

    bool is_empty() const { return end <= start; }
    bool contains(LineIdx line) const { return line >= start && line < end; }
};

struct SemanticTokensLegend {
    std::vector<std::string> token_types;
    std::vector<std::string> token_modifiers;
};

// Flat relative-delta encoding, five integers per token.
struct SemanticTokens {
    std::optional<std::string> result_id;
    std::vector<uint32_t> data;
};

struct SemanticTokensEdit {
    uint32_t start = 0;
    uint32_t delete_count = 0;
    std::vector<uint32_t> data;
};

struct SemanticTokensDelta {
    std::optional<std::string> result_id;
    std::vector<SemanticTokensEdit> edits;
};

// Single line only. Columns are byte offsets into the line.
struct TokenSpan {
    LineIdx line = 0;
    ColIdx col_start = 0;
    ColIdx col_end = 0;
    std::string token_type;
    std::vector<std::string> token_modifiers;
    std::optional<std::string> group;
    bool combine = false;

    bool operator==(const TokenSpan&) const = default;
};

struct HighlightItem {
    LineIdx line = 0;
    ColIdx col_start = 0;
    ColIdx col_end = 0;
    std::string group;
    bool combine = false;
    bool extend_start = false;
    bool extend_end = false;

    bool operator==(const HighlightItem&) const = default;
};
