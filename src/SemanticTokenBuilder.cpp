#include "SemanticTokenBuilder.h"
#include <algorithm>
#include <utility>

SemanticTokenBuilder::SemanticTokenBuilder(LineIdx line_count)
    : tokens_by_line_(static_cast<size_t>(std::max<LineIdx>(line_count, 0))) {}

void SemanticTokenBuilder::add(LineIdx line, EncodedToken token) {
    if (token.start >= token.end) return;
    if (line < 0 || static_cast<size_t>(line) >= tokens_by_line_.size()) return;

    auto& line_tokens = tokens_by_line_[line];

    std::vector<std::pair<uint32_t, uint32_t>> occupied;
    for (const auto& t : line_tokens) {
        if (t.start < token.end && t.end > token.start) {
            occupied.push_back({t.start, t.end});
        }
    }

    if (occupied.empty()) {
        line_tokens.push_back(token);
        count_++;
        return;
    }

    std::sort(occupied.begin(), occupied.end());

    uint32_t pos = token.start;
    for (const auto& [occ_start, occ_end] : occupied) {
        if (pos < occ_start) {
            line_tokens.push_back({pos, occ_start, token.type, token.modifiers});
            count_++;
        }
        pos = std::max(pos, occ_end);
    }
    if (pos < token.end) {
        line_tokens.push_back({pos, token.end, token.type, token.modifiers});
        count_++;
    }
}

std::vector<uint32_t> SemanticTokenBuilder::build() {
    std::vector<uint32_t> data;
    data.reserve(count_ * 5);

    uint32_t prev_line = 0;
    uint32_t prev_char = 0;

    for (size_t line = 0; line < tokens_by_line_.size(); ++line) {
        auto& line_tokens = tokens_by_line_[line];
        std::sort(line_tokens.begin(), line_tokens.end(),
            [](const EncodedToken& a, const EncodedToken& b) { return a.start < b.start; });

        for (const auto& t : line_tokens) {
            uint32_t delta_line = static_cast<uint32_t>(line) - prev_line;
            uint32_t delta_char = (delta_line == 0) ? (t.start - prev_char) : t.start;

            data.push_back(delta_line);
            data.push_back(delta_char);
            data.push_back(t.end - t.start);
            data.push_back(t.type);
            data.push_back(t.modifiers);

            prev_line = static_cast<uint32_t>(line);
            prev_char = t.start;
        }
    }
    return data;
}
