#include "SyntaxTokenProvider.h"
#include "SemanticTokenBuilder.h"
#include "HighlightGroups.h"
#include "TokenEdits.h"
#include "TextDocument.h"
#include "Constants.h"
#include "Utils.h"
#include <SDL2/SDL.h>
#include <algorithm>
#include <format>

namespace {

// Tree-sitter tracks the row and byte column of every read, so the document
// lines are served directly without an offset index.
const char* read_document_chunk(void* payload, uint32_t /*byte_index*/, TSPoint position, uint32_t* bytes_read) {
    auto* doc = static_cast<const TextDocument*>(payload);
    if (position.row >= static_cast<uint32_t>(doc->line_count())) {
        *bytes_read = 0;
        return "";
    }

    const std::string& line = doc->get_line(static_cast<LineIdx>(position.row));

    if (position.column < line.size()) {
        *bytes_read = static_cast<uint32_t>(line.size() - position.column);
        return line.data() + position.column;
    }

    if (position.column == line.size()) {
        static const char newline = '\n';
        *bytes_read = 1;
        return &newline;
    }

    *bytes_read = 0;
    return "";
}

ProviderError cancelled_error() {
    return ProviderError{.cancelled = true, .message = "Request cancelled"};
}

}

SyntaxTokenProvider::SyntaxTokenProvider(Scheduler& scheduler, LanguageRegistry& registry)
    : scheduler_(scheduler),
      registry_(registry),
      legend_{standard_token_types(), standard_token_modifiers()},
      parser_(ts_parser_new()) {}

std::string SyntaxTokenProvider::remember(BufferId id, const std::vector<uint32_t>& tokens) {
    std::string result_id = std::to_string(next_result_id_++);
    results_[id] = LastResult{result_id, tokens};
    return result_id;
}

std::expected<std::vector<uint32_t>, ProviderError> SyntaxTokenProvider::compute_tokens(
    const TextDocument& doc, std::optional<LineRange> lines, const CancellationToken& token) {
    const LanguageDefinition* def = registry_.find_by_filetype(doc.filetype);
    if (!def) {
        return std::unexpected(ProviderError{.message = std::format("No grammar for filetype '{}'", doc.filetype)});
    }
    LoadedLanguage* lang = registry_.get_or_load(def->id);
    if (!lang || !lang->query) {
        return std::unexpected(ProviderError{.message = std::format("Highlight query unavailable for {}", def->id)});
    }
    if (!ts_parser_set_language(parser_.get(), lang->config.factory())) {
        return std::unexpected(ProviderError{.message = std::format("Incompatible grammar for {}", def->id)});
    }

    TSInput input;
    input.payload = const_cast<TextDocument*>(&doc);
    input.read = read_document_chunk;
    input.encoding = TSInputEncodingUTF8;

    ts_parser_set_cancellation_flag(parser_.get(), token.flag());
    TSTreePtr tree(ts_parser_parse(parser_.get(), nullptr, input));
    ts_parser_set_cancellation_flag(parser_.get(), nullptr);

    if (!tree) {
        ts_parser_reset(parser_.get());
        if (token.is_cancellation_requested()) return std::unexpected(cancelled_error());
        return std::unexpected(ProviderError{.message = std::format("Failed to parse buffer {}", doc.id())});
    }

    LineIdx line_count = doc.line_count();
    SemanticTokenBuilder builder(line_count);

    TSQueryCursorPtr cursor(ts_query_cursor_new());
    if (lines) {
        ts_query_cursor_set_point_range(cursor.get(),
            TSPoint{static_cast<uint32_t>(lines->start), 0}, TSPoint{static_cast<uint32_t>(lines->end), 0});
    }
    ts_query_cursor_exec(cursor.get(), lang->query, ts_tree_root_node(tree.get()));

    TSQueryMatch match;
    uint32_t capture_index;
    while (ts_query_cursor_next_capture(cursor.get(), &match, &capture_index)) {
        const TSQueryCapture& capture = match.captures[capture_index];
        if (capture.index >= lang->capture_map.size()) continue;
        const auto& kind = lang->capture_map[capture.index];
        if (!kind) continue;

        TSPoint start = ts_node_start_point(capture.node);
        TSPoint end = ts_node_end_point(capture.node);

        // Multi-line nodes are split into one token per line.
        for (uint32_t row = start.row; row <= end.row && row < static_cast<uint32_t>(line_count); row++) {
            LineIdx line_idx = static_cast<LineIdx>(row);
            if (lines && !lines->contains(line_idx)) continue;

            const std::string& text = doc.get_line(line_idx);
            uint32_t line_len = static_cast<uint32_t>(text.size());
            uint32_t col_start = std::min(row == start.row ? start.column : 0u, line_len);
            uint32_t col_end = std::min(row == end.row ? end.column : line_len, line_len);
            if (col_start >= col_end) continue;

            builder.add(line_idx, {
                .start = byte_to_utf16_offset(text, static_cast<ColIdx>(col_start)),
                .end = byte_to_utf16_offset(text, static_cast<ColIdx>(col_end)),
                .type = kind->type,
                .modifiers = kind->modifiers
            });
        }
    }

    SDL_LogVerbose(LOG_CATEGORY_SEMANTIC, "buffer %d: %zu syntax tokens", doc.id(), builder.size());
    return builder.build();
}

void SyntaxTokenProvider::provide_full(const TextDocument& doc, CancellationToken token, TokensCallback done) {
    scheduler_.post([this, &doc, token, done]() {
        if (token.is_cancellation_requested()) {
            done(std::unexpected(cancelled_error()));
            return;
        }
        auto data = compute_tokens(doc, std::nullopt, token);
        if (!data) {
            done(std::unexpected(data.error()));
            return;
        }
        SemanticTokens result;
        result.result_id = remember(doc.id(), *data);
        result.data = std::move(*data);
        done(std::optional<SemanticTokens>(std::move(result)));
    });
}

void SyntaxTokenProvider::provide_edits(const TextDocument& doc, const std::string& previous_result_id,
                                        CancellationToken token, EditsCallback done) {
    scheduler_.post([this, &doc, previous_result_id, token, done]() {
        if (token.is_cancellation_requested()) {
            done(std::unexpected(cancelled_error()));
            return;
        }
        auto data = compute_tokens(doc, std::nullopt, token);
        if (!data) {
            done(std::unexpected(data.error()));
            return;
        }

        auto it = results_.find(doc.id());
        if (it == results_.end() || it->second.result_id != previous_result_id) {
            SemanticTokens result;
            result.result_id = remember(doc.id(), *data);
            result.data = std::move(*data);
            done(std::optional<TokensOrDelta>(std::move(result)));
            return;
        }

        SemanticTokensDelta delta;
        delta.edits = compute_token_edits(it->second.tokens, *data);
        delta.result_id = remember(doc.id(), *data);
        done(std::optional<TokensOrDelta>(std::move(delta)));
    });
}

void SyntaxTokenProvider::provide_range(const TextDocument& doc, TextRange range, CancellationToken token,
                                        TokensCallback done) {
    LineRange lines{range.start.line, range.end.col > 0 ? range.end.line + 1 : range.end.line};
    scheduler_.post([this, &doc, lines, token, done]() {
        if (token.is_cancellation_requested()) {
            done(std::unexpected(cancelled_error()));
            return;
        }
        auto data = compute_tokens(doc, lines, token);
        if (!data) {
            done(std::unexpected(data.error()));
            return;
        }
        SemanticTokens result;
        result.data = std::move(*data);
        done(std::optional<SemanticTokens>(std::move(result)));
    });
}
