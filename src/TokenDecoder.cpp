#include "TokenDecoder.h"
#include "TextDocument.h"
#include "HighlightGroups.h"
#include "Utils.h"
#include <limits>
#include <memory>

namespace {

constexpr size_t TOKEN_STRIDE = 5;

struct DecodeCursor {
    size_t index = 0;
    LineIdx line = 0;
    uint32_t character = 0;
};

struct DecodeJob {
    std::vector<uint32_t> data;
    SemanticTokensLegend legend;
    const TextDocument* doc;
    const HighlightGroupResolver* resolver;
    CancellationToken token;
    TokenDecoder::Callback done;
    Scheduler* scheduler;
    Uint32 yield_every_ms;
    DecodeCursor cursor;
    std::vector<TokenSpan> spans;
};

bool has_next(const DecodeCursor& cursor, const std::vector<uint32_t>& data) {
    return cursor.index + TOKEN_STRIDE <= data.size();
}

void decode_one(DecodeCursor& cursor, const std::vector<uint32_t>& data, const SemanticTokensLegend& legend,
                const TextDocument& doc, const HighlightGroupResolver& resolver, std::vector<TokenSpan>& out) {
    const uint32_t* group = data.data() + cursor.index;
    uint32_t delta_line = group[0];
    uint32_t delta_start = group[1];
    uint32_t length = group[2];
    uint32_t type_index = group[3];
    uint32_t modifier_bits = group[4];
    cursor.index += TOKEN_STRIDE;

    int64_t line = static_cast<int64_t>(cursor.line) + delta_line;
    if (line > std::numeric_limits<LineIdx>::max()) {
        SDL_LogWarn(LOG_CATEGORY_SEMANTIC, "Token line %lld is out of range, dropping the remaining tokens",
                    static_cast<long long>(line));
        cursor.index = data.size();
        return;
    }
    cursor.line = static_cast<LineIdx>(line);
    cursor.character = delta_line == 0 ? cursor.character + delta_start : delta_start;
    uint32_t end_character = cursor.character + length;

    TokenSpan span;
    span.line = cursor.line;
    if (type_index < legend.token_types.size()) {
        span.token_type = legend.token_types[type_index];
    }
    for (size_t m = 0; m < legend.token_modifiers.size() && m < 32; ++m) {
        if (modifier_bits & (1u << m)) {
            span.token_modifiers.push_back(legend.token_modifiers[m]);
        }
    }

    GroupResolution resolution = resolver.resolve(span.token_type, span.token_modifiers);
    span.group = std::move(resolution.group);
    span.combine = resolution.combine;

    const std::string& text = doc.get_line(cursor.line);
    span.col_start = utf16_to_byte_offset(text, cursor.character);
    span.col_end = utf16_to_byte_offset(text, end_character);

    out.push_back(std::move(span));
}

void run_job(const std::shared_ptr<DecodeJob>& job) {
    Uint32 tick_start = job->scheduler->now();

    // Every batch decodes at least one token before checking the budget.
    while (has_next(job->cursor, job->data)) {
        decode_one(job->cursor, job->data, job->legend, *job->doc, *job->resolver, job->spans);
        if (has_next(job->cursor, job->data) && job->scheduler->now() - tick_start > job->yield_every_ms) {
            job->scheduler->post([job] {
                if (job->token.is_cancellation_requested()) {
                    job->done(std::nullopt);
                    return;
                }
                run_job(job);
            });
            return;
        }
    }

    if (job->token.is_cancellation_requested()) {
        job->done(std::nullopt);
        return;
    }
    job->done(std::move(job->spans));
}

}

void TokenDecoder::decode(std::vector<uint32_t> data, const SemanticTokensLegend& legend,
                          const TextDocument& doc, const HighlightGroupResolver& resolver,
                          CancellationToken token, Callback done) {
    auto job = std::make_shared<DecodeJob>(DecodeJob{
        .data = std::move(data),
        .legend = legend,
        .doc = &doc,
        .resolver = &resolver,
        .token = std::move(token),
        .done = std::move(done),
        .scheduler = &scheduler_,
        .yield_every_ms = yield_every_ms_,
        .cursor = {},
        .spans = {}
    });
    job->spans.reserve(job->data.size() / TOKEN_STRIDE);
    run_job(job);
}

std::vector<TokenSpan> TokenDecoder::decode_all(const std::vector<uint32_t>& data, const SemanticTokensLegend& legend,
                                                const TextDocument& doc, const HighlightGroupResolver& resolver) {
    std::vector<TokenSpan> spans;
    spans.reserve(data.size() / TOKEN_STRIDE);
    DecodeCursor cursor;
    while (has_next(cursor, data)) {
        decode_one(cursor, data, legend, doc, resolver, spans);
    }
    return spans;
}
