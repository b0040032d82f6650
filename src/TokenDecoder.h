#pragma once

#include "Types.h"
#include "Cancellation.h"
#include "Scheduler.h"
#include "Constants.h"
#include <vector>
#include <optional>
#include <functional>

class TextDocument;
class HighlightGroupResolver;

// Turns the five-integer relative encoding into absolute single-line spans.
// Columns arrive in UTF-16 units and leave as byte offsets into the
// document's current line text.
class TokenDecoder {
public:
    using Callback = std::function<void(std::optional<std::vector<TokenSpan>> spans)>;

    explicit TokenDecoder(Scheduler& scheduler, Uint32 yield_every_ms = YIELD_EVERY_MS)
        : scheduler_(scheduler), yield_every_ms_(yield_every_ms) {}

    // Decodes in batches and yields to the scheduler whenever a batch has run
    // longer than the yield budget. Cancellation observed after a yield ends
    // the job with nullopt; a partial result is never delivered. May complete
    // before returning when the input is small.
    void decode(std::vector<uint32_t> data, const SemanticTokensLegend& legend,
                const TextDocument& doc, const HighlightGroupResolver& resolver,
                CancellationToken token, Callback done);

    static std::vector<TokenSpan> decode_all(const std::vector<uint32_t>& data, const SemanticTokensLegend& legend,
                                             const TextDocument& doc, const HighlightGroupResolver& resolver);

private:
    Scheduler& scheduler_;
    Uint32 yield_every_ms_;
};
