#pragma once

#include "Types.h"
#include "Cancellation.h"
#include "HighlightError.h"
#include <functional>
#include <variant>
#include <cstdint>

class TextDocument;

enum class ProviderCapability : uint8_t {
    Full = 1 << 0,
    Range = 1 << 1,
    Edits = 1 << 2
};

using ProviderCapabilities = uint8_t;

constexpr ProviderCapabilities operator|(ProviderCapability a, ProviderCapability b) {
    return static_cast<ProviderCapabilities>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

constexpr ProviderCapabilities operator|(ProviderCapabilities a, ProviderCapability b) {
    return static_cast<ProviderCapabilities>(a | static_cast<uint8_t>(b));
}

constexpr bool has_capability(ProviderCapabilities set, ProviderCapability cap) {
    return (set & static_cast<uint8_t>(cap)) != 0;
}

using TokensOrDelta = std::variant<SemanticTokens, SemanticTokensDelta>;

// A language-analysis source of encoded semantic tokens. Calls complete
// through the callback, possibly later from the scheduler.
class SemanticTokensProvider {
public:
    using TokensCallback = std::function<void(ProviderResult<SemanticTokens> result)>;
    using EditsCallback = std::function<void(ProviderResult<TokensOrDelta> result)>;

    virtual ~SemanticTokensProvider() = default;

    virtual ProviderCapabilities capabilities() const = 0;
    virtual const SemanticTokensLegend& legend() const = 0;

    virtual void provide_full(const TextDocument& doc, CancellationToken token, TokensCallback done) = 0;

    virtual void provide_edits(const TextDocument& /*doc*/, const std::string& /*previous_result_id*/,
                               CancellationToken /*token*/, EditsCallback done) {
        done(std::optional<TokensOrDelta>{});
    }

    virtual void provide_range(const TextDocument& /*doc*/, TextRange /*range*/,
                               CancellationToken /*token*/, TokensCallback done) {
        done(std::optional<SemanticTokens>{});
    }
};
