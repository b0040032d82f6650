#pragma once

#include "SemanticTokensProvider.h"
#include "LanguageRegistry.h"
#include "HandleTypes.h"
#include "Scheduler.h"
#include <expected>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Semantic tokens computed in process from a tree-sitter parse and the
// language's highlight query. Requests run on the scheduler, never inside
// the provide_* call.
class SyntaxTokenProvider : public SemanticTokensProvider {
public:
    explicit SyntaxTokenProvider(Scheduler& scheduler, LanguageRegistry& registry = LanguageRegistry::instance());

    ProviderCapabilities capabilities() const override {
        return ProviderCapability::Full | ProviderCapability::Range | ProviderCapability::Edits;
    }
    const SemanticTokensLegend& legend() const override { return legend_; }

    void provide_full(const TextDocument& doc, CancellationToken token, TokensCallback done) override;
    void provide_edits(const TextDocument& doc, const std::string& previous_result_id, CancellationToken token,
                       EditsCallback done) override;
    void provide_range(const TextDocument& doc, TextRange range, CancellationToken token,
                       TokensCallback done) override;

    bool supports(const std::string& filetype) const { return registry_.find_by_filetype(filetype) != nullptr; }

    // Encoded tokens for the document, limited to `lines` when given.
    std::expected<std::vector<uint32_t>, ProviderError> compute_tokens(const TextDocument& doc,
                                                                       std::optional<LineRange> lines,
                                                                       const CancellationToken& token);
    void forget(BufferId id) { results_.erase(id); }

private:
    struct LastResult {
        std::string result_id;
        std::vector<uint32_t> tokens;
    };

    Scheduler& scheduler_;
    LanguageRegistry& registry_;
    SemanticTokensLegend legend_;
    TSParserPtr parser_;
    std::unordered_map<BufferId, LastResult> results_;
    uint64_t next_result_id_ = 1;

    std::string remember(BufferId id, const std::vector<uint32_t>& tokens);
};
