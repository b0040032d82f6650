#pragma once

#include "SemanticTokensProvider.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Read-only lookup of providers by document filetype. A filetype list
// containing "*" matches every document.
class ProviderRegistry {
public:
    void register_provider(std::vector<std::string> filetypes, std::shared_ptr<SemanticTokensProvider> provider);
    void clear() { entries_.clear(); }

    bool has_provider(const TextDocument& doc, ProviderCapability cap) const;
    bool has_full_provider(const TextDocument& doc) const { return has_provider(doc, ProviderCapability::Full); }
    bool has_range_provider(const TextDocument& doc) const { return has_provider(doc, ProviderCapability::Range); }
    bool has_edit_provider(const TextDocument& doc) const;

    std::optional<SemanticTokensLegend> get_legend(const TextDocument& doc, bool range_only = false) const;

    void request_full(const TextDocument& doc, CancellationToken token,
                      SemanticTokensProvider::TokensCallback done) const;
    void request_edits(const TextDocument& doc, const std::string& previous_result_id, CancellationToken token,
                       SemanticTokensProvider::EditsCallback done) const;
    void request_range(const TextDocument& doc, TextRange range, CancellationToken token,
                       SemanticTokensProvider::TokensCallback done) const;

private:
    struct Entry {
        std::vector<std::string> filetypes;
        std::shared_ptr<SemanticTokensProvider> provider;
    };

    std::vector<Entry> entries_;

    SemanticTokensProvider* find(const TextDocument& doc, ProviderCapability cap) const;
};
