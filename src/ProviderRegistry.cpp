#include "ProviderRegistry.h"
#include "TextDocument.h"
#include "Utils.h"

void ProviderRegistry::register_provider(std::vector<std::string> filetypes,
                                         std::shared_ptr<SemanticTokensProvider> provider) {
    if (!provider) return;
    entries_.push_back({std::move(filetypes), std::move(provider)});
}

SemanticTokensProvider* ProviderRegistry::find(const TextDocument& doc, ProviderCapability cap) const {
    for (const auto& entry : entries_) {
        if (!contains(entry.filetypes, "*") && !contains(entry.filetypes, doc.filetype)) continue;
        if (has_capability(entry.provider->capabilities(), cap)) {
            return entry.provider.get();
        }
    }
    return nullptr;
}

bool ProviderRegistry::has_provider(const TextDocument& doc, ProviderCapability cap) const {
    return find(doc, cap) != nullptr;
}

// Edits are only meaningful from the provider that serves full requests.
bool ProviderRegistry::has_edit_provider(const TextDocument& doc) const {
    SemanticTokensProvider* full = find(doc, ProviderCapability::Full);
    return full && has_capability(full->capabilities(), ProviderCapability::Edits);
}

std::optional<SemanticTokensLegend> ProviderRegistry::get_legend(const TextDocument& doc, bool range_only) const {
    SemanticTokensProvider* provider = find(doc, range_only ? ProviderCapability::Range : ProviderCapability::Full);
    if (!provider) return std::nullopt;
    return provider->legend();
}

void ProviderRegistry::request_full(const TextDocument& doc, CancellationToken token,
                                    SemanticTokensProvider::TokensCallback done) const {
    SemanticTokensProvider* provider = find(doc, ProviderCapability::Full);
    if (!provider) {
        done(std::optional<SemanticTokens>{});
        return;
    }
    provider->provide_full(doc, std::move(token), std::move(done));
}

void ProviderRegistry::request_edits(const TextDocument& doc, const std::string& previous_result_id,
                                     CancellationToken token, SemanticTokensProvider::EditsCallback done) const {
    if (!has_edit_provider(doc)) {
        done(std::optional<TokensOrDelta>{});
        return;
    }
    find(doc, ProviderCapability::Full)->provide_edits(doc, previous_result_id, std::move(token), std::move(done));
}

void ProviderRegistry::request_range(const TextDocument& doc, TextRange range, CancellationToken token,
                                     SemanticTokensProvider::TokensCallback done) const {
    SemanticTokensProvider* provider = find(doc, ProviderCapability::Range);
    if (!provider) {
        done(std::optional<SemanticTokens>{});
        return;
    }
    provider->provide_range(doc, range, std::move(token), std::move(done));
}
