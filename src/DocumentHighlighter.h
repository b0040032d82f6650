#pragma once

#include "Types.h"
#include "Cancellation.h"
#include "Scheduler.h"
#include "Emitter.h"
#include "EngineConfig.h"
#include "HighlightError.h"
#include "HighlightGroups.h"
#include "PaintedRegions.h"
#include "TokenDecoder.h"
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

class TextDocument;
class ProviderRegistry;
class HighlightRenderer;
class Viewport;
class MessageSink;

enum class HighlightState {
    Idle,
    RequestingFull,
    RequestingRange,
    Applying
};

const char* to_string(HighlightState state);

// Collaborators shared by every document. None of them is owned.
struct HighlightContext {
    Scheduler& scheduler;
    const ProviderRegistry& providers;
    HighlightRenderer& renderer;
    const Viewport& viewport;
    const ConfigStore& config_store;
    const StaticConfig& static_config;
    const HostEnvironment& host;
    MessageSink* messages = nullptr;
};

// Cache slot whose payload is only visible for the version it was stored with.
template <typename T>
class VersionedSlot {
public:
    const T* get(DocVersion version) const {
        if (!value_ || version_ != version) return nullptr;
        return &*value_;
    }

    T* get_mut(DocVersion version) {
        if (!value_ || version_ != version) return nullptr;
        return &*value_;
    }

    void set(DocVersion version, T value) {
        version_ = version;
        value_ = std::move(value);
    }

    void reset() { value_.reset(); }
    bool has_value() const { return value_.has_value(); }

private:
    DocVersion version_ = -1;
    std::optional<T> value_;
};

// Raw payload of the last full or delta response, kept to splice the next delta into.
struct PreviousResult {
    DocVersion version = 0;
    std::optional<std::string> result_id;
    std::vector<uint32_t> tokens;
};

// Semantic highlight state of one open document.
//
// Two cancellation scopes run side by side:
//  - the full scope (token_source_) covers do_highlight and its continuations
//    and is the only writer of previous_, version_ and of highlights_ when a
//    whole-document provider exists;
//  - the range scope (range_token_source_) covers cursor-driven passes. It
//    writes highlights_ only when no whole-document result exists yet, merging
//    by line, and repaints through regions_.
class DocumentHighlighter {
public:
    using WaitCallback = std::function<void(std::expected<void, HighlightError> result)>;

    DocumentHighlighter(TextDocument& doc, HighlightContext ctx);
    ~DocumentHighlighter();

    DocumentHighlighter(const DocumentHighlighter&) = delete;
    DocumentHighlighter& operator=(const DocumentHighlighter&) = delete;

    TextDocument& document() { return doc_; }
    const TextDocument& document() const { return doc_; }
    const EngineConfig& config() const { return config_; }
    void load_configuration();

    bool config_enabled() const;
    bool has_provider() const;
    bool has_legend() const;
    bool range_provider_only() const;
    bool should_range_highlight() const;
    bool enabled() const;
    std::expected<void, HighlightError> check_state() const;

    // Decoded spans, only while they match the document version.
    const std::vector<TokenSpan>* highlights() const;
    bool has_previous_result() const { return previous_.has_value(); }
    const PaintedRegions& painted_regions() const { return regions_; }
    bool dirty() const { return dirty_; }
    std::optional<DocVersion> applied_version() const { return version_; }
    HighlightState state() const { return state_; }
    HighlightState range_state() const { return range_state_; }

    void highlight() { highlight_task_.schedule(); }
    void highlight(Uint32 delay_ms) { highlight_task_.schedule(delay_ms); }
    bool highlight_pending() const { return highlight_task_.is_pending(); }

    void on_change();
    void on_text_change();
    void on_cursor_moved();
    void on_shown();

    void force_highlight();
    void do_highlight(bool force_full = false, bool on_shown = false);
    void do_range_highlight(CancellationToken token, std::function<void()> done = {});
    void highlight_regions(const CancellationToken& token, bool skip_check = false);

    void clear_highlight();
    void abandon_result();
    void cancel(bool range_only = false);
    void dispose();

    SubscriptionId on_did_refresh(std::function<void()> listener) { return refreshed_.subscribe(std::move(listener)); }
    void unsubscribe(SubscriptionId id) { refreshed_.unsubscribe(id); }
    // Resolves on the next refresh. Fails when a full request fails or after
    // WAIT_REFRESH_TIMEOUT_MS.
    void wait_refresh(WaitCallback done);

    std::vector<HighlightItem> to_highlight_items(const std::vector<TokenSpan>& spans,
                                                  std::optional<LineRange> range = std::nullopt) const;

private:
    using SpansCallback = std::function<void(std::optional<std::vector<TokenSpan>> spans)>;

    struct Waiter {
        bool settled = false;
        SubscriptionId subscription = 0;
        TimerId timer = 0;
        WaitCallback done;
    };

    TextDocument& doc_;
    HighlightContext ctx_;
    EngineConfig config_;
    bool config_loaded_ = false;
    HighlightGroupResolver resolver_;
    TokenDecoder decoder_;

    VersionedSlot<std::vector<TokenSpan>> highlights_;
    std::optional<PreviousResult> previous_;
    PaintedRegions regions_;
    bool dirty_ = false;
    std::optional<DocVersion> version_;

    CancellationSourcePtr token_source_;
    CancellationSourcePtr range_token_source_;
    DebouncedTask highlight_task_;
    TimerId cursor_timer_ = 0;

    HighlightState state_ = HighlightState::Idle;
    HighlightState range_state_ = HighlightState::Idle;

    Emitter<> refreshed_;
    std::vector<std::shared_ptr<Waiter>> waiters_;
    bool disposed_ = false;

    void request_and_apply(const CancellationToken& token, bool force_full);
    void request_all_highlights(const CancellationToken& token, bool force_full, SpansCallback done);
    void apply_highlights(const CancellationToken& token, DocVersion version);
    void apply_range_highlights(const CancellationToken& token, DocVersion version, LineRange region,
                                std::vector<TokenSpan> spans);

    template <typename T>
    std::optional<T> take_result(ProviderResult<T>&& result, const CancellationToken& token, bool range = false);
    void report_failure(const HighlightError& error);
    void log_discarded(const HighlightError& error) const;
    void fail_waiters(const HighlightError& error);
    void settle_waiter(const std::shared_ptr<Waiter>& waiter, std::expected<void, HighlightError> result);
};
