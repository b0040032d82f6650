#include "DocumentHighlighter.h"
#include "TextDocument.h"
#include "ProviderRegistry.h"
#include "HighlightRenderer.h"
#include "Viewport.h"
#include "TokenEdits.h"
#include "Toast.h"
#include "Constants.h"
#include "Utils.h"
#include <SDL2/SDL.h>
#include <algorithm>
#include <format>
#include <unordered_set>

const char* to_string(HighlightState state) {
    switch (state) {
        case HighlightState::Idle: return "idle";
        case HighlightState::RequestingFull: return "requesting full";
        case HighlightState::RequestingRange: return "requesting range";
        case HighlightState::Applying: return "applying";
    }
    return "unknown";
}

template <typename T>
std::optional<T> DocumentHighlighter::take_result(ProviderResult<T>&& result, const CancellationToken& token,
                                                  bool range) {
    if (result) {
        if (!*result) return std::nullopt;
        return std::move(**result);
    }
    if (token.is_cancellation_requested()) return std::nullopt;

    const ProviderError& error = result.error();
    if (error.cancelled) {
        SDL_LogDebug(LOG_CATEGORY_SEMANTIC, "buffer %d: provider cancelled the request, retrying in %ums",
                     doc_.id(), REQUEST_RETRY_DELAY_MS);
        highlight(REQUEST_RETRY_DELAY_MS);
    } else {
        SDL_LogError(LOG_CATEGORY_SEMANTIC, "buffer %d: semantic tokens %s request failed: %s",
                     doc_.id(), range ? "range" : "full", error.message.c_str());
        HighlightError failure{HighlightErrorKind::ProviderFailure, error.message};
        if (range) {
            range_state_ = HighlightState::Idle;
        } else {
            state_ = HighlightState::Idle;
            fail_waiters(failure);
        }
        report_failure(failure);
    }
    return std::nullopt;
}

DocumentHighlighter::DocumentHighlighter(TextDocument& doc, HighlightContext ctx)
    : doc_(doc),
      ctx_(ctx),
      resolver_(ctx.static_config.highlight_groups),
      decoder_(ctx.scheduler),
      highlight_task_(ctx.scheduler, HIGHLIGHT_DEBOUNCE_MS, [this]() { do_highlight(); }) {
    load_configuration();
    if (has_provider()) highlight();
}

DocumentHighlighter::~DocumentHighlighter() {
    dispose();
}

void DocumentHighlighter::load_configuration() {
    EngineConfig next = EngineConfig::from_store(ctx_.config_store, doc_.filetype);
    bool flipped = config_loaded_ && next.enable != config_.enable;
    config_ = std::move(next);
    config_loaded_ = true;
    resolver_.set_combined_modifiers(config_.combined_modifiers);

    if (!flipped || disposed_) return;
    if (config_.enable) {
        highlight();
    } else {
        cancel();
        clear_highlight();
    }
}

bool DocumentHighlighter::config_enabled() const {
    const auto& filetypes = ctx_.static_config.filetypes;
    if (filetypes) {
        return contains(*filetypes, "*") || contains(*filetypes, doc_.filetype);
    }
    return config_.enable;
}

bool DocumentHighlighter::has_provider() const {
    return ctx_.providers.has_full_provider(doc_) || ctx_.providers.has_range_provider(doc_);
}

bool DocumentHighlighter::has_legend() const {
    return ctx_.providers.get_legend(doc_).has_value() || ctx_.providers.get_legend(doc_, true).has_value();
}

bool DocumentHighlighter::range_provider_only() const {
    return !ctx_.providers.has_full_provider(doc_) && ctx_.providers.has_range_provider(doc_);
}

bool DocumentHighlighter::should_range_highlight() const {
    return ctx_.providers.has_range_provider(doc_) && !previous_.has_value();
}

bool DocumentHighlighter::enabled() const {
    if (disposed_ || !config_enabled() || !ctx_.host.update_highlight) return false;
    return has_legend() && has_provider();
}

std::expected<void, HighlightError> DocumentHighlighter::check_state() const {
    auto unavailable = [](std::string message) {
        return std::unexpected(HighlightError{HighlightErrorKind::ProviderUnavailable, std::move(message)});
    };
    if (!ctx_.host.update_highlight) {
        return unavailable("Can't perform highlight update, host does not support incremental highlight updates");
    }
    if (!config_enabled()) {
        return unavailable(std::format("Semantic tokens highlight not enabled for current filetype: {}",
                                       doc_.filetype.empty() ? "<none>" : doc_.filetype));
    }
    if (ctx_.static_config.highlight_groups.empty()) {
        return unavailable(std::format("Unable to find highlight groups starts with {}", HLGROUP_PREFIX));
    }
    if (!has_provider() || !has_legend()) {
        return unavailable(std::format("SemanticTokens provider not found for {}",
                                       doc_.file_path.empty() ? std::format("buffer {}", doc_.id())
                                                              : doc_.file_path));
    }
    return {};
}

const std::vector<TokenSpan>* DocumentHighlighter::highlights() const {
    return highlights_.get(doc_.version());
}

void DocumentHighlighter::on_change() {
    highlight();
}

void DocumentHighlighter::on_text_change() {
    cancel();
}

void DocumentHighlighter::on_cursor_moved() {
    cancel(true);
    if (!enabled() || doc_.dirty()) return;

    range_token_source_ = std::make_unique<CancellationTokenSource>();
    CancellationToken token = range_token_source_->token();
    cursor_timer_ = ctx_.scheduler.post_delayed(HIGHLIGHT_DEBOUNCE_MS, [this, token]() {
        if (token.is_cancellation_requested()) return;
        cursor_timer_ = 0;
        if (should_range_highlight()) {
            do_range_highlight(token);
        } else {
            highlight_regions(token);
        }
    });
}

void DocumentHighlighter::on_shown() {
    if (should_range_highlight()) return;
    if (doc_.dirty() || version_ == doc_.version()) return;
    do_highlight(false, true);
}

void DocumentHighlighter::force_highlight() {
    clear_highlight();
    cancel();
    do_highlight(true);
}

void DocumentHighlighter::do_highlight(bool force_full, bool on_shown) {
    cancel();
    if (!enabled()) return;

    token_source_ = std::make_unique<CancellationTokenSource>();
    CancellationToken token = token_source_->token();

    if (!on_shown && ctx_.viewport.is_hidden(doc_.id())) return;

    if (should_range_highlight()) {
        range_token_source_ = std::make_unique<CancellationTokenSource>();
        do_range_highlight(range_token_source_->token(), [this, token, force_full]() {
            if (token.is_cancellation_requested() || range_provider_only()) return;
            request_and_apply(token, force_full);
        });
        return;
    }

    request_and_apply(token, force_full);
}

void DocumentHighlighter::request_and_apply(const CancellationToken& token, bool force_full) {
    DocVersion version = doc_.version();
    state_ = HighlightState::RequestingFull;

    auto store_and_apply = [this, token, version](std::optional<std::vector<TokenSpan>> spans) {
        if (token.is_cancellation_requested()) return;
        if (!spans) {
            state_ = HighlightState::Idle;
            return;
        }
        highlights_.set(version, std::move(*spans));
        apply_highlights(token, version);
    };

    // Same version as the last response: reuse the decoded spans, or decode the raw tokens again.
    if (previous_ && previous_->version == version) {
        if (highlights_.get(version)) {
            apply_highlights(token, version);
            return;
        }
        auto legend = ctx_.providers.get_legend(doc_);
        if (!legend) {
            state_ = HighlightState::Idle;
            return;
        }
        decoder_.decode(previous_->tokens, *legend, doc_, resolver_, token, store_and_apply);
        return;
    }

    request_all_highlights(token, force_full, store_and_apply);
}

void DocumentHighlighter::request_all_highlights(const CancellationToken& token, bool force_full,
                                                 SpansCallback done) {
    auto legend = ctx_.providers.get_legend(doc_);
    if (!legend) {
        done(std::nullopt);
        return;
    }

    DocVersion version = doc_.version();
    bool use_edits = !force_full && ctx_.providers.has_edit_provider(doc_) && previous_ && previous_->result_id;

    if (!use_edits) {
        ctx_.providers.request_full(doc_, token,
            [this, token, version, legend = *legend, done](ProviderResult<SemanticTokens> result) {
                if (token.is_cancellation_requested()) return;
                auto payload = take_result(std::move(result), token);
                if (!payload) {
                    done(std::nullopt);
                    return;
                }
                previous_ = PreviousResult{version, payload->result_id, payload->data};
                decoder_.decode(std::move(payload->data), legend, doc_, resolver_, token, done);
            });
        return;
    }

    std::string previous_id = *previous_->result_id;
    ctx_.providers.request_edits(doc_, previous_id, token,
        [this, token, version, previous_id, legend = *legend, done](ProviderResult<TokensOrDelta> result) {
            if (token.is_cancellation_requested()) return;
            auto payload = take_result(std::move(result), token);
            if (!payload) {
                done(std::nullopt);
                return;
            }

            std::optional<std::string> result_id;
            std::vector<uint32_t> tokens;
            if (auto* full = std::get_if<SemanticTokens>(&*payload)) {
                result_id = std::move(full->result_id);
                tokens = std::move(full->data);
            } else {
                auto& delta = std::get<SemanticTokensDelta>(*payload);
                if (doc_.version() != version) {
                    log_discarded({HighlightErrorKind::StaleVersion,
                                   std::format("delta for version {} arrived after an edit", version)});
                    done(std::nullopt);
                    return;
                }
                if (!previous_ || previous_->result_id != previous_id) {
                    SDL_LogWarn(LOG_CATEGORY_SEMANTIC, "buffer %d: delta base %s is gone, requesting full tokens",
                                doc_.id(), previous_id.c_str());
                    previous_.reset();
                    done(std::nullopt);
                    highlight(0);
                    return;
                }
                auto spliced = apply_token_edits(previous_->tokens, delta.edits);
                if (!spliced) {
                    SDL_LogWarn(LOG_CATEGORY_SEMANTIC, "buffer %d: invalid delta (%s), requesting full tokens",
                                doc_.id(), spliced.error().c_str());
                    previous_.reset();
                    done(std::nullopt);
                    highlight(0);
                    return;
                }
                result_id = std::move(delta.result_id);
                tokens = std::move(*spliced);
            }

            previous_ = PreviousResult{version, result_id, tokens};
            decoder_.decode(std::move(tokens), legend, doc_, resolver_, token, done);
        });
}

void DocumentHighlighter::apply_highlights(const CancellationToken& token, DocVersion version) {
    if (token.is_cancellation_requested()) return;
    if (doc_.version() != version) {
        log_discarded({HighlightErrorKind::StaleVersion,
                       std::format("result for version {} discarded, document is at {}", version, doc_.version())});
        state_ = HighlightState::Idle;
        return;
    }
    const auto* spans = highlights_.get(version);
    if (!spans) {
        state_ = HighlightState::Idle;
        return;
    }

    state_ = HighlightState::Applying;
    if (!dirty_ || spans->size() < FULL_APPLY_SPAN_THRESHOLD) {
        auto items = to_highlight_items(*spans);
        auto diff = ctx_.renderer.diff(doc_.id(), HIGHLIGHT_NAMESPACE, items, std::nullopt, token);
        if (token.is_cancellation_requested()) return;
        if (!diff) {
            state_ = HighlightState::Idle;
            return;
        }
        ctx_.renderer.apply(doc_.id(), HIGHLIGHT_NAMESPACE, config_.highlight_priority, *diff, false);
        dirty_ = true;
    } else {
        regions_.clear();
        highlight_regions(token);
        if (token.is_cancellation_requested()) return;
    }
    version_ = version;
    state_ = HighlightState::Idle;
    SDL_LogVerbose(LOG_CATEGORY_SEMANTIC, "buffer %d: %zu spans applied", doc_.id(), spans->size());
    refreshed_.fire();
}

void DocumentHighlighter::do_range_highlight(CancellationToken token, std::function<void()> done) {
    auto finish = [done]() {
        if (done) done();
    };
    if (!enabled() || token.is_cancellation_requested()) {
        finish();
        return;
    }

    auto region = ctx_.viewport.visible_range(doc_.id());
    auto legend = ctx_.providers.get_legend(doc_, true);
    if (!region || !legend) {
        finish();
        return;
    }

    DocVersion version = doc_.version();
    LineIdx end_line = std::min(region->start + ctx_.viewport.screen_lines() * RANGE_REQUEST_HEIGHT_FACTOR,
                                region->end);
    TextRange range{{region->start, 0}, {end_line, 0}};
    LineRange painted = *region;

    range_state_ = HighlightState::RequestingRange;
    ctx_.providers.request_range(doc_, range, token,
        [this, token, version, painted, legend = *legend, finish](ProviderResult<SemanticTokens> result) {
            if (token.is_cancellation_requested()) {
                finish();
                return;
            }
            auto payload = take_result(std::move(result), token, true);
            if (!payload) {
                range_state_ = HighlightState::Idle;
                finish();
                return;
            }
            decoder_.decode(std::move(payload->data), legend, doc_, resolver_, token,
                [this, token, version, painted, finish](std::optional<std::vector<TokenSpan>> spans) {
                    if (token.is_cancellation_requested()) {
                        finish();
                        return;
                    }
                    if (spans) {
                        apply_range_highlights(token, version, painted, std::move(*spans));
                    }
                    range_state_ = HighlightState::Idle;
                    finish();
                });
        });
}

void DocumentHighlighter::apply_range_highlights(const CancellationToken& token, DocVersion version,
                                                 LineRange region, std::vector<TokenSpan> spans) {
    if (doc_.version() != version) {
        log_discarded({HighlightErrorKind::StaleVersion,
                       std::format("range result for version {} discarded, document is at {}",
                                   version, doc_.version())});
        return;
    }

    range_state_ = HighlightState::Applying;
    if (range_provider_only() || !previous_) {
        auto* cached = highlights_.get_mut(version);
        if (!cached) {
            highlights_.set(version, {});
            cached = highlights_.get_mut(version);
        }
        std::unordered_set<LineIdx> used_lines;
        for (const auto& span : *cached) used_lines.insert(span.line);
        for (const auto& span : spans) {
            if (!used_lines.contains(span.line)) cached->push_back(span);
        }
        std::stable_sort(cached->begin(), cached->end(),
            [](const TokenSpan& a, const TokenSpan& b) { return a.line < b.line; });
    }

    auto items = to_highlight_items(spans);
    auto diff = ctx_.renderer.diff(doc_.id(), HIGHLIGHT_NAMESPACE, items, region, token);
    if (!diff || token.is_cancellation_requested()) return;
    ctx_.renderer.apply(doc_.id(), HIGHLIGHT_NAMESPACE, config_.highlight_priority, *diff, true);
    dirty_ = true;

    // Without a whole-document provider this is the only pass that ever completes.
    if (range_provider_only()) refreshed_.fire();
}

void DocumentHighlighter::highlight_regions(const CancellationToken& token, bool skip_check) {
    const auto* spans = highlights();
    if (!spans || token.is_cancellation_requested()) return;

    auto visible = ctx_.viewport.visible_ranges(doc_.id());
    if (visible.empty()) return;

    auto expanded = expand_visible_ranges(visible, ctx_.viewport.screen_lines(), doc_.line_count());
    for (const auto& region : expanded) {
        if (!skip_check && regions_.has(region.start, region.end)) continue;

        auto items = to_highlight_items(*spans, region);
        auto diff = ctx_.renderer.diff(doc_.id(), HIGHLIGHT_NAMESPACE, items, region, token);
        if (token.is_cancellation_requested()) return;
        if (!diff) continue;

        ctx_.renderer.apply(doc_.id(), HIGHLIGHT_NAMESPACE, config_.highlight_priority, *diff, true);
        regions_.add(region.start, region.end);
    }
}

void DocumentHighlighter::clear_highlight() {
    previous_.reset();
    highlights_.reset();
    regions_.clear();
    dirty_ = false;
    version_.reset();
    ctx_.renderer.clear_namespace(doc_.id(), HIGHLIGHT_NAMESPACE);
}

void DocumentHighlighter::abandon_result() {
    previous_.reset();
}

void DocumentHighlighter::cancel(bool range_only) {
    if (cursor_timer_) {
        ctx_.scheduler.cancel(cursor_timer_);
        cursor_timer_ = 0;
    }
    cancel_and_dispose(range_token_source_);
    range_state_ = HighlightState::Idle;
    if (range_only) return;

    highlight_task_.cancel();
    cancel_and_dispose(token_source_);
    regions_.clear();
    state_ = HighlightState::Idle;
}

void DocumentHighlighter::dispose() {
    if (disposed_) return;
    disposed_ = true;
    cancel();
    clear_highlight();

    fail_waiters({HighlightErrorKind::Cancelled, "Highlighter disposed"});
    refreshed_.clear();
}

void DocumentHighlighter::fail_waiters(const HighlightError& error) {
    auto waiters = std::move(waiters_);
    waiters_.clear();
    for (const auto& waiter : waiters) {
        settle_waiter(waiter, std::unexpected(error));
    }
}

void DocumentHighlighter::wait_refresh(WaitCallback done) {
    if (disposed_) {
        done(std::unexpected(HighlightError{HighlightErrorKind::Cancelled, "Highlighter disposed"}));
        return;
    }

    auto waiter = std::make_shared<Waiter>();
    waiter->done = std::move(done);
    waiters_.push_back(waiter);

    waiter->subscription = refreshed_.subscribe([this, waiter]() {
        settle_waiter(waiter, {});
    });
    waiter->timer = ctx_.scheduler.post_delayed(WAIT_REFRESH_TIMEOUT_MS, [this, waiter]() {
        waiter->timer = 0;
        settle_waiter(waiter, std::unexpected(HighlightError{
            HighlightErrorKind::WaitTimeout, std::format("Timeout after {}ms", WAIT_REFRESH_TIMEOUT_MS)}));
    });
}

void DocumentHighlighter::settle_waiter(const std::shared_ptr<Waiter>& waiter,
                                        std::expected<void, HighlightError> result) {
    if (waiter->settled) return;
    waiter->settled = true;
    refreshed_.unsubscribe(waiter->subscription);
    if (waiter->timer) {
        ctx_.scheduler.cancel(waiter->timer);
        waiter->timer = 0;
    }
    std::erase(waiters_, waiter);

    WaitCallback done = std::move(waiter->done);
    if (done) done(std::move(result));
}

std::vector<HighlightItem> DocumentHighlighter::to_highlight_items(const std::vector<TokenSpan>& spans,
                                                                   std::optional<LineRange> range) const {
    std::vector<HighlightItem> items;
    items.reserve(spans.size());
    for (const auto& span : spans) {
        if (!span.group) continue;
        if (range && !range->contains(span.line)) continue;

        HighlightItem item{
            .line = span.line,
            .col_start = span.col_start,
            .col_end = span.col_end,
            .group = *span.group,
            .combine = span.combine
        };
        if (contains(config_.increment_types, span.token_type)) {
            item.extend_start = true;
            item.extend_end = true;
        }
        items.push_back(std::move(item));
    }
    return items;
}

void DocumentHighlighter::report_failure(const HighlightError& error) {
    if (!ctx_.messages) return;
    ctx_.messages->show_error("Semantic tokens", error.message);
}

void DocumentHighlighter::log_discarded(const HighlightError& error) const {
    SDL_LogDebug(LOG_CATEGORY_SEMANTIC, "buffer %d: %s: %s", doc_.id(), to_string(error.kind), error.message.c_str());
}
