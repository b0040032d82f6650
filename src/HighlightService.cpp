#include "HighlightService.h"
#include "TextDocument.h"
#include "Constants.h"
#include "Utils.h"
#include <SDL2/SDL.h>
#include <format>

HighlightService::HighlightService(Scheduler& scheduler, const ProviderRegistry& providers,
                                   HighlightRenderer& renderer, const Viewport& viewport, ConfigStore& config,
                                   MessageSink* messages, HostEnvironment host)
    : scheduler_(scheduler),
      providers_(providers),
      renderer_(renderer),
      viewport_(viewport),
      config_(config),
      messages_(messages),
      host_(host),
      static_config_(StaticConfig::from_store(config)) {
    config_subscription_ = config_.on_did_change([this]() {
        for (auto& [id, highlighter] : highlighters_) {
            highlighter->load_configuration();
        }
    });
}

HighlightService::~HighlightService() {
    config_.unsubscribe(config_subscription_);
    if (request_source_) {
        request_source_->dispose();
        request_source_.reset();
    }
    if (status_timer_) scheduler_.cancel(status_timer_);

    for (auto& [id, highlighter] : highlighters_) {
        highlighter->document().set_change_callback(nullptr);
    }
    highlighters_.clear();
}

DocumentHighlighter& HighlightService::attach(TextDocument& doc) {
    detach(doc.id());

    HighlightContext ctx{
        .scheduler = scheduler_,
        .providers = providers_,
        .renderer = renderer_,
        .viewport = viewport_,
        .config_store = config_,
        .static_config = static_config_,
        .host = host_,
        .messages = messages_
    };
    auto highlighter = std::make_unique<DocumentHighlighter>(doc, ctx);
    BufferId id = doc.id();
    doc.set_change_callback([this, id](const TextDocument&) { on_text_change(id); });

    SDL_LogDebug(LOG_CATEGORY_SEMANTIC, "attached buffer %d (%s)", id,
                 doc.filetype.empty() ? "no filetype" : doc.filetype.c_str());
    auto& ref = *highlighter;
    highlighters_[id] = std::move(highlighter);
    return ref;
}

void HighlightService::detach(BufferId id) {
    auto it = highlighters_.find(id);
    if (it == highlighters_.end()) return;
    it->second->document().set_change_callback(nullptr);
    highlighters_.erase(it);
}

DocumentHighlighter* HighlightService::get(BufferId id) {
    auto it = highlighters_.find(id);
    return it == highlighters_.end() ? nullptr : it->second.get();
}

const DocumentHighlighter* HighlightService::get(BufferId id) const {
    auto it = highlighters_.find(id);
    return it == highlighters_.end() ? nullptr : it->second.get();
}

void HighlightService::on_change(BufferId id) {
    if (auto* highlighter = get(id)) highlighter->on_change();
}

void HighlightService::on_text_change(BufferId id) {
    if (auto* highlighter = get(id)) highlighter->on_text_change();
}

void HighlightService::on_cursor_moved(BufferId id) {
    if (request_source_) request_source_->cancel();
    if (auto* highlighter = get(id)) highlighter->on_cursor_moved();
}

void HighlightService::on_shown(BufferId id) {
    if (auto* highlighter = get(id)) highlighter->on_shown();
}

std::expected<void, HighlightError> HighlightService::highlight_current(BufferId id) {
    DocumentHighlighter* highlighter = get(id);
    if (!highlighter) {
        return std::unexpected(HighlightError{HighlightErrorKind::ProviderUnavailable,
                                              std::format("Buffer {} is not attached", id)});
    }
    if (auto state = highlighter->check_state(); !state) {
        SDL_LogWarn(LOG_CATEGORY_SEMANTIC, "%s", state.error().message.c_str());
        if (messages_) messages_->show_error("Semantic tokens", state.error().message);
        return state;
    }

    CancellationToken token = begin_request(HIGHLIGHT_NAMESPACE);
    highlighter->force_highlight();
    highlighter->wait_refresh([this, token](std::expected<void, HighlightError> result) {
        if (token.is_cancellation_requested()) return;
        end_request();
        if (!result) {
            SDL_LogWarn(LOG_CATEGORY_SEMANTIC, "highlight request ended: %s", result.error().message.c_str());
        }
    });
    return {};
}

void HighlightService::clear_current(BufferId id) {
    if (auto* highlighter = get(id)) {
        highlighter->cancel();
        highlighter->clear_highlight();
    }
}

void HighlightService::clear_all() {
    for (auto& [id, highlighter] : highlighters_) {
        highlighter->cancel();
        highlighter->clear_highlight();
    }
}

std::vector<TokenSpan> HighlightService::inspect(BufferId id, LineIdx line) const {
    std::vector<TokenSpan> result;
    const DocumentHighlighter* highlighter = get(id);
    if (!highlighter) return result;
    const auto* spans = highlighter->highlights();
    if (!spans) return result;
    for (const auto& span : *spans) {
        if (span.line == line) result.push_back(span);
    }
    return result;
}

std::string HighlightService::describe(BufferId id, LineIdx line) const {
    const DocumentHighlighter* highlighter = get(id);
    if (!highlighter) return std::format("buffer {}: not attached", id);

    std::string out = std::format("buffer {} line {}: {} / {}", id, line,
                                  to_string(highlighter->state()), to_string(highlighter->range_state()));
    for (const auto& span : inspect(id, line)) {
        std::string modifiers;
        for (const auto& m : span.token_modifiers) {
            if (!modifiers.empty()) modifiers += ",";
            modifiers += m;
        }
        out += std::format("\n  {}-{} {}", span.col_start, span.col_end,
                           span.token_type.empty() ? "<unknown>" : span.token_type);
        if (!modifiers.empty()) out += std::format(" [{}]", modifiers);
        out += std::format(" -> {}", span.group.value_or("<none>"));
        if (span.combine) out += " (combine)";
    }
    return out;
}

CancellationToken HighlightService::begin_request(const std::string& name) {
    cancel_and_dispose(request_source_);
    if (status_timer_) {
        scheduler_.cancel(status_timer_);
        status_timer_ = 0;
    }

    request_source_ = std::make_unique<CancellationTokenSource>();
    CancellationToken token = request_source_->token();
    token.on_cancellation_requested([this, name]() {
        status_.text = std::format("{} request canceled", name);
        status_.is_progress = false;
        if (status_timer_) scheduler_.cancel(status_timer_);
        status_timer_ = scheduler_.post_delayed(STATUS_HIDE_DELAY_MS, [this]() {
            status_timer_ = 0;
            status_.hide();
        });
    });

    status_.text = std::format("requesting {}", name);
    status_.is_progress = true;
    status_.show();
    return token;
}

void HighlightService::end_request() {
    if (request_source_) {
        request_source_->dispose();
        request_source_.reset();
    }
    if (status_timer_) {
        scheduler_.cancel(status_timer_);
        status_timer_ = 0;
    }
    status_.hide();
}
