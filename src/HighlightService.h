#pragma once

#include "DocumentHighlighter.h"
#include "Toast.h"
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

// Owns one DocumentHighlighter per attached document and routes host events to it.
class HighlightService {
public:
    HighlightService(Scheduler& scheduler, const ProviderRegistry& providers, HighlightRenderer& renderer,
                     const Viewport& viewport, ConfigStore& config, MessageSink* messages = nullptr,
                     HostEnvironment host = {});
    ~HighlightService();

    HighlightService(const HighlightService&) = delete;
    HighlightService& operator=(const HighlightService&) = delete;

    // The document must outlive its attachment.
    DocumentHighlighter& attach(TextDocument& doc);
    void detach(BufferId id);
    DocumentHighlighter* get(BufferId id);
    const DocumentHighlighter* get(BufferId id) const;
    size_t attached_count() const { return highlighters_.size(); }

    void on_change(BufferId id);
    void on_text_change(BufferId id);
    void on_cursor_moved(BufferId id);
    void on_shown(BufferId id);

    // Clears and re-requests everything for the document, with the status item shown until it refreshes.
    std::expected<void, HighlightError> highlight_current(BufferId id);
    void clear_current(BufferId id);
    void clear_all();

    std::vector<TokenSpan> inspect(BufferId id, LineIdx line) const;
    std::string describe(BufferId id, LineIdx line) const;

    const StatusItem& status_item() const { return status_; }
    const StaticConfig& static_config() const { return static_config_; }

private:
    Scheduler& scheduler_;
    const ProviderRegistry& providers_;
    HighlightRenderer& renderer_;
    const Viewport& viewport_;
    ConfigStore& config_;
    MessageSink* messages_;
    HostEnvironment host_;
    StaticConfig static_config_;
    SubscriptionId config_subscription_ = 0;

    std::unordered_map<BufferId, std::unique_ptr<DocumentHighlighter>> highlighters_;

    CancellationSourcePtr request_source_;
    StatusItem status_;
    TimerId status_timer_ = 0;

    CancellationToken begin_request(const std::string& name);
    void end_request();
};
