#pragma once

#include "ConfigStore.h"
#include "DocumentHighlighter.h"
#include "EngineConfig.h"
#include "HighlightGroups.h"
#include "HighlightStore.h"
#include "ProviderRegistry.h"
#include "Scheduler.h"
#include "SemanticTokensProvider.h"
#include "TextDocument.h"
#include "Toast.h"
#include "Viewport.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>

// Time only moves when a test says so. With a non-zero step every read
// advances it, which makes the decoder see its yield budget run out.
struct ManualClock {
    Uint32 now = 1000;
    Uint32 step = 0;

    Clock clock() {
        return [this]() {
            Uint32 t = now;
            now += step;
            return t;
        };
    }
};

inline SemanticTokensLegend test_legend() {
    return {{"keyword", "variable", "function", "string", "parameter"}, {"declaration", "readonly", "deprecated"}};
}

// Provider whose answers are set by the test. Answers are delivered from the
// scheduler, or held until release() when `hold` is set. `hold_full` holds
// only full answers.
class ScriptedProvider : public SemanticTokensProvider {
public:
    ScriptedProvider(Scheduler& scheduler, ProviderCapabilities caps, SemanticTokensLegend legend = test_legend())
        : scheduler_(scheduler), caps_(caps), legend_(std::move(legend)) {}

    ProviderCapabilities capabilities() const override { return caps_; }
    const SemanticTokensLegend& legend() const override { return legend_; }

    void provide_full(const TextDocument& /*doc*/, CancellationToken /*token*/, TokensCallback done) override {
        full_calls++;
        auto result = full_result;
        deliver([done, result]() { done(result); }, hold_full);
    }

    void provide_edits(const TextDocument& /*doc*/, const std::string& previous_result_id,
                       CancellationToken /*token*/, EditsCallback done) override {
        edit_calls++;
        edit_previous_ids.push_back(previous_result_id);
        auto result = edit_result;
        deliver([done, result]() { done(result); });
    }

    void provide_range(const TextDocument& /*doc*/, TextRange range, CancellationToken /*token*/,
                       TokensCallback done) override {
        range_calls++;
        ranges.push_back(range);
        auto result = range_result;
        deliver([done, result]() { done(result); });
    }

    void set_full(std::vector<uint32_t> data, std::optional<std::string> result_id = std::nullopt) {
        full_result = std::optional<SemanticTokens>(SemanticTokens{std::move(result_id), std::move(data)});
    }

    void set_range(std::vector<uint32_t> data) {
        range_result = std::optional<SemanticTokens>(SemanticTokens{std::nullopt, std::move(data)});
    }

    void set_delta(std::vector<SemanticTokensEdit> edits, std::optional<std::string> result_id) {
        edit_result = std::optional<TokensOrDelta>(SemanticTokensDelta{std::move(result_id), std::move(edits)});
    }

    void release() {
        auto pending = std::move(pending_);
        pending_.clear();
        for (auto& fn : pending) fn();
    }

    size_t held() const { return pending_.size(); }

    ProviderResult<SemanticTokens> full_result = std::optional<SemanticTokens>{};
    ProviderResult<TokensOrDelta> edit_result = std::optional<TokensOrDelta>{};
    ProviderResult<SemanticTokens> range_result = std::optional<SemanticTokens>{};
    bool hold = false;
    bool hold_full = false;

    int full_calls = 0;
    int edit_calls = 0;
    int range_calls = 0;
    std::vector<std::string> edit_previous_ids;
    std::vector<TextRange> ranges;

private:
    Scheduler& scheduler_;
    ProviderCapabilities caps_;
    SemanticTokensLegend legend_;
    std::vector<std::function<void()>> pending_;

    void deliver(std::function<void()> fn, bool held = false) {
        if (hold || held) {
            pending_.push_back(std::move(fn));
        } else {
            scheduler_.post(std::move(fn));
        }
    }
};

class RecordingRenderer : public HighlightStore {
public:
    std::optional<DiffSet> diff(BufferId buffer, const std::string& ns, const std::vector<HighlightItem>& desired,
                                std::optional<LineRange> restrict_to, const CancellationToken& token) override {
        diff_calls++;
        restrictions.push_back(restrict_to);
        return HighlightStore::diff(buffer, ns, desired, restrict_to, token);
    }

    void apply(BufferId buffer, const std::string& ns, int priority, const DiffSet& diff, bool partial) override {
        apply_calls++;
        partial_flags.push_back(partial);
        HighlightStore::apply(buffer, ns, priority, diff, partial);
    }

    void clear_namespace(BufferId buffer, const std::string& ns) override {
        clear_calls++;
        HighlightStore::clear_namespace(buffer, ns);
    }

    int diff_calls = 0;
    int apply_calls = 0;
    int clear_calls = 0;
    std::vector<std::optional<LineRange>> restrictions;
    std::vector<bool> partial_flags;
};

class RecordingSink : public MessageSink {
public:
    struct Message {
        std::string title;
        std::string text;
        ToastType type;
    };

    void show(const std::string& title, const std::string& message, ToastType type) override {
        messages.push_back({title, message, type});
    }

    std::vector<Message> messages;
};

// One document wired to a scripted provider, an in-memory renderer and a
// viewport that shows its first 20 lines.
struct Harness {
    ManualClock clock;
    Scheduler scheduler{clock.clock()};
    ConfigStore config;
    StaticConfig static_config{std::nullopt, default_highlight_groups()};
    HostEnvironment host;
    ProviderRegistry providers;
    RecordingRenderer renderer;
    FixedViewport viewport{20};
    RecordingSink sink;
    TextDocument doc{1, "cpp"};
    std::shared_ptr<ScriptedProvider> provider;

    explicit Harness(ProviderCapabilities caps = static_cast<ProviderCapabilities>(ProviderCapability::Full)) {
        config.set(CONFIG_SECTION, "enable", "true");
        provider = std::make_shared<ScriptedProvider>(scheduler, caps);
        providers.register_provider({"cpp"}, provider);
        viewport.show(doc.id(), {{0, 20}});
    }

    HighlightContext context() {
        return HighlightContext{
            .scheduler = scheduler,
            .providers = providers,
            .renderer = renderer,
            .viewport = viewport,
            .config_store = config,
            .static_config = static_config,
            .host = host,
            .messages = &sink
        };
    }

    void set_lines(int count, const std::string& text = "int value = 42;") {
        std::string all;
        for (int i = 0; i < count; i++) {
            if (i) all += "\n";
            all += text;
        }
        doc.load_text(all);
    }

    void run_for(Uint32 ms) {
        clock.now += ms;
        while (scheduler.run_pending() > 0) {}
    }

    std::vector<HighlightItem> painted() const { return renderer.items(doc.id(), HIGHLIGHT_NAMESPACE); }
};

// Two tokens on each of `lines` lines: a keyword at 0-3 and a variable at 4-9.
inline std::vector<uint32_t> two_tokens_per_line(int lines) {
    std::vector<uint32_t> data;
    for (int i = 0; i < lines; i++) {
        uint32_t delta_line = i == 0 ? 0 : 1;
        data.insert(data.end(), {delta_line, 0, 3, 0, 0});
        data.insert(data.end(), {0, 4, 5, 1, 0});
    }
    return data;
}
