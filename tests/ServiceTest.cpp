#include <catch2/catch.hpp>
#include "Fakes.h"
#include "HighlightService.h"

namespace {

struct ServiceHarness : Harness {
    HighlightService service{scheduler, providers, renderer, viewport, config, &sink};

    ServiceHarness() {
        set_lines(3);
        provider->set_full(two_tokens_per_line(3), "r1");
    }
};

}

TEST_CASE("attached documents are highlighted and routed", "[service]") {
    ServiceHarness s;
    DocumentHighlighter& hl = s.service.attach(s.doc);
    CHECK(s.service.attached_count() == 1);
    CHECK(s.service.get(s.doc.id()) == &hl);
    CHECK(s.service.get(42) == nullptr);

    s.run_for(HIGHLIGHT_DEBOUNCE_MS);
    CHECK(s.painted().size() == 6);

    s.service.detach(s.doc.id());
    CHECK(s.service.attached_count() == 0);
    CHECK(s.painted().empty());

    s.doc.replace_line(0, "int other = 42;");
    s.service.on_change(s.doc.id());
    s.run_for(HIGHLIGHT_DEBOUNCE_MS);
    CHECK(s.provider->full_calls == 1);
}

TEST_CASE("document edits cancel the pending request", "[service]") {
    ServiceHarness s;
    s.provider->hold = true;
    DocumentHighlighter& hl = s.service.attach(s.doc);
    s.run_for(HIGHLIGHT_DEBOUNCE_MS);
    REQUIRE(s.provider->held() == 1);

    s.doc.replace_line(0, "int other = 42;");
    CHECK(hl.state() == HighlightState::Idle);
    s.provider->release();
    s.run_for(0);

    CHECK(s.renderer.apply_calls == 0);
}

TEST_CASE("highlight_current shows progress until the refresh", "[service]") {
    ServiceHarness s;
    s.service.attach(s.doc);

    REQUIRE(s.service.highlight_current(s.doc.id()).has_value());
    CHECK(s.service.status_item().visible);
    CHECK(s.service.status_item().is_progress);
    CHECK(s.service.status_item().text == "requesting semanticTokens");

    s.run_for(0);

    CHECK(s.provider->full_calls == 1);
    CHECK(s.painted().size() == 6);
    CHECK_FALSE(s.service.status_item().visible);

    s.run_for(HIGHLIGHT_DEBOUNCE_MS);
    CHECK(s.provider->full_calls == 1);
}

TEST_CASE("highlight_current reports why it cannot run", "[service]") {
    ServiceHarness s;

    auto detached = s.service.highlight_current(s.doc.id());
    REQUIRE_FALSE(detached.has_value());
    CHECK(detached.error().kind == HighlightErrorKind::ProviderUnavailable);

    s.config.set(CONFIG_SECTION, "enable", "false");
    s.service.attach(s.doc);
    auto disabled = s.service.highlight_current(s.doc.id());
    REQUIRE_FALSE(disabled.has_value());
    REQUIRE(s.sink.messages.size() == 1);
    CHECK(s.sink.messages[0].type == ToastType::Error);
    CHECK(s.sink.messages[0].text == disabled.error().message);
    CHECK_FALSE(s.service.status_item().visible);
}

TEST_CASE("moving the cursor cancels a user request", "[service]") {
    ServiceHarness s;
    s.provider->hold = true;
    s.service.attach(s.doc);
    REQUIRE(s.service.highlight_current(s.doc.id()).has_value());

    s.service.on_cursor_moved(s.doc.id());

    CHECK(s.service.status_item().text == "semanticTokens request canceled");
    CHECK(s.service.status_item().visible);
    CHECK_FALSE(s.service.status_item().is_progress);

    s.run_for(STATUS_HIDE_DELAY_MS - 1);
    CHECK(s.service.status_item().visible);
    s.run_for(1);
    CHECK_FALSE(s.service.status_item().visible);
}

TEST_CASE("clear_all removes highlights from every document", "[service]") {
    ServiceHarness s;
    TextDocument other(2, "cpp");
    other.load_text("int a = 1;\nint b = 2;");
    s.viewport.show(other.id(), {{0, 20}});
    s.service.attach(s.doc);
    s.service.attach(other);
    s.run_for(HIGHLIGHT_DEBOUNCE_MS);
    REQUIRE_FALSE(s.painted().empty());
    REQUIRE_FALSE(s.renderer.items(other.id(), HIGHLIGHT_NAMESPACE).empty());

    s.service.clear_current(other.id());
    CHECK(s.renderer.items(other.id(), HIGHLIGHT_NAMESPACE).empty());
    CHECK_FALSE(s.painted().empty());

    s.service.clear_all();
    CHECK(s.painted().empty());
    CHECK(s.service.get(s.doc.id())->highlights() == nullptr);
}

TEST_CASE("inspect and describe report the decoded spans", "[service]") {
    ServiceHarness s;
    s.service.attach(s.doc);
    s.run_for(HIGHLIGHT_DEBOUNCE_MS);

    auto spans = s.service.inspect(s.doc.id(), 0);
    REQUIRE(spans.size() == 2);
    CHECK(spans[0].token_type == "keyword");
    CHECK(spans[1].group == std::optional<std::string>("SemVariable"));
    CHECK(s.service.inspect(s.doc.id(), 7).empty());

    std::string text = s.service.describe(s.doc.id(), 0);
    CHECK(text.starts_with("buffer 1 line 0: idle / idle"));
    CHECK(text.find("0-3 keyword -> SemKeyword") != std::string::npos);
    CHECK(text.find("4-9 variable -> SemVariable") != std::string::npos);
    CHECK(s.service.describe(5, 0) == "buffer 5: not attached");
}

TEST_CASE("configuration changes reach every highlighter", "[service]") {
    ServiceHarness s;
    DocumentHighlighter& hl = s.service.attach(s.doc);
    s.run_for(HIGHLIGHT_DEBOUNCE_MS);
    REQUIRE_FALSE(s.painted().empty());

    s.config.load_from_string("[semanticTokens]\nenable: false\n");
    CHECK_FALSE(hl.config().enable);
    CHECK(s.painted().empty());

    s.config.load_from_string("[semanticTokens]\nenable: true\nhighlightPriority: 99\n");
    s.run_for(HIGHLIGHT_DEBOUNCE_MS);
    CHECK(s.painted().size() == 6);
    CHECK(s.renderer.priority(s.doc.id(), HIGHLIGHT_NAMESPACE) == 99);
}

TEST_CASE("toasts expire by type and can be dismissed", "[service]") {
    ManualClock clock;
    ToastQueue toasts(clock.clock());
    toasts.show_info("Semantic tokens", "ready");
    toasts.show_error("Semantic tokens", "server crashed");
    REQUIRE(toasts.toasts().size() == 2);

    clock.now += TOAST_INFO_MS;
    toasts.update();
    REQUIRE(toasts.toasts().size() == 1);
    CHECK(toasts.toasts()[0].type == ToastType::Error);

    toasts.dismiss(toasts.toasts()[0].id);
    CHECK(toasts.empty());
}

TEST_CASE("service errors queue an expiring toast", "[service]") {
    ServiceHarness s;
    ToastQueue toasts(s.clock.clock());
    HighlightService service(s.scheduler, s.providers, s.renderer, s.viewport, s.config, &toasts);
    s.config.set(CONFIG_SECTION, "enable", "false");
    service.attach(s.doc);

    REQUIRE_FALSE(service.highlight_current(s.doc.id()).has_value());
    REQUIRE(toasts.toasts().size() == 1);
    CHECK(toasts.toasts()[0].type == ToastType::Error);
    CHECK(toasts.toasts()[0].title == "Semantic tokens");

    s.clock.now += TOAST_ERROR_MS;
    toasts.update();
    CHECK(toasts.empty());
}
