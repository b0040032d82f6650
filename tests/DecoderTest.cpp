#include <catch2/catch.hpp>
#include "Fakes.h"
#include "TokenDecoder.h"

namespace {

TextDocument make_doc(const std::string& text) {
    TextDocument doc(7, "cpp");
    doc.load_text(text);
    return doc;
}

}

TEST_CASE("decoder produces absolute spans from relative groups", "[decoder]") {
    TextDocument doc = make_doc("hello world\n\n  abcdef");
    SemanticTokensLegend legend{{"keyword", "variable"}, {}};
    HighlightGroupResolver resolver(default_highlight_groups());

    auto spans = TokenDecoder::decode_all({0, 0, 5, 0, 0, 2, 2, 3, 1, 0}, legend, doc, resolver);

    REQUIRE(spans.size() == 2);
    CHECK(spans[0].line == 0);
    CHECK(spans[0].col_start == 0);
    CHECK(spans[0].col_end == 5);
    CHECK(spans[0].token_type == "keyword");
    CHECK(spans[0].group == std::optional<std::string>("SemKeyword"));
    CHECK(spans[1].line == 2);
    CHECK(spans[1].col_start == 2);
    CHECK(spans[1].col_end == 5);
    CHECK(spans[1].token_type == "variable");
    CHECK(spans[1].group == std::optional<std::string>("SemVariable"));
}

TEST_CASE("decoder yields nothing for an empty array", "[decoder]") {
    TextDocument doc = make_doc("int x;");
    HighlightGroupResolver resolver(default_highlight_groups());
    CHECK(TokenDecoder::decode_all({}, test_legend(), doc, resolver).empty());
}

TEST_CASE("decoder matches a hand computed reference", "[decoder]") {
    TextDocument doc = make_doc("aaaa bbbb cccc\ndddd\n\neeee ffff");
    HighlightGroupResolver resolver(default_highlight_groups());
    std::vector<uint32_t> data = {
        0, 0, 4, 0, 0,
        0, 5, 4, 1, 0,
        0, 5, 4, 2, 0,
        1, 0, 4, 3, 0,
        2, 5, 4, 1, 1
    };

    auto spans = TokenDecoder::decode_all(data, test_legend(), doc, resolver);

    struct Expected { LineIdx line; ColIdx start; ColIdx end; const char* type; };
    std::vector<Expected> reference = {
        {0, 0, 4, "keyword"}, {0, 5, 9, "variable"}, {0, 10, 14, "function"},
        {1, 0, 4, "string"}, {3, 5, 9, "variable"}
    };
    REQUIRE(spans.size() == reference.size());
    for (size_t i = 0; i < reference.size(); i++) {
        CHECK(spans[i].line == reference[i].line);
        CHECK(spans[i].col_start == reference[i].start);
        CHECK(spans[i].col_end == reference[i].end);
        CHECK(spans[i].token_type == reference[i].type);
        if (i > 0) CHECK(spans[i].line >= spans[i - 1].line);
    }
    CHECK(spans[4].token_modifiers == std::vector<std::string>{"declaration"});
    CHECK(spans[4].group == std::optional<std::string>("SemDeclarationVariable") ||
          spans[4].group == std::optional<std::string>("SemDeclaration"));
}

TEST_CASE("decoder converts UTF-16 columns to byte offsets", "[decoder]") {
    // U+1F600 is four bytes in UTF-8 and two UTF-16 units; U+00E9 is two bytes and one unit.
    TextDocument doc = make_doc("\xF0\x9F\x98\x80" "ab \xC3\xA9x");
    HighlightGroupResolver resolver(default_highlight_groups());

    auto spans = TokenDecoder::decode_all({0, 2, 2, 1, 0, 0, 3, 2, 1, 0}, test_legend(), doc, resolver);

    REQUIRE(spans.size() == 2);
    CHECK(spans[0].col_start == 4);
    CHECK(spans[0].col_end == 6);
    CHECK(spans[1].col_start == 7);
    CHECK(spans[1].col_end == 10);
}

TEST_CASE("decoder keeps spans with unknown types but leaves them ungrouped", "[decoder]") {
    TextDocument doc = make_doc("abc def");
    HighlightGroupResolver resolver(default_highlight_groups());

    auto spans = TokenDecoder::decode_all({0, 0, 3, 42, 0, 0, 4, 3, 1, 0}, test_legend(), doc, resolver);

    REQUIRE(spans.size() == 2);
    CHECK(spans[0].token_type.empty());
    CHECK_FALSE(spans[0].group.has_value());
    CHECK(spans[1].group.has_value());
}

TEST_CASE("decoder stops at a line past the largest index", "[decoder]") {
    TextDocument doc = make_doc("abc def");
    HighlightGroupResolver resolver(default_highlight_groups());
    std::vector<uint32_t> data = {
        0, 0, 3, 0, 0,
        0x7fffffff, 0, 1, 1, 0,
        1, 0, 1, 1, 0,
        0, 4, 3, 1, 0
    };

    auto spans = TokenDecoder::decode_all(data, test_legend(), doc, resolver);

    REQUIRE(spans.size() == 2);
    CHECK(spans[0].line == 0);
    CHECK(spans[1].line == 0x7fffffff);
    for (const auto& span : spans) CHECK(span.line >= 0);

    CHECK(TokenDecoder::decode_all({0x80000000u, 0, 1, 0, 0}, test_legend(), doc, resolver).empty());
}

TEST_CASE("decoder ignores a trailing incomplete group", "[decoder]") {
    TextDocument doc = make_doc("abc def");
    HighlightGroupResolver resolver(default_highlight_groups());
    CHECK(TokenDecoder::decode_all({0, 0, 3, 0, 0, 0, 4}, test_legend(), doc, resolver).size() == 1);
}

TEST_CASE("small inputs decode before decode returns", "[decoder]") {
    ManualClock clock;
    Scheduler scheduler(clock.clock());
    TokenDecoder decoder(scheduler);
    TextDocument doc = make_doc("abc def");
    HighlightGroupResolver resolver(default_highlight_groups());
    CancellationTokenSource source;

    std::optional<std::vector<TokenSpan>> result;
    bool called = false;
    decoder.decode({0, 0, 3, 0, 0}, test_legend(), doc, resolver, source.token(),
        [&](std::optional<std::vector<TokenSpan>> spans) {
            called = true;
            result = std::move(spans);
        });

    REQUIRE(called);
    REQUIRE(result.has_value());
    CHECK(result->size() == 1);
    CHECK_FALSE(scheduler.has_pending());
}

TEST_CASE("large inputs yield and still deliver every span", "[decoder]") {
    ManualClock clock;
    clock.step = 20;
    Scheduler scheduler(clock.clock());
    TokenDecoder decoder(scheduler);
    TextDocument doc = make_doc(std::string(200, 'x'));
    HighlightGroupResolver resolver(default_highlight_groups());
    CancellationTokenSource source;

    std::vector<uint32_t> data;
    for (int i = 0; i < 50; i++) data.insert(data.end(), {0, i == 0 ? 0u : 2u, 1, 0, 0});

    std::optional<std::vector<TokenSpan>> result;
    bool called = false;
    decoder.decode(data, test_legend(), doc, resolver, source.token(),
        [&](std::optional<std::vector<TokenSpan>> spans) {
            called = true;
            result = std::move(spans);
        });

    CHECK_FALSE(called);
    CHECK(scheduler.has_pending());
    int pumps = 0;
    while (scheduler.run_pending() > 0) pumps++;

    CHECK(pumps > 1);
    REQUIRE(called);
    REQUIRE(result.has_value());
    CHECK(result->size() == 50);
    CHECK(result->back().col_start == 98);
}

TEST_CASE("cancelling after a yield publishes no spans", "[decoder]") {
    ManualClock clock;
    clock.step = 20;
    Scheduler scheduler(clock.clock());
    TokenDecoder decoder(scheduler);
    TextDocument doc = make_doc(std::string(200, 'x'));
    HighlightGroupResolver resolver(default_highlight_groups());
    CancellationTokenSource source;

    std::vector<uint32_t> data;
    for (int i = 0; i < 50; i++) data.insert(data.end(), {0, i == 0 ? 0u : 2u, 1, 0, 0});

    std::optional<std::vector<TokenSpan>> result;
    bool called = false;
    decoder.decode(data, test_legend(), doc, resolver, source.token(),
        [&](std::optional<std::vector<TokenSpan>> spans) {
            called = true;
            result = std::move(spans);
        });

    REQUIRE_FALSE(called);
    scheduler.run_pending();
    REQUIRE_FALSE(called);
    REQUIRE(scheduler.has_pending());

    source.cancel();
    scheduler.run_pending();

    CHECK(called);
    CHECK_FALSE(result.has_value());
    CHECK_FALSE(scheduler.has_pending());
}
