#include <catch2/catch.hpp>
#include "HighlightStore.h"

namespace {

HighlightItem item(LineIdx line, ColIdx start, ColIdx end, const char* group) {
    return HighlightItem{.line = line, .col_start = start, .col_end = end, .group = group};
}

}

TEST_CASE("diff against an empty namespace adds every line", "[store]") {
    HighlightStore store;
    CancellationTokenSource source;

    auto diff = store.diff(1, "ns", {item(0, 0, 3, "A"), item(2, 1, 4, "B"), item(0, 4, 5, "C")},
                           std::nullopt, source.token());

    REQUIRE(diff.has_value());
    REQUIRE(diff->lines.size() == 2);
    CHECK(diff->lines[0].line == 0);
    CHECK(diff->lines[0].items.size() == 2);
    CHECK(diff->lines[1].line == 2);
}

TEST_CASE("unchanged lines are left out of the diff", "[store]") {
    HighlightStore store;
    CancellationTokenSource source;
    std::vector<HighlightItem> items = {item(0, 0, 3, "A"), item(1, 0, 3, "B")};

    auto first = store.diff(1, "ns", items, std::nullopt, source.token());
    REQUIRE(first.has_value());
    store.apply(1, "ns", 10, *first, false);

    auto second = store.diff(1, "ns", items, std::nullopt, source.token());
    REQUIRE(second.has_value());
    CHECK(second->empty());

    items[1].group = "C";
    auto third = store.diff(1, "ns", items, std::nullopt, source.token());
    REQUIRE(third.has_value());
    REQUIRE(third->lines.size() == 1);
    CHECK(third->lines[0].line == 1);
}

TEST_CASE("lines no longer wanted are cleared", "[store]") {
    HighlightStore store;
    CancellationTokenSource source;

    store.apply(1, "ns", 10, *store.diff(1, "ns", {item(0, 0, 3, "A"), item(5, 0, 3, "B")}, std::nullopt,
                                         source.token()), false);
    store.apply(1, "ns", 10, *store.diff(1, "ns", {item(0, 0, 3, "A")}, std::nullopt, source.token()), false);

    CHECK(store.items(1, "ns").size() == 1);
    CHECK(store.line_items(1, "ns", 5).empty());
}

TEST_CASE("restricted diff leaves other lines alone", "[store]") {
    HighlightStore store;
    CancellationTokenSource source;

    store.apply(1, "ns", 10, *store.diff(1, "ns", {item(0, 0, 3, "A"), item(30, 0, 3, "B")}, std::nullopt,
                                         source.token()), false);

    auto diff = store.diff(1, "ns", {item(1, 0, 3, "C")}, LineRange{0, 10}, source.token());
    REQUIRE(diff.has_value());
    store.apply(1, "ns", 10, *diff, true);

    CHECK(store.line_items(1, "ns", 0).empty());
    CHECK(store.line_items(1, "ns", 1).size() == 1);
    CHECK(store.line_items(1, "ns", 30).size() == 1);
}

TEST_CASE("diff is refused once cancelled or closed", "[store]") {
    HighlightStore store;
    CancellationTokenSource source;
    source.cancel();
    CHECK_FALSE(store.diff(1, "ns", {item(0, 0, 1, "A")}, std::nullopt, source.token()).has_value());

    CancellationTokenSource live;
    store.close_buffer(2);
    CHECK_FALSE(store.diff(2, "ns", {item(0, 0, 1, "A")}, std::nullopt, live.token()).has_value());
}

TEST_CASE("namespaces are independent and keep their priority", "[store]") {
    HighlightStore store;
    CancellationTokenSource source;

    store.apply(1, "a", 5, *store.diff(1, "a", {item(0, 0, 1, "A")}, std::nullopt, source.token()), false);
    store.apply(1, "b", 7, *store.diff(1, "b", {item(0, 0, 1, "B")}, std::nullopt, source.token()), false);
    CHECK(store.priority(1, "a") == 5);
    CHECK(store.priority(1, "b") == 7);

    store.clear_namespace(1, "a");
    CHECK(store.items(1, "a").empty());
    CHECK(store.items(1, "b").size() == 1);
}
