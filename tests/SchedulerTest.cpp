#include <catch2/catch.hpp>
#include "Fakes.h"

TEST_CASE("delayed tasks run once due, in order", "[scheduler]") {
    ManualClock clock;
    Scheduler scheduler(clock.clock());
    std::vector<int> ran;

    scheduler.post_delayed(50, [&] { ran.push_back(2); });
    scheduler.post_delayed(10, [&] { ran.push_back(1); });
    scheduler.post([&] { ran.push_back(0); });

    CHECK(scheduler.run_pending() == 1);
    CHECK(ran == std::vector<int>{0});

    clock.now += 49;
    scheduler.run_pending();
    CHECK(ran == std::vector<int>{0, 1});

    clock.now += 1;
    scheduler.run_pending();
    CHECK(ran == std::vector<int>{0, 1, 2});
    CHECK_FALSE(scheduler.has_pending());
}

TEST_CASE("tasks posted while running wait for the next pump", "[scheduler]") {
    ManualClock clock;
    Scheduler scheduler(clock.clock());
    int count = 0;

    scheduler.post([&] {
        count++;
        scheduler.post([&] { count++; });
    });

    CHECK(scheduler.run_pending() == 1);
    CHECK(count == 1);
    CHECK(scheduler.has_pending());

    CHECK(scheduler.run_pending() == 1);
    CHECK(count == 2);
    CHECK_FALSE(scheduler.has_pending());
}

TEST_CASE("cancelled timers never run", "[scheduler]") {
    ManualClock clock;
    Scheduler scheduler(clock.clock());
    bool ran = false;

    TimerId id = scheduler.post_delayed(10, [&] { ran = true; });
    CHECK(scheduler.next_due() == std::optional<Uint32>(clock.now + 10));
    CHECK(scheduler.cancel(id));
    CHECK_FALSE(scheduler.cancel(id));

    clock.now += 100;
    scheduler.run_pending();
    CHECK_FALSE(ran);
}

TEST_CASE("a task can cancel another task due in the same pump", "[scheduler]") {
    ManualClock clock;
    Scheduler scheduler(clock.clock());
    bool ran = false;
    TimerId later = 0;

    scheduler.post([&] { scheduler.cancel(later); });
    later = scheduler.post([&] { ran = true; });

    CHECK(scheduler.run_pending() == 1);
    CHECK_FALSE(ran);
    CHECK_FALSE(scheduler.has_pending());
}

TEST_CASE("debounced task keeps only the last schedule", "[scheduler]") {
    ManualClock clock;
    Scheduler scheduler(clock.clock());
    int runs = 0;
    DebouncedTask task(scheduler, 100, [&] { runs++; });

    task.schedule();
    clock.now += 60;
    scheduler.run_pending();
    task.schedule();
    clock.now += 60;
    scheduler.run_pending();
    CHECK(runs == 0);
    CHECK(task.is_pending());

    clock.now += 40;
    scheduler.run_pending();
    CHECK(runs == 1);
    CHECK_FALSE(task.is_pending());
}

TEST_CASE("cancellation listeners run once", "[scheduler]") {
    CancellationTokenSource source;
    CancellationToken token = source.token();
    int calls = 0;
    token.on_cancellation_requested([&] { calls++; });

    source.cancel();
    source.cancel();
    CHECK(calls == 1);
    CHECK(token.is_cancellation_requested());

    token.on_cancellation_requested([&] { calls++; });
    CHECK(calls == 2);
    REQUIRE(token.flag() != nullptr);
    CHECK(*token.flag() != 0);
}

TEST_CASE("default token is never cancelled", "[scheduler]") {
    CancellationToken token;
    CHECK_FALSE(token.is_cancellation_requested());
    CHECK(token.flag() == nullptr);
}
