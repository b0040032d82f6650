#pragma once

#include <SDL2/SDL.h>
#include <functional>
#include <map>
#include <unordered_map>
#include <optional>
#include <cstdint>

using Clock = std::function<Uint32()>;
using TimerId = uint64_t;

Clock sdl_clock();

// Single-threaded event loop of continuations and timers. The host pumps it
// from its main loop; nothing here ever runs concurrently.
class Scheduler {
public:
    explicit Scheduler(Clock clock = sdl_clock());

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    TimerId post(std::function<void()> task);
    TimerId post_delayed(Uint32 delay_ms, std::function<void()> task);
    bool cancel(TimerId id);

    // Runs the tasks that were due on entry. Tasks posted meanwhile wait for
    // the next call, so one call is one frame of work.
    size_t run_pending();

    bool has_pending() const { return !tasks_.empty(); }
    std::optional<Uint32> next_due() const;
    Uint32 now() const { return clock_(); }
    const Clock& clock() const { return clock_; }

private:
    using Key = std::pair<Uint32, TimerId>;

    Clock clock_;
    TimerId next_id_ = 1;
    std::map<Key, std::function<void()>> tasks_;
    std::unordered_map<TimerId, Uint32> due_by_id_;
};

// Owns at most one pending run of a callback. Scheduling again supersedes the
// previous run.
class DebouncedTask {
public:
    DebouncedTask(Scheduler& scheduler, Uint32 delay_ms, std::function<void()> fn);
    ~DebouncedTask() { cancel(); }

    DebouncedTask(const DebouncedTask&) = delete;
    DebouncedTask& operator=(const DebouncedTask&) = delete;

    void schedule() { schedule(delay_ms_); }
    void schedule(Uint32 delay_ms);
    void cancel();
    bool is_pending() const { return timer_ != 0; }

private:
    Scheduler& scheduler_;
    Uint32 delay_ms_;
    std::function<void()> fn_;
    TimerId timer_ = 0;
};
