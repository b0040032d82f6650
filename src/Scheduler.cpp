#include "Scheduler.h"
#include <vector>

Clock sdl_clock() {
    return [] { return SDL_GetTicks(); };
}

Scheduler::Scheduler(Clock clock) : clock_(std::move(clock)) {}

TimerId Scheduler::post(std::function<void()> task) {
    return post_delayed(0, std::move(task));
}

TimerId Scheduler::post_delayed(Uint32 delay_ms, std::function<void()> task) {
    TimerId id = next_id_++;
    Uint32 due = clock_() + delay_ms;
    tasks_.emplace(Key{due, id}, std::move(task));
    due_by_id_[id] = due;
    return id;
}

bool Scheduler::cancel(TimerId id) {
    auto it = due_by_id_.find(id);
    if (it == due_by_id_.end()) return false;
    tasks_.erase(Key{it->second, id});
    due_by_id_.erase(it);
    return true;
}

size_t Scheduler::run_pending() {
    Uint32 now = clock_();
    std::vector<Key> due;
    for (const auto& entry : tasks_) {
        if (static_cast<int32_t>(now - entry.first.first) < 0) break;
        due.push_back(entry.first);
    }

    size_t ran = 0;
    for (const Key& key : due) {
        auto it = tasks_.find(key);
        if (it == tasks_.end()) continue;

        std::function<void()> task = std::move(it->second);
        due_by_id_.erase(key.second);
        tasks_.erase(it);
        task();
        ran++;
    }
    return ran;
}

std::optional<Uint32> Scheduler::next_due() const {
    if (tasks_.empty()) return std::nullopt;
    return tasks_.begin()->first.first;
}

DebouncedTask::DebouncedTask(Scheduler& scheduler, Uint32 delay_ms, std::function<void()> fn)
    : scheduler_(scheduler), delay_ms_(delay_ms), fn_(std::move(fn)) {}

void DebouncedTask::schedule(Uint32 delay_ms) {
    cancel();
    timer_ = scheduler_.post_delayed(delay_ms, [this] {
        timer_ = 0;
        fn_();
    });
}

void DebouncedTask::cancel() {
    if (timer_ == 0) return;
    scheduler_.cancel(timer_);
    timer_ = 0;
}
