#pragma once

#include <memory>
#include <functional>
#include <vector>
#include <cstddef>

class CancellationToken {
public:
    CancellationToken() = default;

    bool is_cancellation_requested() const { return state_ && state_->cancelled != 0; }

    // Runs the callback right away when cancellation was already requested.
    void on_cancellation_requested(std::function<void()> callback) const {
        if (!state_) return;
        if (state_->cancelled) {
            callback();
            return;
        }
        if (!state_->disposed) {
            state_->listeners.push_back(std::move(callback));
        }
    }

    // Stable address of the flag, for parsers that poll a size_t.
    const size_t* flag() const { return state_ ? &state_->cancelled : nullptr; }

private:
    friend class CancellationTokenSource;

    struct State {
        size_t cancelled = 0;
        bool disposed = false;
        std::vector<std::function<void()>> listeners;
    };

    explicit CancellationToken(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

class CancellationTokenSource {
public:
    CancellationTokenSource() : state_(std::make_shared<CancellationToken::State>()) {}
    ~CancellationTokenSource() { dispose(); }

    CancellationTokenSource(const CancellationTokenSource&) = delete;
    CancellationTokenSource& operator=(const CancellationTokenSource&) = delete;

    CancellationToken token() const { return CancellationToken(state_); }

    void cancel() {
        if (state_->cancelled) return;
        state_->cancelled = 1;
        auto listeners = std::move(state_->listeners);
        state_->listeners.clear();
        for (auto& listener : listeners) {
            listener();
        }
    }

    // Safe to call more than once. Tokens keep reporting the last cancellation state.
    void dispose() {
        if (state_->disposed) return;
        state_->disposed = true;
        state_->listeners.clear();
    }

    bool is_disposed() const { return state_->disposed; }

private:
    std::shared_ptr<CancellationToken::State> state_;
};

using CancellationSourcePtr = std::unique_ptr<CancellationTokenSource>;

inline void cancel_and_dispose(CancellationSourcePtr& source) {
    if (!source) return;
    source->cancel();
    source->dispose();
    source.reset();
}
