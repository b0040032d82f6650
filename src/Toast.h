#pragma once

#include "Scheduler.h"
#include "Constants.h"
#include <string>
#include <vector>
#include <algorithm>

enum class ToastType {
    Info,
    Warning,
    Error,
    Success
};

struct Toast {
    std::string title;
    std::string message;
    ToastType type;
    Uint32 created_at;
    Uint32 delay_ms;
    int id;

    bool is_expired(Uint32 now) const {
        return (now - created_at) >= delay_ms;
    }
};

// User-facing message channel.
class MessageSink {
public:
    virtual ~MessageSink() = default;
    virtual void show(const std::string& title, const std::string& message, ToastType type) = 0;

    void show_info(const std::string& title, const std::string& message) { show(title, message, ToastType::Info); }
    void show_warning(const std::string& title, const std::string& message) { show(title, message, ToastType::Warning); }
    void show_error(const std::string& title, const std::string& message) { show(title, message, ToastType::Error); }
};

// Timed messages the host draws and expires on its own frame clock.
class ToastQueue : public MessageSink {
public:
    explicit ToastQueue(Clock clock = sdl_clock()) : clock_(std::move(clock)) {}

    void show(const std::string& title, const std::string& message, ToastType type) override {
        toasts_.push_back({
            .title = title,
            .message = message,
            .type = type,
            .created_at = clock_(),
            .delay_ms = default_delay(type),
            .id = next_id_++
        });
    }

    void update() {
        if (toasts_.empty()) return;

        Uint32 now = clock_();
        toasts_.erase(
            std::remove_if(toasts_.begin(), toasts_.end(),
                [now](const Toast& t) { return t.is_expired(now); }),
            toasts_.end()
        );
    }

    void dismiss(int id) {
        toasts_.erase(
            std::remove_if(toasts_.begin(), toasts_.end(),
                [id](const Toast& t) { return t.id == id; }),
            toasts_.end()
        );
    }

    const std::vector<Toast>& toasts() const { return toasts_; }
    bool empty() const { return toasts_.empty(); }

private:
    Clock clock_;
    std::vector<Toast> toasts_;
    int next_id_ = 0;

    static Uint32 default_delay(ToastType type) {
        switch (type) {
            case ToastType::Warning: return TOAST_WARNING_MS;
            case ToastType::Error: return TOAST_ERROR_MS;
            default: return TOAST_INFO_MS;
        }
    }
};

// Progress indicator for an in-flight request.
struct StatusItem {
    std::string text;
    bool is_progress = false;
    bool visible = false;

    void show() { visible = true; }
    void hide() { visible = false; is_progress = false; }
};
