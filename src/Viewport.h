#pragma once

#include "Types.h"
#include "Constants.h"
#include <vector>
#include <optional>
#include <unordered_map>

// What the host currently shows of each buffer.
class Viewport {
public:
    virtual ~Viewport() = default;

    // One range per window showing the buffer, empty when it is hidden.
    virtual std::vector<LineRange> visible_ranges(BufferId buffer) const = 0;
    // Range of the focused window on the buffer.
    virtual std::optional<LineRange> visible_range(BufferId buffer) const = 0;
    virtual int screen_lines() const = 0;

    bool is_hidden(BufferId buffer) const { return visible_ranges(buffer).empty(); }
};

class FixedViewport : public Viewport {
public:
    explicit FixedViewport(int screen_lines = DEFAULT_SCREEN_LINES) : screen_lines_(screen_lines) {}

    void show(BufferId buffer, std::vector<LineRange> ranges) { ranges_[buffer] = std::move(ranges); }
    void hide(BufferId buffer) { ranges_.erase(buffer); }

    std::vector<LineRange> visible_ranges(BufferId buffer) const override {
        auto it = ranges_.find(buffer);
        if (it == ranges_.end()) return {};
        return it->second;
    }

    std::optional<LineRange> visible_range(BufferId buffer) const override {
        auto it = ranges_.find(buffer);
        if (it == ranges_.end() || it->second.empty()) return std::nullopt;
        return it->second.front();
    }

    int screen_lines() const override { return screen_lines_; }

private:
    int screen_lines_;
    std::unordered_map<BufferId, std::vector<LineRange>> ranges_;
};
