#pragma once

#include "Types.h"
#include <vector>

// Ordered, non-overlapping line intervals already reconciled with the
// renderer for the current decoded spans.
class PaintedRegions {
public:
    void add(LineIdx start, LineIdx end);
    bool has(LineIdx start, LineIdx end) const;
    void clear() { ranges_.clear(); }

    bool empty() const { return ranges_.empty(); }
    const std::vector<LineRange>& ranges() const { return ranges_; }

    // Sorts and coalesces overlapping or touching intervals.
    static std::vector<LineRange> merge_spans(std::vector<LineRange> spans);

private:
    std::vector<LineRange> ranges_;
};

// Grows each visible range by the scroll margin, clamped to the document.
std::vector<LineRange> expand_visible_ranges(const std::vector<LineRange>& visible, int screen_lines,
                                             LineIdx line_count);
