#include "PaintedRegions.h"
#include "Constants.h"
#include <algorithm>
#include <cmath>

void PaintedRegions::add(LineIdx start, LineIdx end) {
    if (end <= start) return;
    ranges_.push_back({start, end});
    ranges_ = merge_spans(std::move(ranges_));
}

bool PaintedRegions::has(LineIdx start, LineIdx end) const {
    for (const auto& r : ranges_) {
        if (r.start <= start && r.end >= end) return true;
        if (r.start > start) break;
    }
    return false;
}

std::vector<LineRange> PaintedRegions::merge_spans(std::vector<LineRange> spans) {
    std::sort(spans.begin(), spans.end());
    std::vector<LineRange> merged;
    merged.reserve(spans.size());
    for (const auto& span : spans) {
        if (span.is_empty()) continue;
        if (!merged.empty() && span.start <= merged.back().end) {
            merged.back().end = std::max(merged.back().end, span.end);
        } else {
            merged.push_back(span);
        }
    }
    return merged;
}

std::vector<LineRange> expand_visible_ranges(const std::vector<LineRange>& visible, int screen_lines,
                                             LineIdx line_count) {
    std::vector<LineRange> expanded;
    expanded.reserve(visible.size());
    double height = static_cast<double>(screen_lines);
    for (const auto& span : visible) {
        double s = span.start;
        double e = span.end;
        LineIdx start = static_cast<LineIdx>(std::max(0.0, std::floor(s - height * VIEWPORT_EXPAND_ABOVE)));
        double limit = std::min({static_cast<double>(line_count),
                                 std::ceil(e + height * VIEWPORT_EXPAND_BELOW),
                                 s + height * VIEWPORT_EXPAND_LIMIT});
        expanded.push_back({start, static_cast<LineIdx>(limit)});
    }
    return PaintedRegions::merge_spans(std::move(expanded));
}
