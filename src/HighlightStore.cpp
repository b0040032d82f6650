#include "HighlightStore.h"
#include <algorithm>
#include <set>

namespace {

void sort_items(std::vector<HighlightItem>& items) {
    std::sort(items.begin(), items.end(), [](const HighlightItem& a, const HighlightItem& b) {
        if (a.col_start != b.col_start) return a.col_start < b.col_start;
        if (a.col_end != b.col_end) return a.col_end < b.col_end;
        return a.group < b.group;
    });
}

}

const HighlightStore::Namespace* HighlightStore::find(BufferId buffer, const std::string& ns) const {
    auto buf_it = buffers_.find(buffer);
    if (buf_it == buffers_.end()) return nullptr;
    auto ns_it = buf_it->second.find(ns);
    if (ns_it == buf_it->second.end()) return nullptr;
    return &ns_it->second;
}

std::optional<DiffSet> HighlightStore::diff(BufferId buffer, const std::string& ns,
                                            const std::vector<HighlightItem>& desired,
                                            std::optional<LineRange> restrict_to,
                                            const CancellationToken& token) {
    if (token.is_cancellation_requested() || closed_.contains(buffer)) return std::nullopt;

    LineItems wanted;
    for (const auto& item : desired) {
        if (restrict_to && !restrict_to->contains(item.line)) continue;
        wanted[item.line].push_back(item);
    }
    for (auto& [line, items] : wanted) {
        sort_items(items);
    }

    static const LineItems no_lines;
    const Namespace* current_ns = find(buffer, ns);
    const LineItems& current = current_ns ? current_ns->lines : no_lines;

    std::set<LineIdx> touched;
    for (const auto& [line, items] : wanted) touched.insert(line);
    for (const auto& [line, items] : current) {
        if (restrict_to && !restrict_to->contains(line)) continue;
        touched.insert(line);
    }

    DiffSet result;
    for (LineIdx line : touched) {
        auto want_it = wanted.find(line);
        auto have_it = current.find(line);
        bool has_want = want_it != wanted.end();
        bool has_have = have_it != current.end();
        if (has_want && has_have && want_it->second == have_it->second) continue;
        result.lines.push_back({line, has_want ? want_it->second : std::vector<HighlightItem>{}});
    }
    return result;
}

void HighlightStore::apply(BufferId buffer, const std::string& ns, int priority, const DiffSet& diff,
                           bool /*partial*/) {
    if (closed_.contains(buffer)) return;
    Namespace& target = buffers_[buffer][ns];
    target.priority = priority;
    for (const auto& line_diff : diff.lines) {
        if (line_diff.items.empty()) {
            target.lines.erase(line_diff.line);
        } else {
            target.lines[line_diff.line] = line_diff.items;
        }
    }
}

void HighlightStore::clear_namespace(BufferId buffer, const std::string& ns) {
    auto buf_it = buffers_.find(buffer);
    if (buf_it == buffers_.end()) return;
    buf_it->second.erase(ns);
}

void HighlightStore::close_buffer(BufferId buffer) {
    buffers_.erase(buffer);
    closed_.insert(buffer);
}

std::vector<HighlightItem> HighlightStore::items(BufferId buffer, const std::string& ns) const {
    std::vector<HighlightItem> result;
    const Namespace* target = find(buffer, ns);
    if (!target) return result;
    for (const auto& [line, items] : target->lines) {
        result.insert(result.end(), items.begin(), items.end());
    }
    return result;
}

std::vector<HighlightItem> HighlightStore::line_items(BufferId buffer, const std::string& ns, LineIdx line) const {
    const Namespace* target = find(buffer, ns);
    if (!target) return {};
    auto it = target->lines.find(line);
    if (it == target->lines.end()) return {};
    return it->second;
}

int HighlightStore::priority(BufferId buffer, const std::string& ns) const {
    const Namespace* target = find(buffer, ns);
    return target ? target->priority : 0;
}
