#pragma once

#include "HighlightRenderer.h"
#include <map>
#include <unordered_map>
#include <unordered_set>

// In-process renderer: keeps the painted items of every buffer namespace
// line by line.
class HighlightStore : public HighlightRenderer {
public:
    std::optional<DiffSet> diff(BufferId buffer, const std::string& ns,
                                const std::vector<HighlightItem>& desired,
                                std::optional<LineRange> restrict_to,
                                const CancellationToken& token) override;

    void apply(BufferId buffer, const std::string& ns, int priority, const DiffSet& diff,
               bool partial) override;

    void clear_namespace(BufferId buffer, const std::string& ns) override;

    void close_buffer(BufferId buffer);

    std::vector<HighlightItem> items(BufferId buffer, const std::string& ns) const;
    std::vector<HighlightItem> line_items(BufferId buffer, const std::string& ns, LineIdx line) const;
    int priority(BufferId buffer, const std::string& ns) const;

private:
    using LineItems = std::map<LineIdx, std::vector<HighlightItem>>;

    struct Namespace {
        LineItems lines;
        int priority = 0;
    };

    std::unordered_map<BufferId, std::unordered_map<std::string, Namespace>> buffers_;
    std::unordered_set<BufferId> closed_;

    const Namespace* find(BufferId buffer, const std::string& ns) const;
};
