#pragma once

#include "Types.h"
#include "Cancellation.h"
#include <optional>
#include <string>
#include <vector>

// Replacement item list for one line.
struct LineDiff {
    LineIdx line = 0;
    std::vector<HighlightItem> items;
};

struct DiffSet {
    std::vector<LineDiff> lines;

    bool empty() const { return lines.empty(); }
};

// Rendering primitive that owns painted highlights per buffer and namespace.
class HighlightRenderer {
public:
    virtual ~HighlightRenderer() = default;

    // Changes needed to make the namespace show exactly `desired`, limited to
    // `restrict_to` when given. nullopt when cancelled or the buffer is gone.
    virtual std::optional<DiffSet> diff(BufferId buffer, const std::string& ns,
                                        const std::vector<HighlightItem>& desired,
                                        std::optional<LineRange> restrict_to,
                                        const CancellationToken& token) = 0;

    virtual void apply(BufferId buffer, const std::string& ns, int priority, const DiffSet& diff,
                       bool partial) = 0;

    virtual void clear_namespace(BufferId buffer, const std::string& ns) = 0;
};
