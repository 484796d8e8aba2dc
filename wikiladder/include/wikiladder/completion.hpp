#pragma once
// Completion search: climb from the start until the ladder closes
//
// Best-first over lower-section extensions, ranked by how many links the
// lower and upper rungs share. The pages already known to link to the
// upper rung form a net: any candidate that links into the net closes the
// ladder one rung later, without waiting for the frontier to get there.

#include "graph_oracle.hpp"
#include "search.hpp"
#include <cstddef>

namespace wikiladder {

class CompletionSearch {
public:
    explicit CompletionSearch(GraphOracle& oracle);

    // Completed copy of the ladder, or the best incomplete ladder seen once
    // the reachable pages are exhausted
    WikiLadder complete(const WikiLadder& ladder);

    // Proximity score: INT_MAX when complete, else shared outbound links
    int proximity(const WikiLadder& ladder);

    // Lower frontiers expanded by the last complete() call
    size_t expansions() const { return expansions_; }

private:
    RankedLadder rank(WikiLadder ladder, uint64_t sequence);

    GraphOracle& oracle_;
    size_t expansions_ = 0;
};

} // namespace wikiladder
