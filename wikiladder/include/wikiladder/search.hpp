#pragma once
// Search primitives shared by the anchor and completion phases
//
// A WikiLadder is a Ladder of titles whose link predicate is the oracle.
// RankedLadder pairs a ladder with a score computed once, when the item is
// created, so queue comparators stay pure.

#include "graph_oracle.hpp"
#include "ladder.hpp"
#include "title.hpp"
#include <cstdint>

namespace wikiladder {

using WikiLadder = Ladder<Title>;

// Stands in for the unclosed gap of an incomplete ladder
constexpr const char* GAP_MARKER = "...";

inline WikiLadder make_ladder(GraphOracle& oracle, const Title& start, const Title& end) {
    return WikiLadder(
        canonical_title(start), canonical_title(end),
        [&oracle](const Title& from, const Title& to) { return oracle.has_link_to(from, to); },
        [](const Title& a, const Title& b) { return titles_equal_ignore_case(a, b); });
}

struct RankedLadder {
    WikiLadder ladder;
    int score;          // popularity (anchor) or proximity (completion)
    uint64_t sequence;  // creation order, last tie-break
};

// std::priority_queue comparators: true if `a` should come out after `b`

// Anchor phase: most popular upper rung first
struct ByPopularity {
    bool operator()(const RankedLadder& a, const RankedLadder& b) const {
        if (a.score != b.score) return a.score < b.score;
        return a.sequence > b.sequence;
    }
};

// Completion phase: closest frontiers first, then shortest ladder
struct ByProximity {
    bool operator()(const RankedLadder& a, const RankedLadder& b) const {
        if (a.score != b.score) return a.score < b.score;
        if (a.ladder.height() != b.ladder.height()) {
            return a.ladder.height() > b.ladder.height();
        }
        return a.sequence > b.sequence;
    }
};

} // namespace wikiladder
