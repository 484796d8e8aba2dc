#pragma once
// Anchor search: move the destination somewhere reachable
//
// Forward search has no hope of stumbling onto an obscure page. Before
// completing a ladder, hang rungs under its upper section until the
// innermost upper rung is popular: at least `threshold` known pages link
// to it. Candidates are explored best-first by popularity.

#include "graph_oracle.hpp"
#include "search.hpp"
#include <cstddef>
#include <functional>

namespace wikiladder {

constexpr int DEFAULT_ANCHOR_THRESHOLD = 1000;

// Returns true for titles that should never become an anchor candidate
using NoiseFilter = std::function<bool(const Title&)>;

// "1809 in Denmark": linked to almost exclusively by its siblings, so it
// pulls the frontier into a dead end. Annual event pages ("1995 Men's
// Curling Championship") slip through; no general pattern is known.
NoiseFilter year_in_place_filter();

struct AnchorConfig {
    int threshold = DEFAULT_ANCHOR_THRESHOLD;
    NoiseFilter is_noise = year_in_place_filter();
};

class AnchorSearch {
public:
    AnchorSearch(GraphOracle& oracle, AnchorConfig config);

    // Complete, or the upper rung is popular enough
    bool is_anchored(const WikiLadder& ladder);

    // Anchored copy of the ladder, or the ladder unchanged when no anchor
    // can be reached
    WikiLadder anchor(const WikiLadder& ladder);

    // Upper frontiers expanded by the last anchor() call
    size_t expansions() const { return expansions_; }

    const AnchorConfig& config() const { return config_; }

private:
    GraphOracle& oracle_;
    AnchorConfig config_;
    size_t expansions_ = 0;
};

} // namespace wikiladder
