#include <wikiladder/completion.hpp>
#include <wikiladder/log.hpp>
#include <climits>
#include <queue>
#include <unordered_set>
#include <utility>
#include <vector>

namespace wikiladder {

CompletionSearch::CompletionSearch(GraphOracle& oracle)
    : oracle_(oracle) {}

int CompletionSearch::proximity(const WikiLadder& ladder) {
    if (ladder.is_complete()) return INT_MAX;
    return oracle_.links_in_common(ladder.lower_rung(), ladder.upper_rung());
}

RankedLadder CompletionSearch::rank(WikiLadder ladder, uint64_t sequence) {
    int score = proximity(ladder);
    return {std::move(ladder), score, sequence};
}

WikiLadder CompletionSearch::complete(const WikiLadder& ladder) {
    expansions_ = 0;
    if (ladder.is_complete()) return ladder;

    // Snapshot of pages known to link to the target; fixed for this search
    TitleSetRef net = oracle_.inbound_neighbors(ladder.upper_rung());

    std::priority_queue<RankedLadder, std::vector<RankedLadder>, ByProximity> queue;
    std::unordered_set<Title> visited{ladder.lower_rung()};
    ByProximity ranks_below;
    uint64_t sequence = 0;

    RankedLadder best = rank(ladder, sequence++);
    queue.push(best);

    while (!queue.empty()) {
        RankedLadder current = queue.top();
        queue.pop();
        expansions_++;

        log_debug("complete", "best so far: %s (proximity %d)",
                  current.ladder.to_string().c_str(), current.score);

        auto neighbors = oracle_.outbound_neighbors(current.ladder.lower_rung());
        for (const auto& neighbor : *neighbors) {
            if (visited.count(neighbor)) continue;

            WikiLadder derived = current.ladder;
            RungStatus status = derived.add_lower_rung(neighbor);
            if (status != RungStatus::Applied) {
                log_debug("complete", "skipping %s: %s", neighbor.c_str(), rung_status_name(status));
                continue;
            }

            if (derived.is_complete()) return derived;

            // Did the net catch this page?
            for (const auto& caught : *net) {
                if (oracle_.has_link_to(neighbor, caught) &&
                    derived.add_lower_rung(caught) == RungStatus::Applied) {
                    log_debug("complete", "net caught %s via %s", neighbor.c_str(), caught.c_str());
                    return derived;
                }
            }

            RankedLadder ranked = rank(std::move(derived), sequence++);
            if (ranks_below(best, ranked)) {
                best = ranked;
            }
            queue.push(std::move(ranked));
            visited.insert(neighbor);
        }
    }

    log_debug("complete", "exhausted after %zu expansions", expansions_);
    return best.ladder;
}

} // namespace wikiladder
