#include <wikiladder/anchor.hpp>
#include <wikiladder/log.hpp>
#include <queue>
#include <regex>
#include <stdexcept>
#include <unordered_set>
#include <utility>
#include <vector>

namespace wikiladder {

NoiseFilter year_in_place_filter() {
    static const std::regex year_in_place{"^[0-9]+ in .*"};
    return [](const Title& title) { return std::regex_match(title, year_in_place); };
}

AnchorSearch::AnchorSearch(GraphOracle& oracle, AnchorConfig config)
    : oracle_(oracle), config_(std::move(config)) {
    if (config_.threshold < 1) {
        throw std::invalid_argument("anchor_threshold must be at least 1");
    }
}

bool AnchorSearch::is_anchored(const WikiLadder& ladder) {
    return ladder.is_complete() || oracle_.popularity(ladder.upper_rung()) >= config_.threshold;
}

WikiLadder AnchorSearch::anchor(const WikiLadder& ladder) {
    expansions_ = 0;
    if (is_anchored(ladder)) return ladder;

    std::priority_queue<RankedLadder, std::vector<RankedLadder>, ByPopularity> queue;
    std::unordered_set<Title> expanded;
    uint64_t sequence = 0;

    queue.push({ladder, oracle_.popularity(ladder.upper_rung()), sequence++});

    while (!queue.empty()) {
        RankedLadder best = queue.top();
        queue.pop();

        const Title upper = best.ladder.upper_rung();
        if (!expanded.insert(upper).second) continue;
        expansions_++;

        log_debug("anchor", "best anchor: %s (popularity %d)",
                  best.ladder.to_string().c_str(), best.score);

        auto linking = oracle_.inbound_neighbors(upper);
        for (const auto& rung : *linking) {
            if (expanded.count(rung)) continue;
            if (config_.is_noise && config_.is_noise(rung)) continue;

            WikiLadder derived = best.ladder;
            RungStatus status = derived.add_upper_rung(rung);
            if (status != RungStatus::Applied) {
                if (status != RungStatus::NoOp) {
                    log_debug("anchor", "skipping %s: %s", rung.c_str(), rung_status_name(status));
                }
                continue;
            }

            if (is_anchored(derived)) {
                log_debug("anchor", "anchored at %s after %zu expansions",
                          rung.c_str(), expansions_);
                return derived;
            }

            int popularity = oracle_.popularity(rung);
            queue.push({std::move(derived), popularity, sequence++});
        }
    }

    log_debug("anchor", "no anchor reachable from %s", ladder.end().c_str());
    return ladder;
}

} // namespace wikiladder
