#include <wikiladder/racer.hpp>
#include <wikiladder/log.hpp>
#include <wikiladder/mediawiki_transport.hpp>
#include <stdexcept>
#include <utility>

namespace wikiladder {

namespace {

RacerConfig validated(RacerConfig config) {
    config.validate();
    return config;
}

}  // anonymous namespace

Racer::Racer(RacerConfig config)
    : config_(validated(std::move(config))),
      owned_transport_(std::make_unique<MediaWikiTransport>(config_.transport())),
      transport_(*owned_transport_),
      oracle_(transport_, config_.oracle()),
      anchor_(oracle_, config_.anchor()),
      completion_(oracle_) {}

Racer::Racer(RacerConfig config, Transport& transport)
    : config_(validated(std::move(config))),
      transport_(transport),
      oracle_(transport_, config_.oracle()),
      anchor_(oracle_, config_.anchor()),
      completion_(oracle_) {}

PathResult Racer::find_path(const Title& start, const Title& end) {
    return find_path(std::vector<Title>{start, end});
}

PathResult Racer::find_path(const std::vector<Title>& waypoints) {
    if (waypoints.size() < 2) {
        throw std::invalid_argument("a path needs at least two pages");
    }

    // Decode user text once; everything downstream works on canonical titles
    std::vector<Title> stops;
    for (const auto& waypoint : waypoints) {
        stops.push_back(normalize_title(waypoint));
        if (stops.back().empty()) {
            throw std::invalid_argument("page titles must not be empty");
        }
    }

    PathResult total = PathResult::found({stops.front()});
    for (size_t i = 1; i < stops.size(); ++i) {
        Title source = total.path.back();
        PathResult leg = race(source, stops[i]);

        // The leg starts with the page the previous leg ended on
        total.path.insert(total.path.end(), leg.path.begin() + 1, leg.path.end());

        if (waypoints.size() == 2) {
            total.status = leg.status;
            total.message = leg.message;
            return total;
        }
        if (!leg.success()) {
            total.status = leg.status;
            total.message = "leg " + source + " -> " + stops[i] + ": " + leg.message;
            return total;
        }
    }

    return total;
}

PathResult Racer::race(const Title& from, const Title& to) {
    if (titles_equal_ignore_case(from, to)) {
        return PathResult::found({from}, "start and end are the same page");
    }

    log_debug("racer", "connecting %s -> %s", from.c_str(), to.c_str());
    OracleStats before = oracle_.stats();

    WikiLadder ladder = make_ladder(oracle_, from, to);
    WikiLadder anchored = anchor_.anchor(ladder);
    log_debug("racer", "anchored: %s", anchored.to_string().c_str());

    WikiLadder completed = completion_.complete(anchored);
    std::vector<Title> path = completed.to_sequence(GAP_MARKER);

    if (completed.is_complete()) {
        return PathResult::found(std::move(path));
    }
    if (!oracle_.reachable(before)) {
        return PathResult::unreachable(std::move(path),
            "every fetch failed, last error: " + oracle_.last_failure());
    }
    return PathResult::exhausted(std::move(path),
        "no ladder from " + from + " to " + to + " within the query budget");
}

} // namespace wikiladder
