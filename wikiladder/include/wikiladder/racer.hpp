#pragma once
// Racer: find a chain of clickable links from one page to another
//
//   Racer racer;
//   auto result = racer.find_path("Emu", "Stanford University");
//   // result.path: Emu, Food and Drug Administration, Duke University,
//   //              Stanford University
//
// A racer owns one oracle; every search it runs shares the cache.

#include "anchor.hpp"
#include "completion.hpp"
#include "config.hpp"
#include "graph_oracle.hpp"
#include "search.hpp"
#include "transport.hpp"
#include <memory>
#include <string>
#include <vector>

namespace wikiladder {

struct PathResult {
    enum class Status {
        Found,        // complete path
        Exhausted,    // search space or budget ran out; path has a gap
        Unreachable   // every fetch failed; nothing was learned
    };

    Status status = Status::Found;
    std::vector<Title> path;
    std::string message;

    bool success() const { return status == Status::Found; }

    static PathResult found(std::vector<Title> path, std::string message = "") {
        return {Status::Found, std::move(path), std::move(message)};
    }

    static PathResult exhausted(std::vector<Title> path, std::string message) {
        return {Status::Exhausted, std::move(path), std::move(message)};
    }

    static PathResult unreachable(std::vector<Title> path, std::string message) {
        return {Status::Unreachable, std::move(path), std::move(message)};
    }
};

inline const char* status_name(PathResult::Status status) {
    switch (status) {
        case PathResult::Status::Found: return "found";
        case PathResult::Status::Exhausted: return "exhausted";
        case PathResult::Status::Unreachable: return "unreachable";
    }
    return "unknown";
}

class Racer {
public:
    // Talks to the MediaWiki site named in the config
    explicit Racer(RacerConfig config = {});

    // Uses a caller-provided transport (which must outlive the racer)
    Racer(RacerConfig config, Transport& transport);

    Racer(const Racer&) = delete;
    Racer& operator=(const Racer&) = delete;

    PathResult find_path(const Title& start, const Title& end);

    // start -> w1 -> ... -> end, each leg starting where the last one ended
    PathResult find_path(const std::vector<Title>& waypoints);

    GraphOracle& oracle() { return oracle_; }
    AnchorSearch& anchor_search() { return anchor_; }
    CompletionSearch& completion_search() { return completion_; }
    const RacerConfig& config() const { return config_; }

private:
    // One leg between canonical titles
    PathResult race(const Title& from, const Title& to);

    RacerConfig config_;
    std::unique_ptr<Transport> owned_transport_;
    Transport& transport_;
    GraphOracle oracle_;
    AnchorSearch anchor_;
    CompletionSearch completion_;
};

} // namespace wikiladder
