#pragma once
// GraphOracle: the remote link graph as a memoized, budgeted lookup
//
// Every neighbor set is fetched at most once per key and then served from
// the cache as a shared read-only view. Fetch failures are soft: they are
// logged, counted, and answered with an empty result so that one bad page
// cannot abort a whole search. A transport that throws is treated the same
// as one that reports a failure.
//
// Thread safety: caches are guarded by a shared mutex and each key has at
// most one fetch in flight. A second caller asking for a key that is being
// fetched waits for the first caller's result instead of fetching again.

#include "title.hpp"
#include "transport.hpp"
#include <atomic>
#include <cstdint>
#include <future>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace wikiladder {

constexpr int DEFAULT_QUERY_LIMIT = 500;
constexpr int DEFAULT_FETCH_LIMIT = 2;
constexpr const char* DEFAULT_HOME_TITLE = "Main Page";

struct OracleConfig {
    int query_limit = DEFAULT_QUERY_LIMIT;  // results requested per backlink page
    int fetch_limit = DEFAULT_FETCH_LIMIT;  // backlink pages per inbound query
    Title home_title = DEFAULT_HOME_TITLE;  // never reported as an outbound link

    void validate() const {
        if (query_limit < 1) {
            throw std::invalid_argument("query_limit must be at least 1");
        }
        if (fetch_limit < 1) {
            throw std::invalid_argument("fetch_limit must be at least 1");
        }
    }
};

struct OracleStats {
    uint64_t page_fetches = 0;          // rendered pages requested
    uint64_t inbound_page_fetches = 0;  // backlink pages requested
    uint64_t redirect_fetches = 0;      // redirect lists requested
    uint64_t failed_fetches = 0;        // any of the above that failed
    uint64_t cache_hits = 0;

    uint64_t total_fetches() const {
        return page_fetches + inbound_page_fetches + redirect_fetches;
    }
};

class GraphOracle {
public:
    explicit GraphOracle(Transport& transport, OracleConfig config = {});

    // Owns caches that hand out shared views; never copied
    GraphOracle(const GraphOracle&) = delete;
    GraphOracle& operator=(const GraphOracle&) = delete;

    // Titles linked from the page, including the page itself, never the
    // home page. A redirect shares the links of its target.
    TitleSetRef outbound_neighbors(const Title& title);

    // Titles linking to the page plus redirects into it. Limited to
    // fetch_limit backlink pages of query_limit results each.
    TitleSetRef inbound_neighbors(const Title& title);

    // Redirect pages that resolve to the page
    TitleSetRef redirects_to(const Title& title);

    // Cheapest available evidence first: identity, cached backlinks of b,
    // cached links of a, then a fetch of a's links.
    bool has_link_to(const Title& from, const Title& to);

    int degree(const Title& title);
    int popularity(const Title& title);
    int links_in_common(const Title& a, const Title& b);

    // Cache peeks; never fetch
    std::optional<TitleSetRef> cached_outbound(const Title& title) const;
    std::optional<TitleSetRef> cached_inbound(const Title& title) const;

    OracleStats stats() const;

    // False once fetches were attempted and every one of them failed
    bool reachable() const;

    // Same, counting only fetches made after `since` was taken from stats()
    bool reachable(const OracleStats& since) const;

    // Reason given for the most recent failed fetch
    std::string last_failure() const;

    const OracleConfig& config() const { return config_; }

    // Article links in rendered markup: targets of <a href="/wiki/...">
    // outside non-article namespaces, fragments stripped, normalized.
    static TitleSet extract_links(const std::string& html);

private:
    struct Cache {
        std::unordered_map<Title, TitleSetRef> entries;
        std::unordered_map<Title, std::shared_future<TitleSetRef>> in_flight;
    };

    template<typename Fetch>
    TitleSetRef memoize(Cache& cache, const Title& key, Fetch&& fetch);

    std::optional<TitleSetRef> peek(const Cache& cache, const Title& key) const;

    TitleSetRef fetch_outbound(const Title& title);
    TitleSetRef fetch_inbound(const Title& title);
    TitleSetRef fetch_redirects(const Title& title);

    std::optional<Title> resolve_redirect(const Title& title) const;
    void record_failure(const char* what, const Title& title, const std::string& thrown);

    Transport& transport_;
    OracleConfig config_;

    mutable std::shared_mutex mutex_;
    Cache outbound_;
    Cache inbound_;
    Cache redirects_;
    std::unordered_map<Title, Title> redirect_targets_;  // redirect -> target
    std::string last_failure_;

    std::atomic<uint64_t> page_fetches_{0};
    std::atomic<uint64_t> inbound_page_fetches_{0};
    std::atomic<uint64_t> redirect_fetches_{0};
    std::atomic<uint64_t> failed_fetches_{0};
    std::atomic<uint64_t> cache_hits_{0};
};

} // namespace wikiladder
