#include <wikiladder/graph_oracle.hpp>
#include <wikiladder/log.hpp>
#include <algorithm>
#include <exception>
#include <mutex>
#include <unordered_set>
#include <utility>

namespace wikiladder {

namespace {

TitleSetRef make_ref(TitleSet set) {
    return std::make_shared<const TitleSet>(std::move(set));
}

}  // anonymous namespace

GraphOracle::GraphOracle(Transport& transport, OracleConfig config)
    : transport_(transport), config_(std::move(config)) {
    config_.validate();
    config_.home_title = canonical_title(config_.home_title);
}

template<typename Fetch>
TitleSetRef GraphOracle::memoize(Cache& cache, const Title& key, Fetch&& fetch) {
    std::unique_lock lock(mutex_);

    auto it = cache.entries.find(key);
    if (it != cache.entries.end()) {
        cache_hits_++;
        return it->second;
    }

    // Someone else is already fetching this key: wait for their result
    auto flight = cache.in_flight.find(key);
    if (flight != cache.in_flight.end()) {
        std::shared_future<TitleSetRef> pending = flight->second;
        lock.unlock();
        cache_hits_++;
        return pending.get();
    }

    std::promise<TitleSetRef> promise;
    cache.in_flight.emplace(key, promise.get_future().share());
    lock.unlock();

    TitleSetRef result;
    try {
        result = fetch();
    } catch (...) {
        lock.lock();
        cache.in_flight.erase(key);
        lock.unlock();
        promise.set_exception(std::current_exception());
        throw;
    }

    lock.lock();
    cache.entries.emplace(key, result);
    cache.in_flight.erase(key);
    lock.unlock();

    promise.set_value(result);
    return result;
}

std::optional<TitleSetRef> GraphOracle::peek(const Cache& cache, const Title& key) const {
    std::shared_lock lock(mutex_);
    auto it = cache.entries.find(key);
    if (it == cache.entries.end()) return std::nullopt;
    return it->second;
}

std::optional<TitleSetRef> GraphOracle::cached_outbound(const Title& title) const {
    return peek(outbound_, canonical_title(title));
}

std::optional<TitleSetRef> GraphOracle::cached_inbound(const Title& title) const {
    return peek(inbound_, canonical_title(title));
}

// Follow redirect -> target until a page that is not itself a redirect.
// A chain that loops back has no real target.
std::optional<Title> GraphOracle::resolve_redirect(const Title& title) const {
    std::shared_lock lock(mutex_);
    std::unordered_set<Title> seen{title};
    Title current = title;
    for (;;) {
        auto it = redirect_targets_.find(current);
        if (it == redirect_targets_.end()) break;
        current = it->second;
        if (!seen.insert(current).second) return std::nullopt;
    }
    if (current == title) return std::nullopt;
    return current;
}

void GraphOracle::record_failure(const char* what, const Title& title, const std::string& thrown) {
    failed_fetches_++;
    std::string reason = thrown.empty() ? transport_.last_error() : thrown;
    log_warn("oracle", "fetching %s '%s' failed: %s", what, title.c_str(), reason.c_str());

    std::unique_lock lock(mutex_);
    last_failure_ = std::move(reason);
}

std::string GraphOracle::last_failure() const {
    std::shared_lock lock(mutex_);
    return last_failure_;
}

TitleSetRef GraphOracle::outbound_neighbors(const Title& title) {
    Title key = canonical_title(title);
    return memoize(outbound_, key, [this, &key] { return fetch_outbound(key); });
}

TitleSetRef GraphOracle::inbound_neighbors(const Title& title) {
    Title key = canonical_title(title);
    return memoize(inbound_, key, [this, &key] { return fetch_inbound(key); });
}

TitleSetRef GraphOracle::redirects_to(const Title& title) {
    Title key = canonical_title(title);
    return memoize(redirects_, key, [this, &key] { return fetch_redirects(key); });
}

TitleSetRef GraphOracle::fetch_outbound(const Title& title) {
    // A redirect links to whatever its target links to
    if (auto target = resolve_redirect(title)) {
        TitleSet links = *outbound_neighbors(*target);
        links.insert(title);
        log_debug("oracle", "outbound(%s) aliased to redirect target %s",
                  title.c_str(), target->c_str());
        return make_ref(std::move(links));
    }

    page_fetches_++;
    std::optional<std::string> html;
    std::string thrown;
    try {
        html = transport_.fetch_rendered_page(title);
    } catch (const std::exception& e) {
        thrown = e.what();
    }

    TitleSet links;
    if (html) {
        links = extract_links(*html);
    } else {
        record_failure("page", title, thrown);
    }

    links.insert(title);
    links.erase(config_.home_title);

    log_debug("oracle", "outbound(%s) = %zu links", title.c_str(), links.size() - 1);
    return make_ref(std::move(links));
}

TitleSetRef GraphOracle::fetch_inbound(const Title& title) {
    TitleSet links;
    std::string cursor;

    for (int fetches = 0; fetches < config_.fetch_limit; ++fetches) {
        inbound_page_fetches_++;
        std::optional<InboundPage> page;
        std::string thrown;
        try {
            page = transport_.fetch_inbound_page(title, cursor, config_.query_limit);
        } catch (const std::exception& e) {
            thrown = e.what();
        }
        if (!page) {
            record_failure("backlinks of", title, thrown);
            break;
        }

        for (const auto& raw : page->titles) {
            Title linking = canonical_title(raw);
            if (!linking.empty()) {
                links.insert(std::move(linking));
            }
        }

        if (!page->next_cursor) break;
        cursor = *page->next_cursor;
    }

    auto redirects = redirects_to(title);
    links.insert(redirects->begin(), redirects->end());

    log_debug("oracle", "inbound(%s) = %zu links (%zu redirects)",
              title.c_str(), links.size(), redirects->size());
    return make_ref(std::move(links));
}

TitleSetRef GraphOracle::fetch_redirects(const Title& title) {
    redirect_fetches_++;
    std::optional<std::vector<Title>> fetched;
    std::string thrown;
    try {
        fetched = transport_.fetch_redirects_to(title);
    } catch (const std::exception& e) {
        thrown = e.what();
    }

    TitleSet redirects;
    if (fetched) {
        for (const auto& raw : *fetched) {
            Title redirect = canonical_title(raw);
            if (!redirect.empty() && redirect != title) {
                redirects.insert(std::move(redirect));
            }
        }
    } else {
        record_failure("redirects to", title, thrown);
    }

    {
        std::unique_lock lock(mutex_);
        for (const auto& redirect : redirects) {
            redirect_targets_.emplace(redirect, title);
        }
    }

    return make_ref(std::move(redirects));
}

bool GraphOracle::has_link_to(const Title& from, const Title& to) {
    Title a = canonical_title(from);
    Title b = canonical_title(to);
    if (a == b) return true;

    {
        std::shared_lock lock(mutex_);
        auto in = inbound_.entries.find(b);
        if (in != inbound_.entries.end() && in->second->count(a)) {
            return true;
        }
        auto out = outbound_.entries.find(a);
        if (out != outbound_.entries.end()) {
            return out->second->count(b) > 0;
        }
    }

    return outbound_neighbors(a)->count(b) > 0;
}

int GraphOracle::degree(const Title& title) {
    return static_cast<int>(outbound_neighbors(title)->size()) - 1;
}

int GraphOracle::popularity(const Title& title) {
    return static_cast<int>(inbound_neighbors(title)->size());
}

int GraphOracle::links_in_common(const Title& a, const Title& b) {
    auto a_links = outbound_neighbors(a);
    auto b_links = outbound_neighbors(b);

    // Iterate the small set, look up in the large one
    const TitleSet& small = a_links->size() < b_links->size() ? *a_links : *b_links;
    const TitleSet& large = a_links->size() < b_links->size() ? *b_links : *a_links;

    int common = 0;
    for (const auto& title : small) {
        if (large.count(title)) {
            common++;
        }
    }
    return common;
}

OracleStats GraphOracle::stats() const {
    OracleStats s;
    s.page_fetches = page_fetches_;
    s.inbound_page_fetches = inbound_page_fetches_;
    s.redirect_fetches = redirect_fetches_;
    s.failed_fetches = failed_fetches_;
    s.cache_hits = cache_hits_;
    return s;
}

bool GraphOracle::reachable() const {
    return reachable(OracleStats{});
}

bool GraphOracle::reachable(const OracleStats& since) const {
    OracleStats now = stats();
    uint64_t attempted = now.total_fetches() - since.total_fetches();
    uint64_t failed = now.failed_fetches - since.failed_fetches;
    return attempted == 0 || failed < attempted;
}

TitleSet GraphOracle::extract_links(const std::string& html) {
    static const std::string MARKER = "<a href=\"/wiki/";

    TitleSet links;
    size_t pos = 0;
    while ((pos = html.find(MARKER, pos)) != std::string::npos) {
        pos += MARKER.size();
        size_t end = html.find('"', pos);
        if (end == std::string::npos) break;

        std::string target = html.substr(pos, end - pos);
        pos = end;

        auto cut = target.find_first_of("#?");
        if (cut != std::string::npos) {
            target.erase(cut);
        }

        Title title = normalize_title(target);
        if (title.empty() || has_namespace_prefix(title)) continue;

        links.insert(std::move(title));
    }
    return links;
}

} // namespace wikiladder
