#include <wikiladder/wikiladder.hpp>
#include <iostream>
#include <cassert>
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace wikiladder;

// In-memory link graph standing in for the wiki. Backlink pages are served
// `limit` titles at a time with the offset as cursor.
class SyntheticTransport : public Transport {
public:
    void link(const Title& from, const Title& to) {
        outbound_[from].push_back(to);
        inbound_[to].push_back(from);
    }

    // Pages that link to `to` but are never fetched themselves
    void add_backlinks(const Title& to, int count, const std::string& prefix) {
        for (int i = 0; i < count; ++i) {
            inbound_[to].push_back(prefix + " " + std::to_string(i));
        }
    }

    void redirect(const Title& from, const Title& to) {
        redirects_[to].push_back(from);
    }

    void fail_everything() { fail_ = true; }
    void slow_down(int ms) { delay_ms_ = ms; }

    std::optional<std::string> fetch_rendered_page(const Title& title) override {
        record(page_calls_, title);
        if (delay_ms_ > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_));
        }
        if (fail_) {
            error_ = "synthetic outage";
            return std::nullopt;
        }

        std::string html = "<html><body>"
                           "<a href=\"/wiki/Main_Page\" title=\"Main Page\">Main</a>"
                           "<a href=\"/wiki/Help:Contents\">Help</a>";
        auto it = outbound_.find(title);
        if (it != outbound_.end()) {
            for (const auto& to : it->second) {
                html += "<p><a href=\"/wiki/" + encode_title(to) + "\" title=\"" + to + "\">" +
                        to + "</a></p>";
            }
        }
        return html + "</body></html>";
    }

    std::optional<InboundPage> fetch_inbound_page(
        const Title& title, const std::string& cursor, int limit) override {
        record(inbound_calls_, title);
        if (fail_) {
            error_ = "synthetic outage";
            return std::nullopt;
        }

        InboundPage page;
        auto it = inbound_.find(title);
        if (it == inbound_.end()) return page;

        size_t offset = cursor.empty() ? 0 : std::stoul(cursor);
        size_t stop = std::min(it->second.size(), offset + static_cast<size_t>(limit));
        for (size_t i = offset; i < stop; ++i) {
            page.titles.push_back(it->second[i]);
        }
        if (stop < it->second.size()) {
            page.next_cursor = std::to_string(stop);
        }
        return page;
    }

    std::optional<std::vector<Title>> fetch_redirects_to(const Title& title) override {
        record(redirect_calls_, title);
        if (fail_) {
            error_ = "synthetic outage";
            return std::nullopt;
        }
        auto it = redirects_.find(title);
        if (it == redirects_.end()) return std::vector<Title>{};
        return it->second;
    }

    std::string last_error() const override { return error_; }

    int page_calls(const Title& title) const { return count(page_calls_, title); }
    int inbound_calls(const Title& title) const { return count(inbound_calls_, title); }

    int total_calls() const {
        std::lock_guard lock(mutex_);
        int total = 0;
        for (const auto* calls : {&page_calls_, &inbound_calls_, &redirect_calls_}) {
            for (const auto& [_, n] : *calls) total += n;
        }
        return total;
    }

private:
    void record(std::map<Title, int>& calls, const Title& title) {
        std::lock_guard lock(mutex_);
        calls[title]++;
    }

    int count(const std::map<Title, int>& calls, const Title& title) const {
        std::lock_guard lock(mutex_);
        auto it = calls.find(title);
        return it == calls.end() ? 0 : it->second;
    }

    std::map<Title, std::vector<Title>> outbound_;
    std::map<Title, std::vector<Title>> inbound_;
    std::map<Title, std::vector<Title>> redirects_;
    std::map<Title, int> page_calls_;
    std::map<Title, int> inbound_calls_;
    std::map<Title, int> redirect_calls_;
    mutable std::mutex mutex_;
    bool fail_ = false;
    int delay_ms_ = 0;
    std::string error_;
};

// Every call throws instead of reporting a failure
class ThrowingTransport : public Transport {
public:
    std::optional<std::string> fetch_rendered_page(const Title&) override {
        throw std::runtime_error("transport down");
    }
    std::optional<InboundPage> fetch_inbound_page(const Title&, const std::string&, int) override {
        throw std::runtime_error("transport down");
    }
    std::optional<std::vector<Title>> fetch_redirects_to(const Title&) override {
        throw std::runtime_error("transport down");
    }
    std::string last_error() const override { return ""; }
};

// A -> B -> C -> D, E -> C; D has 1000 backlinks, C has 2
void build_five_nodes(SyntheticTransport& wiki) {
    wiki.link("A", "B");
    wiki.link("B", "C");
    wiki.link("C", "D");
    wiki.link("E", "C");
    wiki.add_backlinks("D", 999, "Fan of D");
}

RacerConfig small_config() {
    RacerConfig config;
    config.query_limit = 10;
    config.anchor_threshold = 1;
    config.fetch_limit = 1;
    return config;
}

void test_title_codec() {
    std::cout << "Testing title codec..." << std::endl;

    assert(encode_title("Kevin Bacon") == "Kevin_Bacon");
    assert(encode_title("AT&T") == "AT%26T");
    assert(encode_title("What? Me worry!") == "What%3F_Me_worry%21");
    assert(encode_title("Mother\xE2\x80\x93" "daughter") == "Mother%E2%80%93daughter");

    // An existing escape is never double-escaped; a bare '%' is
    assert(encode_title("%21") == "%21");
    assert(encode_title("100% Pure") == "100%25_Pure");
    assert(encode_title(encode_title("100% Pure")) == encode_title("100% Pure"));

    for (const std::string& title : {std::string("D\xC3\xA9j\xC3\xA0 vu"),
                                     std::string("Rock & Roll"),
                                     std::string("A/B testing"),
                                     std::string("O'Brien, \"Pat\" (actor)"),
                                     std::string("C++ *=+,;@\\`"),
                                     std::string("100% Pure"),
                                     std::string("Mother\xE2\x80\x93" "daughter")}) {
        assert(decode_title(encode_title(title)) == title);
    }

    // Malformed escapes pass through
    assert(decode_title("50%_off") == "50% off");

    std::cout << "  PASS" << std::endl;
}

void test_title_normalization() {
    std::cout << "Testing title normalization..." << std::endl;

    assert(normalize_title("kevin_Bacon") == "Kevin Bacon");
    assert(normalize_title("  Kevin   Bacon ") == "Kevin Bacon");
    assert(normalize_title("AT%26T") == "AT&T");
    assert(normalize_title("La_V%C3%A9nus_d%27Ille") == "La V\xC3\xA9nus d'Ille");
    assert(normalize_title(normalize_title("emu")) == normalize_title("emu"));
    assert(normalize_title("___").empty());

    // Decoding happens once; canonical titles are never decoded again
    assert(normalize_title("a%2541") == "A%41");
    assert(canonical_title("A%41") == "A%41");
    assert(canonical_title(canonical_title(" kevin_ Bacon")) == "Kevin Bacon");
    assert(canonical_title("AT%26T") == "AT%26T");

    assert(titles_equal_ignore_case("Kevin Bacon", "kevin bacon"));
    assert(!titles_equal_ignore_case("Kevin Bacon", "Kevin Bacons"));

    assert(has_namespace_prefix("Category:Birds"));
    assert(has_namespace_prefix("User talk:Example"));
    assert(has_namespace_prefix("Help:Contents"));
    assert(!has_namespace_prefix("Jimmy Neutron: Boy Genius"));
    assert(!has_namespace_prefix("Emu"));

    std::cout << "  PASS" << std::endl;
}

void test_link_extraction() {
    std::cout << "Testing link extraction..." << std::endl;

    std::string html =
        "<a href=\"/wiki/Emu\">emu</a>"
        "<a href=\"/wiki/Stanford_University#History\">history</a>"
        "<a href=\"/wiki/Category:Birds\">birds</a>"
        "<a href=\"/wiki/File:Emu.jpg\">image</a>"
        "<a href=\"/wiki/AT%26T\">at&amp;t</a>"
        "<a href=\"/wiki/Jimmy_Neutron:_Boy_Genius\">film</a>"
        "<a href=\"/w/index.php?title=Emu&action=edit\">edit</a>"
        "<a href=\"https://example.org/wiki/Elsewhere\">external</a>"
        "<a href=\"/wiki/Emu\">emu again</a>";

    TitleSet links = GraphOracle::extract_links(html);
    assert(links.size() == 4);
    assert(links.count("Emu"));
    assert(links.count("Stanford University"));
    assert(links.count("AT&T"));
    assert(links.count("Jimmy Neutron: Boy Genius"));
    assert(!links.count("Category:Birds"));

    std::cout << "  PASS" << std::endl;
}

void test_outbound_memoized() {
    std::cout << "Testing outbound memoization..." << std::endl;

    SyntheticTransport wiki;
    wiki.link("Emu", "Bird");
    wiki.link("Emu", "Australia");
    GraphOracle oracle(wiki);

    TitleSetRef first = oracle.outbound_neighbors("Emu");
    TitleSetRef second = oracle.outbound_neighbors("emu");
    assert(first.get() == second.get());
    assert(wiki.page_calls("Emu") == 1);

    // Self included, home page excluded, namespaces dropped
    assert(first->count("Emu"));
    assert(first->count("Bird"));
    assert(first->count("Australia"));
    assert(!first->count("Main Page"));
    assert(first->size() == 3);
    assert(oracle.degree("Emu") == 2);
    assert(oracle.stats().cache_hits >= 1);

    std::cout << "  PASS" << std::endl;
}

void test_inbound_budget() {
    std::cout << "Testing inbound fetch budget..." << std::endl;

    // Six backlinks, two per page: three pages to see them all
    SyntheticTransport wiki;
    wiki.add_backlinks("Hub", 6, "Page");

    OracleConfig tight;
    tight.query_limit = 2;
    tight.fetch_limit = 1;
    GraphOracle budgeted(wiki, tight);
    assert(budgeted.popularity("Hub") == 2);
    assert(wiki.inbound_calls("Hub") == 1);

    // Cached: no further page requests
    budgeted.inbound_neighbors("Hub");
    assert(wiki.inbound_calls("Hub") == 1);

    SyntheticTransport wiki2;
    wiki2.add_backlinks("Hub", 6, "Page");
    OracleConfig roomy;
    roomy.query_limit = 2;
    roomy.fetch_limit = 10;
    GraphOracle unbudgeted(wiki2, roomy);
    assert(unbudgeted.popularity("Hub") == 6);
    assert(wiki2.inbound_calls("Hub") == 3);

    std::cout << "  PASS" << std::endl;
}

void test_redirects() {
    std::cout << "Testing redirects..." << std::endl;

    SyntheticTransport wiki;
    wiki.link("Kevin Bacon", "Footloose");
    wiki.link("Fan", "Kevin Bacon");
    wiki.redirect("Bacon, Kevin", "Kevin Bacon");
    GraphOracle oracle(wiki);

    TitleSetRef linking = oracle.inbound_neighbors("Kevin Bacon");
    assert(linking->count("Fan"));
    assert(linking->count("Bacon, Kevin"));
    assert(oracle.popularity("Kevin Bacon") == 2);

    // The redirect links where its target links, without being fetched
    assert(oracle.has_link_to("Bacon, Kevin", "Kevin Bacon"));
    TitleSetRef aliased = oracle.outbound_neighbors("Bacon, Kevin");
    assert(aliased->count("Footloose"));
    assert(aliased->count("Bacon, Kevin"));
    assert(wiki.page_calls("Bacon, Kevin") == 0);

    std::cout << "  PASS" << std::endl;
}

void test_has_link_to_prefers_cache() {
    std::cout << "Testing link evidence from cache..." << std::endl;

    SyntheticTransport wiki;
    wiki.link("A", "B");
    GraphOracle oracle(wiki);

    oracle.inbound_neighbors("B");
    assert(oracle.has_link_to("A", "B"));
    assert(wiki.page_calls("A") == 0);

    assert(oracle.has_link_to("A", "A"));
    assert(!oracle.has_link_to("B", "A"));
    assert(wiki.page_calls("B") == 1);

    std::cout << "  PASS" << std::endl;
}

void test_links_in_common() {
    std::cout << "Testing links in common..." << std::endl;

    SyntheticTransport wiki;
    for (const char* t : {"X", "Y", "Z"}) wiki.link("Left", t);
    for (const char* t : {"Y", "Z"}) wiki.link("Right", t);
    GraphOracle oracle(wiki);

    assert(oracle.links_in_common("Left", "Right") == 2);
    assert(oracle.links_in_common("Right", "Left") == 2);
    assert(oracle.links_in_common("Left", "Left") == 4);

    std::cout << "  PASS" << std::endl;
}

void test_soft_failure() {
    std::cout << "Testing soft fetch failure..." << std::endl;

    SyntheticTransport wiki;
    wiki.fail_everything();
    GraphOracle oracle(wiki);
    assert(oracle.reachable());

    TitleSetRef out = oracle.outbound_neighbors("Emu");
    assert(out->size() == 1 && out->count("Emu"));
    assert(oracle.inbound_neighbors("Emu")->empty());
    assert(oracle.stats().failed_fetches == 3);
    assert(!oracle.reachable());

    // Failures are memoized like any other answer
    oracle.outbound_neighbors("Emu");
    assert(wiki.page_calls("Emu") == 1);

    std::cout << "  PASS" << std::endl;
}

void test_throwing_transport() {
    std::cout << "Testing transport that throws..." << std::endl;

    ThrowingTransport broken;
    GraphOracle oracle(broken);

    TitleSetRef out = oracle.outbound_neighbors("Emu");
    assert(out->size() == 1 && out->count("Emu"));
    assert(oracle.inbound_neighbors("Emu")->empty());
    assert(oracle.stats().failed_fetches == 3);
    assert(!oracle.reachable());
    assert(oracle.last_failure() == "transport down");

    Racer racer(small_config(), broken);
    PathResult result = racer.find_path("Emu", "Kevin Bacon");
    assert(result.status == PathResult::Status::Unreachable);
    assert(result.message.find("transport down") != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

void test_redirect_chains() {
    std::cout << "Testing redirect chains and cycles..." << std::endl;

    SyntheticTransport wiki;
    wiki.link("Target", "Elsewhere");
    wiki.redirect("Hop two", "Target");
    wiki.redirect("Hop one", "Hop two");
    wiki.redirect("Ping", "Pong");
    wiki.redirect("Pong", "Ping");
    GraphOracle oracle(wiki);

    // Hop one -> Hop two -> Target resolves to the final page
    oracle.redirects_to("Target");
    oracle.redirects_to("Hop two");
    TitleSetRef hop = oracle.outbound_neighbors("Hop one");
    assert(hop->count("Elsewhere"));
    assert(hop->count("Hop one"));
    assert(wiki.page_calls("Hop one") == 0);
    assert(wiki.page_calls("Hop two") == 0);

    // A loop has no target: each page is fetched like any other
    oracle.redirects_to("Pong");
    oracle.redirects_to("Ping");
    TitleSetRef ping = oracle.outbound_neighbors("Ping");
    assert(ping->size() == 1 && ping->count("Ping"));
    assert(wiki.page_calls("Ping") == 1);
    TitleSetRef pong = oracle.outbound_neighbors("Pong");
    assert(pong->count("Pong"));
    assert(wiki.page_calls("Pong") == 1);

    std::cout << "  PASS" << std::endl;
}

void test_display_titles_not_decoded() {
    std::cout << "Testing backlink titles kept verbatim..." << std::endl;

    SyntheticTransport wiki;
    wiki.link("Ratio %41", "Hub");
    GraphOracle oracle(wiki);

    TitleSetRef linking = oracle.inbound_neighbors("Hub");
    assert(linking->count("Ratio %41"));
    assert(!linking->count("Ratio A"));
    assert(oracle.has_link_to("Ratio %41", "Hub"));

    Racer racer(small_config(), wiki);
    PathResult same = racer.find_path("a%2541", "A%2541");
    assert(same.success());
    assert((same.path == std::vector<Title>{"A%41"}));

    std::cout << "  PASS" << std::endl;
}

void test_concurrent_single_fetch() {
    std::cout << "Testing single fetch under concurrency..." << std::endl;

    SyntheticTransport wiki;
    wiki.link("Hot", "Cold");
    wiki.slow_down(50);
    GraphOracle oracle(wiki);

    std::vector<TitleSetRef> seen(8);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < seen.size(); ++i) {
        threads.emplace_back([&oracle, &seen, i] {
            seen[i] = oracle.outbound_neighbors("Hot");
        });
    }
    for (auto& t : threads) t.join();

    assert(wiki.page_calls("Hot") == 1);
    for (const auto& ref : seen) {
        assert(ref.get() == seen[0].get());
    }

    std::cout << "  PASS" << std::endl;
}

void test_ladder_rungs() {
    std::cout << "Testing Ladder rungs..." << std::endl;

    // 1 -> 2 -> 3 -> 4 -> 5
    auto links = [](const int& a, const int& b) { return a == b || b == a + 1; };
    Ladder<int> ladder(1, 5, links);
    assert(!ladder.is_complete());
    assert(ladder.height() == 0);
    assert(ladder.to_string() == "[1, ... , 5]");

    assert(ladder.add_lower_rung(1) == RungStatus::NoOp);
    assert(ladder.add_lower_rung(3) == RungStatus::NoLink);
    assert(ladder.lower_rungs().size() == 1);

    assert(ladder.add_lower_rung(2) == RungStatus::Applied);
    assert(ladder.add_upper_rung(3) == RungStatus::NoLink);
    assert(ladder.add_upper_rung(4) == RungStatus::Applied);
    assert(ladder.height() == 2);

    std::vector<int> gapped = ladder.to_sequence(0);
    assert((gapped == std::vector<int>{1, 2, 0, 4, 5}));

    assert(ladder.add_lower_rung(3) == RungStatus::Applied);
    assert(ladder.is_complete());
    assert(ladder.to_string() == "[1, 2, 3, 4, 5]");
    assert((ladder.to_sequence(0) == std::vector<int>{1, 2, 3, 4, 5}));

    // Complete ladders are frozen
    assert(ladder.add_lower_rung(4) == RungStatus::Complete);
    assert(ladder.add_upper_rung(3) == RungStatus::NoOp);
    assert(ladder.height() == 3);

    Ladder<int> same(7, 7, links);
    assert(same.is_complete());

    std::cout << "  PASS" << std::endl;
}

void test_ladder_invariant() {
    std::cout << "Testing Ladder edge invariant..." << std::endl;

    // i -> i+1 and i -> i+3 on 0..19
    auto links = [](const int& a, const int& b) { return a == b || b == a + 1 || b == a + 3; };
    Ladder<int> ladder(0, 19, links);

    std::srand(7);
    for (int step = 0; step < 200 && !ladder.is_complete(); ++step) {
        int candidate = std::rand() % 20;
        auto before_lower = ladder.lower_rungs();
        auto before_upper = ladder.upper_rungs();

        RungStatus status = (step % 2 == 0) ? ladder.add_lower_rung(candidate)
                                            : ladder.add_upper_rung(candidate);
        if (status != RungStatus::Applied) {
            assert(ladder.lower_rungs() == before_lower);
            assert(ladder.upper_rungs() == before_upper);
        }
    }

    const auto& lower = ladder.lower_rungs();
    const auto& upper = ladder.upper_rungs();
    assert(lower.front() == 0 && upper.front() == 19);
    for (size_t i = 1; i < lower.size(); ++i) assert(links(lower[i - 1], lower[i]));
    for (size_t i = 1; i < upper.size(); ++i) assert(links(upper[i], upper[i - 1]));

    std::cout << "  PASS" << std::endl;
}

void test_ranking() {
    std::cout << "Testing frontier ranking..." << std::endl;

    SyntheticTransport wiki;
    wiki.link("S", "M");
    GraphOracle oracle(wiki);

    WikiLadder short_ladder = make_ladder(oracle, "S", "T");
    WikiLadder tall_ladder = short_ladder;
    assert(tall_ladder.add_lower_rung("M") == RungStatus::Applied);

    ByProximity by_proximity;
    RankedLadder close{tall_ladder, 5, 0};
    RankedLadder far{short_ladder, 1, 1};
    assert(by_proximity(far, close));
    assert(!by_proximity(close, far));

    // Equal proximity: the shorter ladder wins
    RankedLadder tall{tall_ladder, 3, 2};
    RankedLadder short_one{short_ladder, 3, 3};
    assert(by_proximity(tall, short_one));

    ByPopularity by_popularity;
    assert(by_popularity(far, close));

    std::cout << "  PASS" << std::endl;
}

void test_anchor_already_anchored() {
    std::cout << "Testing anchor short-circuit..." << std::endl;

    SyntheticTransport wiki;
    build_five_nodes(wiki);
    GraphOracle oracle(wiki);
    AnchorSearch search(oracle, AnchorConfig{1000, year_in_place_filter()});

    assert(oracle.popularity("D") == 1000);
    assert(oracle.popularity("C") == 2);

    WikiLadder ladder = make_ladder(oracle, "D", "D");
    assert(search.is_anchored(ladder));

    WikiLadder from_a = make_ladder(oracle, "A", "D");
    WikiLadder anchored = search.anchor(from_a);
    assert(search.expansions() == 0);
    assert(anchored.upper_rung() == "D");
    assert(anchored.height() == 0);

    std::cout << "  PASS" << std::endl;
}

void test_anchor_relocates() {
    std::cout << "Testing anchor relocation..." << std::endl;

    // Obscure is linked from Hub (popular), Stub (not) and a year page
    SyntheticTransport wiki;
    wiki.link("Start", "Elsewhere");
    wiki.link("Hub", "Obscure");
    wiki.link("Stub", "Obscure");
    wiki.link("1809 in Denmark", "Obscure");
    wiki.add_backlinks("Hub", 1000, "Hub fan");
    wiki.add_backlinks("1809 in Denmark", 1000, "Year fan");

    RacerConfig config;
    GraphOracle oracle(wiki, config.oracle());
    AnchorSearch search(oracle, config.anchor());

    WikiLadder ladder = make_ladder(oracle, "Start", "Obscure");
    assert(!search.is_anchored(ladder));

    WikiLadder anchored = search.anchor(ladder);
    assert(search.is_anchored(anchored));
    assert(anchored.upper_rung() == "Hub");
    assert((anchored.upper_rungs() == std::vector<Title>{"Obscure", "Hub"}));
    assert(anchored.is_complete() ||
           oracle.popularity(anchored.upper_rung()) >= config.anchor_threshold);

    std::cout << "  PASS" << std::endl;
}

void test_anchor_gives_up() {
    std::cout << "Testing anchor exhaustion..." << std::endl;

    SyntheticTransport wiki;
    wiki.link("Start", "Elsewhere");
    wiki.link("Lonely friend", "Lonely");
    GraphOracle oracle(wiki);
    AnchorSearch search(oracle, AnchorConfig{50, year_in_place_filter()});

    WikiLadder ladder = make_ladder(oracle, "Start", "Lonely");
    WikiLadder result = search.anchor(ladder);
    assert(result.upper_rung() == "Lonely");
    assert(result.upper_rungs().size() == 1);
    assert(!search.is_anchored(result));

    std::cout << "  PASS" << std::endl;
}

void test_completion_five_nodes() {
    std::cout << "Testing completion on five nodes..." << std::endl;

    SyntheticTransport wiki;
    build_five_nodes(wiki);
    GraphOracle oracle(wiki);
    CompletionSearch search(oracle);

    WikiLadder completed = search.complete(make_ladder(oracle, "A", "D"));
    assert(completed.is_complete());
    assert((completed.to_sequence(GAP_MARKER) == std::vector<Title>{"A", "B", "C", "D"}));

    // Backlink-only pages are never fetched
    assert(wiki.page_calls("Fan of D 0") == 0);

    std::cout << "  PASS" << std::endl;
}

void test_racer_five_nodes() {
    std::cout << "Testing Racer on five nodes..." << std::endl;

    SyntheticTransport wiki;
    build_five_nodes(wiki);
    Racer racer(RacerConfig{}, wiki);

    PathResult result = racer.find_path("A", "D");
    assert(result.success());
    assert((result.path == std::vector<Title>{"A", "B", "C", "D"}));

    // Second run is served entirely from the cache
    int calls = wiki.total_calls();
    PathResult again = racer.find_path("a", "D");
    assert((again.path == result.path));
    assert(wiki.total_calls() == calls);

    std::cout << "  PASS" << std::endl;
}

void test_self_loop() {
    std::cout << "Testing self loop..." << std::endl;

    SyntheticTransport wiki;
    Racer racer(small_config(), wiki);

    PathResult result = racer.find_path("D\xC3\xA9j\xC3\xA0_vu", "d\xC3\xA9j\xC3\xA0 vu");
    assert(result.success());
    assert((result.path == std::vector<Title>{"D\xC3\xA9j\xC3\xA0 vu"}));
    assert(wiki.total_calls() == 0);

    std::cout << "  PASS" << std::endl;
}

void test_exhausted_and_unreachable() {
    std::cout << "Testing exhausted and unreachable results..." << std::endl;

    SyntheticTransport wiki;
    wiki.link("Island", "Beach");
    wiki.link("Mainland", "Target");
    Racer racer(small_config(), wiki);

    PathResult exhausted = racer.find_path("Island", "Target");
    assert(exhausted.status == PathResult::Status::Exhausted);
    assert(exhausted.path.front() == "Island");
    assert(exhausted.path.back() == "Target");
    assert(std::find(exhausted.path.begin(), exhausted.path.end(), GAP_MARKER) !=
           exhausted.path.end());

    SyntheticTransport down;
    down.fail_everything();
    Racer offline(small_config(), down);
    PathResult unreachable = offline.find_path("Island", "Target");
    assert(unreachable.status == PathResult::Status::Unreachable);
    assert(unreachable.message.find("synthetic outage") != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

void test_outage_after_success() {
    std::cout << "Testing outage after an earlier search..." << std::endl;

    SyntheticTransport wiki;
    wiki.link("Island", "Beach");
    wiki.link("Mainland", "Target");
    Racer racer(small_config(), wiki);

    assert(racer.find_path("Island", "Beach").success());

    // Only this call's fetches decide reachability
    wiki.fail_everything();
    PathResult result = racer.find_path("Mainland", "Target");
    assert(result.status == PathResult::Status::Unreachable);
    assert(racer.oracle().reachable());

    std::cout << "  PASS" << std::endl;
}

void test_chained_path() {
    std::cout << "Testing chained path..." << std::endl;

    SyntheticTransport wiki;
    wiki.link("A", "B");
    wiki.link("B", "C");
    wiki.link("C", "D");
    wiki.link("D", "E");
    Racer racer(small_config(), wiki);

    PathResult result = racer.find_path(std::vector<Title>{"A", "C", "E"});
    assert(result.success());
    assert((result.path == std::vector<Title>{"A", "B", "C", "D", "E"}));

    bool threw = false;
    try {
        racer.find_path(std::vector<Title>{"A"});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_config_validation() {
    std::cout << "Testing config validation..." << std::endl;

    auto rejected = [](RacerConfig config) {
        try {
            config.validate();
        } catch (const std::invalid_argument&) {
            return true;
        }
        return false;
    };

    RacerConfig config;
    assert(!rejected(config));

    RacerConfig zero = config;
    zero.fetch_limit = 0;
    assert(rejected(zero));

    RacerConfig too_big = config;
    too_big.query_limit = 501;
    assert(rejected(too_big));

    // 1 result per page can never show 501 backlinks
    RacerConfig unreachable = config;
    unreachable.query_limit = 1;
    unreachable.anchor_threshold = 501;
    assert(rejected(unreachable));

    SyntheticTransport wiki;
    bool threw = false;
    try {
        Racer racer(zero, wiki);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        OracleConfig bad;
        bad.query_limit = 0;
        GraphOracle oracle(wiki, bad);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_config_sources() {
    std::cout << "Testing config sources..." << std::endl;

    RacerConfig from_json = config_from_json(json{{"fetch_limit", 3}, {"domain", "de.wikipedia.org"}});
    assert(from_json.fetch_limit == 3);
    assert(from_json.domain == "de.wikipedia.org");
    assert(from_json.query_limit == DEFAULT_QUERY_LIMIT);

    bool threw = false;
    try {
        config_from_json(json{{"fetch_limit", "lots"}});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    const std::string path = "wikiladder_test_config.json";
    {
        std::ofstream file(path);
        file << R"({"anchor_threshold": 250, "verbose": false})";
    }
    RacerConfig from_file = load_config_file(path);
    assert(from_file.anchor_threshold == 250);
    std::remove(path.c_str());

    setenv("WIKILADDER_FETCH_LIMIT", "4", 1);
    RacerConfig from_env = from_file;
    apply_env_overrides(from_env);
    assert(from_env.fetch_limit == 4);
    assert(from_env.anchor_threshold == 250);

    setenv("WIKILADDER_FETCH_LIMIT", "four", 1);
    threw = false;
    try {
        apply_env_overrides(from_env);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    unsetenv("WIKILADDER_FETCH_LIMIT");

    json round = config_to_json(from_env);
    assert(round["anchor_threshold"] == 250);

    std::cout << "  PASS" << std::endl;
}

void test_mediawiki_parsing() {
    std::cout << "Testing MediaWiki response parsing..." << std::endl;

    std::string error;
    auto page = MediaWikiTransport::parse_backlinks(R"({
        "continue": {"blcontinue": "0|4242", "continue": "-||"},
        "query": {"backlinks": [
            {"pageid": 1, "ns": 0, "title": "Emu"},
            {"pageid": 2, "ns": 0, "title": "Emu War", "redirect": true},
            {"pageid": 3, "ns": 0, "title": "Cassowary"}
        ]}
    })", error);
    assert(page.has_value());
    assert((page->titles == std::vector<Title>{"Emu", "Cassowary"}));
    assert(page->next_cursor && *page->next_cursor == "0|4242");

    auto last = MediaWikiTransport::parse_backlinks(R"({"query": {"backlinks": []}})", error);
    assert(last && last->titles.empty() && !last->next_cursor);

    auto failed = MediaWikiTransport::parse_backlinks(
        R"({"error": {"code": "badtitle", "info": "Bad title"}})", error);
    assert(!failed);
    assert(error == "badtitle: Bad title");

    assert(!MediaWikiTransport::parse_backlinks("<html>", error));

    std::vector<Title> redirects;
    std::optional<std::string> next;
    bool ok = MediaWikiTransport::parse_redirects(R"({
        "continue": {"rdcontinue": "77", "continue": "||"},
        "query": {"pages": [{"pageid": 9, "ns": 0, "title": "Kevin Bacon",
            "redirects": [{"pageid": 10, "ns": 0, "title": "Bacon, Kevin"}]}]}
    })", redirects, next, error);
    assert(ok);
    assert((redirects == std::vector<Title>{"Bacon, Kevin"}));
    assert(next && *next == "77");

    // Unexpected field types are tolerated, never thrown
    auto odd = MediaWikiTransport::parse_backlinks(R"({
        "continue": {"blcontinue": 17},
        "query": {"backlinks": [
            {"pageid": 1, "ns": 0, "title": "Emu", "redirect": "yes"},
            {"pageid": 2, "ns": 0, "title": 12}
        ]}
    })", error);
    assert(odd.has_value());
    assert((odd->titles == std::vector<Title>{"Emu"}));
    assert(!odd->next_cursor);

    auto odd_error = MediaWikiTransport::parse_backlinks(
        R"({"error": {"code": 42, "info": "Numeric code"}})", error);
    assert(!odd_error);
    assert(error == "unknown: Numeric code");

    redirects.clear();
    ok = MediaWikiTransport::parse_redirects(
        R"({"query": {"pages": [{"title": "X", "redirects": {"title": "Y"}}]}, "continue": []})",
        redirects, next, error);
    assert(ok && redirects.empty() && !next);

    MediaWikiTransport transport;
    assert(transport.article_url("AT&T") == "https://en.wikipedia.org/wiki/AT%26T");
    std::string api = transport.api_url({{"action", "query"}, {"bltitle", "Kevin Bacon"}});
    assert(api == "https://en.wikipedia.org/w/api.php?action=query&bltitle=Kevin%20Bacon");

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== wikiladder Tests ===" << std::endl;
    std::cout << std::endl;

    test_title_codec();
    test_title_normalization();
    test_link_extraction();

    test_outbound_memoized();
    test_inbound_budget();
    test_redirects();
    test_has_link_to_prefers_cache();
    test_links_in_common();
    test_soft_failure();
    test_throwing_transport();
    test_redirect_chains();
    test_display_titles_not_decoded();
    test_concurrent_single_fetch();

    test_ladder_rungs();
    test_ladder_invariant();
    test_ranking();

    std::cout << std::endl;
    std::cout << "=== Search Tests ===" << std::endl;
    test_anchor_already_anchored();
    test_anchor_relocates();
    test_anchor_gives_up();
    test_completion_five_nodes();
    test_racer_five_nodes();
    test_self_loop();
    test_exhausted_and_unreachable();
    test_outage_after_success();
    test_chained_path();

    std::cout << std::endl;
    std::cout << "=== Configuration and Transport Tests ===" << std::endl;
    test_config_validation();
    test_config_sources();
    test_mediawiki_parsing();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
