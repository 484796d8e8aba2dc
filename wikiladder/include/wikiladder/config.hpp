#pragma once
// Configuration: one struct, four sources
//
// Defaults < JSON config file < WIKILADDER_* environment < command line.
// validate() rejects limits that make the search meaningless, most notably
// an anchor threshold the backlink query could never reach.

#include "anchor.hpp"
#include "graph_oracle.hpp"
#include "mediawiki_transport.hpp"
#include "version.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

namespace wikiladder {

using json = nlohmann::json;

// MediaWiki never returns more than this many backlinks per request
constexpr int DEFAULT_PROVIDER_PAGE_CAP = 500;

struct RacerConfig {
    int query_limit = DEFAULT_QUERY_LIMIT;
    int anchor_threshold = DEFAULT_ANCHOR_THRESHOLD;
    int fetch_limit = DEFAULT_FETCH_LIMIT;
    int provider_page_cap = DEFAULT_PROVIDER_PAGE_CAP;
    std::string home_title = DEFAULT_HOME_TITLE;
    std::string domain = DEFAULT_DOMAIN;
    long timeout_ms = DEFAULT_TIMEOUT_MS;
    std::string user_agent = WIKILADDER_USER_AGENT;
    bool verbose = false;

    void validate() const {
        if (query_limit < 1 || anchor_threshold < 1 || fetch_limit < 1) {
            throw std::invalid_argument(
                "query_limit, anchor_threshold and fetch_limit must be positive");
        }
        if (provider_page_cap < 1) {
            throw std::invalid_argument("provider_page_cap must be positive");
        }
        if (query_limit > provider_page_cap) {
            throw std::invalid_argument("query_limit " + std::to_string(query_limit) +
                                        " exceeds the provider page cap of " +
                                        std::to_string(provider_page_cap));
        }
        if (static_cast<long long>(query_limit) * provider_page_cap < anchor_threshold) {
            throw std::invalid_argument("anchor_threshold " + std::to_string(anchor_threshold) +
                                        " is unreachable with query_limit " +
                                        std::to_string(query_limit));
        }
        if (timeout_ms <= 0) {
            throw std::invalid_argument("timeout_ms must be positive");
        }
        if (domain.empty()) {
            throw std::invalid_argument("domain must not be empty");
        }
    }

    OracleConfig oracle() const {
        OracleConfig c;
        c.query_limit = query_limit;
        c.fetch_limit = fetch_limit;
        c.home_title = home_title;
        return c;
    }

    MediaWikiConfig transport() const {
        MediaWikiConfig c;
        c.domain = domain;
        c.timeout_ms = timeout_ms;
        c.user_agent = user_agent;
        return c;
    }

    AnchorConfig anchor() const {
        AnchorConfig c;
        c.threshold = anchor_threshold;
        return c;
    }
};

// Overlay the keys present in `j` onto `base`. Unknown keys are ignored.
inline RacerConfig config_from_json(const json& j, RacerConfig base = {}) {
    if (!j.is_object()) {
        throw std::invalid_argument("configuration must be a JSON object");
    }

    try {
        base.query_limit = j.value("query_limit", base.query_limit);
        base.anchor_threshold = j.value("anchor_threshold", base.anchor_threshold);
        base.fetch_limit = j.value("fetch_limit", base.fetch_limit);
        base.provider_page_cap = j.value("provider_page_cap", base.provider_page_cap);
        base.home_title = j.value("home_title", base.home_title);
        base.domain = j.value("domain", base.domain);
        base.timeout_ms = j.value("timeout_ms", base.timeout_ms);
        base.user_agent = j.value("user_agent", base.user_agent);
        base.verbose = j.value("verbose", base.verbose);
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("bad configuration value: ") + e.what());
    }
    return base;
}

inline json config_to_json(const RacerConfig& config) {
    return {
        {"query_limit", config.query_limit},
        {"anchor_threshold", config.anchor_threshold},
        {"fetch_limit", config.fetch_limit},
        {"provider_page_cap", config.provider_page_cap},
        {"home_title", config.home_title},
        {"domain", config.domain},
        {"timeout_ms", config.timeout_ms},
        {"user_agent", config.user_agent},
        {"verbose", config.verbose}
    };
}

inline RacerConfig load_config_file(const std::string& path, RacerConfig base = {}) {
    std::ifstream file(path);
    if (!file) {
        throw std::invalid_argument("cannot open config file: " + path);
    }

    json j = json::parse(file, nullptr, false);
    if (j.is_discarded()) {
        throw std::invalid_argument("config file is not valid JSON: " + path);
    }
    return config_from_json(j, base);
}

namespace detail {

inline int env_int(const char* name, int fallback) {
    const char* value = std::getenv(name);
    if (!value || !*value) return fallback;
    try {
        size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (value[used] != '\0') {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(name) + " is not an integer: " + value);
    }
}

} // namespace detail

inline void apply_env_overrides(RacerConfig& config) {
    config.query_limit = detail::env_int("WIKILADDER_QUERY_LIMIT", config.query_limit);
    config.anchor_threshold = detail::env_int("WIKILADDER_ANCHOR_THRESHOLD", config.anchor_threshold);
    config.fetch_limit = detail::env_int("WIKILADDER_FETCH_LIMIT", config.fetch_limit);
    if (const char* domain = std::getenv("WIKILADDER_DOMAIN")) {
        if (*domain) config.domain = domain;
    }
    if (const char* verbose = std::getenv("WIKILADDER_VERBOSE")) {
        config.verbose = *verbose && std::string(verbose) != "0";
    }
}

} // namespace wikiladder
