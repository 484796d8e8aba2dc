// wikiladder: find a chain of clickable wikilinks between pages
//
// Usage: wikiladder [options] <start> <end> [more pages...]
//
// With more than two pages, each leg starts where the previous one ended:
//   wikiladder Emu "Stanford University" "Kevin Bacon"
//
// Exit status: 0 path found, 1 search exhausted, 2 bad usage or
// configuration, 3 the wiki could not be reached.

#include <wikiladder/wikiladder.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace wikiladder;

// Get program name from path
static const char* prog_name(const char* path) {
    const char* last = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') last = p + 1;
    }
    return last;
}

void print_usage(const char* prog) {
    const char* name = prog_name(prog);
    std::cerr << "wikiladder " << version::software() << " - link ladders between wiki pages\n\n"
              << "Usage: " << name << " [options] <start> <end> [more pages...]\n\n"
              << "Options:\n"
              << "  --query-limit N        Backlinks requested per API call (default: "
              << DEFAULT_QUERY_LIMIT << ")\n"
              << "  --anchor-threshold N   Popularity needed to anchor (default: "
              << DEFAULT_ANCHOR_THRESHOLD << ")\n"
              << "  --fetch-limit N        API calls per backlink query (default: "
              << DEFAULT_FETCH_LIMIT << ")\n"
              << "  --domain HOST          Wiki host (default: " << DEFAULT_DOMAIN << ")\n"
              << "  --timeout-ms N         HTTP timeout (default: " << DEFAULT_TIMEOUT_MS << ")\n"
              << "  --config PATH          JSON configuration file\n"
              << "  --json                 Output as JSON\n"
              << "  --verbose              Enable verbose debug logging\n"
              << "  -v, --version          Show version\n"
              << "  -h, --help             Show this help\n\n"
              << "Environment: WIKILADDER_QUERY_LIMIT, WIKILADDER_ANCHOR_THRESHOLD,\n"
              << "WIKILADDER_FETCH_LIMIT, WIKILADDER_DOMAIN, WIKILADDER_VERBOSE\n";
}

static int parse_int(const char* flag, const char* value) {
    try {
        size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (value[used] == '\0') return parsed;
    } catch (const std::exception&) {
        // reported below
    }
    throw std::invalid_argument(std::string(flag) + " expects an integer, got '" + value + "'");
}

static std::string join_path(const std::vector<Title>& path) {
    std::string out = "[";
    for (size_t i = 0; i < path.size(); ++i) {
        if (i > 0) out += ", ";
        out += path[i];
    }
    return out + "]";
}

static int exit_code(PathResult::Status status) {
    switch (status) {
        case PathResult::Status::Found: return 0;
        case PathResult::Status::Exhausted: return 1;
        case PathResult::Status::Unreachable: return 3;
    }
    return 1;
}

int main(int argc, char* argv[]) {
    std::string config_path;
    std::vector<Title> pages;
    bool json_output = false;

    // Command-line overrides, applied after the file and environment
    std::optional<int> query_limit;
    std::optional<int> anchor_threshold;
    std::optional<int> fetch_limit;
    std::optional<int> timeout_ms;
    std::optional<std::string> domain;
    bool verbose = false;

    try {
        for (int i = 1; i < argc; ++i) {
            if (strcmp(argv[i], "--query-limit") == 0 && i + 1 < argc) {
                query_limit = parse_int(argv[i], argv[i + 1]);
                ++i;
            } else if (strcmp(argv[i], "--anchor-threshold") == 0 && i + 1 < argc) {
                anchor_threshold = parse_int(argv[i], argv[i + 1]);
                ++i;
            } else if (strcmp(argv[i], "--fetch-limit") == 0 && i + 1 < argc) {
                fetch_limit = parse_int(argv[i], argv[i + 1]);
                ++i;
            } else if (strcmp(argv[i], "--timeout-ms") == 0 && i + 1 < argc) {
                timeout_ms = parse_int(argv[i], argv[i + 1]);
                ++i;
            } else if (strcmp(argv[i], "--domain") == 0 && i + 1 < argc) {
                domain = argv[++i];
            } else if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
                config_path = argv[++i];
            } else if (strcmp(argv[i], "--json") == 0) {
                json_output = true;
            } else if (strcmp(argv[i], "--verbose") == 0) {
                verbose = true;
            } else if (strcmp(argv[i], "--version") == 0 || strcmp(argv[i], "-v") == 0) {
                std::cout << "wikiladder " << version::software() << "\n";
                return 0;
            } else if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
                print_usage(argv[0]);
                return 0;
            } else if (strncmp(argv[i], "--", 2) == 0) {
                std::cerr << "Error: unknown option " << argv[i] << "\n\n";
                print_usage(argv[0]);
                return 2;
            } else {
                pages.emplace_back(argv[i]);
            }
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }

    if (pages.size() < 2) {
        std::cerr << "Error: please provide at least two page titles\n\n";
        print_usage(argv[0]);
        return 2;
    }

    RacerConfig config;
    try {
        if (!config_path.empty()) {
            config = load_config_file(config_path, config);
        }
        apply_env_overrides(config);

        if (query_limit) config.query_limit = *query_limit;
        if (anchor_threshold) config.anchor_threshold = *anchor_threshold;
        if (fetch_limit) config.fetch_limit = *fetch_limit;
        if (timeout_ms) config.timeout_ms = *timeout_ms;
        if (domain) config.domain = *domain;
        if (verbose) config.verbose = true;

        config.validate();
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }

    set_verbose(config.verbose);

    if (!json_output) {
        std::cout << "connecting " << join_path(pages) << "...\n";
    }

    auto started = std::chrono::steady_clock::now();

    std::optional<PathResult> result;
    try {
        Racer racer(config);
        result = racer.find_path(pages);

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        OracleStats stats = racer.oracle().stats();

        if (json_output) {
            json out = {
                {"status", status_name(result->status)},
                {"path", result->path},
                {"message", result->message},
                {"seconds", elapsed.count() / 1000.0},
                {"fetches", {
                    {"pages", stats.page_fetches},
                    {"backlinks", stats.inbound_page_fetches},
                    {"redirects", stats.redirect_fetches},
                    {"failed", stats.failed_fetches},
                    {"cache_hits", stats.cache_hits}
                }},
                {"config", config_to_json(config)}
            };
            std::cout << out.dump(2) << "\n";
        } else {
            std::cout << join_path(result->path) << "\n"
                      << "in " << elapsed.count() / 1000 << " seconds ("
                      << stats.total_fetches() << " fetches)\n";
            if (!result->success()) {
                std::cerr << "[wikiladder] " << status_name(result->status) << ": "
                          << result->message << "\n";
            }
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 3;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 3;
    }

    return exit_code(result->status);
}
