#pragma once
// MediaWiki transport: the live encyclopedia over HTTPS
//
// Rendered pages come from /wiki/<title>; backlinks and redirects come from
// the action API (api.php, JSON, formatversion=2). Each request uses its own
// libcurl handle, so one transport may serve several threads.

#include "transport.hpp"
#include "version.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace wikiladder {

constexpr const char* DEFAULT_DOMAIN = "en.wikipedia.org";
constexpr long DEFAULT_TIMEOUT_MS = 30000;

struct MediaWikiConfig {
    std::string domain = DEFAULT_DOMAIN;
    std::string protocol = "https";
    long timeout_ms = DEFAULT_TIMEOUT_MS;
    std::string user_agent = WIKILADDER_USER_AGENT;
};

class MediaWikiTransport : public Transport {
public:
    static constexpr int MAX_REDIRECT_PAGES = 20;

    explicit MediaWikiTransport(MediaWikiConfig config = {});
    ~MediaWikiTransport() override = default;

    MediaWikiTransport(const MediaWikiTransport&) = delete;
    MediaWikiTransport& operator=(const MediaWikiTransport&) = delete;

    std::optional<std::string> fetch_rendered_page(const Title& title) override;
    std::optional<InboundPage> fetch_inbound_page(
        const Title& title, const std::string& cursor, int limit) override;
    std::optional<std::vector<Title>> fetch_redirects_to(const Title& title) override;
    std::string last_error() const override;

    std::string article_url(const Title& title) const;
    std::string api_url(const std::vector<std::pair<std::string, std::string>>& params) const;

    // Response parsers, separated from I/O. On failure they return nullopt
    // and describe the problem in `error`.
    static std::optional<InboundPage> parse_backlinks(const std::string& body, std::string& error);

    // Appends redirect titles to `out`; `next` receives the rdcontinue token
    // or nullopt on the last page
    static bool parse_redirects(const std::string& body, std::vector<Title>& out,
                                std::optional<std::string>& next, std::string& error);

    const MediaWikiConfig& config() const { return config_; }

private:
    std::optional<std::string> http_get(const std::string& url);
    void set_error(std::string message);

    MediaWikiConfig config_;
    mutable std::mutex error_mutex_;
    std::string last_error_;
};

} // namespace wikiladder
