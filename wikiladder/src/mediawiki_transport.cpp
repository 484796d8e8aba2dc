#include <wikiladder/mediawiki_transport.hpp>
#include <wikiladder/log.hpp>
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <memory>
#include <stdexcept>

namespace wikiladder {

using json = nlohmann::json;

namespace {

// curl_global_init is not thread-safe; run it once before any handle exists
struct CurlGlobal {
    CurlGlobal() {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("curl_global_init failed");
        }
    }
    ~CurlGlobal() { curl_global_cleanup(); }
};

void ensure_curl_global() {
    static CurlGlobal global;
}

struct CurlDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

size_t append_body(char* data, size_t size, size_t count, void* user) {
    auto* body = static_cast<std::string*>(user);
    body->append(data, size * count);
    return size * count;
}

// Query-component escaping: everything but RFC 3986 unreserved characters
std::string url_escape(const std::string& value) {
    static const char* HEX = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '.' || c == '_' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += HEX[c >> 4];
            out += HEX[c & 0x0F];
        }
    }
    return out;
}

std::string string_field(const json& object, const char* key, const char* fallback) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

bool flag_set(const json& object, const char* key) {
    auto it = object.find(key);
    return it != object.end() && it->is_boolean() && it->get<bool>();
}

// {"error": {"code": "...", "info": "..."}} -> "code: info"
std::optional<std::string> api_error(const json& response) {
    if (!response.contains("error")) return std::nullopt;
    const json& err = response["error"];
    if (!err.is_object()) return std::string("unrecognized API error");
    return string_field(err, "code", "unknown") + ": " + string_field(err, "info", "no details");
}

}  // anonymous namespace

MediaWikiTransport::MediaWikiTransport(MediaWikiConfig config)
    : config_(std::move(config)) {
    if (config_.domain.empty()) {
        throw std::invalid_argument("MediaWiki domain must not be empty");
    }
    ensure_curl_global();
}

std::string MediaWikiTransport::article_url(const Title& title) const {
    return config_.protocol + "://" + config_.domain + "/wiki/" + encode_title(title);
}

std::string MediaWikiTransport::api_url(
    const std::vector<std::pair<std::string, std::string>>& params) const {
    std::string url = config_.protocol + "://" + config_.domain + "/w/api.php?";
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) url += '&';
        first = false;
        url += url_escape(key) + "=" + url_escape(value);
    }
    return url;
}

std::optional<std::string> MediaWikiTransport::http_get(const std::string& url) {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        set_error("curl_easy_init failed");
        return std::nullopt;
    }

    std::string body;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, config_.user_agent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, config_.timeout_ms);
    curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    log_debug("http", "GET %s", url.c_str());

    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        set_error(std::string("GET ") + url + " failed: " + curl_easy_strerror(rc));
        return std::nullopt;
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status >= 400) {
        set_error("GET " + url + " returned HTTP " + std::to_string(status));
        return std::nullopt;
    }

    return body;
}

std::optional<std::string> MediaWikiTransport::fetch_rendered_page(const Title& title) {
    return http_get(article_url(title));
}

std::optional<InboundPage> MediaWikiTransport::fetch_inbound_page(
    const Title& title, const std::string& cursor, int limit) {
    std::vector<std::pair<std::string, std::string>> params = {
        {"action", "query"},
        {"format", "json"},
        {"formatversion", "2"},
        {"list", "backlinks"},
        {"bltitle", title},
        {"blnamespace", "0"},
        {"blfilterredir", "nonredirects"},
        {"bllimit", std::to_string(limit)},
    };
    if (!cursor.empty()) {
        params.emplace_back("blcontinue", cursor);
        params.emplace_back("continue", "-||");
    }

    auto body = http_get(api_url(params));
    if (!body) return std::nullopt;

    std::string error;
    auto page = parse_backlinks(*body, error);
    if (!page) {
        set_error("backlinks of '" + title + "': " + error);
    }
    return page;
}

std::optional<std::vector<Title>> MediaWikiTransport::fetch_redirects_to(const Title& title) {
    std::vector<Title> redirects;
    std::optional<std::string> next;

    for (int pages = 0; pages < MAX_REDIRECT_PAGES; ++pages) {
        std::vector<std::pair<std::string, std::string>> params = {
            {"action", "query"},
            {"format", "json"},
            {"formatversion", "2"},
            {"prop", "redirects"},
            {"titles", title},
            {"rdnamespace", "0"},
            {"rdlimit", "max"},
        };
        if (next) {
            params.emplace_back("rdcontinue", *next);
            params.emplace_back("continue", "||");
        }

        auto body = http_get(api_url(params));
        if (!body) return std::nullopt;

        std::string error;
        if (!parse_redirects(*body, redirects, next, error)) {
            set_error("redirects to '" + title + "': " + error);
            return std::nullopt;
        }
        if (!next) break;
    }

    return redirects;
}

std::optional<InboundPage> MediaWikiTransport::parse_backlinks(
    const std::string& body, std::string& error) {
    json response = json::parse(body, nullptr, false);
    if (response.is_discarded() || !response.is_object()) {
        error = "response is not a JSON object";
        return std::nullopt;
    }
    if (auto api = api_error(response)) {
        error = *api;
        return std::nullopt;
    }

    InboundPage page;
    try {
        const json& query = response.value("query", json::object());
        if (query.is_object() && query.contains("backlinks") && query["backlinks"].is_array()) {
            for (const auto& entry : query["backlinks"]) {
                if (!entry.is_object() || flag_set(entry, "redirect")) continue;
                std::string title = string_field(entry, "title", "");
                if (!title.empty()) {
                    page.titles.push_back(std::move(title));
                }
            }
        }

        const json& cont = response.value("continue", json::object());
        if (cont.is_object()) {
            std::string cursor = string_field(cont, "blcontinue", "");
            if (!cursor.empty()) page.next_cursor = std::move(cursor);
        }
    } catch (const json::exception& e) {
        error = std::string("malformed backlinks response: ") + e.what();
        return std::nullopt;
    }
    return page;
}

bool MediaWikiTransport::parse_redirects(const std::string& body, std::vector<Title>& out,
                                         std::optional<std::string>& next, std::string& error) {
    json response = json::parse(body, nullptr, false);
    if (response.is_discarded() || !response.is_object()) {
        error = "response is not a JSON object";
        return false;
    }
    if (auto api = api_error(response)) {
        error = *api;
        return false;
    }

    next.reset();
    try {
        const json& query = response.value("query", json::object());
        if (query.is_object() && query.contains("pages") && query["pages"].is_array()) {
            for (const auto& page : query["pages"]) {
                if (!page.is_object() || !page.contains("redirects") ||
                    !page["redirects"].is_array()) {
                    continue;
                }
                for (const auto& redirect : page["redirects"]) {
                    if (!redirect.is_object()) continue;
                    std::string title = string_field(redirect, "title", "");
                    if (!title.empty()) out.push_back(std::move(title));
                }
            }
        }

        const json& cont = response.value("continue", json::object());
        if (cont.is_object()) {
            std::string token = string_field(cont, "rdcontinue", "");
            if (!token.empty()) next = std::move(token);
        }
    } catch (const json::exception& e) {
        error = std::string("malformed redirects response: ") + e.what();
        return false;
    }
    return true;
}

void MediaWikiTransport::set_error(std::string message) {
    std::lock_guard lock(error_mutex_);
    last_error_ = std::move(message);
}

std::string MediaWikiTransport::last_error() const {
    std::lock_guard lock(error_mutex_);
    return last_error_;
}

} // namespace wikiladder
