#pragma once
// Titles: the node identifiers of the link graph
//
// A Title is the display form of a page name ("Kevin Bacon"). Every title
// that enters the oracle or a ladder goes through canonical_title, so
// equality, hashing and set membership all see one canonical spelling.
//
// The transport form ("Kevin_Bacon", "AT%26T") is produced by encode_title
// and reversed by decode_title. normalize_title decodes first and belongs
// at the edges only (hrefs, user input): decoding twice is not idempotent.

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace wikiladder {

using Title = std::string;
using TitleSet = std::unordered_set<Title>;

// Read-only shared view of a cached neighbor set
using TitleSetRef = std::shared_ptr<const TitleSet>;

namespace detail {

inline bool is_hex(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

inline int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return c - 'A' + 10;
}

// Characters MediaWiki percent-encodes in article paths
inline bool is_reserved(unsigned char c) {
    switch (c) {
        case '!': case '"': case '&': case '\'': case '*': case '+':
        case ',': case '/': case ';': case '=': case '?': case '@':
        case '\\': case '`':
            return true;
        default:
            return false;
    }
}

inline bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

} // namespace detail

// Percent-encode a title for use in an article URL path.
// A '%' already followed by two hex digits is left alone, so encoding an
// encoded title never produces "%2521".
inline std::string encode_title(const std::string& title) {
    static const char* HEX = "0123456789ABCDEF";

    std::string out;
    out.reserve(title.size() + title.size() / 2);

    for (size_t i = 0; i < title.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(title[i]);

        if (c == ' ') {
            out += '_';
        } else if (c == '%') {
            bool encoded = i + 2 < title.size() &&
                           detail::is_hex(title[i + 1]) && detail::is_hex(title[i + 2]);
            out += encoded ? "%" : "%25";
        } else if (c >= 0x80 || detail::is_reserved(c)) {
            out += '%';
            out += HEX[c >> 4];
            out += HEX[c & 0x0F];
        } else {
            out += static_cast<char>(c);
        }
    }

    return out;
}

// Reverse encode_title: '_' becomes a space, every valid %HH becomes its byte.
// A '%' that does not start a valid escape is kept verbatim.
inline std::string decode_title(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '_') {
            out += ' ';
        } else if (c == '%' && i + 2 < text.size() &&
                   detail::is_hex(text[i + 1]) && detail::is_hex(text[i + 2])) {
            out += static_cast<char>(detail::hex_value(text[i + 1]) * 16 +
                                     detail::hex_value(text[i + 2]));
            i += 2;
        } else {
            out += c;
        }
    }

    return out;
}

// Canonical form: underscores read as spaces, whitespace runs collapsed,
// trimmed, first letter upper-cased (MediaWiki titles are case-sensitive
// except for the first character). Idempotent; never decodes.
inline Title canonical_title(const std::string& text) {
    Title out;
    out.reserve(text.size());
    bool pending_space = false;
    for (char c : text) {
        if (c == '_' || detail::is_space(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out += ' ';
            pending_space = false;
        }
        out += c;
    }

    if (!out.empty() && static_cast<unsigned char>(out[0]) < 0x80) {
        out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
    }
    return out;
}

// Transport or user text to canonical form: decode once, then canonicalize
inline Title normalize_title(const std::string& text) {
    return canonical_title(decode_title(text));
}

inline bool titles_equal_ignore_case(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    return std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) ==
               std::tolower(static_cast<unsigned char>(y));
    });
}

// True if the title lives outside the article namespace ("Category:Birds",
// "Help:Contents", "User talk:Foo"). "Jimmy Neutron: Boy Genius" is an
// article and returns false.
inline bool has_namespace_prefix(const Title& title) {
    static const std::vector<std::string> NAMESPACES = {
        "media", "special", "talk", "user", "wikipedia", "wp", "project",
        "file", "image", "mediawiki", "template", "help", "category",
        "portal", "draft", "timedtext", "module", "book",
        "education program", "gadget", "gadget definition", "topic",
    };

    auto colon = title.find(':');
    if (colon == std::string::npos || colon == 0) return false;

    std::string prefix = title.substr(0, colon);
    std::transform(prefix.begin(), prefix.end(), prefix.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    std::replace(prefix.begin(), prefix.end(), '_', ' ');

    const std::string talk_suffix = " talk";
    if (prefix.size() > talk_suffix.size() &&
        prefix.compare(prefix.size() - talk_suffix.size(), talk_suffix.size(), talk_suffix) == 0) {
        return true;
    }

    return std::find(NAMESPACES.begin(), NAMESPACES.end(), prefix) != NAMESPACES.end();
}

} // namespace wikiladder
