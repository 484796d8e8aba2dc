#pragma once
// Transport: where edges come from
//
// The oracle never talks to the network itself. A Transport answers three
// questions about one page and reports failure as std::nullopt, leaving the
// reason in last_error(). Implementations must be safe to call from several
// threads at once when the oracle is shared between threads.

#include "title.hpp"
#include <optional>
#include <string>
#include <vector>

namespace wikiladder {

// One page of backlinks. Redirect entries are already filtered out.
struct InboundPage {
    std::vector<Title> titles;
    std::optional<std::string> next_cursor;  // nullopt = no further pages
};

class Transport {
public:
    virtual ~Transport() = default;

    // Raw rendered markup of the page
    virtual std::optional<std::string> fetch_rendered_page(const Title& title) = 0;

    // One page of titles linking to `title`. `cursor` is empty for the first
    // page, otherwise the next_cursor of the previous page.
    virtual std::optional<InboundPage> fetch_inbound_page(
        const Title& title, const std::string& cursor, int limit) = 0;

    // Titles of redirect pages that resolve to `title`
    virtual std::optional<std::vector<Title>> fetch_redirects_to(const Title& title) = 0;

    // Error message from the most recent failed call
    virtual std::string last_error() const = 0;
};

} // namespace wikiladder
