#pragma once
// wikiladder: link ladders through the encyclopedia
//
// - Titles: normalization and percent encoding of page names
// - Transport: where edges come from (MediaWiki over HTTPS, or your own)
// - GraphOracle: memoized, budgeted neighbor sets
// - Ladder: a path built from both ends
// - AnchorSearch / CompletionSearch: the two search phases
// - Racer: the entry point tying them together

#include "version.hpp"
#include "log.hpp"
#include "title.hpp"
#include "transport.hpp"
#include "mediawiki_transport.hpp"
#include "graph_oracle.hpp"
#include "ladder.hpp"
#include "search.hpp"
#include "anchor.hpp"
#include "completion.hpp"
#include "config.hpp"
#include "racer.hpp"
