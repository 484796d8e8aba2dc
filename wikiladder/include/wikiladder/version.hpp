#pragma once

#define WIKILADDER_VERSION "1.3.0"
#define WIKILADDER_USER_AGENT "wikiladder/" WIKILADDER_VERSION " (link-ladder search bot)"

namespace wikiladder {
namespace version {

inline const char* software() {
    return WIKILADDER_VERSION;
}

} // namespace version
} // namespace wikiladder
