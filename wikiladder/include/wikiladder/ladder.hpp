#pragma once
// Ladder: a path built from both ends
//
// A ladder starts as just its two end rungs. Rungs are stacked on the lower
// section (climbing up from the start) or hung under the upper section
// (climbing down from the end) until the two innermost rungs link. Every
// adjacent pair inside a section links in the direction of travel.
//
//   lower: start -> l1 -> l2          upper: end <- u1
//   path:  start, l1, l2, u1, end     (complete when l2 links to u1)
//
// Ladders are plain values: searches copy a ladder and extend the copy.

#include <functional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace wikiladder {

// Outcome of adding a rung
enum class RungStatus {
    Applied,    // rung appended
    NoOp,       // rung is already the frontier of that section
    NoLink,     // rejected: the frontier and the rung do not link
    Complete    // rejected: the ladder is already complete
};

inline const char* rung_status_name(RungStatus status) {
    switch (status) {
        case RungStatus::Applied: return "applied";
        case RungStatus::NoOp: return "no-op";
        case RungStatus::NoLink: return "no link";
        case RungStatus::Complete: return "already complete";
    }
    return "unknown";
}

template<typename Rung>
class Ladder {
public:
    // links(a, b): true if rung a leads directly to rung b
    using LinkPredicate = std::function<bool(const Rung&, const Rung&)>;
    // same_ends(start, end): a ladder whose ends match is complete from birth
    using EndsPredicate = std::function<bool(const Rung&, const Rung&)>;

    Ladder(Rung start, Rung end, LinkPredicate links,
           EndsPredicate same_ends = std::equal_to<Rung>())
        : links_(std::move(links)), same_ends_(std::move(same_ends)) {
        lower_.push_back(std::move(start));
        upper_.push_back(std::move(end));
        complete_ = compute_complete();
    }

    const Rung& start() const { return lower_.front(); }
    const Rung& end() const { return upper_.front(); }

    // Innermost rung of each section
    const Rung& lower_rung() const { return lower_.back(); }
    const Rung& upper_rung() const { return upper_.back(); }

    const std::vector<Rung>& lower_rungs() const { return lower_; }
    const std::vector<Rung>& upper_rungs() const { return upper_; }

    bool is_complete() const { return complete_; }

    // Rungs excluding the two ends; shorter ladders are preferred
    int height() const {
        return static_cast<int>(lower_.size() + upper_.size()) - 2;
    }

    RungStatus add_lower_rung(const Rung& rung) {
        if (rung == lower_rung()) return RungStatus::NoOp;
        if (complete_) return RungStatus::Complete;
        if (!links_(lower_rung(), rung)) return RungStatus::NoLink;

        lower_.push_back(rung);
        complete_ = compute_complete();
        return RungStatus::Applied;
    }

    RungStatus add_upper_rung(const Rung& rung) {
        if (rung == upper_rung()) return RungStatus::NoOp;
        if (complete_) return RungStatus::Complete;
        if (!links_(rung, upper_rung())) return RungStatus::NoLink;

        upper_.push_back(rung);
        complete_ = compute_complete();
        return RungStatus::Applied;
    }

    // Start-to-end order. An incomplete ladder gets `gap` between sections.
    std::vector<Rung> to_sequence(const Rung& gap) const {
        std::vector<Rung> seq(lower_.begin(), lower_.end());
        if (!complete_) {
            seq.push_back(gap);
        }
        seq.insert(seq.end(), upper_.rbegin(), upper_.rend());
        return seq;
    }

    // "[a, b, c]" or "[a, b, ... , y, z]" while a gap remains
    std::string to_string() const {
        std::ostringstream oss;
        oss << "[";
        for (size_t i = 0; i < lower_.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << lower_[i];
        }
        oss << (complete_ ? ", " : ", ... , ");
        for (size_t i = upper_.size(); i > 0; --i) {
            oss << upper_[i - 1];
            if (i > 1) oss << ", ";
        }
        oss << "]";
        return oss.str();
    }

private:
    bool compute_complete() const {
        if (same_ends_(start(), end())) return true;
        return links_(lower_rung(), upper_rung());
    }

    LinkPredicate links_;
    EndsPredicate same_ends_;
    std::vector<Rung> lower_;
    std::vector<Rung> upper_;
    bool complete_ = false;
};

} // namespace wikiladder
