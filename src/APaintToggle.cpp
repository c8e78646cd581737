#include <APaintToggle>

const char* toString(EPaintPattern pattern) {
    switch (pattern) {
    case EPaintPattern::White: return "White";
    case EPaintPattern::Black: return "Black";
    default: return "Unknown";
    }
}

APaintToggle::APaintToggle(EPaintPattern initial) : pattern_(initial) {}

EPaintPattern APaintToggle::current() const {
    return pattern_;
}

void APaintToggle::flip() {
    pattern_ = pattern_ == EPaintPattern::White ? EPaintPattern::Black : EPaintPattern::White;
    ++flips_;
}

uint64_t APaintToggle::paintCount() const {
    return flips_;
}
