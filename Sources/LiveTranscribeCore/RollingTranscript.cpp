#include "RollingTranscript.hpp"

#include <algorithm>

namespace lt {

RollingTranscript::RollingTranscript(size_t capacity)
    : capacity_(std::max<size_t>(capacity, 1)) {}

void RollingTranscript::append(const std::string& text) {
    entries_.push_back(text);
    while (entries_.size() > capacity_) {
        entries_.pop_front();
    }
}

void RollingTranscript::clear() {
    entries_.clear();
}

std::string RollingTranscript::join() const {
    std::string out;
    for (const auto& entry : entries_) {
        if (!out.empty()) out += ' ';
        out += entry;
    }
    return out;
}

std::vector<std::string> RollingTranscript::entries() const {
    return std::vector<std::string>(entries_.begin(), entries_.end());
}

} // namespace lt
