#pragma once

#include <cstddef>
#include <deque>
#include <string>
#include <vector>

namespace lt {

/// Bounded FIFO of recent transcript fragments.  Appending past capacity
/// evicts the oldest fragment.  Not thread-safe.
class RollingTranscript {
public:
    explicit RollingTranscript(size_t capacity = 20);

    void append(const std::string& text);
    void clear();

    /// Fragments joined by single spaces.
    std::string join() const;

    std::vector<std::string> entries() const;
    size_t size() const { return entries_.size(); }
    size_t capacity() const { return capacity_; }

private:
    size_t                  capacity_;
    std::deque<std::string> entries_;
};

} // namespace lt
