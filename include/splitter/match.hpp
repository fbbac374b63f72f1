#pragma once
#include <cstddef>
#include <optional>

namespace splitter {

// Half-open range [start, end) of one delimiter occurrence in the input.
struct Match {
    std::size_t start{0};
    std::size_t end{0};

    std::size_t length() const noexcept { return end - start; }
    bool empty() const noexcept { return start == end; }
};

// std::nullopt means "no further match".
using MatchResult = std::optional<Match>;

inline bool operator==(const Match& a, const Match& b) {
    return a.start == b.start && a.end == b.end;
}
inline bool operator!=(const Match& a, const Match& b) { return !(a == b); }

} // namespace splitter
