#pragma once
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string_view>

namespace splitter {

struct InvalidLimit : std::runtime_error { using std::runtime_error::runtime_error; };

/// How many tokens a split may produce, and whether trailing empties survive.
///
///   Default    unlimited; trailing empty tokens are dropped
///   Unbounded  unlimited; every token is kept
///   Bounded    at most count() tokens; the last one takes the rest of the input
class Limit {
public:
    enum class Kind { Default, Unbounded, Bounded };

    Limit() = default;

    static Limit trim_trailing() { return Limit{}; }
    static Limit unbounded() { return Limit{Kind::Unbounded, 0}; }
    static Limit at_most(std::size_t n);

    /// Integer encoding: nullopt -> Default, -1 -> Unbounded, n >= 1 -> Bounded(n).
    /// Throws InvalidLimit for 0 and anything below -1.
    static Limit from_int(std::optional<long long> n);

    /// Same encoding read from text; empty text means Default.
    static Limit parse(std::string_view text);

    Kind kind() const noexcept { return kind_; }
    std::size_t count() const noexcept { return count_; } // Bounded only
    bool trims_trailing() const noexcept { return kind_ == Kind::Default; }

    friend bool operator==(const Limit& a, const Limit& b) {
        return a.kind_ == b.kind_ && a.count_ == b.count_;
    }
    friend bool operator!=(const Limit& a, const Limit& b) { return !(a == b); }

private:
    Limit(Kind k, std::size_t n) : kind_(k), count_(n) {}

    Kind kind_{Kind::Default};
    std::size_t count_{0};
};

} // namespace splitter
