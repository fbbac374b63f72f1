#pragma once
#include <functional>
#include <regex>
#include <stdexcept>
#include <string>
#include <string_view>

#include "splitter/match.hpp"

namespace splitter {

struct MatcherError : std::runtime_error { using std::runtime_error::runtime_error; };

/// Locates the next delimiter occurrence in `input` at or after `from`.
/// Callers guarantee from <= input.size(). A returned match must satisfy
/// from <= start <= end <= input.size().
/// Matchers hold no per-call state, so one instance can serve concurrent calls.
class Matcher {
public:
    virtual ~Matcher() = default;
    virtual MatchResult find(std::string_view input, std::size_t from) const = 0;
};

// Fixed, non-empty substring.
class LiteralMatcher : public Matcher {
public:
    explicit LiteralMatcher(std::string delimiter);
    explicit LiteralMatcher(char delimiter) : LiteralMatcher(std::string(1, delimiter)) {}

    MatchResult find(std::string_view input, std::size_t from) const override;

    const std::string& delimiter() const { return delim_; }

private:
    std::string delim_;
};

// Any single character from `set`. With `runs`, a run of consecutive set
// characters is consumed as one delimiter.
class CharSetMatcher : public Matcher {
public:
    explicit CharSetMatcher(std::string set, bool runs = false);

    MatchResult find(std::string_view input, std::size_t from) const override;

private:
    bool contains(char c) const { return set_.find(c) != std::string::npos; }

    std::string set_;
    bool runs_{false};
};

// Runs of std::isspace characters.
class WhitespaceMatcher : public Matcher {
public:
    MatchResult find(std::string_view input, std::size_t from) const override;
};

// ECMAScript regular expression. The search sees the whole input, so the
// anchors and word boundaries ('^', '\b', '\B') respect the characters
// before `from`.
class RegexMatcher : public Matcher {
public:
    explicit RegexMatcher(const std::string& pattern);

    MatchResult find(std::string_view input, std::size_t from) const override;

private:
    std::regex re_;
};

// Wraps a function value with the same signature as Matcher::find.
class FunctionMatcher : public Matcher {
public:
    using Fn = std::function<MatchResult(std::string_view, std::size_t)>;

    explicit FunctionMatcher(Fn fn);

    MatchResult find(std::string_view input, std::size_t from) const override {
        return fn_(input, from);
    }

private:
    Fn fn_;
};

} // namespace splitter
