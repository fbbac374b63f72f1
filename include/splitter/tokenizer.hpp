#pragma once
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "splitter/limit.hpp"
#include "splitter/matcher.hpp"

namespace splitter {

// A matcher broke the find() contract. Not recoverable.
struct InvalidMatcherResult : std::logic_error { using std::logic_error::logic_error; };

/// Split `input` at each delimiter `matcher` finds, left to right.
/// Tokens between adjacent delimiters are empty and kept, except that the
/// Default limit drops empty tokens at the end. A Bounded(n) limit stops
/// searching after n - 1 delimiters and leaves the rest as the final token.
/// Throws InvalidMatcherResult if the matcher reports an out-of-range match.
std::vector<std::string> tokenize(std::string_view input, const Matcher& matcher, Limit limit = {});

/// As tokenize(), but the tokens view into `input`, which must outlive them.
std::vector<std::string_view> tokenize_views(std::string_view input, const Matcher& matcher, Limit limit = {});

// Literal-delimiter shorthands.
std::vector<std::string> split(std::string_view input, char delimiter, Limit limit = {});
std::vector<std::string> split(std::string_view input, const std::string& delimiter, Limit limit = {});

} // namespace splitter
