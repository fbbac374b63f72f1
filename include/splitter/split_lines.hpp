#pragma once
#include <iosfwd>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "splitter/limit.hpp"
#include "splitter/matcher.hpp"

namespace splitter {

struct UsageError : std::runtime_error { using std::runtime_error::runtime_error; };

struct LineOptions {
    std::unique_ptr<Matcher> matcher; // literal ',' unless a flag picks another
    Limit limit;
};

/// Parse split_lines flags (program name excluded):
///   -d STR | -c SET | -w | -r PATTERN   delimiter, the last one given wins
///   -l LIMIT                            Limit::parse encoding
/// Throws UsageError, InvalidLimit or MatcherError.
LineOptions parse_line_options(const std::vector<std::string>& args);

// ["a", "b\"c", ""] with '"' and '\' escaped.
std::string format_tokens(const std::vector<std::string>& tokens);

/// Split every line of `in`, writing one formatted token list per line to `out`.
/// Returns the process exit status: 0, or 2 after a one-line message on `err`
/// if the matcher fails mid-stream.
int split_stream(std::istream& in, std::ostream& out, std::ostream& err,
                 const Matcher& matcher, Limit limit);

/// Whole program: parse `args`, then split_stream(). Exit status 2 on bad
/// arguments, with the message (and usage, for UsageError) on `err`.
int run_split_lines(const std::vector<std::string>& args,
                    std::istream& in, std::ostream& out, std::ostream& err);

} // namespace splitter
