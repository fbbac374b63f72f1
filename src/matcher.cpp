#include "splitter/matcher.hpp"
#include <cctype>
#include <utility>

namespace splitter {

static bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

LiteralMatcher::LiteralMatcher(std::string delimiter) : delim_(std::move(delimiter)) {
    if (delim_.empty()) throw MatcherError("Literal delimiter must not be empty");
}

MatchResult LiteralMatcher::find(std::string_view input, std::size_t from) const {
    std::size_t pos = input.find(delim_, from);
    if (pos == std::string_view::npos) return std::nullopt;
    return Match{pos, pos + delim_.size()};
}

CharSetMatcher::CharSetMatcher(std::string set, bool runs) : set_(std::move(set)), runs_(runs) {
    if (set_.empty()) throw MatcherError("Delimiter character set must not be empty");
}

MatchResult CharSetMatcher::find(std::string_view input, std::size_t from) const {
    std::size_t i = from;
    while (i < input.size() && !contains(input[i])) ++i;
    if (i >= input.size()) return std::nullopt;

    std::size_t start = i++;
    if (runs_) {
        while (i < input.size() && contains(input[i])) ++i;
    }
    return Match{start, i};
}

MatchResult WhitespaceMatcher::find(std::string_view input, std::size_t from) const {
    std::size_t i = from;
    while (i < input.size() && !is_space(input[i])) ++i;
    if (i >= input.size()) return std::nullopt;

    std::size_t start = i;
    while (i < input.size() && is_space(input[i])) ++i;
    return Match{start, i};
}

static std::regex compile_pattern(const std::string& pattern) {
    try {
        return std::regex(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        throw MatcherError("Invalid delimiter pattern '" + pattern + "': " + e.what());
    }
}

RegexMatcher::RegexMatcher(const std::string& pattern) : re_(compile_pattern(pattern)) {}

MatchResult RegexMatcher::find(std::string_view input, std::size_t from) const {
    const char* base = input.data();
    const char* first = base + from;
    const char* last = base + input.size();

    auto flags = std::regex_constants::match_default;
    if (from > 0) flags |= std::regex_constants::match_prev_avail;

    std::cmatch m;
    if (!std::regex_search(first, last, m, re_, flags)) return std::nullopt;

    std::size_t start = from + static_cast<std::size_t>(m.position(0));
    return Match{start, start + static_cast<std::size_t>(m.length(0))};
}

FunctionMatcher::FunctionMatcher(Fn fn) : fn_(std::move(fn)) {
    if (!fn_) throw MatcherError("Matcher function must not be empty");
}

} // namespace splitter
