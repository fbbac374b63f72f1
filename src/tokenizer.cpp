#include "splitter/tokenizer.hpp"

namespace splitter {

static MatchResult checked_find(std::string_view input, const Matcher& matcher, std::size_t from) {
    MatchResult m = matcher.find(input, from);
    if (!m) return m;
    if (m->start < from || m->end < m->start || m->end > input.size()) {
        throw InvalidMatcherResult("Matcher returned [" + std::to_string(m->start) + ", " +
                                   std::to_string(m->end) + ") for a search from offset " +
                                   std::to_string(from) + " in input of length " +
                                   std::to_string(input.size()));
    }
    return m;
}

// An empty match right at the cursor would not advance the scan; resume the
// search one character later instead.
static MatchResult next_delimiter(std::string_view input, const Matcher& matcher, std::size_t cursor) {
    MatchResult m = checked_find(input, matcher, cursor);
    if (m && m->empty() && m->start == cursor) {
        if (cursor >= input.size()) return std::nullopt;
        m = checked_find(input, matcher, cursor + 1);
    }
    return m;
}

std::vector<std::string_view> tokenize_views(std::string_view input, const Matcher& matcher, Limit limit) {
    std::vector<std::string_view> tokens;
    const bool bounded = limit.kind() == Limit::Kind::Bounded;
    std::size_t cursor = 0;

    for (;;) {
        // last slot under the limit: it takes whatever is left
        if (bounded && tokens.size() + 1 == limit.count()) break;

        MatchResult m = next_delimiter(input, matcher, cursor);
        if (!m) break;

        tokens.push_back(input.substr(cursor, m->start - cursor));
        cursor = m->end;
    }
    tokens.push_back(input.substr(cursor));

    if (limit.trims_trailing()) {
        while (!tokens.empty() && tokens.back().empty()) tokens.pop_back();
    }
    return tokens;
}

std::vector<std::string> tokenize(std::string_view input, const Matcher& matcher, Limit limit) {
    std::vector<std::string_view> views = tokenize_views(input, matcher, limit);

    std::vector<std::string> tokens;
    tokens.reserve(views.size());
    for (auto v : views) tokens.emplace_back(v);
    return tokens;
}

std::vector<std::string> split(std::string_view input, char delimiter, Limit limit) {
    return tokenize(input, LiteralMatcher(delimiter), limit);
}

std::vector<std::string> split(std::string_view input, const std::string& delimiter, Limit limit) {
    return tokenize(input, LiteralMatcher(delimiter), limit);
}

} // namespace splitter
