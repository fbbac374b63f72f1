#include "splitter/limit.hpp"
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <string>

namespace splitter {

Limit Limit::at_most(std::size_t n) {
    if (n == 0) throw InvalidLimit("Split limit must be at least 1");
    return Limit{Kind::Bounded, n};
}

Limit Limit::from_int(std::optional<long long> n) {
    if (!n) return Limit{};
    if (*n == -1) return unbounded();
    if (*n < 1) throw InvalidLimit("Invalid split limit: " + std::to_string(*n) + " (expected -1 or a positive count)");
    return at_most(static_cast<std::size_t>(*n));
}

Limit Limit::parse(std::string_view text) {
    if (text.empty()) return Limit{};

    std::string s(text);
    // strtoll would otherwise skip leading whitespace and accept '+'
    if (s[0] != '-' && !std::isdigit(static_cast<unsigned char>(s[0])))
        throw InvalidLimit("Split limit is not an integer: '" + s + "'");

    const char* begin = s.c_str();
    char* end = nullptr;
    errno = 0;
    long long v = std::strtoll(begin, &end, 10);
    if (end == begin || end != begin + s.size()) throw InvalidLimit("Split limit is not an integer: '" + s + "'");
    if (errno == ERANGE) throw InvalidLimit("Split limit out of range: '" + s + "'");
    return from_int(v);
}

} // namespace splitter
