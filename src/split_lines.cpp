#include "splitter/split_lines.hpp"
#include "splitter/tokenizer.hpp"
#include <istream>
#include <ostream>
#include <regex>

namespace splitter {

static void print_usage(std::ostream& os) {
    os << "usage: split_lines [-d STR | -c SET | -w | -r PATTERN] [-l LIMIT]\n"
          "  -d STR      literal delimiter (default ',')\n"
          "  -c SET      any character of SET, runs collapsed\n"
          "  -w          runs of whitespace\n"
          "  -r PATTERN  ECMAScript regular expression\n"
          "  -l LIMIT    -1 keeps trailing empty tokens, N >= 1 caps the token count\n";
}

LineOptions parse_line_options(const std::vector<std::string>& args) {
    LineOptions opts;

    auto value = [&](std::size_t& i) -> const std::string& {
        if (i + 1 >= args.size()) throw UsageError("Missing value for " + args[i]);
        return args[++i];
    };

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (a == "-d") {
            opts.matcher = std::make_unique<LiteralMatcher>(value(i));
        } else if (a == "-c") {
            opts.matcher = std::make_unique<CharSetMatcher>(value(i), true);
        } else if (a == "-w") {
            opts.matcher = std::make_unique<WhitespaceMatcher>();
        } else if (a == "-r") {
            opts.matcher = std::make_unique<RegexMatcher>(value(i));
        } else if (a == "-l") {
            opts.limit = Limit::parse(value(i));
        } else {
            throw UsageError("Unknown option: " + a);
        }
    }

    if (!opts.matcher) opts.matcher = std::make_unique<LiteralMatcher>(',');
    return opts;
}

std::string format_tokens(const std::vector<std::string>& tokens) {
    std::string out = "[";
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        if (i) out += ", ";
        out += '"';
        for (char c : tokens[i]) {
            if (c == '"' || c == '\\') out += '\\';
            out += c;
        }
        out += '"';
    }
    out += "]";
    return out;
}

int split_stream(std::istream& in, std::ostream& out, std::ostream& err,
                 const Matcher& matcher, Limit limit) {
    std::string line;
    while (std::getline(in, line)) {
        try {
            out << format_tokens(tokenize(line, matcher, limit)) << "\n";
        } catch (const std::regex_error& e) {
            // error_complexity / error_stack on pathological lines
            err << "split_lines: pattern failed on input line: " << e.what() << "\n";
            return 2;
        }
    }
    return 0;
}

int run_split_lines(const std::vector<std::string>& args,
                    std::istream& in, std::ostream& out, std::ostream& err) {
    LineOptions opts;
    try {
        opts = parse_line_options(args);
    } catch (const UsageError& e) {
        err << "split_lines: " << e.what() << "\n";
        print_usage(err);
        return 2;
    } catch (const InvalidLimit& e) {
        err << "split_lines: " << e.what() << "\n";
        return 2;
    } catch (const MatcherError& e) {
        err << "split_lines: " << e.what() << "\n";
        return 2;
    }

    return split_stream(in, out, err, *opts.matcher, opts.limit);
}

} // namespace splitter
