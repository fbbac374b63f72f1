#include <splitter/split_lines.hpp>

#include <iostream>
#include <string>
#include <vector>

// Usage: split_lines [-d STR | -c SET | -w | -r PATTERN] [-l LIMIT] < input
//
//   printf 'a,b,c,\n' | split_lines            -> ["a", "b", "c"]
//   printf 'a,b,c,\n' | split_lines -l -1      -> ["a", "b", "c", ""]
//   printf '2013-04-05 14:39\n' | split_lines -c '- ' -l 2
//                                              -> ["2013", "04-05 14:39"]

int main(int argc, char** argv) {
    std::vector<std::string> args(argc > 0 ? argv + 1 : argv, argv + argc);
    return splitter::run_split_lines(args, std::cin, std::cout, std::cerr);
}
