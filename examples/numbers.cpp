/**
 * Reads lines of whitespace-separated tokens and prints the integers found in
 * each line along with their sum. Tokens that are not integers are skipped.
 */

#include <iostream>
#include <iterator>
#include <numeric>
#include <sstream>
#include <string>
#include <vector>
#include <maybetype/maybetype.hpp>

namespace mt = maybetype;

int main() {
    std::string line;

    while (std::getline(std::cin, line)) {
        std::istringstream tokens(line);
        std::vector<std::string> words{
            std::istream_iterator<std::string>(tokens),
            std::istream_iterator<std::string>()
        };

        auto numbers = mt::map_maybe(mt::parse_int, words);
        if (numbers.empty()) {
            std::cout << "No integers in the input!" << std::endl;
            continue;
        }

        long long sum = std::accumulate(numbers.begin(), numbers.end(), 0LL);
        std::cout << numbers.size() << " integer(s), sum: " << sum << std::endl;
    }

    return 0;
}
