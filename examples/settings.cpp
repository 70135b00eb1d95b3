/**
 * Reads "key = value" settings from the standard input and prints the
 * effective server configuration. Missing or malformed entries fall back to
 * defaults without a single explicit presence check.
 */

#include <iostream>
#include <map>
#include <string>
#include <utility>
#include <maybetype/maybetype.hpp>

namespace mt = maybetype;

using settings = std::map<std::string, std::string>;

std::string trim(std::string const& s) {
    auto const first = s.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return std::string();
    }
    auto const last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

mt::maybe<std::pair<std::string, std::string>> parse_line(std::string const& line) {
    auto const eq = line.find('=');
    if (eq == std::string::npos || line.front() == '#') {
        return mt::nothing;
    }
    return mt::make_maybe(
        std::make_pair(trim(line.substr(0, eq)), trim(line.substr(eq + 1))),
        [](auto const& kv) { return !kv.first.empty(); }
    );
}

bool is_port(int p) { return p > 0 && p < 65536; }

int main() {
    settings raw;
    std::string line;

    while (std::getline(std::cin, line)) {
        if (line.empty()) {
            continue;
        }
        auto kv = parse_line(line);
        if (kv.is_none()) {
            std::cerr << "Ignoring malformed line: " << line << std::endl;
            continue;
        }
        raw.insert_or_assign(kv.some().value().first, kv.some().value().second);
    }

    auto config = mt::make_maybe(raw, [](settings const& s) { return !s.empty(); });

    auto host = config.get("host").unwrap_or("localhost");
    auto port = mt::flatten(config.get("port").and_then(mt::parse_int))
        .test(is_port)
        .unwrap_or(8080);
    auto workers = mt::flatten(config.get("workers").and_then(mt::parse_int))
        .test([](int n) { return n > 0; })
        .this_or(1)
        .unwrap();
    auto name = config.get("name")
        .test([](std::string const& s) { return !s.empty(); })
        .match(
            [](std::string const& s) { return s; },
            [] { return std::string("<unnamed>"); }
        );

    std::cout << "name:    " << name << std::endl;
    std::cout << "host:    " << host << std::endl;
    std::cout << "port:    " << port << std::endl;
    std::cout << "workers: " << workers << std::endl;

    return 0;
}
