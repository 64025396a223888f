#include <catch2/catch.hpp>
#include <iostream>
#include <rang.hpp>
#include <sstream>
#include <string>
#include <vector>

#include "include/pricing_cli.hpp"

namespace {

std::vector<std::string> capture_table(const std::vector<std::vector<std::string>>& table,
                                       const std::vector<int>& min_width) {
    rang::setControlMode(rang::control::Off);
    std::ostringstream out;
    std::streambuf* previous = std::cout.rdbuf(out.rdbuf());
    print_table(table, min_width);
    std::cout.rdbuf(previous);
    rang::setControlMode(rang::control::Auto);

    std::vector<std::string> lines;
    std::istringstream in(out.str());
    for (std::string line; std::getline(in, line);) {
        if (!line.empty()) lines.push_back(line);
    }
    return lines;
}

}  // namespace

TEST_CASE("Table columns grow to the widest cell", "[print]") {
    auto lines = capture_table({{"barrier", "rate=0.00"},
                                {"1.0000", "0.87016693"},
                                {"16384.0000", "n/a"}},
                               {});

    // rule, header, rule, two rows, rule
    REQUIRE(lines.size() == 6);
    for (const auto& line : lines) {
        INFO("line: '" << line << "'");
        REQUIRE(line.size() == std::string("16384.0000 0.87016693").size());
    }
    REQUIRE(lines[1] == "barrier     rate=0.00");
    REQUIRE(lines[3] == "1.0000     0.87016693");
    REQUIRE(lines[4] == "16384.0000        n/a");
}

TEST_CASE("Table rows shorter than the header are padded", "[print]") {
    auto lines = capture_table({{"Function", "Status"}, {"path_enumeration_cpu"}}, {0, 8});

    REQUIRE(lines.size() == 5);
    REQUIRE(lines[1] == "Function               Status");
    REQUIRE(lines[3] == "path_enumeration_cpu        -");
}
