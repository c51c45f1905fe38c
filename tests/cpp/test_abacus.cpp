#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <string>
#include "lr_puzzle/abacus.hpp"
#include "lr_puzzle/errors.hpp"
#include "lr_puzzle/partition.hpp"

using namespace lr_puzzle;

// ============================================================================
// Partition tests
// ============================================================================

TEST_CASE("Partition basic operations", "[partition]") {
    Partition p({3, 2, 1, 0, 0});

    SECTION("trailing zeros are stripped") {
        REQUIRE(p.length() == 3);
        REQUIRE(p.parts() == std::vector<int>{3, 2, 1});
        REQUIRE(p == Partition({3, 2, 1}));
    }

    SECTION("size is the sum of parts") {
        REQUIRE(p.size() == 6);
    }

    SECTION("parts past the end read as zero") {
        REQUIRE(p[0] == 3);
        REQUIRE(p[2] == 1);
        REQUIRE(p[3] == 0);
        REQUIRE(p[100] == 0);
    }

    SECTION("padded") {
        REQUIRE(p.padded(5) == std::vector<int>{3, 2, 1, 0, 0});
        REQUIRE(p.padded(2) == std::vector<int>{3, 2, 1});
    }

    SECTION("to_string") {
        REQUIRE(p.to_string() == "[3, 2, 1]");
        REQUIRE(Partition().to_string() == "[]");
    }
}

TEST_CASE("Partition rejects invalid parts", "[partition]") {
    REQUIRE_THROWS_AS(Partition({1, 2}), FormatError);
    REQUIRE_THROWS_AS(Partition({2, -1}), FormatError);
    REQUIRE(Partition({0, 0}).empty());
}

// ============================================================================
// Abacus tests
// ============================================================================

TEST_CASE("abacus_to_partition", "[abacus]") {
    SECTION("string input") {
        REQUIRE(abacus_to_partition("010101") == Partition({3, 2, 1}));
        REQUIRE(abacus_to_partition("111000").empty());
        REQUIRE(abacus_to_partition("0011").parts() == std::vector<int>{2, 2});
        REQUIRE(abacus_to_partition("").empty());
    }

    SECTION("integer input") {
        REQUIRE(abacus_to_partition(std::vector<int>{1, 1, 0, 0, 0}).empty());
        REQUIRE(abacus_to_partition(std::vector<int>{0, 1, 0, 1, 0, 1}) == Partition({3, 2, 1}));
    }

    SECTION("symbols other than 0 and 1") {
        REQUIRE_THROWS_AS(abacus_to_partition("0120"), FormatError);
        REQUIRE_THROWS_AS(abacus_to_partition("01 1"), FormatError);
        REQUIRE_THROWS_AS(abacus_to_partition(std::vector<int>{0, 2}), FormatError);
    }
}

TEST_CASE("partition_to_abacus", "[abacus]") {
    SECTION("literal cases") {
        REQUIRE(partition_to_abacus(std::vector<int>{3, 2, 1}) == "010101");
        REQUIRE(partition_to_abacus(std::vector<int>{3, 2, 1}, 10) == "0101010000");
        REQUIRE(partition_to_abacus(Partition({3, 2, 1}), 10) == "0101010000");
    }

    SECTION("zero parts still place a bead") {
        REQUIRE(partition_to_abacus(std::vector<int>{1, 0}) == "101");
        REQUIRE(partition_to_abacus(std::vector<int>{0, 0, 0}) == "111");
    }

    SECTION("min_size shorter than the word does not truncate") {
        REQUIRE(partition_to_abacus(std::vector<int>{3, 2, 1}, 2) == "010101");
    }

    SECTION("not a partition") {
        REQUIRE_THROWS_AS(partition_to_abacus(std::vector<int>{1, 3}), FormatError);
        REQUIRE_THROWS_AS(partition_to_abacus(std::vector<int>{-1}), FormatError);
    }

    SECTION("round trip through the abacus") {
        for (const auto& parts : {std::vector<int>{4, 4, 2}, std::vector<int>{5},
                                  std::vector<int>{2, 1, 1, 1}}) {
            size_t natural = partition_to_abacus(parts).size();
            for (size_t min_size : {size_t{0}, size_t{1}, natural, natural + 7}) {
                std::string word = partition_to_abacus(parts, min_size);
                REQUIRE(word.size() == std::max(natural, min_size));
                REQUIRE(abacus_to_partition(word) == Partition(parts));
            }
        }
    }
}
