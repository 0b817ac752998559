#include <catch2/catch.hpp>
#include <suture/css/assembler.hpp>

using namespace suture::css;

TEST_CASE("assemble writes one line per fragment in order", "[assembler]") {
    std::vector<CssFragment> fragments = {
        {"drums", ".drums {background: url('drums/drums.png')}"},
        {"calipers", ".calipers {}"},
        {"brakes", ".brakes {}"},
    };
    REQUIRE(assemble(fragments) ==
            ".drums {background: url('drums/drums.png')}\n"
            ".calipers {}\n"
            ".brakes {}\n");
}

TEST_CASE("assemble of nothing is empty", "[assembler]") {
    REQUIRE(assemble({}).empty());
}

TEST_CASE("assemble does not deduplicate", "[assembler]") {
    std::vector<CssFragment> fragments = {{"a", ".a {}"}, {"a", ".a {}"}};
    REQUIRE(assemble(fragments) == ".a {}\n.a {}\n");
}
