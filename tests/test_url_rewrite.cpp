#include <catch2/catch.hpp>
#include <suture/css/url_rewrite.hpp>
#include <vector>

using namespace suture::css;

TEST_CASE("url style names", "[url_rewrite]") {
    REQUIRE(std::string(url_style_name(UrlStyle::Literal)) == "literal");
    REQUIRE(std::string(url_style_name(UrlStyle::Helper)) == "helper");
    REQUIRE(parse_url_style("helper") == UrlStyle::Helper);
    REQUIRE(parse_url_style("literal") == UrlStyle::Literal);
    REQUIRE_FALSE(parse_url_style("asset-url").has_value());
}

TEST_CASE("rewrite_urls tokenizes quoted and unquoted references", "[url_rewrite]") {
    std::vector<UrlToken> seen;
    auto out = rewrite_urls(
        "a{background:url('a.png')} b{background:url(\"b.png\")} c{background:url( c.png )}",
        [&](const UrlToken& tok) {
            seen.push_back(tok);
            return std::string("X");
        });

    REQUIRE(out == "a{background:X} b{background:X} c{background:X}");
    REQUIRE(seen.size() == 3);
    REQUIRE(seen[0].ref == "a.png");
    REQUIRE(seen[0].quote == '\'');
    REQUIRE(seen[0].raw == "url('a.png')");
    REQUIRE(seen[1].ref == "b.png");
    REQUIRE(seen[1].quote == '"');
    REQUIRE(seen[2].ref == "c.png");
    REQUIRE(seen[2].quote == 0);
    REQUIRE(seen[2].raw == "url( c.png )");
}

TEST_CASE("rewrite_urls matches the function name case-insensitively", "[url_rewrite]") {
    int count = 0;
    rewrite_urls("x{background:URL(a.png)} y{background:Url(b.png)}",
                 [&](const UrlToken& tok) { ++count; return tok.raw; });
    REQUIRE(count == 2);
}

TEST_CASE("rewrite_urls ignores longer identifiers and comments", "[url_rewrite]") {
    int count = 0;
    auto css = "/* url(skip.png) */ a{background:asset-url('x.png'); b:my_url(y)}";
    auto out = rewrite_urls(css, [&](const UrlToken& tok) { ++count; return tok.raw; });
    REQUIRE(count == 0);
    REQUIRE(out == css);
}

TEST_CASE("rewrite_urls copies an unterminated token verbatim", "[url_rewrite]") {
    int count = 0;
    auto replace = [&](const UrlToken&) { ++count; return std::string("X"); };
    REQUIRE(rewrite_urls("a{b:url(x.png) c:url('y.png", replace) == "a{b:X c:url('y.png");
    REQUIRE(rewrite_urls("a{b:url(", replace) == "a{b:url(");
    REQUIRE(count == 1);
}

TEST_CASE("rewrite_urls copies string literals through", "[url_rewrite]") {
    int count = 0;
    auto replace = [&](const UrlToken&) { ++count; return std::string("X"); };

    REQUIRE(rewrite_urls(".a {content: \"/*\"; background: url(a.png)}", replace) ==
            ".a {content: \"/*\"; background: X}");
    REQUIRE(rewrite_urls(".a {content: 'url(x.png)'; background: url(a.png)}", replace) ==
            ".a {content: 'url(x.png)'; background: X}");
    REQUIRE(rewrite_urls(".a {content: \"say \\\"url(x)\\\"\"; b: url(a.png)}", replace) ==
            ".a {content: \"say \\\"url(x)\\\"\"; b: X}");
    REQUIRE(count == 3);
}

TEST_CASE("rewrite_urls copies an unterminated string verbatim", "[url_rewrite]") {
    int count = 0;
    auto replace = [&](const UrlToken&) { ++count; return std::string("X"); };
    REQUIRE(rewrite_urls(".a {content: \"url(x.png)", replace) == ".a {content: \"url(x.png)");
    REQUIRE(rewrite_urls(".a {content: 'ends in \\", replace) == ".a {content: 'ends in \\");
    REQUIRE(count == 0);
}

TEST_CASE("is_relative_url", "[url_rewrite]") {
    REQUIRE(is_relative_url("brakes.png"));
    REQUIRE(is_relative_url("./img/brakes.png"));
    REQUIRE(is_relative_url("../shared/a.png"));
    REQUIRE(is_relative_url("88-mph.png"));

    REQUIRE_FALSE(is_relative_url(""));
    REQUIRE_FALSE(is_relative_url("/assets/a.png"));
    REQUIRE_FALSE(is_relative_url("//cdn.example.com/a.png"));
    REQUIRE_FALSE(is_relative_url("#clip"));
    REQUIRE_FALSE(is_relative_url("http://example.com/a.png"));
    REQUIRE_FALSE(is_relative_url("data:image/png;base64,AAAA"));
}

TEST_CASE("relocate_urls prefixes relative references", "[url_rewrite]") {
    REQUIRE(relocate_urls(".brakes {background: url('brakes.png')}", "brakes") ==
            ".brakes {background: url('brakes/brakes.png')}");
    REQUIRE(relocate_urls(".a {background: url(\"./88-mph.png\")}", "88-mph") ==
            ".a {background: url('88-mph/88-mph.png')}");
    REQUIRE(relocate_urls(".a {background: url(img/a.png)}", "pkg") ==
            ".a {background: url('pkg/img/a.png')}");
}

TEST_CASE("relocate_urls keeps absolute references", "[url_rewrite]") {
    std::string css =
        ".a {background: url(http://example.com/a.png)}"
        ".b {background: url('/root.png')}"
        ".c {mask: url(#m)}";
    REQUIRE(relocate_urls(css, "pkg") == css);
}

TEST_CASE("relocate_urls switches quotes around a quote in the path", "[url_rewrite]") {
    REQUIRE(relocate_urls(".a {b: url(\"it's.png\")}", "pkg") ==
            ".a {b: url(\"pkg/it's.png\")}");
}

TEST_CASE("apply_url_style", "[url_rewrite]") {
    std::string css = ".brakes {background: url('brakes/brakes.png')}";
    REQUIRE(apply_url_style(css, UrlStyle::Literal) == css);
    REQUIRE(apply_url_style(css, UrlStyle::Helper) ==
            ".brakes {background: asset-url('brakes/brakes.png')}");

    // Already-helper references are left alone
    std::string helper = ".x {background: asset-url('x/x.png')}";
    REQUIRE(apply_url_style(helper, UrlStyle::Helper) == helper);

    REQUIRE(apply_url_style(".a {b: url(a.png) c: url( 'b.png' )}", UrlStyle::Helper) ==
            ".a {b: asset-url(a.png) c: asset-url( 'b.png' )}");
}

TEST_CASE("url passes leave content strings alone", "[url_rewrite]") {
    std::string comment_in_string = ".a {content: \"/*\"; background: url(a.png)}";
    REQUIRE(relocate_urls(comment_in_string, "pkg") ==
            ".a {content: \"/*\"; background: url('pkg/a.png')}");
    REQUIRE(apply_url_style(relocate_urls(comment_in_string, "pkg"), UrlStyle::Helper) ==
            ".a {content: \"/*\"; background: asset-url('pkg/a.png')}");

    std::string url_in_string = ".a {content: \"url(x.png)\"; background: url(a.png)}";
    REQUIRE(relocate_urls(url_in_string, "pkg") ==
            ".a {content: \"url(x.png)\"; background: url('pkg/a.png')}");
    REQUIRE(apply_url_style(relocate_urls(url_in_string, "pkg"), UrlStyle::Helper) ==
            ".a {content: \"url(x.png)\"; background: asset-url('pkg/a.png')}");
}
