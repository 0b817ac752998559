#pragma once

#include <functional>
#include <optional>
#include <string>

namespace suture::css {

// How asset references are written in the final stylesheet
enum class UrlStyle {
    Literal,   // url('brakes/brakes.png')
    Helper     // asset-url('brakes/brakes.png'), for Rails-style pipelines
};

const char* url_style_name(UrlStyle style);
std::optional<UrlStyle> parse_url_style(const std::string& name);

// One url(...) occurrence in a stylesheet
struct UrlToken {
    std::string ref;     // reference with quotes removed
    char quote = 0;      // '\'', '"' or 0 when unquoted
    std::string raw;     // the complete original text, "url(" through ")"
};

// Replace every url(...) token with replace(token). Comments and quoted
// strings are copied through untouched; "url(" only matches as a whole
// function name, so asset-url(...) is not a token. A token without a
// closing parenthesis ends the scan and the rest is copied verbatim.
std::string rewrite_urls(const std::string& css,
                         const std::function<std::string(const UrlToken&)>& replace);

// False for "", "/x", "//host/x", "#id" and anything with a scheme
// ("http:", "data:", ...).
bool is_relative_url(const std::string& ref);

// Point every relative reference at prefix/<ref> (leading "./" dropped),
// written as url('<prefix>/<ref>'). Other references keep their text.
std::string relocate_urls(const std::string& css, const std::string& prefix);

// Helper style turns each url(...) into asset-url(...) with the same
// argument; Literal returns css unchanged.
std::string apply_url_style(const std::string& css, UrlStyle style);

} // namespace suture::css
