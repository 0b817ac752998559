#include <suture/css/url_rewrite.hpp>
#include <algorithm>
#include <cctype>

namespace suture::css {

const char* url_style_name(UrlStyle style) {
    switch (style) {
        case UrlStyle::Literal: return "literal";
        case UrlStyle::Helper:  return "helper";
    }
    return "unknown";
}

std::optional<UrlStyle> parse_url_style(const std::string& name) {
    if (name == "literal") return UrlStyle::Literal;
    if (name == "helper") return UrlStyle::Helper;
    return std::nullopt;
}

static bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
}

static bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Case-insensitive "url(" at pos, not preceded by an identifier character
static bool url_function_at(const std::string& css, size_t pos) {
    if (pos + 4 > css.size()) return false;
    if (pos > 0 && is_ident_char(css[pos - 1])) return false;
    return std::tolower(static_cast<unsigned char>(css[pos])) == 'u'
        && std::tolower(static_cast<unsigned char>(css[pos + 1])) == 'r'
        && std::tolower(static_cast<unsigned char>(css[pos + 2])) == 'l'
        && css[pos + 3] == '(';
}

// Parse the token starting at pos ("url(" already matched). Returns the
// index one past ")" or npos when the token is unterminated.
static size_t parse_token(const std::string& css, size_t pos, UrlToken& tok) {
    size_t i = pos + 4;
    while (i < css.size() && is_space(css[i])) ++i;
    if (i >= css.size()) return std::string::npos;

    if (css[i] == '\'' || css[i] == '"') {
        tok.quote = css[i++];
        while (i < css.size() && css[i] != tok.quote) {
            if (css[i] == '\\' && i + 1 < css.size()) {
                tok.ref += css[i++];
            }
            tok.ref += css[i++];
        }
        if (i >= css.size()) return std::string::npos;
        ++i;  // closing quote
        while (i < css.size() && is_space(css[i])) ++i;
        if (i >= css.size() || css[i] != ')') return std::string::npos;
    } else {
        while (i < css.size() && css[i] != ')') {
            tok.ref += css[i++];
        }
        if (i >= css.size()) return std::string::npos;
        while (!tok.ref.empty() && is_space(tok.ref.back())) tok.ref.pop_back();
    }

    ++i;  // ')'
    tok.raw = css.substr(pos, i - pos);
    return i;
}

// Index one past the string literal opened at pos; css.size() when it
// never closes. A backslash escapes the next character.
static size_t string_end(const std::string& css, size_t pos) {
    char quote = css[pos];
    size_t i = pos + 1;
    while (i < css.size() && css[i] != quote) {
        i += (css[i] == '\\') ? 2 : 1;
    }
    return std::min(i + 1, css.size());
}

std::string rewrite_urls(const std::string& css,
                         const std::function<std::string(const UrlToken&)>& replace) {
    std::string out;
    out.reserve(css.size());

    size_t i = 0;
    while (i < css.size()) {
        if (css[i] == '\'' || css[i] == '"') {
            size_t end = string_end(css, i);
            out.append(css, i, end - i);
            i = end;
            continue;
        }

        if (css.compare(i, 2, "/*") == 0) {
            size_t end = css.find("*/", i + 2);
            end = (end == std::string::npos) ? css.size() : end + 2;
            out.append(css, i, end - i);
            i = end;
            continue;
        }

        if (url_function_at(css, i)) {
            UrlToken tok;
            size_t next = parse_token(css, i, tok);
            if (next == std::string::npos) {
                out.append(css, i, std::string::npos);
                break;
            }
            out += replace(tok);
            i = next;
            continue;
        }

        out += css[i++];
    }
    return out;
}

bool is_relative_url(const std::string& ref) {
    if (ref.empty()) return false;
    if (ref[0] == '/' || ref[0] == '#') return false;

    // scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." ) ":"
    if (std::isalpha(static_cast<unsigned char>(ref[0]))) {
        for (size_t i = 1; i < ref.size(); ++i) {
            char c = ref[i];
            if (c == ':') return false;
            if (!std::isalnum(static_cast<unsigned char>(c))
                && c != '+' && c != '-' && c != '.') {
                break;
            }
        }
    }
    return true;
}

std::string relocate_urls(const std::string& css, const std::string& prefix) {
    return rewrite_urls(css, [&prefix](const UrlToken& tok) {
        if (!is_relative_url(tok.ref)) return tok.raw;

        std::string path = tok.ref;
        while (path.compare(0, 2, "./") == 0) path.erase(0, 2);

        std::string target = prefix.empty() ? path : prefix + "/" + path;
        char quote = (target.find('\'') == std::string::npos) ? '\'' : '"';
        return "url(" + std::string(1, quote) + target + std::string(1, quote) + ")";
    });
}

std::string apply_url_style(const std::string& css, UrlStyle style) {
    if (style == UrlStyle::Literal) return css;
    return rewrite_urls(css, [](const UrlToken& tok) {
        // raw starts with "url" in any case; the argument is kept verbatim
        return std::string("asset-url") + tok.raw.substr(3);
    });
}

} // namespace suture::css
