#include <suture/css/fragment.hpp>
#include <suture/css/url_rewrite.hpp>
#include <suture/log.hpp>
#include <cctype>
#include <fstream>
#include <sstream>

namespace suture::css {

static bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string normalize_fragment(const std::string& source) {
    std::string out;
    out.reserve(source.size());

    size_t i = 0;
    while (i < source.size()) {
        if (!is_space(source[i])) {
            out += source[i++];
            continue;
        }
        size_t run_start = i;
        bool has_break = false;
        while (i < source.size() && is_space(source[i])) {
            if (source[i] == '\n' || source[i] == '\r') has_break = true;
            ++i;
        }
        if (has_break) {
            out += ' ';
        } else {
            out.append(source, run_start, i - run_start);
        }
    }

    size_t first = out.find_first_not_of(" \t\f\v");
    if (first == std::string::npos) return "";
    size_t last = out.find_last_not_of(" \t\f\v");
    return out.substr(first, last - first + 1);
}

std::string render_fragment(const std::string& package, const std::string& source) {
    return relocate_urls(normalize_fragment(source), package);
}

FragmentResolver::FragmentResolver(const DependencyGraph& graph, FragmentCache& cache)
    : graph_(graph), cache_(cache) {}

Result<std::string> FragmentResolver::read_source(const std::string& package) const {
    if (!graph_.contains(package)) {
        return SutureError{SutureError::NotFound,
            "package '" + package + "' is not part of the dependency graph"};
    }
    const PackageDescriptor& pkg = graph_.package(package);

    std::string source;
    if (pkg.css.has_value()) {
        source = *pkg.css;
    } else if (pkg.css_path.empty()) {
        return SutureError{SutureError::FragmentNotFound,
            "package '" + package + "' has no CSS source",
            "give it inline css or a css-file"};
    } else {
        std::ifstream in(pkg.css_path, std::ios::binary);
        if (!in.is_open()) {
            return SutureError{SutureError::FragmentNotFound,
                "cannot read CSS source of package '" + package + "'",
                "", pkg.css_path.string(), 0};
        }
        std::ostringstream ss;
        ss << in.rdbuf();
        source = ss.str();
    }

    if (normalize_fragment(source).empty()) {
        return SutureError{SutureError::FragmentNotFound,
            "CSS source of package '" + package + "' is empty"};
    }
    return Result<std::string>::ok(std::move(source));
}

Result<CssFragment> FragmentResolver::resolve(const std::string& package) {
    auto source = read_source(package);
    if (source.is_err()) return std::move(source).error();
    return Result<CssFragment>::ok(resolve_source(package, source.value()));
}

void FragmentResolver::acquire(const std::string& key) {
    std::unique_lock<std::mutex> lock(flight_mutex_);
    flight_done_.wait(lock, [&] { return in_flight_.count(key) == 0; });
    in_flight_.insert(key);
}

void FragmentResolver::release(const std::string& key) {
    {
        std::lock_guard<std::mutex> lock(flight_mutex_);
        in_flight_.erase(key);
    }
    flight_done_.notify_all();
}

CssFragment FragmentResolver::resolve_source(const std::string& package,
                                             const std::string& source) {
    std::string key = fragment_cache_key(package, source);

    struct FlightGuard {
        FragmentResolver& self;
        const std::string& key;
        ~FlightGuard() { self.release(key); }
    };
    acquire(key);
    FlightGuard guard{*this, key};

    auto cached = cache_.get(key);
    if (cached.is_ok()) {
        ++hits_;
        log::trace("fragment cache hit: %s", package.c_str());
        return CssFragment{package, std::move(cached).value()};
    }
    if (!cached.is_err(SutureError::NotFound)) {
        log::warn("fragment cache lookup failed for '%s': %s",
                  package.c_str(), cached.error().message.c_str());
    }

    ++misses_;
    CssFragment fragment{package, render_fragment(package, source)};

    auto stored = cache_.put(key, fragment.text);
    if (stored.is_err()) {
        log::warn("fragment cache store failed for '%s': %s",
                  package.c_str(), stored.error().message.c_str());
    }
    return fragment;
}

} // namespace suture::css
