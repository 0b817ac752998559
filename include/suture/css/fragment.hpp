#pragma once

#include <suture/dependency_graph.hpp>
#include <suture/fragment_cache.hpp>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <unordered_set>

namespace suture::css {

// The single CSS rule contributed by one package, on one line, with its
// relative url() references already pointing at <package>/...
struct CssFragment {
    std::string package;
    std::string text;
};

// Join the source onto one line: whitespace runs containing a line break
// become a single space; leading and trailing whitespace is dropped.
std::string normalize_fragment(const std::string& source);

// normalize_fragment() followed by relocate_urls() under the package name.
std::string render_fragment(const std::string& package, const std::string& source);

// Turns graph packages into fragments, consulting a FragmentCache keyed on
// fragment_cache_key(package, source). Concurrent calls for the same key
// compute at most once; the others wait for the result to land in the
// cache. Thread-safe as long as the cache is.
class FragmentResolver {
public:
    FragmentResolver(const DependencyGraph& graph, FragmentCache& cache);

    // Inline css, else the contents of css_path. FragmentNotFound when there
    // is no source, it cannot be read, or it is blank.
    Result<std::string> read_source(const std::string& package) const;

    Result<CssFragment> resolve(const std::string& package);

    // For callers that already hold the source text
    CssFragment resolve_source(const std::string& package, const std::string& source);

    size_t hits() const { return hits_.load(); }
    size_t misses() const { return misses_.load(); }

private:
    const DependencyGraph& graph_;
    FragmentCache& cache_;

    std::mutex flight_mutex_;
    std::condition_variable flight_done_;
    std::unordered_set<std::string> in_flight_;

    std::atomic<size_t> hits_{0};
    std::atomic<size_t> misses_{0};

    void acquire(const std::string& key);
    void release(const std::string& key);
};

} // namespace suture::css
