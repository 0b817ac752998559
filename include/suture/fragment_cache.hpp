#pragma once

#include <suture/result.hpp>
#include <suture/css/url_rewrite.hpp>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace suture {

// Content-addressed store for resolved fragments and assembled stylesheets.
// Keys are fingerprints of everything that influences the value, so an
// entry never needs invalidating: changed input means a different key.
// Implementations must be safe to call from several threads.
class FragmentCache {
public:
    virtual ~FragmentCache() = default;

    // NotFound on a miss; other codes are backend failures
    virtual Result<std::string> get(const std::string& key) = 0;
    virtual Status put(const std::string& key, const std::string& value) = 0;
    virtual Status clear() = 0;
    virtual Result<size_t> size() = 0;

    // False only for the pass-through cache
    virtual bool enabled() const { return true; }
};

// Caching disabled: every get misses, put stores nothing.
class NullFragmentCache : public FragmentCache {
public:
    Result<std::string> get(const std::string& key) override;
    Status put(const std::string& key, const std::string& value) override;
    Status clear() override;
    Result<size_t> size() override;
    bool enabled() const override { return false; }
};

class MemoryFragmentCache : public FragmentCache {
public:
    Result<std::string> get(const std::string& key) override;
    Status put(const std::string& key, const std::string& value) override;
    Status clear() override;
    Result<size_t> size() override;

private:
    std::mutex mutex_;
    std::unordered_map<std::string, std::string> entries_;
};

// Key of one package's fragment: its name and the exact CSS source text.
std::string fragment_cache_key(const std::string& package,
                               const std::string& source);

// Key of a whole stylesheet: the ordered (package, fragment key) pairs and
// the URL style applied on output.
std::string output_cache_key(
    const std::vector<std::pair<std::string, std::string>>& ordered_fragments,
    css::UrlStyle style);

} // namespace suture
