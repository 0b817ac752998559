#include <suture/fragment_cache.hpp>
#include <suture/sha256.hpp>

namespace suture {

// Bump when the fragment text produced for a given source changes shape
static const char* FRAGMENT_KEY_DOMAIN = "suture.fragment.v1";
static const char* OUTPUT_KEY_DOMAIN = "suture.stylesheet.v1";

static SutureError cache_miss(const std::string& key) {
    return SutureError{SutureError::NotFound, "cache miss: " + key};
}

// ---- NullFragmentCache ----

Result<std::string> NullFragmentCache::get(const std::string& key) {
    return cache_miss(key);
}

Status NullFragmentCache::put(const std::string&, const std::string&) {
    return ok_status();
}

Status NullFragmentCache::clear() {
    return ok_status();
}

Result<size_t> NullFragmentCache::size() {
    return Result<size_t>::ok(0);
}

// ---- MemoryFragmentCache ----

Result<std::string> MemoryFragmentCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return cache_miss(key);
    return Result<std::string>::ok(it->second);
}

Status MemoryFragmentCache::put(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[key] = value;
    return ok_status();
}

Status MemoryFragmentCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    return ok_status();
}

Result<size_t> MemoryFragmentCache::size() {
    std::lock_guard<std::mutex> lock(mutex_);
    return Result<size_t>::ok(entries_.size());
}

// ---- Keys ----

std::string fragment_cache_key(const std::string& package,
                               const std::string& source) {
    return Fingerprint(FRAGMENT_KEY_DOMAIN).add(package).add(source).hex();
}

std::string output_cache_key(
    const std::vector<std::pair<std::string, std::string>>& ordered_fragments,
    css::UrlStyle style)
{
    Fingerprint fp(OUTPUT_KEY_DOMAIN);
    fp.add(css::url_style_name(style));
    fp.add(static_cast<uint64_t>(ordered_fragments.size()));
    for (const auto& [package, key] : ordered_fragments) {
        fp.add(package).add(key);
    }
    return fp.hex();
}

} // namespace suture
