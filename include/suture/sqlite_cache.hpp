#pragma once

#include <suture/fragment_cache.hpp>
#include <memory>
#include <string>

namespace suture {

// Persistent FragmentCache backed by a SQLite database (WAL journal).
// A schema version mismatch on open empties the store.
class SqliteFragmentCache : public FragmentCache {
public:
    SqliteFragmentCache();
    ~SqliteFragmentCache() override;
    SqliteFragmentCache(SqliteFragmentCache&&) noexcept;
    SqliteFragmentCache& operator=(SqliteFragmentCache&&) noexcept;

    // Creates parent directories and the database file as needed
    Status open(const std::string& db_path);
    void close();
    bool is_open() const;

    Result<std::string> get(const std::string& key) override;
    Status put(const std::string& key, const std::string& value) override;
    Status clear() override;
    Result<size_t> size() override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace suture
