#include <suture/sqlite_cache.hpp>
#include <suture/log.hpp>
#include <sqlite3.h>

#include <chrono>
#include <filesystem>
#include <mutex>

namespace fs = std::filesystem;

namespace suture {

static const std::string SCHEMA_VERSION = "1";

struct SqliteFragmentCache::Impl {
    sqlite3* db = nullptr;
    std::mutex mutex;

    // Prepared statements (lazily initialized, cached)
    sqlite3_stmt* stmt_get = nullptr;
    sqlite3_stmt* stmt_put = nullptr;

    ~Impl() {
        finalize_all();
        if (db) sqlite3_close(db);
    }

    void finalize_all() {
        auto fin = [](sqlite3_stmt*& s) {
            if (s) { sqlite3_finalize(s); s = nullptr; }
        };
        fin(stmt_get);
        fin(stmt_put);
    }

    SutureError sqlite_error(const std::string& what) const {
        return SutureError{SutureError::IO,
            what + ": " + (db ? sqlite3_errmsg(db) : "no database")};
    }

    Status prepare(const char* sql, sqlite3_stmt*& out) {
        if (out) return ok_status();
        if (sqlite3_prepare_v2(db, sql, -1, &out, nullptr) != SQLITE_OK) {
            return sqlite_error("SQLite prepare failed");
        }
        return ok_status();
    }

    Status exec(const std::string& sql) {
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string msg = errmsg ? errmsg : "unknown error";
            sqlite3_free(errmsg);
            return SutureError{SutureError::IO, "SQLite exec failed: " + msg};
        }
        return ok_status();
    }

    Result<std::string> stored_schema_version() {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db,
                "SELECT value FROM schema_info WHERE key='version'",
                -1, &stmt, nullptr) != SQLITE_OK) {
            return sqlite_error("SQLite prepare failed");
        }
        std::string version;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            const char* v = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
            if (v) version = v;
        }
        sqlite3_finalize(stmt);
        return Result<std::string>::ok(std::move(version));
    }

    Status init_schema() {
        SUTURE_TRY(exec(
            "CREATE TABLE IF NOT EXISTS schema_info ("
            "  key TEXT PRIMARY KEY,"
            "  value TEXT"
            ");"
            "CREATE TABLE IF NOT EXISTS entry ("
            "  key TEXT PRIMARY KEY,"
            "  value TEXT NOT NULL,"
            "  created_at INTEGER"
            ");"
        ));

        auto version = stored_schema_version();
        if (version.is_err()) return std::move(version).error();
        if (version.value() == SCHEMA_VERSION) return ok_status();

        if (!version.value().empty()) {
            log::info("fragment cache schema %s is outdated, clearing",
                      version.value().c_str());
            SUTURE_TRY(exec("DELETE FROM entry;"));
        }
        return exec("INSERT OR REPLACE INTO schema_info (key, value) "
                    "VALUES ('version', '" + SCHEMA_VERSION + "');");
    }
};

SqliteFragmentCache::SqliteFragmentCache() = default;
SqliteFragmentCache::~SqliteFragmentCache() = default;
SqliteFragmentCache::SqliteFragmentCache(SqliteFragmentCache&&) noexcept = default;
SqliteFragmentCache& SqliteFragmentCache::operator=(SqliteFragmentCache&&) noexcept = default;

Status SqliteFragmentCache::open(const std::string& db_path) {
    close();

    fs::path parent = fs::path(db_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            return SutureError{SutureError::IO,
                "cannot create cache directory " + parent.string() + ": " + ec.message()};
        }
    }

    auto impl = std::make_unique<Impl>();
    if (sqlite3_open(db_path.c_str(), &impl->db) != SQLITE_OK) {
        return impl->sqlite_error("cannot open fragment cache " + db_path);
    }

    SUTURE_TRY(impl->exec("PRAGMA journal_mode=WAL;"));
    SUTURE_TRY(impl->exec("PRAGMA synchronous=NORMAL;"));
    SUTURE_TRY(impl->init_schema());

    impl_ = std::move(impl);
    log::debug("fragment cache opened: %s", db_path.c_str());
    return ok_status();
}

void SqliteFragmentCache::close() {
    impl_.reset();
}

bool SqliteFragmentCache::is_open() const {
    return impl_ && impl_->db;
}

static SutureError not_open() {
    return SutureError{SutureError::IO, "fragment cache is not open"};
}

Result<std::string> SqliteFragmentCache::get(const std::string& key) {
    if (!is_open()) return not_open();
    std::lock_guard<std::mutex> lock(impl_->mutex);

    SUTURE_TRY(impl_->prepare("SELECT value FROM entry WHERE key = ?",
                              impl_->stmt_get));
    sqlite3_stmt* stmt = impl_->stmt_get;
    sqlite3_reset(stmt);
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_DONE) {
        return SutureError{SutureError::NotFound, "cache miss: " + key};
    }
    if (rc != SQLITE_ROW) {
        return impl_->sqlite_error("SQLite lookup failed");
    }

    const char* data = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
    int len = sqlite3_column_bytes(stmt, 0);
    std::string value = data ? std::string(data, static_cast<size_t>(len)) : std::string();
    sqlite3_reset(stmt);
    return Result<std::string>::ok(std::move(value));
}

Status SqliteFragmentCache::put(const std::string& key, const std::string& value) {
    if (!is_open()) return not_open();
    std::lock_guard<std::mutex> lock(impl_->mutex);

    SUTURE_TRY(impl_->prepare(
        "INSERT OR REPLACE INTO entry (key, value, created_at) VALUES (?, ?, ?)",
        impl_->stmt_put));
    sqlite3_stmt* stmt = impl_->stmt_put;
    sqlite3_reset(stmt);

    auto now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, value.data(), static_cast<int>(value.size()),
                      SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(now));

    int rc = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    if (rc != SQLITE_DONE) {
        return impl_->sqlite_error("SQLite store failed");
    }
    return ok_status();
}

Status SqliteFragmentCache::clear() {
    if (!is_open()) return not_open();
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->exec("DELETE FROM entry;");
}

Result<size_t> SqliteFragmentCache::size() {
    if (!is_open()) return not_open();
    std::lock_guard<std::mutex> lock(impl_->mutex);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(impl_->db, "SELECT COUNT(*) FROM entry",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        return impl_->sqlite_error("SQLite prepare failed");
    }
    size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return Result<size_t>::ok(count);
}

} // namespace suture
