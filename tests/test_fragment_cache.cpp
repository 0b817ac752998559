#include <catch2/catch.hpp>
#include <suture/fragment_cache.hpp>
#include <suture/sqlite_cache.hpp>
#include <sqlite3.h>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>
#include <unistd.h>

using namespace suture;
namespace fs = std::filesystem;

static std::string test_db_path() {
    static int counter = 0;
    return "/tmp/suture_test_fragment_cache_" + std::to_string(getpid())
           + "_" + std::to_string(counter++) + ".db";
}

static void remove_db(const std::string& path) {
    fs::remove(path);
    fs::remove(path + "-wal");
    fs::remove(path + "-shm");
}

// ---------------------------------------------------------------------------
// Keys
// ---------------------------------------------------------------------------

TEST_CASE("fragment keys are content fingerprints", "[fragment_cache]") {
    auto k = fragment_cache_key("brakes", ".brakes {}");
    REQUIRE(k.size() == 64);
    REQUIRE(k == fragment_cache_key("brakes", ".brakes {}"));
    REQUIRE(k != fragment_cache_key("brakes", ".brakes { }"));
    REQUIRE(k != fragment_cache_key("drums", ".brakes {}"));
    // Field boundaries are part of the key
    REQUIRE(fragment_cache_key("ab", "c") != fragment_cache_key("a", "bc"));
}

TEST_CASE("output keys depend on order and url style", "[fragment_cache]") {
    std::vector<std::pair<std::string, std::string>> ab = {{"a", "k1"}, {"b", "k2"}};
    std::vector<std::pair<std::string, std::string>> ba = {{"b", "k2"}, {"a", "k1"}};

    auto literal = output_cache_key(ab, css::UrlStyle::Literal);
    REQUIRE(literal == output_cache_key(ab, css::UrlStyle::Literal));
    REQUIRE(literal != output_cache_key(ba, css::UrlStyle::Literal));
    REQUIRE(literal != output_cache_key(ab, css::UrlStyle::Helper));
    REQUIRE(literal != fragment_cache_key("a", "k1"));
}

// ---------------------------------------------------------------------------
// Null and memory backends
// ---------------------------------------------------------------------------

TEST_CASE("null cache stores nothing", "[fragment_cache]") {
    NullFragmentCache cache;
    REQUIRE_FALSE(cache.enabled());
    REQUIRE(cache.put("k", "v").is_ok());
    REQUIRE(cache.get("k").is_err(SutureError::NotFound));
    REQUIRE(cache.size().value() == 0);
    REQUIRE(cache.clear().is_ok());
}

TEST_CASE("memory cache round trip", "[fragment_cache]") {
    MemoryFragmentCache cache;
    REQUIRE(cache.enabled());
    REQUIRE(cache.get("k").is_err(SutureError::NotFound));

    REQUIRE(cache.put("k", ".a {}").is_ok());
    REQUIRE(cache.get("k").value() == ".a {}");

    REQUIRE(cache.put("k", ".b {}").is_ok());
    REQUIRE(cache.get("k").value() == ".b {}");
    REQUIRE(cache.size().value() == 1);

    REQUIRE(cache.clear().is_ok());
    REQUIRE(cache.size().value() == 0);
}

TEST_CASE("memory cache concurrent writers", "[fragment_cache]") {
    MemoryFragmentCache cache;
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&cache, &failures, t] {
            for (int i = 0; i < 100; ++i) {
                auto key = std::to_string(t) + ":" + std::to_string(i);
                if (cache.put(key, key).is_err()) ++failures;
            }
        });
    }
    for (auto& th : threads) th.join();
    REQUIRE(failures == 0);
    REQUIRE(cache.size().value() == 400);
    REQUIRE(cache.get("3:99").value() == "3:99");
}

// ---------------------------------------------------------------------------
// SQLite backend
// ---------------------------------------------------------------------------

TEST_CASE("SqliteFragmentCache open creates database file", "[fragment_cache][sqlite]") {
    auto path = test_db_path();
    SqliteFragmentCache cache;
    REQUIRE_FALSE(cache.is_open());
    REQUIRE(cache.open(path).is_ok());
    REQUIRE(cache.is_open());
    REQUIRE(fs::exists(path));
    cache.close();
    REQUIRE_FALSE(cache.is_open());
    remove_db(path);
}

TEST_CASE("SqliteFragmentCache creates parent directories", "[fragment_cache][sqlite]") {
    auto dir = fs::path(test_db_path() + ".d");
    auto path = (dir / "nested" / "cache.db").string();
    SqliteFragmentCache cache;
    REQUIRE(cache.open(path).is_ok());
    REQUIRE(fs::exists(path));
    cache.close();
    fs::remove_all(dir);
}

TEST_CASE("SqliteFragmentCache round trip", "[fragment_cache][sqlite]") {
    auto path = test_db_path();
    SqliteFragmentCache cache;
    REQUIRE(cache.open(path).is_ok());

    REQUIRE(cache.get("missing").is_err(SutureError::NotFound));
    REQUIRE(cache.put("k", ".tires {background: url('tires/tires.png')}").is_ok());
    REQUIRE(cache.get("k").value() == ".tires {background: url('tires/tires.png')}");

    REQUIRE(cache.put("k", "replaced").is_ok());
    REQUIRE(cache.get("k").value() == "replaced");
    REQUIRE(cache.size().value() == 1);

    REQUIRE(cache.put("multi", ".a {}\n.b {}\n").is_ok());
    REQUIRE(cache.get("multi").value() == ".a {}\n.b {}\n");
    REQUIRE(cache.size().value() == 2);

    REQUIRE(cache.clear().is_ok());
    REQUIRE(cache.size().value() == 0);

    cache.close();
    remove_db(path);
}

TEST_CASE("SqliteFragmentCache persists across reopen", "[fragment_cache][sqlite]") {
    auto path = test_db_path();
    {
        SqliteFragmentCache cache;
        REQUIRE(cache.open(path).is_ok());
        REQUIRE(cache.put("k", "v").is_ok());
    }
    {
        SqliteFragmentCache cache;
        REQUIRE(cache.open(path).is_ok());
        REQUIRE(cache.get("k").value() == "v");
    }
    remove_db(path);
}

TEST_CASE("SqliteFragmentCache clears on schema version mismatch", "[fragment_cache][sqlite]") {
    auto path = test_db_path();
    {
        SqliteFragmentCache cache;
        REQUIRE(cache.open(path).is_ok());
        REQUIRE(cache.put("old", "data").is_ok());
    }
    {
        sqlite3* raw_db = nullptr;
        REQUIRE(sqlite3_open(path.c_str(), &raw_db) == SQLITE_OK);
        char* errmsg = nullptr;
        sqlite3_exec(raw_db,
            "UPDATE schema_info SET value='999' WHERE key='version'",
            nullptr, nullptr, &errmsg);
        if (errmsg) sqlite3_free(errmsg);
        sqlite3_close(raw_db);
    }
    {
        SqliteFragmentCache cache;
        REQUIRE(cache.open(path).is_ok());
        CHECK(cache.get("old").is_err(SutureError::NotFound));
        REQUIRE(cache.put("new", "data").is_ok());
        CHECK(cache.get("new").is_ok());
    }
    remove_db(path);
}

TEST_CASE("SqliteFragmentCache calls before open fail", "[fragment_cache][sqlite]") {
    SqliteFragmentCache cache;
    REQUIRE(cache.get("k").is_err(SutureError::IO));
    REQUIRE(cache.put("k", "v").is_err(SutureError::IO));
    REQUIRE(cache.size().is_err(SutureError::IO));
    REQUIRE(cache.clear().is_err(SutureError::IO));
}

TEST_CASE("SqliteFragmentCache open failure is IO", "[fragment_cache][sqlite]") {
    // A regular file where the parent directory should be
    auto blocker = test_db_path();
    { std::ofstream(blocker) << "x"; }
    SqliteFragmentCache cache;
    auto r = cache.open(blocker + "/cache.db");
    REQUIRE(r.is_err(SutureError::IO));
    REQUIRE_FALSE(cache.is_open());
    fs::remove(blocker);
}

TEST_CASE("SqliteFragmentCache is move constructible", "[fragment_cache][sqlite]") {
    auto path = test_db_path();
    SqliteFragmentCache a;
    REQUIRE(a.open(path).is_ok());
    REQUIRE(a.put("k", "v").is_ok());
    SqliteFragmentCache b(std::move(a));
    REQUIRE(b.is_open());
    REQUIRE(b.get("k").value() == "v");
    b.close();
    remove_db(path);
}
