#pragma once

#include <suture/log.hpp>
#include <suture/pipeline.hpp>
#include <suture/result.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace suture {

// Layered configuration: global (~/.suture/config.toml) then project
// (.suture.toml). A later layer only overrides the keys it sets.
struct Config {
    std::optional<std::vector<std::string>> whitelist;
    WhitelistMode whitelist_mode = WhitelistMode::Closure;
    css::UrlStyle url_style = css::UrlStyle::Literal;
    size_t jobs = 1;
    log::Level log_level = log::Info;

    // [cache]
    bool cache_enabled = false;
    std::string cache_path;   // empty = in-memory

    // Track which fields were explicitly set (for merge)
    bool whitelist_mode_set = false;
    bool url_style_set = false;
    bool jobs_set = false;
    bool log_level_set = false;
    bool cache_enabled_set = false;
    bool cache_path_set = false;

    static Result<Config> load(const std::string& path);
    static Result<Config> parse(const std::string& toml_str);

    // Apply other on top of this
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);

    AssemblyOptions options() const;

    // NullFragmentCache when caching is off, a MemoryFragmentCache when no
    // path is set, otherwise a SqliteFragmentCache opened at cache_path.
    Result<std::unique_ptr<FragmentCache>> open_cache() const;

    void apply_log_level() const { log::set_level(log_level); }
};

// ~/.suture/config.toml, or "" when no home directory is known
std::string global_config_path();

// Name of the per-project configuration file
inline constexpr const char* PROJECT_CONFIG_FILE = ".suture.toml";

} // namespace suture
