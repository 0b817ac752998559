#include <suture/config.hpp>
#include <suture/sqlite_cache.hpp>
#include <tomlplusplus/toml.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace suture {

static SutureError bad_value(const std::string& key, const std::string& value,
                             const std::string& allowed) {
    return SutureError{SutureError::Config,
        "invalid value '" + value + "' for " + key,
        "expected one of: " + allowed};
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return SutureError{SutureError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    if (auto arr = doc["whitelist"].as_array()) {
        std::vector<std::string> names;
        for (const auto& elem : *arr) {
            auto s = elem.value<std::string>();
            if (!s) {
                return SutureError{SutureError::Config,
                    "whitelist entries must be package names (strings)"};
            }
            names.push_back(*s);
        }
        cfg.whitelist = std::move(names);
    } else if (doc.contains("whitelist")) {
        return SutureError{SutureError::Config, "whitelist must be an array"};
    }

    if (auto v = doc["whitelist-mode"].value<std::string>()) {
        auto mode = parse_whitelist_mode(*v);
        if (!mode) return bad_value("whitelist-mode", *v, "closure, strict");
        cfg.whitelist_mode = *mode;
        cfg.whitelist_mode_set = true;
    }

    if (auto v = doc["url-style"].value<std::string>()) {
        auto style = css::parse_url_style(*v);
        if (!style) return bad_value("url-style", *v, "literal, helper");
        cfg.url_style = *style;
        cfg.url_style_set = true;
    }

    if (auto v = doc["jobs"].value<int64_t>()) {
        if (*v <= 0) return bad_value("jobs", std::to_string(*v), "a positive integer");
        cfg.jobs = static_cast<size_t>(*v);
        cfg.jobs_set = true;
    }

    if (auto v = doc["log-level"].value<std::string>()) {
        auto lvl = log::parse_level(*v);
        if (!lvl) return bad_value("log-level", *v, "trace, debug, info, warn, error");
        cfg.log_level = *lvl;
        cfg.log_level_set = true;
    }

    // [cache] section
    if (auto cache = doc["cache"].as_table()) {
        if (auto v = (*cache)["enabled"].value<bool>()) {
            cfg.cache_enabled = *v;
            cfg.cache_enabled_set = true;
        }
        if (auto v = (*cache)["path"].value<std::string>()) {
            cfg.cache_path = *v;
            cfg.cache_path_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return SutureError{SutureError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        auto err = std::move(cfg).error();
        err.file = path;
        return err;
    }
    return cfg;
}

void Config::merge(const Config& other) {
    // A whitelist replaces the previous one outright
    if (other.whitelist.has_value()) {
        whitelist = other.whitelist;
    }
    if (other.whitelist_mode_set) {
        whitelist_mode = other.whitelist_mode;
        whitelist_mode_set = true;
    }
    if (other.url_style_set) {
        url_style = other.url_style;
        url_style_set = true;
    }
    if (other.jobs_set) {
        jobs = other.jobs;
        jobs_set = true;
    }
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.cache_enabled_set) {
        cache_enabled = other.cache_enabled;
        cache_enabled_set = true;
    }
    if (other.cache_path_set) {
        cache_path = other.cache_path;
        cache_path_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

AssemblyOptions Config::options() const {
    AssemblyOptions opts;
    opts.cached = cache_enabled;
    opts.url_style = url_style;
    opts.whitelist = whitelist;
    opts.whitelist_mode = whitelist_mode;
    opts.jobs = jobs;
    return opts;
}

Result<std::unique_ptr<FragmentCache>> Config::open_cache() const {
    using CachePtr = std::unique_ptr<FragmentCache>;
    if (!cache_enabled) {
        return Result<CachePtr>::ok(std::make_unique<NullFragmentCache>());
    }
    if (cache_path.empty()) {
        return Result<CachePtr>::ok(std::make_unique<MemoryFragmentCache>());
    }

    auto cache = std::make_unique<SqliteFragmentCache>();
    SUTURE_TRY(cache->open(cache_path));
    return Result<CachePtr>::ok(std::move(cache));
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.suture/config.toml";
}

} // namespace suture
