#include <suture/package.hpp>
#include <tomlplusplus/toml.hpp>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace suture {

static fs::path resolve_against(const fs::path& base, const std::string& raw) {
    fs::path p(raw);
    if (p.is_absolute() || base.empty()) return p;
    return base / p;
}

static Result<PackageDescriptor> parse_package(const toml::table& tbl,
                                               size_t index,
                                               const fs::path& base_dir) {
    PackageDescriptor pkg;

    auto name = tbl["name"].value<std::string>();
    if (!name || name->empty()) {
        return SutureError{SutureError::Manifest,
            "package entry #" + std::to_string(index + 1) + " has no name",
            "every [[package]] needs name = \"...\""};
    }
    pkg.name = *name;

    if (auto deps = tbl["dependencies"].as_array()) {
        for (const auto& elem : *deps) {
            auto dep = elem.value<std::string>();
            if (!dep) {
                return SutureError{SutureError::Manifest,
                    "package '" + pkg.name + "' lists a non-string dependency"};
            }
            pkg.dependencies.push_back(*dep);
        }
    } else if (tbl.contains("dependencies")) {
        return SutureError{SutureError::Manifest,
            "package '" + pkg.name + "': dependencies must be an array"};
    }

    if (auto css = tbl["css"].value<std::string>()) {
        pkg.css = *css;
    }
    if (auto file = tbl["css-file"].value<std::string>()) {
        pkg.css_path = resolve_against(base_dir, *file);
    }
    if (auto assets = tbl["assets"].value<std::string>()) {
        pkg.asset_dir = resolve_against(base_dir, *assets);
    }

    return Result<PackageDescriptor>::ok(std::move(pkg));
}

Result<PackageSet> PackageSet::parse(const std::string& toml_str,
                                     const fs::path& base_dir) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return SutureError{SutureError::Parse,
            std::string("package set TOML parse error: ") + e.what()};
    }

    PackageSet set;

    // [[package]] array-of-tables, kept in document order
    if (auto arr = doc["package"].as_array()) {
        for (size_t i = 0; i < arr->size(); ++i) {
            auto tbl = (*arr)[i].as_table();
            if (!tbl) {
                return SutureError{SutureError::Manifest,
                    "package entry #" + std::to_string(i + 1) + " is not a table"};
            }
            auto pkg = parse_package(*tbl, i, base_dir);
            if (pkg.is_err()) return std::move(pkg).error();
            set.packages.push_back(std::move(pkg).value());
        }
    }

    return Result<PackageSet>::ok(std::move(set));
}

Result<PackageSet> PackageSet::load(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return SutureError{SutureError::IO,
            "cannot open package set: " + path.string()};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto set = PackageSet::parse(ss.str(), path.parent_path());
    if (set.is_err()) {
        auto err = std::move(set).error();
        err.file = path.string();
        return err;
    }
    return set;
}

} // namespace suture
