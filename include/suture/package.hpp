#pragma once

#include <suture/result.hpp>
#include <string>
#include <vector>
#include <optional>
#include <filesystem>

namespace suture {

// One installed package as reported by the discovery layer.
struct PackageDescriptor {
    std::string name;
    std::vector<std::string> dependencies;   // declaration order
    std::optional<std::string> css;          // inline CSS source
    std::filesystem::path css_path;          // used when css is not set
    std::filesystem::path asset_dir;

    bool has_css_source() const {
        return css.has_value() || !css_path.empty();
    }
};

// Ordered set of installed packages. The order is significant: it is the
// insertion order of the dependency graph and therefore the tie-break order
// of the stylesheet.
struct PackageSet {
    std::vector<PackageDescriptor> packages;

    // Parse a package set document. Relative css-file and assets paths are
    // resolved against base_dir.
    static Result<PackageSet> parse(const std::string& toml_str,
                                    const std::filesystem::path& base_dir = {});

    // Parse from file; relative paths resolve against the file's directory
    static Result<PackageSet> load(const std::filesystem::path& path);
};

} // namespace suture
