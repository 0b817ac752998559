#pragma once

#include <suture/css/url_rewrite.hpp>
#include <suture/fragment_cache.hpp>
#include <suture/graph_loader.hpp>
#include <suture/package.hpp>
#include <optional>
#include <string>
#include <vector>

namespace suture {

struct AssemblyOptions {
    bool cached = false;
    css::UrlStyle url_style = css::UrlStyle::Literal;
    std::optional<std::vector<std::string>> whitelist;
    WhitelistMode whitelist_mode = WhitelistMode::Closure;
    // Worker threads for reading and resolving fragments; 0 = one per core
    size_t jobs = 1;
};

struct Stylesheet {
    std::string css;                  // one rule per line, dependencies first
    std::vector<std::string> order;   // package of each line
    bool from_cache = false;          // whole stylesheet served from cache
    size_t fragment_hits = 0;
    size_t fragment_misses = 0;
};

// load -> order -> resolve -> url style -> assemble, in one pass. Any error
// aborts the run and no CSS is returned. The cache is only consulted when
// options.cached is set; its contents never change the result.
Result<Stylesheet> assemble_stylesheet(const std::vector<PackageDescriptor>& installed,
                                       const AssemblyOptions& options,
                                       FragmentCache& cache);

// Same, with a cache that lives for this call only
Result<Stylesheet> assemble_stylesheet(const std::vector<PackageDescriptor>& installed,
                                       const AssemblyOptions& options = {});

} // namespace suture
