#include <suture/pipeline.hpp>
#include <suture/css/assembler.hpp>
#include <suture/css/fragment.hpp>
#include <suture/log.hpp>
#include <suture/orderer.hpp>

#include <algorithm>
#include <atomic>
#include <functional>
#include <thread>

namespace suture {

// Run task(0..count-1) on up to jobs threads. Workers pull the next index
// from a shared counter; each task writes only to its own slot, so the
// outcome does not depend on scheduling. Reports the error of the lowest
// failing index.
static Status run_indexed(size_t count, size_t jobs,
                          const std::function<Status(size_t)>& task) {
    if (jobs == 0) {
        jobs = std::max<size_t>(1, std::thread::hardware_concurrency());
    }

    if (jobs == 1 || count <= 1) {
        for (size_t i = 0; i < count; ++i) {
            SUTURE_TRY(task(i));
        }
        return ok_status();
    }

    std::vector<std::optional<SutureError>> errors(count);
    std::atomic<size_t> next{0};
    auto worker = [&]() {
        while (true) {
            size_t i = next.fetch_add(1);
            if (i >= count) return;
            auto status = task(i);
            if (status.is_err()) errors[i] = std::move(status).error();
        }
    };

    std::vector<std::thread> workers;
    size_t n = std::min(jobs, count);
    workers.reserve(n);
    for (size_t t = 0; t < n; ++t) {
        workers.emplace_back(worker);
    }
    for (auto& w : workers) {
        w.join();
    }

    for (auto& e : errors) {
        if (e) return std::move(*e);
    }
    return ok_status();
}

static void log_dependency_trees(const DependencyGraph& graph) {
    if (log::get_level() > log::Trace) return;
    for (const auto& root : graph.roots()) {
        log::trace("dependency tree:\n%s", graph.tree_display(root).c_str());
    }
}

Result<Stylesheet> assemble_stylesheet(const std::vector<PackageDescriptor>& installed,
                                       const AssemblyOptions& options,
                                       FragmentCache& cache) {
    auto graph = load_graph(installed, options.whitelist, options.whitelist_mode);
    if (graph.is_err()) return std::move(graph).error();
    log_dependency_trees(graph.value());

    auto order = topological_order(graph.value());
    if (order.is_err()) return std::move(order).error();
    const auto& names = order.value();

    NullFragmentCache disabled;
    FragmentCache& active = options.cached ? cache : disabled;
    css::FragmentResolver resolver(graph.value(), active);

    // Stage 1: read every source; the output key depends on all of them
    std::vector<std::string> sources(names.size());
    SUTURE_TRY(run_indexed(names.size(), options.jobs, [&](size_t i) -> Status {
        auto src = resolver.read_source(names[i]);
        if (src.is_err()) return std::move(src).error();
        sources[i] = std::move(src).value();
        return ok_status();
    }));

    Stylesheet sheet;
    sheet.order = names;

    std::string output_key;
    if (active.enabled()) {
        std::vector<std::pair<std::string, std::string>> keyed;
        keyed.reserve(names.size());
        for (size_t i = 0; i < names.size(); ++i) {
            keyed.emplace_back(names[i], fragment_cache_key(names[i], sources[i]));
        }
        output_key = output_cache_key(keyed, options.url_style);

        auto hit = active.get(output_key);
        if (hit.is_ok()) {
            log::debug("stylesheet served from cache (%zu rules)", names.size());
            sheet.css = std::move(hit).value();
            sheet.from_cache = true;
            return Result<Stylesheet>::ok(std::move(sheet));
        }
        if (!hit.is_err(SutureError::NotFound)) {
            log::warn("stylesheet cache lookup failed: %s",
                      hit.error().message.c_str());
        }
    }

    // Stage 2: resolve fragments into their sequence slots
    std::vector<css::CssFragment> fragments(names.size());
    SUTURE_TRY(run_indexed(names.size(), options.jobs, [&](size_t i) -> Status {
        fragments[i] = resolver.resolve_source(names[i], sources[i]);
        fragments[i].text = css::apply_url_style(fragments[i].text, options.url_style);
        return ok_status();
    }));

    sheet.css = css::assemble(fragments);
    sheet.fragment_hits = resolver.hits();
    sheet.fragment_misses = resolver.misses();
    log::debug("assembled %zu rules (%zu fragment hits, %zu misses)",
               fragments.size(), sheet.fragment_hits, sheet.fragment_misses);

    if (active.enabled()) {
        auto stored = active.put(output_key, sheet.css);
        if (stored.is_err()) {
            log::warn("stylesheet cache store failed: %s",
                      stored.error().message.c_str());
        }
    }

    return Result<Stylesheet>::ok(std::move(sheet));
}

Result<Stylesheet> assemble_stylesheet(const std::vector<PackageDescriptor>& installed,
                                       const AssemblyOptions& options) {
    MemoryFragmentCache cache;
    return assemble_stylesheet(installed, options, cache);
}

} // namespace suture
