#include "tfwrap/builder.hpp"

#include "tfwrap/scanner.hpp"
#include "tfwrap/source_analysis.hpp"

#include <algorithm>
#include <filesystem>

namespace tfwrap {

GraphResult<BuildOutput> GraphBuilder::build(const std::filesystem::path &root) const {
    auto scan = scan_directories(root);
    if (!scan) {
        return std::unexpected(GraphError{GraphErrorKind::InvalidConfig, root.string(), {}, scan.error()});
    }

    std::error_code ec;
    const std::string scan_root = normalize_path(std::filesystem::canonical(root, ec));
    std::string repo_root = scan_root;
    if (!options.repo_root.empty()) {
        repo_root = normalize_path(std::filesystem::weakly_canonical(options.repo_root, ec));
    }

    BuildOutput out;
    out.symlinks = scan->symlinks;

    std::set<std::string> known(scan->directories.begin(), scan->directories.end());
    for (const auto &[link, target] : scan->symlinks) {
        known.insert(link);
    }

    std::map<std::string, std::vector<std::string>> declared;
    for (const auto &dir : scan->directories) {
        auto config = load_config(dir, repo_root);
        if (!config) {
            return std::unexpected(GraphError{GraphErrorKind::InvalidConfig, dir, {}, config.error()});
        }
        if (config->depends_on.has_value()) {
            declared.emplace(dir, std::move(*config->depends_on));
        }
    }
    out.has_dependency_metadata = !declared.empty();

    if (!out.has_dependency_metadata) {
        for (const auto &dir : scan->directories) {
            out.graph.add_to_post_set(dir);
        }
        return out;
    }

    for (const auto &[dir, deps] : declared) {
        out.graph.get_or_create_node(dir);
        if (auto res = add_directory(out.graph, dir, deps, repo_root, scan_root, known); !res) {
            return std::unexpected(res.error());
        }
    }

    if (options.infer_module_edges) {
        std::vector<std::string> paths;
        for (const auto &node : out.graph.nodes()) {
            paths.push_back(node.path);
        }
        for (const auto &dir : paths) {
            for (const auto &module : module_dependencies(dir)) {
                std::error_code canon_ec;
                std::string real = normalize_path(std::filesystem::weakly_canonical(module, canon_ec));
                if (real == dir || !out.graph.contains(real))
                    continue;
                if (auto res = out.graph.add_edge(real, dir); !res) {
                    return std::unexpected(res.error());
                }
            }
        }
    }

    if (auto order = out.graph.topo_sort(); !order) {
        return std::unexpected(order.error());
    }

    for (const auto &dir : scan->directories) {
        if (!out.graph.contains(dir)) {
            out.graph.add_to_post_set(dir);
        }
    }
    return out;
}

GraphResult<void> GraphBuilder::add_directory(DirectoryGraph &graph, const std::string &directory,
                                              const std::vector<std::string> &depends_on,
                                              const std::string &repo_root, const std::string &scan_root,
                                              const std::set<std::string> &known) const {
    const std::filesystem::path base(repo_root);
    for (const auto &dep : depends_on) {
        std::filesystem::path dep_path(dep);
        std::string abs = normalize_path(dep_path.is_absolute() ? dep_path : base / dep_path);

        std::error_code ec;
        if (!std::filesystem::is_directory(abs, ec)) {
            return std::unexpected(GraphError{GraphErrorKind::NoDependency, abs, {},
                                              "Dependency " + abs + " of " + directory + " does not exist"});
        }

        // Dependencies outside the scanned root are not scheduled by this run and count as satisfied.
        if (!is_within(abs, scan_root))
            continue;

        std::string key = abs;
        if (!known.contains(key)) {
            key = normalize_path(std::filesystem::canonical(abs, ec));
            if (ec || !known.contains(key))
                continue; // nothing to run there
        }

        if (auto res = graph.add_edge(key, directory); !res) {
            return std::unexpected(res.error());
        }
    }
    return {};
}

void connect_symlinks(DirectoryGraph &graph, const std::map<std::string, std::string> &symlinks) {
    // Drop the edge rather than close a cycle: aliasing is best effort.
    auto try_connect = [&graph](size_t from, size_t to) {
        if (from == to || graph.reaches(to, from))
            return;
        graph.connect(from, to);
    };

    for (const auto &[link, target] : symlinks) {
        auto target_id = graph.find(target);
        if (!target_id && graph.remove_from_post_set(target)) {
            // The target runs with the graph so the alias can be ordered after it.
            target_id = graph.get_or_create_node(target);
        }
        if (!target_id) {
            // Target outside the scanned tree: nothing to order against.
            if (auto id = graph.find(link)) {
                graph.set_symlink(*id, target);
            } else if (!graph.in_post_set(link)) {
                graph.set_symlink(graph.get_or_create_node(link), target);
            }
            continue;
        }

        size_t link_id = graph.get_or_create_node(link);
        graph.set_symlink(link_id, target);
        graph.remove_from_post_set(link);

        // Copies: connecting below appends to these vectors.
        const std::vector<size_t> preds = graph.node(*target_id).in_edges;
        const std::vector<size_t> succs = graph.node(*target_id).out_edges;

        try_connect(*target_id, link_id);
        for (size_t pred : preds) {
            try_connect(pred, link_id);
        }
        for (size_t succ : succs) {
            try_connect(link_id, succ);
        }
    }
}

} // namespace tfwrap
