#include "tfwrap/change_impact.hpp"

#include "tfwrap/config.hpp"
#include "tfwrap/scanner.hpp"
#include "tfwrap/source_analysis.hpp"

#include <algorithm>
#include <map>
#include <set>

namespace tfwrap {

namespace {

// The path as given plus its real path when they differ; changed files are reported by real path.
std::vector<std::string> path_keys(const std::filesystem::path &path) {
    std::vector<std::string> keys{normalize_path(path)};
    std::error_code ec;
    auto real = std::filesystem::canonical(path, ec);
    if (!ec) {
        std::string real_key = normalize_path(real);
        if (real_key != keys.front())
            keys.push_back(std::move(real_key));
    }
    return keys;
}

} // namespace

ChangeImpactAnalyzer::ChangeImpactAnalyzer(std::filesystem::path universe_root) {
    std::error_code ec;
    auto real = std::filesystem::weakly_canonical(universe_root, ec);
    this->universe_root = normalize_path(ec ? universe_root : real);
}

Result<std::vector<std::string>> ChangeImpactAnalyzer::config_directories() const {
    auto scan = scan_directories(universe_root);
    if (!scan)
        return std::unexpected(scan.error());

    std::vector<std::string> dirs = std::move(scan->directories);
    for (const auto &[link, target] : scan->symlinks) {
        dirs.push_back(link);
    }
    std::sort(dirs.begin(), dirs.end());
    return dirs;
}

Result<DirectoryGraph> ChangeImpactAnalyzer::module_usage_graph() const {
    auto dirs = config_directories();
    if (!dirs)
        return std::unexpected(dirs.error());

    DirectoryGraph graph;
    for (const auto &dir : *dirs) {
        graph.get_or_create_node(dir);
        for (const auto &module : module_dependencies(dir)) {
            for (const auto &key : path_keys(module)) {
                if (key == dir)
                    continue;
                if (auto res = graph.add_edge(key, dir); !res)
                    return std::unexpected(res.error().message);
            }
        }
    }
    return graph;
}

Result<DirectoryGraph> ChangeImpactAnalyzer::file_inclusion_graph() const {
    auto dirs = config_directories();
    if (!dirs)
        return std::unexpected(dirs.error());

    DirectoryGraph graph;
    for (const auto &dir : *dirs) {
        graph.get_or_create_node(dir);
        std::vector<std::filesystem::path> files;
        std::error_code ec = for_each_entry(dir, [&](const std::filesystem::directory_entry &entry) {
            std::error_code entry_ec;
            if (entry.is_regular_file(entry_ec))
                files.push_back(entry.path());
        });
        if (ec) {
            return std::unexpected("Cannot list " + dir + ": " + ec.message());
        }
        for (const auto &file : files) {
            for (const auto &key : path_keys(file)) {
                if (auto res = graph.add_edge(key, dir); !res)
                    return std::unexpected(res.error().message);
            }
        }
    }
    return graph;
}

Result<DirectoryGraph> ChangeImpactAnalyzer::auto_vars_graph() const {
    auto dirs = config_directories();
    if (!dirs)
        return std::unexpected(dirs.error());

    std::vector<std::filesystem::path> var_files;
    auto walked = walk_files(universe_root, [&](const std::filesystem::path &file) {
        if (is_auto_vars_file(file))
            var_files.push_back(file);
    });
    if (!walked)
        return std::unexpected(walked.error());
    std::sort(var_files.begin(), var_files.end());

    std::map<std::string, std::set<std::string>> declared;
    auto declared_in = [&](const std::string &dir) -> const std::set<std::string> & {
        auto it = declared.find(dir);
        if (it == declared.end())
            it = declared.emplace(dir, declared_variables(dir)).first;
        return it->second;
    };

    DirectoryGraph graph;
    for (const auto &file : var_files) {
        const std::string parent = normalize_path(file.parent_path());
        const std::set<std::string> assigned = assigned_variables(file);
        const std::vector<std::string> keys = path_keys(file);
        for (const auto &key : keys) {
            graph.get_or_create_node(key);
        }

        for (const auto &dir : *dirs) {
            if (!is_within(dir, parent))
                continue;
            const auto &vars = declared_in(dir);
            bool uses = std::any_of(assigned.begin(), assigned.end(),
                                    [&](const std::string &name) { return vars.contains(name); });
            if (!uses)
                continue;
            for (const auto &key : keys) {
                if (auto res = graph.add_edge(key, dir); !res)
                    return std::unexpected(res.error().message);
            }
        }
    }
    return graph;
}

Result<DirectoryGraph> ChangeImpactAnalyzer::dependency_graph() const {
    auto modules = module_usage_graph();
    if (!modules)
        return modules;
    auto files = file_inclusion_graph();
    if (!files)
        return files;
    auto vars = auto_vars_graph();
    if (!vars)
        return vars;
    return graph_union(graph_union(*modules, *files), *vars);
}

Result<ImpactResult> ChangeImpactAnalyzer::affected(const std::vector<std::string> &changed_files,
                                                    const std::filesystem::path &scope_root) const {
    auto graph = dependency_graph();
    if (!graph)
        return std::unexpected(graph.error());

    std::error_code ec;
    auto real_scope = std::filesystem::weakly_canonical(scope_root, ec);
    const std::string scope = normalize_path(ec ? scope_root : real_scope);

    std::set<std::string> candidates;
    auto collect = [&](size_t id) {
        candidates.insert(graph->node(id).path);
        for (size_t desc : graph->descendants(id)) {
            candidates.insert(graph->node(desc).path);
        }
    };

    for (const auto &changed : changed_files) {
        std::filesystem::path path(changed);
        if (!path.is_absolute())
            path = std::filesystem::path(universe_root) / path;

        std::error_code exists_ec;
        if (!std::filesystem::exists(path, exists_ec)) {
            // Deleted file: its directory is what changed.
            if (auto id = graph->find(normalize_path(path.parent_path())))
                collect(*id);
            continue;
        }
        for (const auto &key : path_keys(path)) {
            if (auto id = graph->find(key)) {
                for (size_t desc : graph->descendants(*id)) {
                    candidates.insert(graph->node(desc).path);
                }
            }
        }
    }

    ImpactResult result;
    for (const auto &dir : candidates) {
        std::error_code dir_ec;
        if (!is_within(dir, scope) || !std::filesystem::is_directory(dir, dir_ec) || !has_source_files(dir))
            continue;

        auto config = load_config(dir, universe_root);
        if (!config)
            return std::unexpected(config.error());
        if (!config->plan_check)
            continue;

        auto real = std::filesystem::canonical(dir, dir_ec);
        if (!dir_ec && normalize_path(real) != dir) {
            result.symlinked_dirs.push_back(dir);
        } else {
            result.regular_dirs.push_back(dir);
        }
    }
    return result;
}

} // namespace tfwrap
