#pragma once

#include "tfwrap/config.hpp"
#include "tfwrap/graph.hpp"
#include "tfwrap/utility.hpp"

#include <filesystem>
#include <map>
#include <set>
#include <string>

namespace tfwrap {

struct BuilderOptions {
    std::filesystem::path repo_root; ///< `depends_on` entries are relative to this. Empty: the scanned root.
    bool infer_module_edges = true;  ///< Order a module directory before its users when both are graph nodes.
};

struct BuildOutput {
    DirectoryGraph graph;                        ///< Post-set included.
    std::map<std::string, std::string> symlinks; ///< Symlinked directory -> real directory, for connect_symlinks.
    bool has_dependency_metadata = false;        ///< False when no directory declares `depends_on` at all.
};

/**
 * @brief Builds the execution graph for every configuration directory under a root.
 *
 * Edges come from the `depends_on` declarations in `.tf_wrapper` files and, optionally, from local module
 * references between directories that are already ordered. Directories without any ordering information
 * go to the post-set. When no directory declares dependencies, every directory goes to the post-set.
 */
class GraphBuilder {
public:
    explicit GraphBuilder(BuilderOptions options = {}) : options(std::move(options)) {
    }

    GraphResult<BuildOutput> build(const std::filesystem::path &root) const;

    /**
     * @brief Adds the declared dependencies of one directory.
     *
     * Relative entries are resolved against `repo_root`. Dependencies outside `scan_root`, or on directories
     * without source files, add no edge.
     *
     * @param known Directories eligible as graph nodes (regular and symlinked) under the scanned root.
     * @return A NoDependency error if a dependency does not exist on disk.
     */
    GraphResult<void> add_directory(DirectoryGraph &graph, const std::string &directory,
                                    const std::vector<std::string> &depends_on, const std::string &repo_root,
                                    const std::string &scan_root, const std::set<std::string> &known) const;

private:
    BuilderOptions options;
};

/**
 * @brief Folds symlinked directories into the graph so an alias is never scheduled ahead of its target.
 *
 * For a symlink whose target is a node: the symlink becomes a node, the edge `target -> symlink` is added
 * and the target's inbound and outbound edges are mirrored onto the symlink. Any mirrored edge that would
 * close a cycle is dropped. Existing edges are never removed. A target waiting in the post-set is moved into
 * the graph first. A symlink whose target is outside the scanned tree becomes a source node.
 */
void connect_symlinks(DirectoryGraph &graph, const std::map<std::string, std::string> &symlinks);

} // namespace tfwrap
