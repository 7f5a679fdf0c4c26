#pragma once

#include "tfwrap/domain.hpp"
#include "tfwrap/utility.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tfwrap {

/**
 * @brief Dependency graph over configuration directories.
 *
 * An edge `from -> to` means `to` depends on `from`: `from` has to finish before `to` may start.
 * Nodes are keyed by path. Directories with no ordering constraints at all are kept aside in the
 * post-set and never become nodes.
 */
class DirectoryGraph {
public:
    struct Node {
        std::string path;
        NodeKind kind = NodeKind::Regular;
        std::string target;            ///< Resolved real directory, symlink nodes only.
        std::vector<size_t> out_edges; ///< Nodes that depend on this node.
        std::vector<size_t> in_edges;  ///< Nodes this node depends on.
    };

    size_t get_or_create_node(std::string_view path);
    std::optional<size_t> find(std::string_view path) const;
    bool contains(std::string_view path) const {
        return find(path).has_value();
    }

    /**
     * @brief Adds `from -> to`, creating both nodes if needed.
     * @return true if the edge is new, false if it already existed, or a SelfDependency error.
     */
    GraphResult<bool> add_edge(std::string_view from, std::string_view to);

    // Id based variant. Returns false for duplicates and self-loops instead of failing.
    bool connect(size_t from, size_t to);
    bool has_edge(size_t from, size_t to) const;

    // True if `to` is reachable from `from` following out edges. A node reaches itself.
    bool reaches(size_t from, size_t to) const;

    // Every node reachable from `from`, excluding `from`, in discovery order.
    std::vector<size_t> descendants(size_t from) const;

    /**
     * @brief Topological order, dependencies first.
     * @return The order, or a CyclicDependency error listing one cycle.
     */
    GraphResult<std::vector<size_t>> topo_sort() const;

    void set_symlink(size_t id, std::string_view target);

    void add_to_post_set(std::string_view path);
    bool remove_from_post_set(std::string_view path);
    bool in_post_set(std::string_view path) const;
    const std::vector<std::string> &post_set() const {
        return post_set_;
    }

    const std::vector<Node> &nodes() const {
        return nodes_;
    }
    const Node &node(size_t id) const {
        return nodes_[id];
    }
    size_t edge_count() const {
        return edge_count_;
    }
    bool empty() const {
        return nodes_.empty();
    }

private:
    std::vector<Node> nodes_;
    std::unordered_map<std::string, size_t> index_;
    std::vector<std::string> post_set_;
    size_t edge_count_ = 0;
};

/**
 * @brief Node present if present in either input, edge present if present in either input.
 *
 * Nodes are matched by path; duplicate edges collapse. Post-sets are concatenated without duplicates.
 */
DirectoryGraph graph_union(const DirectoryGraph &lhs, const DirectoryGraph &rhs);

} // namespace tfwrap
