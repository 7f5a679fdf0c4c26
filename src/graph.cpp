#include "tfwrap/graph.hpp"

#include "tfwrap/utility.hpp"

#include <algorithm>
#include <cstdint>
#include <functional>

namespace tfwrap {

size_t DirectoryGraph::get_or_create_node(std::string_view path) {
    if (auto it = index_.find(std::string(path)); it != index_.end()) {
        return it->second;
    }

    size_t id = nodes_.size();
    nodes_.push_back({std::string(path), NodeKind::Regular, {}, {}, {}});
    index_.emplace(nodes_.back().path, id);
    return id;
}

std::optional<size_t> DirectoryGraph::find(std::string_view path) const {
    if (auto it = index_.find(std::string(path)); it != index_.end()) {
        return it->second;
    }
    return std::nullopt;
}

GraphResult<bool> DirectoryGraph::add_edge(std::string_view from, std::string_view to) {
    if (from == to) {
        return std::unexpected(GraphError{GraphErrorKind::SelfDependency, std::string(to), {},
                                          "Directory depends on itself: " + std::string(to)});
    }

    size_t from_id = get_or_create_node(from);
    size_t to_id = get_or_create_node(to);
    return connect(from_id, to_id);
}

bool DirectoryGraph::connect(size_t from, size_t to) {
    if (from == to || has_edge(from, to)) {
        return false;
    }

    nodes_[from].out_edges.push_back(to);
    nodes_[to].in_edges.push_back(from);
    ++edge_count_;
    return true;
}

bool DirectoryGraph::has_edge(size_t from, size_t to) const {
    const auto &out = nodes_[from].out_edges;
    return std::find(out.begin(), out.end(), to) != out.end();
}

bool DirectoryGraph::reaches(size_t from, size_t to) const {
    if (from == to)
        return true;

    std::vector<bool> seen(nodes_.size(), false);
    std::vector<size_t> stack{from};
    seen[from] = true;
    while (!stack.empty()) {
        size_t u = stack.back();
        stack.pop_back();
        for (size_t v : nodes_[u].out_edges) {
            if (v == to)
                return true;
            if (!seen[v]) {
                seen[v] = true;
                stack.push_back(v);
            }
        }
    }
    return false;
}

std::vector<size_t> DirectoryGraph::descendants(size_t from) const {
    std::vector<bool> seen(nodes_.size(), false);
    std::vector<size_t> result;
    std::vector<size_t> stack{from};
    seen[from] = true;
    while (!stack.empty()) {
        size_t u = stack.back();
        stack.pop_back();
        for (size_t v : nodes_[u].out_edges) {
            if (!seen[v]) {
                seen[v] = true;
                result.push_back(v);
                stack.push_back(v);
            }
        }
    }
    return result;
}

GraphResult<std::vector<size_t>> DirectoryGraph::topo_sort() const {
    enum class STATUS : uint8_t { UNSTARTED, WORKING, FINISHED };

    std::vector<STATUS> status(nodes_.size(), STATUS::UNSTARTED);
    std::vector<size_t> order;
    order.reserve(nodes_.size());
    std::vector<size_t> path; // current DFS chain, used to report the cycle

    std::function<GraphResult<void>(size_t)> dfs = [&](size_t u) -> GraphResult<void> {
        status[u] = STATUS::WORKING;
        path.push_back(u);
        for (size_t v : nodes_[u].out_edges) {
            if (status[v] == STATUS::UNSTARTED) {
                if (auto res = dfs(v); !res)
                    return res;
            } else if (status[v] == STATUS::WORKING) {
                GraphError err{GraphErrorKind::CyclicDependency, nodes_[v].path, {}, {}};
                auto start = std::find(path.begin(), path.end(), v);
                for (auto it = start; it != path.end(); ++it) {
                    err.cycle.push_back(nodes_[*it].path);
                }
                err.cycle.push_back(nodes_[v].path);

                err.message = "Cycle detected in the dependency graph: ";
                for (size_t i = 0; i < err.cycle.size(); ++i) {
                    if (i > 0)
                        err.message += " -> ";
                    err.message += err.cycle[i];
                }
                return std::unexpected(std::move(err));
            }
        }
        path.pop_back();
        status[u] = STATUS::FINISHED;
        order.push_back(u);
        return {};
    };

    for (size_t i = 0; i < nodes_.size(); ++i) {
        if (status[i] == STATUS::UNSTARTED) {
            if (auto res = dfs(i); !res)
                return std::unexpected(res.error());
        }
    }

    std::reverse(order.begin(), order.end());
    return order;
}

void DirectoryGraph::set_symlink(size_t id, std::string_view target) {
    nodes_[id].kind = NodeKind::Symlink;
    nodes_[id].target = std::string(target);
}

void DirectoryGraph::add_to_post_set(std::string_view path) {
    if (std::find(post_set_.begin(), post_set_.end(), path) == post_set_.end()) {
        post_set_.emplace_back(path);
    }
}

bool DirectoryGraph::remove_from_post_set(std::string_view path) {
    auto it = std::find(post_set_.begin(), post_set_.end(), path);
    if (it == post_set_.end())
        return false;
    post_set_.erase(it);
    return true;
}

bool DirectoryGraph::in_post_set(std::string_view path) const {
    return std::find(post_set_.begin(), post_set_.end(), path) != post_set_.end();
}

DirectoryGraph graph_union(const DirectoryGraph &lhs, const DirectoryGraph &rhs) {
    DirectoryGraph result;
    for (const DirectoryGraph *input : {&lhs, &rhs}) {
        for (const auto &node : input->nodes()) {
            size_t id = result.get_or_create_node(node.path);
            if (node.kind == NodeKind::Symlink) {
                result.set_symlink(id, node.target);
            }
        }
        for (const auto &node : input->nodes()) {
            size_t from = *result.find(node.path);
            for (size_t out : node.out_edges) {
                result.connect(from, *result.find(input->node(out).path));
            }
        }
        for (const auto &path : input->post_set()) {
            result.add_to_post_set(path);
        }
    }
    return result;
}

} // namespace tfwrap
