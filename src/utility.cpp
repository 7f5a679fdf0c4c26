#include "tfwrap/utility.hpp"

#include "tfwrap/domain.hpp"

#include <filesystem>

namespace tfwrap {

std::string_view to_string(GraphErrorKind kind) {
    switch (kind) {
    case GraphErrorKind::NoDependency:
        return "NoDependency";
    case GraphErrorKind::CyclicDependency:
        return "CyclicDependency";
    case GraphErrorKind::SelfDependency:
        return "SelfDependency";
    case GraphErrorKind::InvalidConfig:
        return "InvalidConfig";
    }
    return "Unknown";
}

std::string_view to_string(NodeStatus status) {
    switch (status) {
    case NodeStatus::Pending:
        return "pending";
    case NodeStatus::Running:
        return "running";
    case NodeStatus::Succeeded:
        return "succeeded";
    case NodeStatus::Failed:
        return "failed";
    case NodeStatus::Skipped:
        return "skipped";
    }
    return "unknown";
}

std::string_view to_string(NodeKind kind) {
    return kind == NodeKind::Symlink ? "symlink" : "regular";
}

std::string normalize_path(const std::filesystem::path &path) {
    std::error_code ec;
    std::filesystem::path abs = std::filesystem::absolute(path, ec);
    if (ec)
        abs = path;
    std::string result = abs.lexically_normal().string();
    while (result.size() > 1 && result.back() == '/') {
        result.pop_back();
    }
    return result;
}

bool is_within(std::string_view path, std::string_view root) {
    if (root == "/")
        return !path.empty() && path.front() == '/';
    if (!path.starts_with(root))
        return false;
    return path.size() == root.size() || path[root.size()] == '/';
}

std::string relative_to(std::string_view path, std::string_view root) {
    if (!is_within(path, root))
        return std::string(path);
    if (path.size() == root.size())
        return ".";
    size_t skip = root == "/" ? 1 : root.size() + 1;
    return std::string(path.substr(skip));
}

} // namespace tfwrap
