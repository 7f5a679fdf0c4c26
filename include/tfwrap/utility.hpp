#pragma once
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace tfwrap {
template <typename T> using Result = std::expected<T, std::string>;

enum class GraphErrorKind { NoDependency, CyclicDependency, SelfDependency, InvalidConfig };

struct GraphError {
    GraphErrorKind kind;
    std::string path;               // offending directory
    std::vector<std::string> cycle; // only for CyclicDependency, first node repeated at the end
    std::string message;
};

template <typename T> using GraphResult = std::expected<T, GraphError>;

std::string_view to_string(GraphErrorKind kind);

// Absolute, lexically normalized, without a trailing separator. Does not touch symlinks.
std::string normalize_path(const std::filesystem::path &path);

bool is_within(std::string_view path, std::string_view root);

// `path` relative to `root` when inside it, otherwise `path` unchanged.
std::string relative_to(std::string_view path, std::string_view root);

} // namespace tfwrap
