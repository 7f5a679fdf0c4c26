#include "tfwrap/git.hpp"

#include "tfwrap/process_exec.hpp"

#include <algorithm>

namespace tfwrap {

namespace {

Result<std::vector<std::string>> git_lines(const std::filesystem::path &root, std::vector<std::string> args) {
    args.insert(args.begin(), {"git", "-C", root.string()});
    CommandOptions options;
    options.capture_stderr = false;
    auto res = execute_command(args, options);
    if (!res)
        return std::unexpected(res.error());
    if (res->exit_code != 0) {
        return std::unexpected(join_command(args) + " exited with " + std::to_string(res->exit_code));
    }

    std::vector<std::string> lines;
    for (auto &line : res->output) {
        if (!line.empty())
            lines.push_back(std::move(line));
    }
    return lines;
}

} // namespace

Result<std::string> git_root(const std::filesystem::path &path) {
    auto lines = git_lines(path, {"rev-parse", "--show-toplevel"});
    if (!lines)
        return std::unexpected(lines.error());
    if (lines->empty())
        return std::unexpected("Not inside a git work tree: " + path.string());
    return normalize_path(lines->front());
}

std::string find_repo_root(const std::filesystem::path &path) {
    std::error_code ec;
    auto real = std::filesystem::weakly_canonical(path, ec);
    const std::filesystem::path start = ec ? std::filesystem::path(normalize_path(path)) : real;

    for (auto current = start;; current = current.parent_path()) {
        std::error_code exists_ec;
        if (std::filesystem::exists(current / ".git", exists_ec))
            return normalize_path(current);
        if (current == current.parent_path())
            break;
    }
    return normalize_path(start);
}

Result<std::vector<std::string>> changed_files(const std::filesystem::path &root, const std::string &base_ref) {
    std::vector<std::string> files;
    const std::vector<std::vector<std::string>> queries = {
        {"diff", "--name-only", base_ref + "...HEAD"},
        {"diff", "--name-only", "HEAD"},
        {"ls-files", "--others", "--exclude-standard"},
    };
    for (const auto &query : queries) {
        auto lines = git_lines(root, query);
        if (!lines)
            return std::unexpected(lines.error());
        files.insert(files.end(), lines->begin(), lines->end());
    }

    std::sort(files.begin(), files.end());
    files.erase(std::unique(files.begin(), files.end()), files.end());
    return files;
}

} // namespace tfwrap
