#pragma once

#include "tfwrap/utility.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace tfwrap {

// Top level of the git work tree containing `path`.
Result<std::string> git_root(const std::filesystem::path &path);

// Nearest ancestor of `path` holding `.git`, or `path` itself. Does not run git.
std::string find_repo_root(const std::filesystem::path &path);

/**
 * @brief Files changed relative to `base_ref`, relative to the work tree root.
 *
 * Union of committed changes since the merge base (`base_ref...HEAD`), uncommitted changes and
 * untracked files. Sorted, without duplicates.
 */
Result<std::vector<std::string>> changed_files(const std::filesystem::path &root, const std::string &base_ref);

} // namespace tfwrap
