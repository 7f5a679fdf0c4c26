#pragma once

#include "tfwrap/utility.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace tfwrap {

inline constexpr std::string_view SOURCE_EXTENSION = ".tf";

struct ScanResult {
    std::vector<std::string> directories;         ///< Regular directories with source files, canonical, sorted.
    std::map<std::string, std::string> symlinks;  ///< Symlinked directory (as reached from the root) -> real directory.
};

// Calls `visit` for each entry of `directory`. Stops at the first listing error and returns it; never throws.
std::error_code for_each_entry(const std::filesystem::path &directory,
                               const std::function<void(const std::filesystem::directory_entry &)> &visit);

// `.terraform` and `.git` are never entered.
bool is_ignored_directory(std::string_view name);

bool has_source_files(const std::filesystem::path &directory);

/**
 * @brief Walks `root` following directory symlinks and classifies every directory holding source files.
 *
 * A directory is symlinked when its path as reached from the root differs from its canonical path,
 * which also covers directories nested below a symlink. Symlink loops are not followed.
 */
Result<ScanResult> scan_directories(const std::filesystem::path &root);

/**
 * @brief Calls `visit` for every regular file below `root`, following directory symlinks.
 *
 * Paths are reported as reached from the root. Ignored directories are skipped.
 */
Result<void> walk_files(const std::filesystem::path &root,
                        const std::function<void(const std::filesystem::path &)> &visit);

} // namespace tfwrap
