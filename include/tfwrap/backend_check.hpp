#pragma once

#include "tfwrap/utility.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace tfwrap {

struct BackendReport {
    std::vector<std::string> checked;
    std::vector<std::string> missing; ///< No backend block and `backend_check` not disabled.
    std::vector<std::string> waived;  ///< No backend block, but `backend_check: false`.

    bool ok() const {
        return missing.empty();
    }
};

/**
 * @brief Checks every configuration directory named by `paths` for a remote-state backend.
 *
 * A path may be a source file (its directory is checked), a configuration directory, or any directory
 * above configuration directories (all of them are checked).
 */
Result<BackendReport> check_backends(const std::vector<std::string> &paths, const std::filesystem::path &repo_root);

} // namespace tfwrap
