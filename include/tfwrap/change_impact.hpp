#pragma once

#include "tfwrap/graph.hpp"
#include "tfwrap/utility.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace tfwrap {

struct ImpactResult {
    std::vector<std::string> regular_dirs;   ///< sorted
    std::vector<std::string> symlinked_dirs; ///< sorted, as reached from the root
};

/**
 * @brief Finds the configuration directories transitively affected by a set of changed files.
 *
 * Three reachability graphs are built over the directories below the universe root:
 * - module usage: module directory -> directory calling it,
 * - file inclusion: source file (by real and reached path) -> directory containing it,
 * - auto-loaded variables: `*.auto.tfvars` file -> directory below it declaring one of its variables.
 *
 * Every edge means "the target is affected when the source changes".
 */
class ChangeImpactAnalyzer {
public:
    explicit ChangeImpactAnalyzer(std::filesystem::path universe_root);

    Result<DirectoryGraph> module_usage_graph() const;
    Result<DirectoryGraph> file_inclusion_graph() const;
    Result<DirectoryGraph> auto_vars_graph() const;

    // Union of the three graphs above.
    Result<DirectoryGraph> dependency_graph() const;

    /**
     * @brief Directories affected by `changed_files`.
     *
     * Relative changed paths are taken relative to the universe root. A changed file that no longer
     * exists seeds the analysis from its parent directory. Candidates are kept if they lie within
     * `scope_root`, still exist, hold source files and have not set `plan_check: false`.
     */
    Result<ImpactResult> affected(const std::vector<std::string> &changed_files,
                                  const std::filesystem::path &scope_root) const;

private:
    Result<std::vector<std::string>> config_directories() const;

    std::string universe_root;
};

} // namespace tfwrap
