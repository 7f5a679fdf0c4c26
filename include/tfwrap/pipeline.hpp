#pragma once

#include "tfwrap/utility.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace tfwrap {

struct PipelineEntry {
    std::string step;
    std::string directory; ///< As written, relative to the repository root.
    std::string operation; ///< Optional third column.
    size_t line = 0;
};

struct PipelineManifest {
    std::filesystem::path file;
    std::vector<PipelineEntry> entries;
};

/**
 * @brief Parses a pipeline manifest.
 *
 * The first non-comment line is a header and is skipped. Every other line is
 * `step,directory[,operation]`. `#` starts a comment line, blank lines are ignored.
 */
Result<PipelineManifest> parse_manifest(const std::filesystem::path &file);

// Every `*.csv` manifest in `pipeline_dir`, sorted by file name.
Result<std::vector<PipelineManifest>> load_manifests(const std::filesystem::path &pipeline_dir);

struct PipelineReport {
    std::vector<std::string> missing;                        ///< Config directories absent from every manifest.
    std::vector<std::string> nonexistent;                    ///< `manifest:line: directory` entries that do not exist.
    std::map<std::string, std::vector<std::string>> duplicates; ///< Directory -> manifests listing it.

    bool ok() const {
        return missing.empty() && nonexistent.empty() && duplicates.empty();
    }
};

/**
 * @brief Cross-checks manifests against the configuration tree.
 *
 * Only directories under one of `filters` are reported (all when `filters` is empty). Directories with
 * `pipeline_check: false` are never reported missing.
 */
Result<PipelineReport> check_pipelines(const std::vector<PipelineManifest> &manifests,
                                       const std::filesystem::path &config_dir,
                                       const std::filesystem::path &repo_root,
                                       const std::vector<std::string> &filters);

} // namespace tfwrap
