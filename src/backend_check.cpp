#include "tfwrap/backend_check.hpp"

#include "tfwrap/config.hpp"
#include "tfwrap/scanner.hpp"
#include "tfwrap/source_analysis.hpp"

#include <algorithm>
#include <set>

namespace tfwrap {

namespace {

Result<std::vector<std::string>> resolve_directories(const std::string &path) {
    std::error_code ec;
    std::filesystem::path p = normalize_path(path);
    if (std::filesystem::is_regular_file(p, ec))
        return std::vector<std::string>{normalize_path(p.parent_path())};
    if (!std::filesystem::is_directory(p, ec))
        return std::unexpected("No such file or directory: " + path);
    if (has_source_files(p))
        return std::vector<std::string>{normalize_path(p)};

    auto scan = scan_directories(p);
    if (!scan)
        return std::unexpected(scan.error());
    std::vector<std::string> dirs = scan->directories;
    for (const auto &[link, target] : scan->symlinks) {
        dirs.push_back(link);
    }
    return dirs;
}

} // namespace

Result<BackendReport> check_backends(const std::vector<std::string> &paths, const std::filesystem::path &repo_root) {
    std::set<std::string> directories;
    for (const auto &path : paths) {
        auto dirs = resolve_directories(path);
        if (!dirs)
            return std::unexpected(dirs.error());
        directories.insert(dirs->begin(), dirs->end());
    }

    BackendReport report;
    for (const auto &dir : directories) {
        report.checked.push_back(dir);
        if (has_backend(dir))
            continue;

        auto config = load_config(dir, repo_root);
        if (!config)
            return std::unexpected(config.error());
        if (config->backend_check)
            report.missing.push_back(dir);
        else
            report.waived.push_back(dir);
    }
    return report;
}

} // namespace tfwrap
