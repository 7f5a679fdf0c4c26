#include "tfwrap/pipeline.hpp"

#include "mmap.hpp"
#include "tfwrap/config.hpp"
#include "tfwrap/scanner.hpp"

#include <algorithm>
#include <memory>
#include <set>
#include <string_view>
#include <vector>

namespace tfwrap {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
        s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
        s.remove_suffix(1);
    return s;
}

Result<PipelineEntry> parse_entry(const std::string_view line, size_t line_no) {
    size_t first_comma = line.find(',');
    if (first_comma == std::string_view::npos) {
        return std::unexpected("Malformed pipeline line " + std::to_string(line_no) +
                               " (missing directory column): " + std::string(line));
    }

    PipelineEntry entry;
    entry.line = line_no;
    entry.step = trim(line.substr(0, first_comma));

    size_t second_comma = line.find(',', first_comma + 1);
    if (second_comma == std::string_view::npos) {
        entry.directory = trim(line.substr(first_comma + 1));
    } else {
        entry.directory = trim(line.substr(first_comma + 1, second_comma - (first_comma + 1)));
        entry.operation = trim(line.substr(second_comma + 1));
    }

    if (entry.directory.empty()) {
        return std::unexpected("Malformed pipeline line " + std::to_string(line_no) +
                               " (empty directory): " + std::string(line));
    }
    return entry;
}

} // namespace

Result<PipelineManifest> parse_manifest(const std::filesystem::path &file) {
    auto mapped = MappedFile::open_file(file);
    if (!mapped)
        return std::unexpected(mapped.error());

    PipelineManifest manifest;
    manifest.file = file;

    bool header_seen = false;
    std::string error;
    (*mapped)->for_each_line([&](std::string_view line, size_t line_no) {
        line = trim(line);
        if (!error.empty() || line.empty() || line[0] == '#')
            return;
        if (!header_seen) {
            header_seen = true;
            return;
        }
        auto entry = parse_entry(line, line_no);
        if (!entry) {
            error = file.string() + ": " + entry.error();
            return;
        }
        manifest.entries.push_back(std::move(*entry));
    });

    if (!error.empty())
        return std::unexpected(error);
    return manifest;
}

Result<std::vector<PipelineManifest>> load_manifests(const std::filesystem::path &pipeline_dir) {
    std::vector<std::filesystem::path> files;
    std::error_code ec = for_each_entry(pipeline_dir, [&](const std::filesystem::directory_entry &entry) {
        std::error_code entry_ec;
        if (entry.path().extension() == ".csv" && entry.is_regular_file(entry_ec)) {
            files.push_back(entry.path());
        }
    });
    if (ec) {
        return std::unexpected("Cannot list " + pipeline_dir.string() + ": " + ec.message());
    }
    std::sort(files.begin(), files.end());

    std::vector<PipelineManifest> manifests;
    for (const auto &file : files) {
        auto manifest = parse_manifest(file);
        if (!manifest)
            return std::unexpected(manifest.error());
        manifests.push_back(std::move(*manifest));
    }
    return manifests;
}

Result<PipelineReport> check_pipelines(const std::vector<PipelineManifest> &manifests,
                                       const std::filesystem::path &config_dir,
                                       const std::filesystem::path &repo_root,
                                       const std::vector<std::string> &filters) {
    std::error_code canon_ec;
    auto real_root = std::filesystem::weakly_canonical(repo_root, canon_ec);
    const std::string root = normalize_path(canon_ec ? repo_root : real_root);
    std::vector<std::string> scopes;
    for (const auto &filter : filters) {
        std::filesystem::path p(filter);
        scopes.push_back(normalize_path(p.is_absolute() ? p : std::filesystem::path(root) / p));
    }
    auto in_scope = [&](const std::string &path) {
        return scopes.empty() ||
               std::any_of(scopes.begin(), scopes.end(), [&](const std::string &s) { return is_within(path, s); });
    };

    PipelineReport report;
    std::map<std::string, std::vector<std::string>> listed; // directory -> manifests
    for (const auto &manifest : manifests) {
        for (const auto &entry : manifest.entries) {
            std::string path = normalize_path(std::filesystem::path(root) / entry.directory);
            listed[path].push_back(manifest.file.filename().string());

            std::error_code ec;
            if (in_scope(path) && !std::filesystem::is_directory(path, ec)) {
                report.nonexistent.push_back(manifest.file.filename().string() + ":" + std::to_string(entry.line) +
                                             ": " + entry.directory);
            }
        }
    }

    for (const auto &[path, files] : listed) {
        if (files.size() > 1 && in_scope(path)) {
            report.duplicates.emplace(relative_to(path, root), files);
        }
    }

    auto scan = scan_directories(config_dir);
    if (!scan)
        return std::unexpected(scan.error());

    std::vector<std::string> dirs = scan->directories;
    for (const auto &[link, target] : scan->symlinks) {
        dirs.push_back(link);
    }
    std::sort(dirs.begin(), dirs.end());

    for (const auto &dir : dirs) {
        if (!in_scope(dir) || listed.contains(dir))
            continue;
        auto config = load_config(dir, root);
        if (!config)
            return std::unexpected(config.error());
        if (config->pipeline_check) {
            report.missing.push_back(relative_to(dir, root));
        }
    }
    return report;
}

} // namespace tfwrap
