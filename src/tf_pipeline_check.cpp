#include "tfwrap/cli.hpp"
#include "tfwrap/git.hpp"
#include "tfwrap/pipeline.hpp"

#include <filesystem>
#include <iostream>

using namespace tfwrap;

int main(int argc, char **argv) {
    ArgumentSpec spec;
    spec.flags = {"help"};
    spec.options = {"pipeline-dir", "config-dir"};
    spec.allow_positional = true;

    auto args = parse_arguments(argc, argv, spec);
    auto usage = [](std::ostream &out) {
        out << "Usage: tf_pipeline_check --pipeline-dir <dir> --config-dir <dir> [<path filter>...]\n";
    };
    if (!args) {
        std::cerr << args.error() << "\n";
        usage(std::cerr);
        return EXIT_USAGE;
    }
    if (args->has("help")) {
        usage(std::cout);
        return 0;
    }

    auto pipeline_dir = args->get("pipeline-dir");
    auto config_dir = args->get("config-dir");
    if (!pipeline_dir || !config_dir) {
        std::cerr << "--pipeline-dir and --config-dir are required\n";
        usage(std::cerr);
        return EXIT_USAGE;
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(*config_dir, ec)) {
        std::cerr << "Not a directory: " << *config_dir << "\n";
        return EXIT_USAGE;
    }

    auto manifests = load_manifests(*pipeline_dir);
    if (!manifests) {
        std::cerr << manifests.error() << "\n";
        return EXIT_TOOL_FAILURE;
    }

    const std::string repo_root = find_repo_root(*config_dir);
    auto report = check_pipelines(*manifests, *config_dir, repo_root, args->positional);
    if (!report) {
        std::cerr << report.error() << "\n";
        return EXIT_TOOL_FAILURE;
    }

    if (!report->missing.empty()) {
        std::cout << "Directories not in any pipeline:\n";
        for (const auto &dir : report->missing) {
            std::cout << "  " << dir << "\n";
        }
    }
    if (!report->nonexistent.empty()) {
        std::cout << "Pipeline entries for directories that do not exist:\n";
        for (const auto &entry : report->nonexistent) {
            std::cout << "  " << entry << "\n";
        }
    }
    if (!report->duplicates.empty()) {
        std::cout << "Directories in more than one pipeline:\n";
        for (const auto &[dir, files] : report->duplicates) {
            std::cout << "  " << dir << ":";
            for (const auto &file : files) {
                std::cout << " " << file;
            }
            std::cout << "\n";
        }
    }

    if (report->ok()) {
        std::cout << "All " << manifests->size() << " pipelines are consistent" << std::endl;
        return 0;
    }
    return EXIT_TOOL_FAILURE;
}
