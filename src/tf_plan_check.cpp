#include "tfwrap/change_impact.hpp"
#include "tfwrap/cli.hpp"
#include "tfwrap/config.hpp"
#include "tfwrap/executor.hpp"
#include "tfwrap/git.hpp"
#include "tfwrap/scanner.hpp"
#include "tfwrap/terraform.hpp"

#include <filesystem>
#include <iostream>

using namespace tfwrap;

namespace {

constexpr int EXIT_IAM_CHANGES = 3;
constexpr int EXIT_IAM_CHANGES_AND_FAILURE = 4;

void usage(std::ostream &out) {
    out << "Usage: tf_plan_check [--path <dir>] [options]\n"
           "\n"
           "Plans every configuration directory below <dir> (default: current directory).\n"
           "\n"
           "  --modified-only         Only directories affected by changes against --base-ref\n"
           "  --base-ref <ref>        Git base for --modified-only (default: origin/master)\n"
           "  --skip-iam              Do not flag IAM changes\n"
           "  --print-diff            Print plan output\n"
           "  --with-colors           Colored output\n"
           "  --parallel-jobs <n>     Directories planned at the same time (default: 4)\n"
           "  --output-dir <dir>      Write plan.tfplan and plan.json per directory\n"
           "  --no-resolve-envvars    Do not resolve envvars from .tf_wrapper files\n"
           "  --debug                 Verbose output\n";
}

struct PlanTargets {
    std::vector<std::string> regular;
    std::vector<std::string> symlinked;
};

Result<PlanTargets> all_directories(const std::string &path, const std::string &repo_root) {
    auto scan = scan_directories(path);
    if (!scan)
        return std::unexpected(scan.error());

    PlanTargets targets;
    auto keep = [&](const std::string &dir) -> Result<bool> {
        auto config = load_config(dir, repo_root);
        if (!config)
            return std::unexpected(config.error());
        return config->plan_check;
    };
    for (const auto &dir : scan->directories) {
        auto res = keep(dir);
        if (!res)
            return std::unexpected(res.error());
        if (*res)
            targets.regular.push_back(dir);
    }
    for (const auto &[link, target] : scan->symlinks) {
        auto res = keep(link);
        if (!res)
            return std::unexpected(res.error());
        if (*res)
            targets.symlinked.push_back(link);
    }
    return targets;
}

} // namespace

int main(int argc, char **argv) {
    ArgumentSpec spec;
    spec.flags = {"skip-iam", "modified-only", "print-diff", "with-colors", "debug", "no-resolve-envvars", "help"};
    spec.options = {"path", "parallel-jobs", "output-dir", "base-ref"};

    auto args = parse_arguments(argc, argv, spec);
    if (!args) {
        std::cerr << args.error() << "\n";
        usage(std::cerr);
        return EXIT_USAGE;
    }
    if (args->has("help")) {
        usage(std::cout);
        return 0;
    }

    auto jobs = parallel_jobs(*args);
    if (!jobs) {
        std::cerr << jobs.error() << "\n";
        return EXIT_USAGE;
    }

    const std::string path = normalize_path(args->get("path").value_or("."));
    std::error_code ec;
    if (!std::filesystem::is_directory(path, ec)) {
        std::cerr << "Not a directory: " << path << "\n";
        return EXIT_USAGE;
    }

    const bool debug = args->has("debug");
    std::string repo_root = find_repo_root(path);

    PlanTargets targets;
    if (args->has("modified-only")) {
        auto root = git_root(path);
        if (!root) {
            std::cerr << "--modified-only must run inside a git repository: " << root.error() << "\n";
            return EXIT_USAGE;
        }
        repo_root = *root;

        const std::string base_ref = args->get("base-ref").value_or("origin/master");
        auto changed = changed_files(repo_root, base_ref);
        if (!changed) {
            std::cerr << changed.error() << "\n";
            return EXIT_TOOL_FAILURE;
        }
        if (debug) {
            std::cout << changed->size() << " files changed against " << base_ref << std::endl;
        }

        auto impact = ChangeImpactAnalyzer(repo_root).affected(*changed, path);
        if (!impact) {
            std::cerr << impact.error() << "\n";
            return EXIT_TOOL_FAILURE;
        }
        targets.regular = std::move(impact->regular_dirs);
        targets.symlinked = std::move(impact->symlinked_dirs);
    } else {
        auto all = all_directories(path, repo_root);
        if (!all) {
            std::cerr << all.error() << "\n";
            return EXIT_TOOL_FAILURE;
        }
        targets = std::move(*all);
    }

    if (targets.regular.empty() && targets.symlinked.empty()) {
        std::cout << "No directories to check" << std::endl;
        return 0;
    }

    TerraformOptions tf_options;
    tf_options.operation = "plan";
    tf_options.repo_root = repo_root;
    tf_options.resolve_envvars = !args->has("no-resolve-envvars");
    tf_options.detect_iam = !args->has("skip-iam");
    tf_options.colors = args->has("with-colors");
    tf_options.print_command = debug;
    if (auto dir = args->get("output-dir"))
        tf_options.output_dir = std::filesystem::absolute(*dir);

    auto version = check_tool_version(tf_options.tool, MIN_TOOL_VERSION);
    if (!version) {
        std::cerr << version.error() << "\n";
        return EXIT_TOOL_FAILURE;
    }

    SsmSecretStore secrets;
    TerraformRunner runner(tf_options, secrets);
    RunSummary summary;

    ExecutorConfig exec_config;
    exec_config.jobs = *jobs;
    exec_config.print_output = args->has("print-diff");
    exec_config.print_only_changes = true;
    exec_config.debug = debug;
    exec_config.colors = tf_options.colors;
    exec_config.root = repo_root;

    Executor executor(exec_config);
    if (auto res = executor.execute_post_graph(targets.regular, runner, summary); !res) {
        std::cerr << res.error() << "\n";
        return EXIT_TOOL_FAILURE;
    }

    // Symlinked directories share state with their targets, one at a time.
    exec_config.jobs = 1;
    Executor serial(exec_config);
    if (auto res = serial.execute_post_graph(targets.symlinked, runner, summary); !res) {
        std::cerr << res.error() << "\n";
        return EXIT_TOOL_FAILURE;
    }

    executor.print_summary(summary, std::cout);

    if (tf_options.output_dir) {
        for (const auto &[dir, result] : summary.results) {
            if (result.changed_resources.empty())
                continue;
            std::cout << relative_to(dir, repo_root) << ": " << result.changed_resources.size()
                      << " resources to change\n";
            for (const auto &address : result.changed_resources) {
                std::cout << "  " << address << "\n";
            }
        }
    }

    std::vector<std::string> iam;
    for (const auto &[dir, result] : summary.results) {
        if (result.iam_changes)
            iam.push_back(dir);
    }
    if (!iam.empty()) {
        std::cout << "\nIAM changes detected in:\n";
        for (const auto &dir : iam) {
            std::cout << "  " << relative_to(dir, repo_root) << "\n";
        }
    }

    if (!summary.ok() && !iam.empty())
        return EXIT_IAM_CHANGES_AND_FAILURE;
    if (!iam.empty())
        return EXIT_IAM_CHANGES;
    if (!summary.ok())
        return EXIT_TOOL_FAILURE;
    return 0;
}
