#include "tfwrap/builder.hpp"
#include "tfwrap/cli.hpp"
#include "tfwrap/config.hpp"
#include "tfwrap/executor.hpp"
#include "tfwrap/git.hpp"
#include "tfwrap/terraform.hpp"

#include <filesystem>
#include <iostream>

using namespace tfwrap;

namespace {

void usage(std::ostream &out) {
    out << "Usage: tf_graph_apply --path <dir> [options] [-- <extra tool arguments>]\n"
           "\n"
           "Runs the tool in every configuration directory below <dir>, ordered by depends_on.\n"
           "\n"
           "  --operation <op>        Tool operation (default: plan)\n"
           "  --parallel-jobs <n>     Directories run at the same time (default: 4)\n"
           "  --print-only-changes    Only print output of directories with changes\n"
           "  --emit-graph            Print the graph in DOT form and exit\n"
           "  --emit-graph-json <f>   Write the graph as JSON to <f> and exit\n"
           "  --dry-run               Print the waves without running the tool\n"
           "  --no-resolve-envvars    Do not resolve envvars from .tf_wrapper files\n"
           "  --audit-api-url <url>   POST every directory's outcome to <url>\n"
           "  --with-colors           Force colored output\n"
           "  --debug                 Verbose output\n";
}

} // namespace

int main(int argc, char **argv) {
    ArgumentSpec spec;
    spec.flags = {"debug", "print-only-changes", "emit-graph", "dry-run", "no-resolve-envvars", "with-colors", "help"};
    spec.options = {"path", "operation", "parallel-jobs", "emit-graph-json", "audit-api-url"};
    spec.allow_positional = true;

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

    auto path = args->get("path");
    if (!path) {
        std::cerr << "--path is required\n";
        usage(std::cerr);
        return EXIT_USAGE;
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(*path, ec)) {
        std::cerr << "Not a directory: " << *path << "\n";
        return EXIT_USAGE;
    }

    const bool debug = args->has("debug");
    const bool inspect_only = args->has("emit-graph") || args->get("emit-graph-json").has_value();
    const std::string repo_root = find_repo_root(*path);

    TerraformOptions tf_options;
    tf_options.operation = args->get("operation").value_or("plan");
    tf_options.extra_args = args->positional;
    tf_options.repo_root = repo_root;
    tf_options.resolve_envvars = !args->has("no-resolve-envvars");
    tf_options.detect_iam = false;
    tf_options.colors = args->has("with-colors");
    tf_options.print_command = debug;
    tf_options.retry = true;
    tf_options.audit_url = args->get("audit-api-url");

    if (!inspect_only && !args->has("dry-run")) {
        auto version = check_tool_version(tf_options.tool, MIN_TOOL_VERSION);
        if (!version) {
            std::cerr << version.error() << "\n";
            return EXIT_TOOL_FAILURE;
        }
        if (debug)
            std::cout << "Using " << tf_options.tool << " " << version->str() << std::endl;
    }

    BuilderOptions builder_options;
    builder_options.repo_root = repo_root;
    auto built = GraphBuilder(builder_options).build(*path);
    if (!built) {
        const auto &err = built.error();
        std::cerr << to_string(err.kind) << ": " << err.message << "\n";
        for (const auto &p : err.cycle) {
            std::cerr << "  " << p << "\n";
        }
        return EXIT_TOOL_FAILURE;
    }
    connect_symlinks(built->graph, built->symlinks);

    ExecutorConfig exec_config;
    exec_config.jobs = *jobs;
    exec_config.print_only_changes = args->has("print-only-changes");
    exec_config.dry_run = args->has("dry-run");
    exec_config.debug = debug;
    exec_config.colors = tf_options.colors || stdout_is_tty();
    exec_config.root = repo_root;
    Executor executor(exec_config);

    if (inspect_only) {
        if (args->has("emit-graph"))
            executor.emit_graph(built->graph, std::cout);
        if (auto file = args->get("emit-graph-json")) {
            if (auto res = executor.write_graph_json(built->graph, *file); !res) {
                std::cerr << res.error() << "\n";
                return EXIT_TOOL_FAILURE;
            }
        }
        return 0;
    }

    if (debug && !built->has_dependency_metadata) {
        std::cout << "No directory declares depends_on, running everything unordered" << std::endl;
    }

    SsmSecretStore secrets;
    TerraformRunner runner(tf_options, secrets);
    RunSummary summary;

    if (auto res = executor.execute_graph(built->graph, runner, summary); !res) {
        std::cerr << res.error() << "\n";
        return EXIT_TOOL_FAILURE;
    }
    if (auto res = executor.execute_post_graph(built->graph.post_set(), runner, summary); !res) {
        std::cerr << res.error() << "\n";
        return EXIT_TOOL_FAILURE;
    }

    executor.print_summary(summary, std::cout);
    return summary.ok() ? 0 : EXIT_TOOL_FAILURE;
}
