#include "tfwrap/backend_check.hpp"
#include "tfwrap/cli.hpp"
#include "tfwrap/git.hpp"

#include <iostream>

using namespace tfwrap;

int main(int argc, char **argv) {
    ArgumentSpec spec;
    spec.flags = {"debug"};
    spec.allow_positional = true;

    auto args = parse_arguments(argc, argv, spec);
    if (!args || args->positional.empty()) {
        if (!args)
            std::cerr << args.error() << "\n";
        std::cerr << "Usage: tf_backend_check [--debug] <path>...\n";
        return EXIT_USAGE;
    }

    const std::string repo_root = find_repo_root(args->positional.front());
    auto report = check_backends(args->positional, repo_root);
    if (!report) {
        std::cerr << report.error() << "\n";
        return EXIT_TOOL_FAILURE;
    }

    if (args->has("debug")) {
        std::cout << "Checked " << report->checked.size() << " directories" << std::endl;
        for (const auto &dir : report->waived) {
            std::cout << "No backend, check disabled: " << relative_to(dir, repo_root) << "\n";
        }
    }

    for (const auto &dir : report->missing) {
        std::cerr << "No backend configured: " << relative_to(dir, repo_root) << "\n";
    }
    return report->ok() ? 0 : EXIT_TOOL_FAILURE;
}
