#include "tfwrap/cli.hpp"

#include <charconv>
#include <unistd.h>

namespace tfwrap {

std::optional<std::string> Arguments::get(std::string_view option) const {
    if (auto it = options.find(std::string(option)); it != options.end())
        return it->second;
    return std::nullopt;
}

Result<Arguments> parse_arguments(int argc, char **argv, const ArgumentSpec &spec) {
    Arguments args;
    bool only_positional = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (only_positional || !arg.starts_with("--")) {
            if (!spec.allow_positional)
                return std::unexpected("Unexpected argument: " + arg);
            args.positional.push_back(std::move(arg));
            continue;
        }
        if (arg == "--") {
            only_positional = true;
            continue;
        }

        std::string name = arg.substr(2);
        std::optional<std::string> value;
        if (auto eq = name.find('='); eq != std::string::npos) {
            value = name.substr(eq + 1);
            name.erase(eq);
        }

        if (spec.flags.contains(name)) {
            if (value)
                return std::unexpected("--" + name + " takes no value");
            args.flags.insert(name);
        } else if (spec.options.contains(name)) {
            if (!value) {
                if (i + 1 >= argc)
                    return std::unexpected("--" + name + " requires a value");
                value = argv[++i];
            }
            args.options[name] = *value;
        } else {
            return std::unexpected("Unknown option: --" + name);
        }
    }
    return args;
}

Result<size_t> parse_positive_int(std::string_view text) {
    size_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size() || value == 0) {
        return std::unexpected("Expected a positive integer, got '" + std::string(text) + "'");
    }
    return value;
}

Result<size_t> parallel_jobs(const Arguments &args) {
    auto text = args.get("parallel-jobs");
    if (!text)
        return 4;
    auto jobs = parse_positive_int(*text);
    if (!jobs)
        return std::unexpected("--parallel-jobs: " + jobs.error());
    return jobs;
}

bool stdout_is_tty() {
    return ::isatty(STDOUT_FILENO) == 1;
}

} // namespace tfwrap
