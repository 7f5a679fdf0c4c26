#pragma once

#include "tfwrap/utility.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace tfwrap {

inline constexpr int EXIT_TOOL_FAILURE = 1;
inline constexpr int EXIT_USAGE = 2;

/**
 * @brief Parsed command line.
 *
 * Accepts `--flag`, `--option value` and `--option=value`. Anything not starting with `--` is positional,
 * as is everything after a bare `--`.
 */
struct Arguments {
    std::set<std::string> flags;
    std::map<std::string, std::string> options;
    std::vector<std::string> positional;

    bool has(std::string_view flag) const {
        return flags.contains(std::string(flag));
    }
    std::optional<std::string> get(std::string_view option) const;
};

struct ArgumentSpec {
    std::set<std::string> flags;   ///< Names without leading dashes.
    std::set<std::string> options; ///< Names taking a value.
    bool allow_positional = false;
};

Result<Arguments> parse_arguments(int argc, char **argv, const ArgumentSpec &spec);

// Strictly positive decimal integer, the whole string must be consumed.
Result<size_t> parse_positive_int(std::string_view text);

// `--parallel-jobs`, default 4.
Result<size_t> parallel_jobs(const Arguments &args);

// Terminal detection for colored output.
bool stdout_is_tty();

} // namespace tfwrap
