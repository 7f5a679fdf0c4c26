#pragma once

#include "tfwrap/domain.hpp"
#include "tfwrap/utility.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace tfwrap {

inline constexpr size_t MAX_RETRIES = 5;

struct CommandOptions {
    std::filesystem::path cwd; ///< Empty keeps the current directory.
    EnvVars env;               ///< Merged over the inherited environment. Empty values unset the variable.
    std::string input;         ///< Written to the child's stdin. Empty keeps the inherited stdin.
    bool capture_stderr = true;
    bool print_command = false;
    bool retry = false; ///< Retry on transient network errors, up to MAX_RETRIES attempts.
    std::chrono::seconds timeout{15 * 60};
    std::optional<std::string> audit_url; ///< Post the final outcome here. Needs `cwd`.
};

struct CommandResult {
    int exit_code = 0;
    std::vector<std::string> output; ///< One entry per line, newline stripped.
};

// Single attempt. Errors only when the process could not be started.
Result<CommandResult> process_exec(const std::vector<std::string> &args, const CommandOptions &options = {});

/**
 * @brief process_exec plus the retry policy of `options`.
 *
 * With `audit_url` set, the outcome of the last attempt is posted through post_audit_record(). A failed
 * post is reported on stderr and does not change the result.
 */
Result<CommandResult> execute_command(const std::vector<std::string> &args, const CommandOptions &options = {});

// Binary named by TFWRAP_CURL, or `curl`.
std::string audit_client();

/**
 * @brief POSTs `{"directory", "status", "run_by", "output"}` as JSON to `url`.
 *
 * `directory` is relative to the repository root, `status` is SUCCESS for exit code 0 and FAILED
 * otherwise, `run_by` is the current user. The body goes to curl on stdin.
 */
Result<void> post_audit_record(const std::string &url, const std::filesystem::path &directory, int exit_code,
                               const std::vector<std::string> &output);

// Lines of `output` that carry a known transient error.
std::vector<std::string> retriable_errors(const std::vector<std::string> &output);

std::string join_command(const std::vector<std::string> &args);

// Exponential backoff with full jitter. backoff() sleeps and returns the total time waited so far.
class Jitter {
public:
    explicit Jitter(std::chrono::milliseconds min_wait = std::chrono::seconds(1),
                    std::chrono::milliseconds max_wait = std::chrono::seconds(60));

    std::chrono::milliseconds backoff();

private:
    std::chrono::milliseconds min_wait;
    std::chrono::milliseconds max_wait;
    std::chrono::milliseconds current;
    std::chrono::milliseconds total{0};
    std::mt19937 rng;
};

} // namespace tfwrap
