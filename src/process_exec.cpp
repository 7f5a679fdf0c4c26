#include "tfwrap/process_exec.hpp"

#include "tfwrap/git.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <pthread.h>
#include <pwd.h>
#include <string_view>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char **environ;

namespace tfwrap {

namespace {

constexpr std::array<std::string_view, 17> RETRIABLE_ERRORS = {
    "RequestError: send request failed",
    "unexpected EOF",
    "Throttling",
    "timeout while waiting for state",
    "ServiceUnavailable: Service Unavailable",
    "failed to decode query XML error response",
    "connection reset",
    "Connection reset",
    "Please try again.",
    "Client.Timeout exceeded",
    "Request limit for operation",
    "try again later",
    "handshake timeout",
    "SSL_ERROR_SYSCALL",
    "ConditionalCheckFailedException",
    "Api Rate Limit Exceeded",
    "TooManyUpdates",
};

std::mutex echo_mtx;

std::vector<std::string> build_environment(const EnvVars &overrides) {
    EnvVars merged;
    for (char **entry = environ; entry && *entry; ++entry) {
        std::string_view kv(*entry);
        auto eq = kv.find('=');
        if (eq == std::string_view::npos)
            continue;
        merged.emplace(std::string(kv.substr(0, eq)), std::string(kv.substr(eq + 1)));
    }
    for (const auto &[key, value] : overrides) {
        if (value.empty())
            merged.erase(key);
        else
            merged[key] = value;
    }

    std::vector<std::string> env;
    env.reserve(merged.size());
    for (const auto &[key, value] : merged) {
        env.push_back(key + "=" + value);
    }
    return env;
}

// Runs on its own thread so a child that fills its output pipe before reading stdin cannot deadlock us.
int write_input(int fd, std::string_view input) {
    // EPIPE instead of SIGPIPE when the child exits without reading everything.
    sigset_t pipe_set;
    sigemptyset(&pipe_set);
    sigaddset(&pipe_set, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &pipe_set, nullptr);

    int err = 0;
    while (!input.empty()) {
        ssize_t n = write(fd, input.data(), input.size());
        if (n == -1) {
            if (errno == EINTR)
                continue;
            err = errno;
            break;
        }
        input.remove_prefix(static_cast<size_t>(n));
    }
    close(fd);
    return err;
}

std::string current_user() {
    if (const char *user = std::getenv("USER"); user && *user)
        return user;
    if (const passwd *pw = getpwuid(geteuid()); pw && pw->pw_name)
        return pw->pw_name;
    return "unknown";
}

} // namespace

std::string join_command(const std::vector<std::string> &args) {
    std::string joined;
    for (const auto &arg : args) {
        if (!joined.empty())
            joined += ' ';
        joined += arg;
    }
    return joined;
}

Result<CommandResult> process_exec(const std::vector<std::string> &args, const CommandOptions &options) {
    if (args.empty()) {
        return std::unexpected("Empty command");
    }

    if (options.print_command) {
        std::lock_guard lock(echo_mtx);
        std::cout << "Executing: " << join_command(args) << std::endl;
    }

    // Everything the child needs is prepared before fork.
    std::vector<char *> argv;
    argv.reserve(args.size() + 1);
    for (const auto &arg : args) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_storage = build_environment(options.env);
    std::vector<char *> envp;
    envp.reserve(env_storage.size() + 1);
    for (auto &kv : env_storage) {
        envp.push_back(kv.data());
    }
    envp.push_back(nullptr);

    const std::string cwd = options.cwd.string();
    const bool feed_input = !options.input.empty();

    int pipe_fds[2];
    if (pipe2(pipe_fds, O_CLOEXEC) == -1) {
        return std::unexpected(std::string("pipe failed: ") + std::strerror(errno));
    }
    int input_fds[2] = {-1, -1};
    if (feed_input && pipe2(input_fds, O_CLOEXEC) == -1) {
        int err = errno;
        close(pipe_fds[0]);
        close(pipe_fds[1]);
        return std::unexpected(std::string("pipe failed: ") + std::strerror(err));
    }

    pid_t pid = fork();
    if (pid == -1) {
        int err = errno;
        close(pipe_fds[0]);
        close(pipe_fds[1]);
        if (feed_input) {
            close(input_fds[0]);
            close(input_fds[1]);
        }
        return std::unexpected(std::string("fork failed: ") + std::strerror(err));
    }

    if (pid == 0) {
        if (feed_input)
            dup2(input_fds[0], STDIN_FILENO);
        dup2(pipe_fds[1], STDOUT_FILENO);
        if (options.capture_stderr) {
            dup2(pipe_fds[1], STDERR_FILENO);
        } else {
            int dev_null = open("/dev/null", O_WRONLY);
            if (dev_null != -1)
                dup2(dev_null, STDERR_FILENO);
        }
        if (!cwd.empty() && chdir(cwd.c_str()) == -1) {
            _exit(126);
        }
        execvpe(argv[0], argv.data(), envp.data());
        _exit(127);
    }

    close(pipe_fds[1]);

    int input_error = 0;
    std::jthread writer;
    if (feed_input) {
        close(input_fds[0]);
        writer = std::jthread(
            [&input_error, fd = input_fds[1], &options] { input_error = write_input(fd, options.input); });
    }

    CommandResult result;
    std::string pending;
    std::array<char, 4096> buffer;
    while (true) {
        ssize_t n = read(pipe_fds[0], buffer.data(), buffer.size());
        if (n == -1 && errno == EINTR)
            continue;
        if (n <= 0)
            break;

        pending.append(buffer.data(), static_cast<size_t>(n));
        size_t start = 0;
        for (size_t nl = pending.find('\n'); nl != std::string::npos; nl = pending.find('\n', start)) {
            result.output.push_back(pending.substr(start, nl - start));
            start = nl + 1;
        }
        pending.erase(0, start);
    }
    if (!pending.empty()) {
        result.output.push_back(std::move(pending));
    }
    close(pipe_fds[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            return std::unexpected(std::string("waitpid failed: ") + std::strerror(errno));
        }
    }

    if (writer.joinable())
        writer.join();
    if (input_error != 0 && input_error != EPIPE) {
        return std::unexpected("Failed to write stdin of " + args[0] + ": " + std::strerror(input_error));
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    } else {
        result.exit_code = 1;
    }

    if (result.exit_code == 127 && result.output.empty()) {
        return std::unexpected("Failed to execute: " + args[0]);
    }
    return result;
}

std::vector<std::string> retriable_errors(const std::vector<std::string> &output) {
    std::vector<std::string> found;
    for (const auto &line : output) {
        bool hit = std::any_of(RETRIABLE_ERRORS.begin(), RETRIABLE_ERRORS.end(),
                               [&](std::string_view err) { return line.find(err) != std::string::npos; });
        if (hit)
            found.push_back(line);
    }
    return found;
}

Result<CommandResult> execute_command(const std::vector<std::string> &args, const CommandOptions &options) {
    const size_t attempts = options.retry ? MAX_RETRIES : 1;
    Jitter jitter;
    std::chrono::milliseconds time_passed{0};

    Result<CommandResult> res;
    for (size_t attempt = 1; attempt <= attempts; ++attempt) {
        res = process_exec(args, options);
        if (!res)
            return res;

        if (res->exit_code == 0 || !options.retry || attempt == attempts)
            break;

        auto network_errors = retriable_errors(res->output);
        if (network_errors.empty())
            break;

        {
            std::lock_guard lock(echo_mtx);
            std::cerr << "Found network errors while running " << join_command(args) << ": " << network_errors.front()
                      << std::endl;
        }

        if (time_passed >= options.timeout) {
            return std::unexpected("Timed out retrying " + join_command(args));
        }
        time_passed = jitter.backoff();
    }

    if (res && options.audit_url && !options.cwd.empty()) {
        auto posted = post_audit_record(*options.audit_url, options.cwd, res->exit_code, res->output);
        if (!posted) {
            std::lock_guard lock(echo_mtx);
            std::cerr << "Unable to post data to " << *options.audit_url << ": " << posted.error() << std::endl;
        }
    }
    return res;
}

std::string audit_client() {
    if (const char *curl = std::getenv("TFWRAP_CURL"); curl && *curl)
        return curl;
    return "curl";
}

Result<void> post_audit_record(const std::string &url, const std::filesystem::path &directory, int exit_code,
                               const std::vector<std::string> &output) {
    const std::string dir = normalize_path(directory);
    nlohmann::json body;
    body["directory"] = relative_to(dir, find_repo_root(dir));
    body["status"] = exit_code == 0 ? "SUCCESS" : "FAILED";
    body["run_by"] = current_user();
    body["output"] = output;

    CommandOptions options;
    options.input = body.dump();
    auto res = process_exec({audit_client(), "-sS", "--fail", "-X", "POST", "-H", "Content-Type: application/json",
                             "--data", "@-", url},
                            options);
    if (!res)
        return std::unexpected(res.error());
    if (res->exit_code != 0) {
        std::string reason = res->output.empty() ? "" : ": " + res->output.front();
        return std::unexpected(audit_client() + " exited with " + std::to_string(res->exit_code) + reason);
    }
    return {};
}

Jitter::Jitter(std::chrono::milliseconds min_wait, std::chrono::milliseconds max_wait)
    : min_wait(min_wait), max_wait(max_wait), current(min_wait), rng(std::random_device{}()) {
}

std::chrono::milliseconds Jitter::backoff() {
    std::uniform_int_distribution<long long> dist(min_wait.count(), std::max(min_wait, current).count());
    std::chrono::milliseconds wait{dist(rng)};
    std::this_thread::sleep_for(wait);
    total += wait;
    current = std::min(max_wait, current * 2);
    return total;
}

} // namespace tfwrap
