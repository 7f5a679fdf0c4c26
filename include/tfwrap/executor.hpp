#pragma once

#include "tfwrap/domain.hpp"
#include "tfwrap/graph.hpp"
#include "tfwrap/utility.hpp"

#include <atomic>
#include <filesystem>
#include <map>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace tfwrap {

/**
 * @brief What the executor runs in each directory.
 *
 * prepare() is called once per directory before anything is dispatched, from the scheduling thread.
 * run() is called from worker threads, concurrently for different directories.
 */
class DirectoryOperation {
public:
    virtual ~DirectoryOperation() = default;

    virtual std::string_view name() const = 0;
    virtual Result<EnvVars> prepare(const std::string &directory) = 0;
    virtual DirectoryResult run(const std::string &directory, const EnvVars &envvars) = 0;
};

struct ExecutorConfig {
    size_t jobs = 4;                 ///< Upper bound on concurrent run() calls.
    bool print_output = true;        ///< Print captured output when a directory completes. Failures always print.
    bool print_only_changes = false; ///< Suppress output of directories whose result carries no diff.
    bool dry_run = false;            ///< Print the waves without calling run().
    bool debug = false;
    bool colors = false;
    std::string root; ///< Paths are printed relative to this when set.
};

/**
 * @brief Outcome of one invocation. Written only by the executor, under its lock.
 *
 * A directory shows up in `results` as Running once run() has been called for it, and is replaced by
 * its terminal result when run() returns.
 */
struct RunSummary {
    std::vector<std::string> failures;
    std::vector<std::string> not_applied; ///< Skipped because an ancestor failed or was skipped.
    std::vector<std::string> successes;
    std::map<std::string, DirectoryResult> results;

    bool ok() const {
        return failures.empty();
    }
    NodeStatus status_of(std::string_view path) const;
    bool any_iam_changes() const;
    bool any_changes() const;
};

class Executor {
public:
    explicit Executor(ExecutorConfig config = {});

    /**
     * @brief Runs every node of `graph`, a wave at a time.
     *
     * A node is ready once all its predecessors are terminal. Ready nodes with a failed or skipped
     * predecessor are skipped without running; the rest run concurrently, bounded by `jobs`. The next
     * wave is computed only after the whole current wave has finished.
     *
     * @return An error only for an internal scheduling defect (cycle or stall). Directory failures are
     *         reported through `summary`.
     */
    Result<void> execute_graph(const DirectoryGraph &graph, DirectoryOperation &operation, RunSummary &summary);

    // Runs every post-set directory with no ordering among them, regardless of any graph outcome.
    Result<void> execute_post_graph(const std::vector<std::string> &post_set, DirectoryOperation &operation,
                                    RunSummary &summary);

    void print_summary(const RunSummary &summary, std::ostream &out) const;

    // Graphviz rendering of `graph`, post-set members as unconnected grey nodes.
    void emit_graph(const DirectoryGraph &graph, std::ostream &out) const;

    // Same content as emit_graph() as JSON: `{"nodes": [...], "edges": [[from, to]...], "post_set": [...]}`.
    Result<void> write_graph_json(const DirectoryGraph &graph, const std::filesystem::path &file) const;

    size_t peak_concurrency() const {
        return peak_running.load();
    }

private:
    struct Task {
        std::string path;
        EnvVars envvars;
    };

    // Blocks until every task of the wave has finished. Statuses are parallel to `wave`.
    std::vector<NodeStatus> run_wave(const std::vector<Task> &wave, DirectoryOperation &operation,
                                     RunSummary &summary);
    void record(const std::string &path, DirectoryResult &&result, RunSummary &summary);
    void print_result(const std::string &path, const DirectoryResult &result);
    std::string display(const std::string &path) const;

    ExecutorConfig config;
    std::vector<std::jthread> pool;
    std::mutex summary_mtx;
    std::mutex cout_tty_mtx;
    size_t started = 0;
    size_t total = 0;
    std::atomic<size_t> running{0};
    std::atomic<size_t> peak_running{0};
};

} // namespace tfwrap
