#include "tfwrap/executor.hpp"

#include "tfwrap/utility.hpp"

#include <algorithm>
#include <atomic>
#if FF_tfwrap__profiling
#include <chrono>
#endif
#include <cstddef>
#include <exception>
#include <fstream>
// No <format> or <print> in the GCC 12 library: lines keep the println layout over iostreams.
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include <thread>
#include <vector>

namespace tfwrap {

namespace {

constexpr std::string_view BOLD = "\033[1m";
constexpr std::string_view GREEN = "\033[1;32m";
constexpr std::string_view RED = "\033[1;31m";
constexpr std::string_view YELLOW = "\033[1;33m";
constexpr std::string_view RESET = "\033[0m";

// Quoted DOT ids only need `"` and `\` escaped.
std::string dot_label(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '"' || c == '\\')
            out += '\\';
        out += c;
    }
    return out;
}

} // namespace

NodeStatus RunSummary::status_of(std::string_view path) const {
    if (auto it = results.find(std::string(path)); it != results.end()) {
        return it->second.status;
    }
    return NodeStatus::Pending;
}

bool RunSummary::any_iam_changes() const {
    return std::any_of(results.begin(), results.end(), [](const auto &entry) { return entry.second.iam_changes; });
}

bool RunSummary::any_changes() const {
    return std::any_of(results.begin(), results.end(),
                       [](const auto &entry) { return entry.second.has_changes(); });
}

Executor::Executor(ExecutorConfig config) : config(std::move(config)) {
    if (this->config.jobs == 0)
        this->config.jobs = std::thread::hardware_concurrency();
    if (this->config.jobs == 0)
        this->config.jobs = 1;
}

std::string Executor::display(const std::string &path) const {
    if (config.root.empty())
        return path;
    return relative_to(path, config.root);
}

Result<void> Executor::execute_graph(const DirectoryGraph &graph, DirectoryOperation &operation,
                                     RunSummary &summary) {
    pool.clear(); // Ensure clean state

    auto order = graph.topo_sort();
    if (!order) {
        return std::unexpected(order.error().message);
    }

    const auto &nodes = graph.nodes();
    std::vector<NodeStatus> status(nodes.size(), NodeStatus::Pending);

    // Resolve every directory once up front so shared secret lookups are cached before dispatch.
    std::vector<EnvVars> envvars(nodes.size());
    std::vector<std::string> prepare_errors(nodes.size());
    for (size_t id : *order) {
        if (auto env = operation.prepare(nodes[id].path); env) {
            envvars[id] = std::move(*env);
        } else {
            prepare_errors[id] = env.error();
        }
    }

    {
        std::lock_guard lock(cout_tty_mtx);
        total += nodes.size();
    }

    size_t remaining = nodes.size();
    size_t wave_number = 0;
    while (remaining > 0) {
        std::vector<size_t> ready;
        for (size_t id : *order) {
            if (status[id] != NodeStatus::Pending)
                continue;
            const auto &preds = nodes[id].in_edges;
            if (std::all_of(preds.begin(), preds.end(), [&](size_t p) { return is_terminal(status[p]); })) {
                ready.push_back(id);
            }
        }

        if (ready.empty()) {
            return std::unexpected("Scheduling stalled with " + std::to_string(remaining) +
                                   " pending directories: the dependency graph is inconsistent");
        }

        std::vector<Task> wave;
        std::vector<size_t> wave_ids;
        for (size_t id : ready) {
            const auto &node = nodes[id];
            const auto &preds = node.in_edges;
            bool blocked = std::any_of(preds.begin(), preds.end(),
                                       [&](size_t p) { return status[p] != NodeStatus::Succeeded; });
            if (blocked) {
                status[id] = NodeStatus::Skipped;
                --remaining;
                if (config.dry_run)
                    continue;
                DirectoryResult result;
                result.status = NodeStatus::Skipped;
                if (config.debug) {
                    std::lock_guard lock(cout_tty_mtx);
                    std::cout << "Not running " << display(node.path) << ": a dependency did not succeed"
                              << std::endl;
                }
                record(node.path, std::move(result), summary);
                continue;
            }

            if (!prepare_errors[id].empty()) {
                status[id] = NodeStatus::Failed;
                --remaining;
                DirectoryResult result;
                result.status = NodeStatus::Failed;
                result.exit_class = ExitClass::Failure;
                result.error = prepare_errors[id];
                print_result(node.path, result);
                record(node.path, std::move(result), summary);
                continue;
            }

            wave.push_back({node.path, envvars[id]});
            wave_ids.push_back(id);
        }

        if (wave.empty())
            continue;

        ++wave_number;
        if (config.debug || config.dry_run) {
            std::lock_guard lock(cout_tty_mtx);
            std::cout << "Wave " << wave_number << ": " << wave.size() << " director"
                      << (wave.size() == 1 ? "y" : "ies") << std::endl;
        }

        auto statuses = run_wave(wave, operation, summary);
        for (size_t i = 0; i < wave_ids.size(); ++i) {
            status[wave_ids[i]] = statuses[i];
            --remaining;
        }
    }

    return {};
}

Result<void> Executor::execute_post_graph(const std::vector<std::string> &post_set, DirectoryOperation &operation,
                                          RunSummary &summary) {
    pool.clear();

    {
        std::lock_guard lock(cout_tty_mtx);
        total += post_set.size();
    }

    std::vector<Task> wave;
    wave.reserve(post_set.size());
    for (const auto &path : post_set) {
        auto env = operation.prepare(path);
        if (!env) {
            DirectoryResult result;
            result.status = NodeStatus::Failed;
            result.exit_class = ExitClass::Failure;
            result.error = env.error();
            print_result(path, result);
            record(path, std::move(result), summary);
            continue;
        }
        wave.push_back({path, std::move(*env)});
    }

    if (config.dry_run && !wave.empty()) {
        std::lock_guard lock(cout_tty_mtx);
        std::cout << "Unordered: " << wave.size() << " director" << (wave.size() == 1 ? "y" : "ies") << std::endl;
    }
    run_wave(wave, operation, summary);
    return {};
}

std::vector<NodeStatus> Executor::run_wave(const std::vector<Task> &wave, DirectoryOperation &operation,
                                           RunSummary &summary) {
    std::vector<NodeStatus> statuses(wave.size(), NodeStatus::Pending);
    if (wave.empty())
        return statuses;

    if (config.dry_run) {
        std::lock_guard lock(cout_tty_mtx);
        for (const auto &task : wave) {
            std::cout << "[DRY RUN] " << operation.name() << " -> " << display(task.path) << std::endl;
        }
        std::fill(statuses.begin(), statuses.end(), NodeStatus::Succeeded);
        return statuses;
    }

    std::atomic<size_t> next{0};

    auto worker = [&]() {
        while (true) {
            size_t i = next.fetch_add(1);
            if (i >= wave.size())
                return;
            const Task &task = wave[i];

            size_t now = running.fetch_add(1) + 1;
            size_t peak = peak_running.load();
            while (now > peak && !peak_running.compare_exchange_weak(peak, now)) {
            }

            {
                std::lock_guard lock(cout_tty_mtx);
                ++started;
                if (config.colors)
                    std::cout << BOLD;
                std::cout << "[" << started << "/" << total << "] ";
                if (config.colors)
                    std::cout << RESET << GREEN;
                std::cout << operation.name();
                if (config.colors)
                    std::cout << RESET;
                std::cout << " -> " << display(task.path) << std::endl;
            }
            {
                std::lock_guard lock(summary_mtx);
                summary.results[task.path].status = NodeStatus::Running;
            }

#if FF_tfwrap__profiling
            auto start = std::chrono::steady_clock::now();
#endif
            DirectoryResult result;
            try {
                result = operation.run(task.path, task.envvars);
            } catch (const std::exception &err) {
                result = DirectoryResult{};
                result.exit_class = ExitClass::Failure;
                result.exit_code = -1;
                result.error = err.what();
            }
#if FF_tfwrap__profiling
            auto end = std::chrono::steady_clock::now();
            std::chrono::duration<double> diff = end - start;
            {
                std::lock_guard lock(cout_tty_mtx);
                std::cout << display(task.path) << " took " << diff.count() << "s" << std::endl;
            }
#endif
            running.fetch_sub(1);

            result.status = result.exit_class == ExitClass::Failure ? NodeStatus::Failed : NodeStatus::Succeeded;
            statuses[i] = result.status;
            print_result(task.path, result);
            record(task.path, std::move(result), summary);
        }
    };

    size_t thread_count = std::min(config.jobs, wave.size());
    for (size_t i = 0; i < thread_count; ++i) {
        pool.emplace_back(worker);
    }

    pool.clear(); // Join all threads: the wave is a barrier
    return statuses;
}

void Executor::record(const std::string &path, DirectoryResult &&result, RunSummary &summary) {
    std::lock_guard lock(summary_mtx);
    switch (result.status) {
    case NodeStatus::Succeeded:
        summary.successes.push_back(path);
        break;
    case NodeStatus::Failed:
        summary.failures.push_back(path);
        break;
    case NodeStatus::Skipped:
        summary.not_applied.push_back(path);
        break;
    default:
        break;
    }
    summary.results[path] = std::move(result);
}

void Executor::print_result(const std::string &path, const DirectoryResult &result) {
    bool failed = result.status == NodeStatus::Failed;
    bool show_output = failed || (config.print_output && (!config.print_only_changes || result.has_changes()));

    std::lock_guard lock(cout_tty_mtx);
    if (failed) {
        if (config.colors)
            std::cerr << RED;
        std::cerr << "Failed: " << display(path);
        if (!result.error.empty())
            std::cerr << ": " << result.error;
        else
            std::cerr << " (exit code " << result.exit_code << ")";
        if (config.colors)
            std::cerr << RESET;
        std::cerr << std::endl;
    }

    if (!show_output || result.output.empty())
        return;

    std::cout << "---- " << display(path) << " ----\n";
    for (const auto &line : result.output) {
        std::cout << line << '\n';
    }
    std::cout << std::flush;
}

void Executor::print_summary(const RunSummary &summary, std::ostream &out) const {
    auto section = [&](std::string_view title, std::string_view color, const std::vector<std::string> &paths) {
        if (paths.empty())
            return;
        if (config.colors)
            out << color;
        out << title;
        if (config.colors)
            out << RESET;
        out << "\n";
        std::vector<std::string> sorted = paths;
        std::sort(sorted.begin(), sorted.end());
        for (const auto &path : sorted) {
            out << "  " << display(path) << "\n";
        }
    };

    out << "\n";
    section("Succeeded:", GREEN, summary.successes);
    section("Failed:", RED, summary.failures);
    section("Not applied because a dependency failed:", YELLOW, summary.not_applied);
    out << summary.successes.size() << " succeeded, " << summary.failures.size() << " failed, "
        << summary.not_applied.size() << " not applied" << std::endl;
}

void Executor::emit_graph(const DirectoryGraph &graph, std::ostream &out) const {
    out << "digraph tfwrap {\n";
    out << "  rankdir=LR;\n";
    out << "  node [shape=box, style=filled, fontname=\"Helvetica\"];\n";

    const auto &nodes = graph.nodes();
    for (size_t i = 0; i < nodes.size(); ++i) {
        const auto &node = nodes[i];
        std::string color = node.kind == NodeKind::Symlink ? "lightblue" : "white";
        out << "  n" << i << " [label=\"" << dot_label(display(node.path)) << "\", fillcolor=\"" << color << "\"];\n";

        for (size_t target_idx : node.out_edges) {
            out << "  n" << i << " -> n" << target_idx << ";\n";
        }
    }

    const auto &post = graph.post_set();
    for (size_t i = 0; i < post.size(); ++i) {
        out << "  p" << i << " [label=\"" << dot_label(display(post[i])) << "\", fillcolor=\"0.9 0.9 0.9\"];\n";
    }
    out << "}\n";
}

Result<void> Executor::write_graph_json(const DirectoryGraph &graph, const std::filesystem::path &file) const {
    using json = nlohmann::json;
    json doc;
    doc["nodes"] = json::array();
    doc["edges"] = json::array();

    const auto &nodes = graph.nodes();
    for (const auto &node : nodes) {
        json entry;
        entry["path"] = display(node.path);
        entry["kind"] = std::string(to_string(node.kind));
        if (node.kind == NodeKind::Symlink)
            entry["target"] = display(node.target);
        doc["nodes"].push_back(entry);

        for (size_t target_idx : node.out_edges) {
            doc["edges"].push_back(json::array({display(node.path), display(nodes[target_idx].path)}));
        }
    }

    json post = json::array();
    for (const auto &path : graph.post_set()) {
        post.push_back(display(path));
    }
    doc["post_set"] = post;

    std::ofstream f(file);
    f << doc.dump(4);
    if (!f) {
        return std::unexpected("Failed to write " + file.string());
    }
    return {};
}

} // namespace tfwrap
