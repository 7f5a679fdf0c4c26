#pragma once

#include "tfwrap/executor.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace tfwrap::testing {

// Scratch directory under the system temp dir, removed on destruction. Paths are canonical.
class TempTree {
public:
    TempTree();
    ~TempTree();
    TempTree(const TempTree &) = delete;
    TempTree &operator=(const TempTree &) = delete;

    const std::filesystem::path &root() const {
        return root_;
    }
    std::string path(const std::string &rel) const;

    // Creates parent directories as needed.
    void write(const std::string &rel, const std::string &content) const;
    void mkdir(const std::string &rel) const;
    // `rel` becomes a directory symlink to `target_rel`.
    void symlink(const std::string &target_rel, const std::string &rel) const;
    // Configuration directory with one `main.tf`.
    void config_dir(const std::string &rel, const std::string &main_tf = "") const;

private:
    std::filesystem::path root_;
};

/**
 * @brief Scripted DirectoryOperation that records what was called.
 *
 * Directories listed in `fail` exit 1, those in `diff` exit with a diff, those in `prepare_fail`
 * fail in prepare().
 */
class FakeOperation : public DirectoryOperation {
public:
    std::set<std::string> fail;
    std::set<std::string> diff;
    std::set<std::string> prepare_fail;
    std::chrono::milliseconds delay{0};

    std::string_view name() const override {
        return "fake";
    }
    Result<EnvVars> prepare(const std::string &directory) override;
    DirectoryResult run(const std::string &directory, const EnvVars &envvars) override;

    std::vector<std::string> invocations() const;
    size_t peak() const {
        return peak_active.load();
    }

private:
    mutable std::mutex mtx;
    std::vector<std::string> calls;
    std::atomic<size_t> active{0};
    std::atomic<size_t> peak_active{0};
};

bool contains(const std::vector<std::string> &values, const std::string &value);

} // namespace tfwrap::testing
