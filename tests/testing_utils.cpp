#include "tests/testing_utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <thread>

namespace tfwrap::testing {

TempTree::TempTree() {
    std::string pattern = (std::filesystem::temp_directory_path() / "tfwrap-test-XXXXXX").string();
    if (::mkdtemp(pattern.data()) == nullptr) {
        throw std::runtime_error("mkdtemp failed for " + pattern);
    }
    root_ = std::filesystem::canonical(pattern);
}

TempTree::~TempTree() {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
}

std::string TempTree::path(const std::string &rel) const {
    if (rel.empty() || rel == ".")
        return root_.string();
    return (root_ / rel).lexically_normal().string();
}

void TempTree::write(const std::string &rel, const std::string &content) const {
    std::filesystem::path file = root_ / rel;
    std::filesystem::create_directories(file.parent_path());
    std::ofstream f(file);
    f << content;
}

void TempTree::mkdir(const std::string &rel) const {
    std::filesystem::create_directories(root_ / rel);
}

void TempTree::symlink(const std::string &target_rel, const std::string &rel) const {
    std::filesystem::path link = root_ / rel;
    std::filesystem::create_directories(link.parent_path());
    std::filesystem::create_directory_symlink(root_ / target_rel, link);
}

void TempTree::config_dir(const std::string &rel, const std::string &main_tf) const {
    write(rel + "/main.tf", main_tf.empty() ? "resource \"null_resource\" \"this\" {}\n" : main_tf);
}

Result<EnvVars> FakeOperation::prepare(const std::string &directory) {
    if (prepare_fail.contains(directory))
        return std::unexpected("cannot resolve envvars for " + directory);
    return EnvVars{{"TFWRAP_DIR", directory}};
}

DirectoryResult FakeOperation::run(const std::string &directory, const EnvVars &) {
    size_t now = active.fetch_add(1) + 1;
    size_t peak = peak_active.load();
    while (now > peak && !peak_active.compare_exchange_weak(peak, now)) {
    }
    {
        std::lock_guard lock(mtx);
        calls.push_back(directory);
    }
    if (delay.count() > 0)
        std::this_thread::sleep_for(delay);

    DirectoryResult result;
    if (fail.contains(directory)) {
        result.exit_class = ExitClass::Failure;
        result.exit_code = 1;
        result.output = {"Error: scripted failure"};
    } else if (diff.contains(directory)) {
        result.exit_class = ExitClass::SuccessWithDiff;
        result.exit_code = 2;
        result.output = {"Plan: 1 to add, 0 to change, 0 to destroy."};
    }
    active.fetch_sub(1);
    return result;
}

std::vector<std::string> FakeOperation::invocations() const {
    std::lock_guard lock(mtx);
    return calls;
}

bool contains(const std::vector<std::string> &values, const std::string &value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

} // namespace tfwrap::testing
