#pragma once

#include "tfwrap/config.hpp"
#include "tfwrap/domain.hpp"
#include "tfwrap/executor.hpp"
#include "tfwrap/utility.hpp"

#include <compare>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tfwrap {

struct ToolVersion {
    int major = 0;
    int minor = 0;
    int patch = 0;

    auto operator<=>(const ToolVersion &) const = default;
    std::string str() const;
};

inline constexpr ToolVersion MIN_TOOL_VERSION{0, 12, 0};

// Parses `X.Y.Z`, optionally prefixed with `v` and suffixed with a pre-release tag.
Result<ToolVersion> parse_version(std::string_view text);

// Binary named by TFWRAP_TOOL, or `terraform`.
std::string default_tool();

/**
 * @brief Startup precondition: the tool runs and is at least `minimum`.
 *
 * Reads `<tool> version -json`. Returns the detected version, or why the check failed.
 */
Result<ToolVersion> check_tool_version(const std::string &tool, ToolVersion minimum);

/**
 * @brief Exit status of `operation` read as success, success with a diff, or failure.
 *
 * Only `plan` runs with `-detailed-exitcode`, so 2 means "changes present" for plan alone.
 */
ExitClass classify_exit(std::string_view operation, int exit_code);

struct TerraformOptions {
    std::string tool = default_tool();
    std::string operation = "plan";
    std::vector<std::string> extra_args;
    std::filesystem::path repo_root;
    std::optional<std::filesystem::path> output_dir; ///< Snapshot root for plan artifacts.
    bool resolve_envvars = true;                     ///< False under --no-resolve-envvars.
    bool detect_iam = true;
    bool colors = false;
    bool print_command = false;
    bool retry = true;
    std::optional<std::string> audit_url; ///< Where each operation's outcome is posted. Not used for init.
};

/**
 * @brief Runs the infrastructure tool in one configuration directory.
 *
 * `init` always runs first, without the backend when `configure_backend` is false. Parent
 * `*.auto.tfvars` files are passed to plan and apply as `-var-file` arguments.
 */
class TerraformRunner : public DirectoryOperation {
public:
    TerraformRunner(TerraformOptions options, SecretStore &secrets);

    std::string_view name() const override {
        return options.operation;
    }
    Result<EnvVars> prepare(const std::string &directory) override;
    DirectoryResult run(const std::string &directory, const EnvVars &envvars) override;

    std::vector<std::string> init_command(const WrapperConfig &config) const;
    std::vector<std::string> operation_command(const std::string &directory,
                                               const std::optional<std::filesystem::path> &plan_file) const;

    // `<output_dir>/<directory relative to the repository root>`
    std::filesystem::path snapshot_directory(const std::string &directory) const;

private:
    Result<void> write_snapshot(const std::string &directory, const std::filesystem::path &plan_file,
                                const EnvVars &envvars, DirectoryResult &result) const;

    TerraformOptions options;
    SecretStore &secrets;
    std::map<std::string, WrapperConfig> configs; // filled by prepare()
    std::mutex configs_mtx;
};

} // namespace tfwrap
