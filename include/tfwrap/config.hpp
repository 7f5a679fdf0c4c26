#pragma once

#include "tfwrap/domain.hpp"
#include "tfwrap/utility.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace tfwrap {

inline constexpr std::string_view CONFIG_FILE_NAME = ".tf_wrapper";

enum class EnvVarSource { Ssm, Text };

struct EnvVarConfig {
    EnvVarSource source = EnvVarSource::Text;
    std::string path;  // parameter name, ssm only
    std::string value; // literal, text only
};

/**
 * @brief Per-directory wrapper settings merged from every `.tf_wrapper` between the repository root
 * and the directory.
 *
 * Override precedence: the nearest directory wins per key. `envvars` merge per variable name.
 * `depends_on` is never inherited, it is read only from the directory's own file.
 */
struct WrapperConfig {
    bool configure_backend = true;
    bool pipeline_check = true;
    bool backend_check = true;
    bool plan_check = true;
    std::optional<std::vector<std::string>> depends_on;
    std::map<std::string, EnvVarConfig> envvars;
    EnvVars resolved_envvars;
};

struct ConfigFile {
    std::filesystem::path directory; // directory holding the file
    YAML::Node document;
};

// Pure merge. `files` are ordered from the repository root downward.
Result<WrapperConfig> merge_configs(const std::vector<ConfigFile> &files, const std::filesystem::path &directory);

// `.tf_wrapper` files from `root` down to `directory`, root first. `directory` must be inside `root`.
std::vector<std::filesystem::path> discover_config_files(const std::filesystem::path &directory,
                                                         const std::filesystem::path &root);

Result<WrapperConfig> load_config(const std::filesystem::path &directory, const std::filesystem::path &root);

/**
 * @brief Source of secret values referenced by `envvars`.
 *
 * Implementations must be safe to call from several threads.
 */
class SecretStore {
public:
    virtual ~SecretStore() = default;
    virtual Result<std::string> get(const std::string &path) = 0;
};

// Reads SSM parameters through the AWS CLI. Values are cached for the lifetime of the store.
class SsmSecretStore : public SecretStore {
public:
    explicit SsmSecretStore(std::string aws_binary = "aws") : aws_binary(std::move(aws_binary)) {
    }

    Result<std::string> get(const std::string &path) override;

private:
    std::string aws_binary;
    std::map<std::string, std::string> cache;
    std::mutex cache_mtx;
};

Result<EnvVars> resolve_envvars(const WrapperConfig &config, SecretStore &store);

} // namespace tfwrap
