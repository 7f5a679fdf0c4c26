#include "tfwrap/config.hpp"

#include "tfwrap/process_exec.hpp"
#include "tfwrap/utility.hpp"

#include <filesystem>
#include <yaml-cpp/yaml.h>

namespace tfwrap {

namespace {

Result<bool> read_bool(const YAML::Node &node, std::string_view key) {
    try {
        return node.as<bool>();
    } catch (const YAML::Exception &e) {
        return std::unexpected("Expected a boolean for '" + std::string(key) + "': " + e.what());
    }
}

Result<EnvVarConfig> read_envvar(const std::string &name, const YAML::Node &node) {
    if (!node.IsMap()) {
        return std::unexpected("envvar '" + name + "' must be a map with a 'source' key");
    }
    try {
        EnvVarConfig var;
        std::string source = node["source"] ? node["source"].as<std::string>() : "";
        if (source == "ssm") {
            if (!node["path"])
                return std::unexpected("envvar '" + name + "' has source ssm but no path");
            var.source = EnvVarSource::Ssm;
            var.path = node["path"].as<std::string>();
        } else if (source == "text") {
            if (!node["value"])
                return std::unexpected("envvar '" + name + "' has source text but no value");
            var.source = EnvVarSource::Text;
            var.value = node["value"].as<std::string>();
        } else {
            return std::unexpected("envvar '" + name + "' has an invalid source: '" + source + "'");
        }
        return var;
    } catch (const YAML::Exception &e) {
        return std::unexpected("Malformed envvar '" + name + "': " + e.what());
    }
}

Result<void> apply_document(WrapperConfig &config, const ConfigFile &file, bool own_file) {
    const YAML::Node &doc = file.document;
    if (!doc || doc.IsNull())
        return {};
    if (!doc.IsMap()) {
        return std::unexpected("Config in " + file.directory.string() + " is not a map");
    }

    const std::pair<std::string_view, bool *> flags[] = {
        {"configure_backend", &config.configure_backend},
        {"pipeline_check", &config.pipeline_check},
        {"backend_check", &config.backend_check},
        {"plan_check", &config.plan_check},
    };
    for (const auto &[key, field] : flags) {
        if (auto node = doc[std::string(key)]; node) {
            auto value = read_bool(node, key);
            if (!value)
                return std::unexpected(file.directory.string() + ": " + value.error());
            *field = *value;
        }
    }

    if (auto envvars = doc["envvars"]; envvars) {
        if (!envvars.IsMap()) {
            return std::unexpected(file.directory.string() + ": envvars must be a map");
        }
        for (const auto &entry : envvars) {
            std::string name;
            try {
                name = entry.first.as<std::string>();
            } catch (const YAML::Exception &e) {
                return std::unexpected(file.directory.string() + ": envvar names must be strings: " + e.what());
            }
            if (entry.second.IsNull()) {
                config.envvars.erase(name); // explicit null unsets an inherited variable
                continue;
            }
            auto var = read_envvar(name, entry.second);
            if (!var)
                return std::unexpected(file.directory.string() + ": " + var.error());
            config.envvars[name] = std::move(*var);
        }
    }

    if (own_file) {
        if (auto deps = doc["depends_on"]; deps) {
            std::vector<std::string> paths;
            if (deps.IsSequence()) {
                try {
                    for (const auto &dep : deps) {
                        paths.push_back(dep.as<std::string>());
                    }
                } catch (const YAML::Exception &e) {
                    return std::unexpected(file.directory.string() + ": malformed depends_on: " + e.what());
                }
            } else if (!deps.IsNull()) {
                return std::unexpected(file.directory.string() + ": depends_on must be a list");
            }
            config.depends_on = std::move(paths);
        }
    }
    return {};
}

} // namespace

Result<WrapperConfig> merge_configs(const std::vector<ConfigFile> &files, const std::filesystem::path &directory) {
    WrapperConfig config;
    const std::string own = normalize_path(directory);
    for (const auto &file : files) {
        if (auto res = apply_document(config, file, normalize_path(file.directory) == own); !res) {
            return std::unexpected(res.error());
        }
    }
    return config;
}

std::vector<std::filesystem::path> discover_config_files(const std::filesystem::path &directory,
                                                         const std::filesystem::path &root) {
    const std::string dir = normalize_path(directory);
    const std::string top = normalize_path(root);

    std::vector<std::filesystem::path> candidates;
    if (is_within(dir, top)) {
        std::filesystem::path current = top;
        candidates.push_back(current / CONFIG_FILE_NAME);
        std::filesystem::path rel = relative_to(dir, top);
        if (rel != ".") {
            for (const auto &part : rel) {
                current /= part;
                candidates.push_back(current / CONFIG_FILE_NAME);
            }
        }
    } else {
        candidates.push_back(std::filesystem::path(dir) / CONFIG_FILE_NAME);
    }

    std::vector<std::filesystem::path> found;
    for (auto &candidate : candidates) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec)) {
            found.push_back(std::move(candidate));
        }
    }
    return found;
}

Result<WrapperConfig> load_config(const std::filesystem::path &directory, const std::filesystem::path &root) {
    std::vector<ConfigFile> files;
    for (const auto &path : discover_config_files(directory, root)) {
        try {
            files.push_back({path.parent_path(), YAML::LoadFile(path.string())});
        } catch (const YAML::Exception &e) {
            return std::unexpected("Failed to parse " + path.string() + ": " + e.what());
        }
    }
    return merge_configs(files, directory);
}

Result<std::string> SsmSecretStore::get(const std::string &path) {
    {
        std::lock_guard lock(cache_mtx);
        if (auto it = cache.find(path); it != cache.end()) {
            return it->second;
        }
    }

    CommandOptions options;
    options.retry = true;
    options.capture_stderr = false;
    auto res = execute_command({aws_binary, "ssm", "get-parameter", "--name", path, "--with-decryption", "--query",
                                "Parameter.Value", "--output", "text"},
                               options);
    if (!res)
        return std::unexpected(res.error());
    if (res->exit_code != 0) {
        return std::unexpected("aws ssm get-parameter exited with " + std::to_string(res->exit_code) + " for " +
                               path);
    }

    std::string value;
    for (const auto &line : res->output) {
        if (!value.empty())
            value += '\n';
        value += line;
    }
    while (!value.empty() && (value.back() == '\n' || value.back() == '\r')) {
        value.pop_back();
    }

    std::lock_guard lock(cache_mtx);
    cache.emplace(path, value);
    return value;
}

Result<EnvVars> resolve_envvars(const WrapperConfig &config, SecretStore &store) {
    EnvVars resolved = config.resolved_envvars;
    for (const auto &[name, var] : config.envvars) {
        if (var.source == EnvVarSource::Text) {
            resolved[name] = var.value;
            continue;
        }
        auto value = store.get(var.path);
        if (!value) {
            return std::unexpected("Failed to resolve envvar " + name + " from ssm:" + var.path + ": " +
                                   value.error());
        }
        resolved[name] = std::move(*value);
    }
    return resolved;
}

} // namespace tfwrap
