#include "tfwrap/terraform.hpp"

#include "tfwrap/plan_scan.hpp"
#include "tfwrap/process_exec.hpp"
#include "tfwrap/source_analysis.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>

namespace tfwrap {

namespace {

bool uses_var_files(std::string_view operation) {
    return operation == "plan" || operation == "apply" || operation == "destroy" || operation == "import" ||
           operation == "refresh";
}

} // namespace

std::string ToolVersion::str() const {
    return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
}

Result<ToolVersion> parse_version(std::string_view text) {
    if (!text.empty() && text.front() == 'v')
        text.remove_prefix(1);

    ToolVersion version;
    int *fields[] = {&version.major, &version.minor, &version.patch};
    const char *ptr = text.data();
    const char *end = text.data() + text.size();
    for (size_t i = 0; i < 3; ++i) {
        auto [next, ec] = std::from_chars(ptr, end, *fields[i]);
        if (ec != std::errc{}) {
            return std::unexpected("Malformed version: " + std::string(text));
        }
        ptr = next;
        if (i < 2) {
            if (ptr == end || *ptr != '.')
                return std::unexpected("Malformed version: " + std::string(text));
            ++ptr;
        }
    }
    return version;
}

std::string default_tool() {
    if (const char *tool = std::getenv("TFWRAP_TOOL"); tool && *tool)
        return tool;
    return "terraform";
}

Result<ToolVersion> check_tool_version(const std::string &tool, ToolVersion minimum) {
    CommandOptions options;
    options.capture_stderr = false;
    auto res = execute_command({tool, "version", "-json"}, options);
    if (!res)
        return std::unexpected(res.error());
    if (res->exit_code != 0 || res->output.empty()) {
        return std::unexpected(tool + " version exited with " + std::to_string(res->exit_code));
    }

    std::string text;
    for (const auto &line : res->output) {
        text += line;
        text += '\n';
    }

    std::string version_text;
    try {
        auto doc = nlohmann::json::parse(text);
        version_text = doc.at("terraform_version").get<std::string>();
    } catch (const nlohmann::json::exception &) {
        // Releases before 0.13 print `Terraform v0.12.31` and ignore -json.
        const std::string &first = res->output.front();
        auto pos = first.find(" v");
        if (pos == std::string::npos)
            return std::unexpected("Cannot read version from: " + first);
        version_text = first.substr(pos + 1);
    }

    auto version = parse_version(version_text);
    if (!version)
        return version;
    if (*version < minimum) {
        return std::unexpected(tool + " " + version->str() + " is older than the required " + minimum.str());
    }
    return version;
}

ExitClass classify_exit(std::string_view operation, int exit_code) {
    if (exit_code == 0)
        return ExitClass::Success;
    if (operation == "plan" && exit_code == 2)
        return ExitClass::SuccessWithDiff;
    return ExitClass::Failure;
}

TerraformRunner::TerraformRunner(TerraformOptions options, SecretStore &secrets)
    : options(std::move(options)), secrets(secrets) {
    if (this->options.repo_root.empty())
        this->options.repo_root = std::filesystem::current_path();
}

Result<EnvVars> TerraformRunner::prepare(const std::string &directory) {
    auto config = load_config(directory, options.repo_root);
    if (!config)
        return std::unexpected(config.error());

    EnvVars env;
    if (options.resolve_envvars) {
        auto resolved = resolve_envvars(*config, secrets);
        if (!resolved)
            return std::unexpected(resolved.error());
        env = std::move(*resolved);
    }
    env["TF_IN_AUTOMATION"] = "1";

    std::lock_guard lock(configs_mtx);
    configs[directory] = std::move(*config);
    return env;
}

std::vector<std::string> TerraformRunner::init_command(const WrapperConfig &config) const {
    std::vector<std::string> args{options.tool, "init", "-input=false"};
    if (!config.configure_backend)
        args.emplace_back("-backend=false");
    if (!options.colors)
        args.emplace_back("-no-color");
    return args;
}

std::vector<std::string> TerraformRunner::operation_command(
    const std::string &directory, const std::optional<std::filesystem::path> &plan_file) const {
    std::vector<std::string> args{options.tool, options.operation};
    const std::string &op = options.operation;
    if (op == "plan") {
        args.emplace_back("-detailed-exitcode");
        args.emplace_back("-input=false");
        if (plan_file)
            args.push_back("-out=" + plan_file->string());
    } else if (op == "apply" || op == "destroy") {
        args.emplace_back("-auto-approve");
        args.emplace_back("-input=false");
    }
    if (uses_var_files(op)) {
        for (const auto &file : parent_auto_var_files(directory, options.repo_root)) {
            args.push_back("-var-file=" + file.string());
        }
    }
    if (!options.colors && op != "fmt")
        args.emplace_back("-no-color");
    args.insert(args.end(), options.extra_args.begin(), options.extra_args.end());
    return args;
}

std::filesystem::path TerraformRunner::snapshot_directory(const std::string &directory) const {
    if (!options.output_dir)
        return {};
    std::string rel = relative_to(normalize_path(directory), normalize_path(options.repo_root));
    if (!rel.empty() && rel.front() == '/')
        rel.erase(0, 1); // outside the repository: mirror the absolute path
    return *options.output_dir / rel;
}

DirectoryResult TerraformRunner::run(const std::string &directory, const EnvVars &envvars) {
    DirectoryResult result;
    result.exit_class = ExitClass::Failure;

    WrapperConfig config;
    {
        std::lock_guard lock(configs_mtx);
        if (auto it = configs.find(directory); it != configs.end())
            config = it->second;
    }

    CommandOptions cmd;
    cmd.cwd = directory;
    cmd.env = envvars;
    cmd.retry = options.retry;
    cmd.print_command = options.print_command;

    auto init = execute_command(init_command(config), cmd);
    if (!init) {
        result.error = init.error();
        return result;
    }
    if (init->exit_code != 0) {
        result.exit_code = init->exit_code;
        result.output = std::move(init->output);
        result.error = "init exited with " + std::to_string(result.exit_code);
        return result;
    }

    std::optional<std::filesystem::path> plan_file;
    if (options.output_dir && options.operation == "plan") {
        auto dir = snapshot_directory(directory);
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            result.error = "Cannot create " + dir.string() + ": " + ec.message();
            return result;
        }
        plan_file = dir / "plan.tfplan";
    }

    CommandOptions op_cmd = cmd;
    op_cmd.audit_url = options.audit_url;
    auto op = execute_command(operation_command(directory, plan_file), op_cmd);
    if (!op) {
        result.error = op.error();
        return result;
    }
    result.exit_code = op->exit_code;
    result.exit_class = classify_exit(options.operation, op->exit_code);
    result.output = std::move(op->output);

    if (result.exit_class == ExitClass::Failure)
        return result;

    if (options.detect_iam && options.operation == "plan")
        result.iam_changes = has_iam_changes(result.output);

    if (plan_file) {
        if (auto res = write_snapshot(directory, *plan_file, envvars, result); !res) {
            result.exit_class = ExitClass::Failure;
            result.error = res.error();
        }
    }
    return result;
}

Result<void> TerraformRunner::write_snapshot(const std::string &directory, const std::filesystem::path &plan_file,
                                             const EnvVars &envvars, DirectoryResult &result) const {
    CommandOptions cmd;
    cmd.cwd = directory;
    cmd.env = envvars;
    cmd.capture_stderr = false;
    auto show = execute_command({options.tool, "show", "-json", plan_file.string()}, cmd);
    if (!show)
        return std::unexpected(show.error());
    if (show->exit_code != 0) {
        return std::unexpected("show -json exited with " + std::to_string(show->exit_code));
    }

    std::string text;
    for (const auto &line : show->output) {
        text += line;
        text += '\n';
    }

    nlohmann::json plan;
    try {
        plan = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error &err) {
        return std::unexpected("Cannot convert " + plan_file.string() + ": " + err.what());
    }

    if (options.detect_iam && has_iam_changes(plan))
        result.iam_changes = true;
    result.changed_resources = changed_resources(plan);

    auto json_path = plan_file.parent_path() / "plan.json";
    std::ofstream f(json_path);
    f << plan.dump(4);
    if (!f) {
        return std::unexpected("Failed to write " + json_path.string());
    }
    return {};
}

} // namespace tfwrap
