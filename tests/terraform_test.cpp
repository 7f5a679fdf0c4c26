#include "tests/test_suite.hpp"
#include "tests/testing_utils.hpp"

#include "tfwrap/plan_scan.hpp"
#include "tfwrap/source_analysis.hpp"
#include "tfwrap/terraform.hpp"

#include <filesystem>

using namespace tfwrap;
using tfwrap::testing::TempTree;

namespace {

class NoSecrets : public SecretStore {
public:
    Result<std::string> get(const std::string &path) override {
        return std::unexpected("no secrets in tests: " + path);
    }
};

// Stands in for the infrastructure tool: plan finds an IAM change.
const char *FAKE_TOOL = R"(#!/bin/sh
case "$1" in
  version) echo '{"terraform_version": "1.5.7", "platform": "linux_amd64"}'; exit 0 ;;
  init) echo "Terraform has been successfully initialized!"; exit 0 ;;
  plan) echo "  # aws_iam_role.deploy will be created"; echo "Plan: 1 to add"; exit 2 ;;
  show) echo '{"resource_changes": [{"address": "aws_iam_role.deploy", "type": "aws_iam_role", "change": {"actions": ["create"]}}]}'; exit 0 ;;
  validate) echo "Error: Unsupported argument" >&2; exit 1 ;;
esac
exit 1
)";

TerraformOptions options_for(const TempTree &tree) {
    TerraformOptions options;
    options.tool = "terraform";
    options.repo_root = tree.root();
    return options;
}

} // namespace

bool terraform_classify_exit_test() {
    TFWRAP_CHECK(classify_exit("plan", 0) == ExitClass::Success);
    TFWRAP_CHECK(classify_exit("plan", 2) == ExitClass::SuccessWithDiff);
    TFWRAP_CHECK(classify_exit("plan", 1) == ExitClass::Failure);
    TFWRAP_CHECK(classify_exit("apply", 2) == ExitClass::Failure);
    TFWRAP_CHECK(classify_exit("apply", 0) == ExitClass::Success);
    return true;
}

bool terraform_parse_version_test() {
    auto v = parse_version("1.5.7");
    TFWRAP_CHECK(v.has_value());
    TFWRAP_CHECK(v->major == 1 && v->minor == 5 && v->patch == 7);
    TFWRAP_CHECK(parse_version("v0.12.31").value() == (ToolVersion{0, 12, 31}));
    TFWRAP_CHECK(parse_version("1.6.0-beta1").value() == (ToolVersion{1, 6, 0}));
    TFWRAP_CHECK(!parse_version("1.2").has_value());
    TFWRAP_CHECK(!parse_version("abc").has_value());
    TFWRAP_CHECK((ToolVersion{0, 12, 31}) < (ToolVersion{1, 0, 0}));
    TFWRAP_CHECK(MIN_TOOL_VERSION.str() == "0.12.0");
    return true;
}

bool terraform_commands_test() {
    TempTree tree;
    tree.write("global.auto.tfvars", "region = \"eu-west-1\"\n");
    tree.write("team/team.auto.tfvars", "team = \"infra\"\n");
    tree.write("team/app/own.auto.tfvars", "x = 1\n");
    tree.config_dir("team/app");
    const std::string app = tree.path("team/app");

    NoSecrets secrets;
    TerraformRunner plan(options_for(tree), secrets);
    auto plan_args = plan.operation_command(app, std::filesystem::path("/out/plan.tfplan"));
    TFWRAP_CHECK(plan_args == std::vector<std::string>({
                                  "terraform",
                                  "plan",
                                  "-detailed-exitcode",
                                  "-input=false",
                                  "-out=/out/plan.tfplan",
                                  "-var-file=" + tree.path("global.auto.tfvars"),
                                  "-var-file=" + tree.path("team/team.auto.tfvars"),
                                  "-no-color",
                              }));

    WrapperConfig no_backend;
    no_backend.configure_backend = false;
    TFWRAP_CHECK(plan.init_command(no_backend) ==
                 std::vector<std::string>({"terraform", "init", "-input=false", "-backend=false", "-no-color"}));

    TerraformOptions apply_options = options_for(tree);
    apply_options.operation = "apply";
    apply_options.colors = true;
    apply_options.extra_args = {"-lock-timeout=60s"};
    TerraformRunner apply(apply_options, secrets);
    auto apply_args = apply.operation_command(app, std::nullopt);
    TFWRAP_CHECK(apply_args.size() == 7);
    TFWRAP_CHECK(apply_args[2] == "-auto-approve");
    TFWRAP_CHECK(apply_args.back() == "-lock-timeout=60s");
    TFWRAP_CHECK(apply.name() == "apply");

    TerraformOptions validate_options = options_for(tree);
    validate_options.operation = "validate";
    TerraformRunner validate(validate_options, secrets);
    TFWRAP_CHECK(validate.operation_command(app, std::nullopt) ==
                 std::vector<std::string>({"terraform", "validate", "-no-color"}));
    return true;
}

bool terraform_snapshot_directory_test() {
    TempTree tree;
    tree.config_dir("team/app");
    tree.write("bin/tool", FAKE_TOOL);
    std::filesystem::permissions(tree.path("bin/tool"), std::filesystem::perms::owner_all);

    TFWRAP_CHECK(check_tool_version(tree.path("bin/tool"), MIN_TOOL_VERSION).value() == (ToolVersion{1, 5, 7}));
    TFWRAP_CHECK(!check_tool_version(tree.path("bin/tool"), ToolVersion{2, 0, 0}).has_value());

    TerraformOptions options = options_for(tree);
    options.tool = tree.path("bin/tool");
    options.output_dir = tree.root() / "out";
    options.retry = false;

    NoSecrets secrets;
    TerraformRunner runner(options, secrets);
    const std::string app = tree.path("team/app");
    TFWRAP_CHECK(runner.snapshot_directory(app) == tree.root() / "out" / "team/app");

    auto env = runner.prepare(app);
    TFWRAP_CHECK(env.has_value());
    TFWRAP_CHECK(env->at("TF_IN_AUTOMATION") == "1");

    DirectoryResult result = runner.run(app, *env);
    TFWRAP_CHECK(result.exit_class == ExitClass::SuccessWithDiff);
    TFWRAP_CHECK(result.exit_code == 2);
    TFWRAP_CHECK(result.iam_changes);
    TFWRAP_CHECK(result.changed_resources == std::vector<std::string>({"aws_iam_role.deploy"}));
    TFWRAP_CHECK(std::filesystem::exists(tree.path("out/team/app/plan.json")));

    options.operation = "validate";
    options.output_dir.reset();
    TerraformRunner failing(options, secrets);
    TFWRAP_CHECK(failing.prepare(app).has_value());
    DirectoryResult failed = failing.run(app, *env);
    TFWRAP_CHECK(failed.exit_class == ExitClass::Failure);
    TFWRAP_CHECK(failed.exit_code == 1);
    return true;
}

bool plan_scan_text_test() {
    TFWRAP_CHECK(strip_ansi("\033[1m  # aws_iam_role.x\033[0m will be created") == "  # aws_iam_role.x will be created");

    TFWRAP_CHECK(has_iam_changes(std::vector<std::string>{
        "\033[1m  # aws_iam_policy.deploy\033[0m will be updated in-place"}));
    TFWRAP_CHECK(has_iam_changes(std::vector<std::string>{"  # module.ci.aws_iam_role.runner must be replaced"}));
    TFWRAP_CHECK(!has_iam_changes(std::vector<std::string>{
        "  # data.aws_iam_policy_document.assume will be read during apply"}));
    TFWRAP_CHECK(!has_iam_changes(std::vector<std::string>{"  # aws_s3_bucket.logs will be created"}));
    TFWRAP_CHECK(!has_iam_changes(std::vector<std::string>{}));
    return true;
}

bool plan_scan_json_test() {
    auto plan = nlohmann::json::parse(R"({
        "resource_changes": [
            {"address": "aws_iam_role.ci", "type": "aws_iam_role", "change": {"actions": ["no-op"]}},
            {"address": "data.aws_iam_policy_document.x", "type": "aws_iam_policy_document", "change": {"actions": ["read"]}},
            {"address": "aws_s3_bucket.logs", "type": "aws_s3_bucket", "change": {"actions": ["delete", "create"]}}
        ]
    })");
    TFWRAP_CHECK(!has_iam_changes(plan));
    TFWRAP_CHECK(changed_resources(plan) == std::vector<std::string>({"aws_s3_bucket.logs"}));

    plan["resource_changes"].push_back(
        {{"address", "aws_iam_policy.p"}, {"type", "aws_iam_policy"}, {"change", {{"actions", {"update"}}}}});
    TFWRAP_CHECK(has_iam_changes(plan));
    TFWRAP_CHECK(!has_iam_changes(nlohmann::json::object()));
    return true;
}

bool source_analysis_test() {
    TempTree tree;
    tree.config_dir("modules/net/sub");
    tree.config_dir("app", "# module \"old\" { source = \"../gone\" }\n"
                           "module \"net\" {\n"
                           "  source = \"../modules/net//sub\"\n"
                           "}\n"
                           "module \"remote\" {\n"
                           "  source = \"git::https://example.com/mod.git\"\n"
                           "}\n"
                           "variable \"region\" {\n"
                           "  default = \"eu # not a comment\"\n"
                           "}\n"
                           "/* variable \"hidden\" {} */\n");
    tree.write("app/backend.tf", "terraform {\n  backend \"s3\" {}\n}\n");

    const std::string app = tree.path("app");
    TFWRAP_CHECK(module_dependencies(app) == std::vector<std::string>({tree.path("modules/net/sub")}));
    TFWRAP_CHECK(declared_variables(app) == std::set<std::string>({"region"}));
    TFWRAP_CHECK(has_backend(app));
    TFWRAP_CHECK(!has_backend(tree.path("modules/net/sub")));
    TFWRAP_CHECK(source_files(app).size() == 2);

    TFWRAP_CHECK(strip_comments("a = \"#x\" # y") == "a = \"#x\"    ");
    TFWRAP_CHECK(is_auto_vars_file("/r/common.auto.tfvars"));
    TFWRAP_CHECK(!is_auto_vars_file("/r/common.tfvars"));
    return true;
}
