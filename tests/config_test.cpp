#include "tests/test_suite.hpp"
#include "tests/testing_utils.hpp"

#include "tfwrap/config.hpp"

#include <map>

using namespace tfwrap;
using tfwrap::testing::TempTree;

namespace {

class MapSecretStore : public SecretStore {
public:
    std::map<std::string, std::string> values;
    size_t lookups = 0;

    Result<std::string> get(const std::string &path) override {
        ++lookups;
        if (auto it = values.find(path); it != values.end())
            return it->second;
        return std::unexpected("ParameterNotFound: " + path);
    }
};

} // namespace

bool config_merge_precedence_test() {
    std::vector<ConfigFile> files = {
        {"/repo", YAML::Load("configure_backend: false\n"
                             "backend_check: false\n"
                             "envvars:\n"
                             "  A: {source: text, value: root}\n"
                             "  B: {source: text, value: rootB}\n")},
        {"/repo/team/app", YAML::Load("configure_backend: true\n"
                                      "envvars:\n"
                                      "  A: {source: text, value: child}\n"
                                      "  C: {source: ssm, path: /team/secret}\n")},
    };

    auto config = merge_configs(files, "/repo/team/app");
    TFWRAP_CHECK(config.has_value());
    TFWRAP_CHECK(config->configure_backend);
    TFWRAP_CHECK(!config->backend_check);
    TFWRAP_CHECK(config->pipeline_check);
    TFWRAP_CHECK(config->plan_check);
    TFWRAP_CHECK(config->envvars.size() == 3);
    TFWRAP_CHECK(config->envvars.at("A").value == "child");
    TFWRAP_CHECK(config->envvars.at("B").value == "rootB");
    TFWRAP_CHECK(config->envvars.at("C").source == EnvVarSource::Ssm);
    TFWRAP_CHECK(config->envvars.at("C").path == "/team/secret");

    auto empty = merge_configs({}, "/repo/x");
    TFWRAP_CHECK(empty.has_value());
    TFWRAP_CHECK(empty->configure_backend && !empty->depends_on.has_value());
    return true;
}

bool config_depends_on_not_inherited_test() {
    TempTree tree;
    tree.write(".tf_wrapper", "depends_on: [shared]\n");
    tree.config_dir("app");
    tree.write("app/.tf_wrapper", "pipeline_check: false\n");
    tree.config_dir("db");
    tree.write("db/.tf_wrapper", "depends_on: []\n");

    auto files = discover_config_files(tree.path("app"), tree.root());
    TFWRAP_CHECK(files.size() == 2);
    TFWRAP_CHECK(files.front().parent_path() == tree.root());

    auto app = load_config(tree.path("app"), tree.root());
    TFWRAP_CHECK(app.has_value());
    TFWRAP_CHECK(!app->depends_on.has_value());
    TFWRAP_CHECK(!app->pipeline_check);

    auto db = load_config(tree.path("db"), tree.root());
    TFWRAP_CHECK(db.has_value());
    TFWRAP_CHECK(db->depends_on.has_value() && db->depends_on->empty());

    auto root = load_config(tree.root(), tree.root());
    TFWRAP_CHECK(root.has_value());
    TFWRAP_CHECK(root->depends_on == std::vector<std::string>({"shared"}));
    return true;
}

bool config_envvar_unset_test() {
    std::vector<ConfigFile> files = {
        {"/repo", YAML::Load("envvars:\n  TOKEN: {source: text, value: x}\n  KEEP: {source: text, value: y}\n")},
        {"/repo/app", YAML::Load("envvars:\n  TOKEN: null\n")},
    };
    auto config = merge_configs(files, "/repo/app");
    TFWRAP_CHECK(config.has_value());
    TFWRAP_CHECK(!config->envvars.contains("TOKEN"));
    TFWRAP_CHECK(config->envvars.contains("KEEP"));
    return true;
}

bool config_invalid_test() {
    auto bad_bool = merge_configs({{"/repo", YAML::Load("plan_check: maybe\n")}}, "/repo");
    TFWRAP_CHECK(!bad_bool.has_value());
    TFWRAP_CHECK(bad_bool.error().find("plan_check") != std::string::npos);

    auto bad_source = merge_configs({{"/repo", YAML::Load("envvars:\n  X: {source: vault, path: a}\n")}}, "/repo");
    TFWRAP_CHECK(!bad_source.has_value());

    auto bad_deps = merge_configs({{"/repo", YAML::Load("depends_on: vpc\n")}}, "/repo");
    TFWRAP_CHECK(!bad_deps.has_value());

    auto list_key = merge_configs({{"/repo", YAML::Load("envvars:\n  ? [A, B]\n  : {source: text, value: x}\n")}},
                                  "/repo");
    TFWRAP_CHECK(!list_key.has_value());
    TFWRAP_CHECK(list_key.error().find("envvar names") != std::string::npos);

    TempTree tree;
    tree.config_dir("app");
    tree.write("app/.tf_wrapper", "depends_on: [unterminated\n");
    auto broken = load_config(tree.path("app"), tree.root());
    TFWRAP_CHECK(!broken.has_value());
    TFWRAP_CHECK(broken.error().find(".tf_wrapper") != std::string::npos);
    return true;
}

bool config_resolve_envvars_test() {
    WrapperConfig config;
    config.envvars["PLAIN"] = {EnvVarSource::Text, "", "value"};
    config.envvars["SECRET"] = {EnvVarSource::Ssm, "/app/db-password", ""};

    MapSecretStore store;
    store.values["/app/db-password"] = "hunter2";
    auto env = resolve_envvars(config, store);
    TFWRAP_CHECK(env.has_value());
    TFWRAP_CHECK(env->at("PLAIN") == "value");
    TFWRAP_CHECK(env->at("SECRET") == "hunter2");
    TFWRAP_CHECK(store.lookups == 1);

    config.envvars["MISSING"] = {EnvVarSource::Ssm, "/app/none", ""};
    auto missing = resolve_envvars(config, store);
    TFWRAP_CHECK(!missing.has_value());
    TFWRAP_CHECK(missing.error().find("MISSING") != std::string::npos);
    return true;
}
