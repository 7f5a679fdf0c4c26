#include "tests/test_suite.hpp"
#include "tests/testing_utils.hpp"

#include "tfwrap/cli.hpp"
#include "tfwrap/process_exec.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

using namespace tfwrap;
using tfwrap::testing::TempTree;

namespace {

std::string read_file(const std::string &path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void make_executable(const std::string &path) {
    std::filesystem::permissions(path, std::filesystem::perms::owner_all, std::filesystem::perm_options::add);
}

} // namespace

bool process_exec_output_test() {
    auto res = process_exec({"/bin/sh", "-c", "echo hello; echo oops >&2; printf 'no newline'; exit 3"});
    TFWRAP_CHECK(res.has_value());
    TFWRAP_CHECK(res->exit_code == 3);
    TFWRAP_CHECK(res->output.size() == 3);
    TFWRAP_CHECK(res->output[0] == "hello");
    TFWRAP_CHECK(res->output[2] == "no newline");

    CommandOptions stdout_only;
    stdout_only.capture_stderr = false;
    auto quiet = execute_command({"/bin/sh", "-c", "echo out; echo err >&2"}, stdout_only);
    TFWRAP_CHECK(quiet.has_value());
    TFWRAP_CHECK(quiet->exit_code == 0);
    TFWRAP_CHECK(quiet->output == std::vector<std::string>({"out"}));
    return true;
}

bool process_exec_env_and_cwd_test() {
    TempTree tree;
    ::setenv("TFWRAP_TEST_INHERITED", "parent", 1);
    ::setenv("TFWRAP_TEST_DROPPED", "parent", 1);

    CommandOptions options;
    options.cwd = tree.root();
    options.env = {{"TFWRAP_TEST_VALUE", "from-config"}, {"TFWRAP_TEST_DROPPED", ""}};
    auto res = process_exec({"/bin/sh", "-c",
                             "echo $TFWRAP_TEST_VALUE; echo $TFWRAP_TEST_INHERITED; "
                             "echo ${TFWRAP_TEST_DROPPED-unset}; pwd -P"},
                            options);
    TFWRAP_CHECK(res.has_value());
    TFWRAP_CHECK(res->exit_code == 0);
    TFWRAP_CHECK(res->output ==
                 std::vector<std::string>({"from-config", "parent", "unset", tree.root().string()}));
    return true;
}

bool process_exec_stdin_test() {
    CommandOptions options;
    options.input = "first\nsecond\n";
    auto res = process_exec({"/bin/sh", "-c", "cat; echo done"}, options);
    TFWRAP_CHECK(res.has_value());
    TFWRAP_CHECK(res->output == std::vector<std::string>({"first", "second", "done"}));

    // A child that never reads its input still completes.
    options.input = std::string(1 << 20, 'x');
    auto ignored = process_exec({"/bin/sh", "-c", "exit 4"}, options);
    TFWRAP_CHECK(ignored.has_value());
    TFWRAP_CHECK(ignored->exit_code == 4);
    return true;
}

bool process_audit_post_test() {
    TempTree tree;
    tree.mkdir(".git");
    tree.config_dir("team/app");
    tree.write("curl", "#!/bin/sh\n"
                       "printf '%s\\n' \"$@\" > \"" + tree.path("args") + "\"\n"
                       "cat > \"" + tree.path("body") + "\"\n");
    make_executable(tree.path("curl"));
    tree.write("curl-down", "#!/bin/sh\necho 'Could not resolve host'\nexit 6\n");
    make_executable(tree.path("curl-down"));

    const char *saved_user = std::getenv("USER");
    const std::string user_before = saved_user ? saved_user : "";
    ::setenv("USER", "tfwrap-tester", 1);
    ::setenv("TFWRAP_CURL", tree.path("curl").c_str(), 1);

    CommandOptions options;
    options.cwd = tree.path("team/app");
    options.audit_url = "https://audit.example.com/runs";
    auto res = execute_command({"/bin/sh", "-c", "echo 'Plan: 1 to add'; exit 2"}, options);
    TFWRAP_CHECK(res.has_value());
    TFWRAP_CHECK(res->exit_code == 2);

    auto body = nlohmann::json::parse(read_file(tree.path("body")));
    TFWRAP_CHECK(body.at("directory") == "team/app");
    TFWRAP_CHECK(body.at("status") == "FAILED");
    TFWRAP_CHECK(body.at("run_by") == "tfwrap-tester");
    TFWRAP_CHECK(body.at("output") == nlohmann::json::array({"Plan: 1 to add"}));

    std::string args = read_file(tree.path("args"));
    TFWRAP_CHECK(args.find("POST\n") != std::string::npos);
    TFWRAP_CHECK(args.find("@-\n") != std::string::npos);
    TFWRAP_CHECK(args.find("https://audit.example.com/runs\n") != std::string::npos);

    TFWRAP_CHECK(post_audit_record("https://audit.example.com/runs", tree.path("team/app"), 0, {}).has_value());
    TFWRAP_CHECK(nlohmann::json::parse(read_file(tree.path("body"))).at("status") == "SUCCESS");

    // An unreachable endpoint is reported but leaves the command result alone.
    ::setenv("TFWRAP_CURL", tree.path("curl-down").c_str(), 1);
    auto down = post_audit_record("https://audit.example.com/runs", tree.path("team/app"), 0, {});
    TFWRAP_CHECK(!down.has_value());
    TFWRAP_CHECK(down.error().find("exited with 6") != std::string::npos);
    auto still_ok = execute_command({"/bin/sh", "-c", "exit 0"}, options);

    ::unsetenv("TFWRAP_CURL");
    if (saved_user)
        ::setenv("USER", user_before.c_str(), 1);
    else
        ::unsetenv("USER");

    TFWRAP_CHECK(still_ok.has_value());
    TFWRAP_CHECK(still_ok->exit_code == 0);
    return true;
}

bool process_exec_missing_binary_test() {
    auto res = process_exec({"/nonexistent/tfwrap-binary"});
    TFWRAP_CHECK(!res.has_value());
    TFWRAP_CHECK(res.error().find("/nonexistent/tfwrap-binary") != std::string::npos);
    TFWRAP_CHECK(!process_exec({}).has_value());
    return true;
}

bool process_retriable_errors_test() {
    std::vector<std::string> output = {
        "Initializing the backend...",
        "Error: RequestError: send request failed",
        "caused by: read tcp: connection reset by peer",
        "Error: Invalid reference",
    };
    auto found = retriable_errors(output);
    TFWRAP_CHECK(found.size() == 2);
    TFWRAP_CHECK(found[0] == output[1]);
    TFWRAP_CHECK(retriable_errors({"Error: Unsupported argument"}).empty());

    // non-transient failures are not retried
    CommandOptions options;
    options.retry = true;
    auto res = execute_command({"/bin/sh", "-c", "echo 'Error: Invalid reference'; exit 1"}, options);
    TFWRAP_CHECK(res.has_value());
    TFWRAP_CHECK(res->exit_code == 1);

    TFWRAP_CHECK(join_command({"terraform", "plan", "-input=false"}) == "terraform plan -input=false");
    return true;
}

bool cli_arguments_test() {
    ArgumentSpec spec;
    spec.flags = {"debug"};
    spec.options = {"path", "parallel-jobs"};
    spec.allow_positional = true;

    const char *argv[] = {"tf_graph_apply", "--path", "config", "--parallel-jobs=8", "--debug", "--", "-target=x"};
    auto args = parse_arguments(7, const_cast<char **>(argv), spec);
    TFWRAP_CHECK(args.has_value());
    TFWRAP_CHECK(args->get("path") == "config");
    TFWRAP_CHECK(args->has("debug"));
    TFWRAP_CHECK(args->positional == std::vector<std::string>({"-target=x"}));
    TFWRAP_CHECK(parallel_jobs(*args).value() == 8);

    const char *defaults[] = {"tf_graph_apply"};
    auto none = parse_arguments(1, const_cast<char **>(defaults), spec);
    TFWRAP_CHECK(none.has_value());
    TFWRAP_CHECK(parallel_jobs(*none).value() == 4);
    TFWRAP_CHECK(!none->get("path").has_value());

    const char *unknown[] = {"tf_graph_apply", "--bogus"};
    TFWRAP_CHECK(!parse_arguments(2, const_cast<char **>(unknown), spec).has_value());
    const char *dangling[] = {"tf_graph_apply", "--path"};
    TFWRAP_CHECK(!parse_arguments(2, const_cast<char **>(dangling), spec).has_value());
    return true;
}

bool cli_parse_positive_int_test() {
    TFWRAP_CHECK(parse_positive_int("4").value() == 4);
    TFWRAP_CHECK(parse_positive_int("16").value() == 16);
    TFWRAP_CHECK(!parse_positive_int("abc").has_value());
    TFWRAP_CHECK(!parse_positive_int("0").has_value());
    TFWRAP_CHECK(!parse_positive_int("-2").has_value());
    TFWRAP_CHECK(!parse_positive_int("3x").has_value());
    TFWRAP_CHECK(!parse_positive_int("").has_value());

    ArgumentSpec spec;
    spec.options = {"parallel-jobs"};
    const char *argv[] = {"tf_graph_apply", "--parallel-jobs=abc"};
    auto args = parse_arguments(2, const_cast<char **>(argv), spec);
    TFWRAP_CHECK(args.has_value());
    auto jobs = parallel_jobs(*args);
    TFWRAP_CHECK(!jobs.has_value());
    TFWRAP_CHECK(jobs.error().find("abc") != std::string::npos);
    return true;
}
