#pragma once

#include "tfwrap/utility.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace tfwrap {

std::string strip_ansi(std::string_view line);

// Plan text lines such as `# aws_iam_role.deploy will be created`.
bool has_iam_changes(const std::vector<std::string> &plan_output);

// `resource_changes` of a `show -json` document whose type starts with `aws_iam` and that do more than read.
bool has_iam_changes(const nlohmann::json &plan);

// Resource addresses changed by a `show -json` document, for the snapshot summary.
std::vector<std::string> changed_resources(const nlohmann::json &plan);

} // namespace tfwrap
