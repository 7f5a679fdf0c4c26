#include "tfwrap/plan_scan.hpp"

#include <regex>

namespace tfwrap {

namespace {

const std::regex &iam_change_pattern() {
    static const std::regex re(
        R"re(#\s+(module\.\S+\.)?(data\.)?aws_iam_\w+\.\S+\s+(will be|must be|has changed))re");
    return re;
}

bool is_mutating(const nlohmann::json &actions) {
    if (!actions.is_array())
        return false;
    for (const auto &action : actions) {
        if (!action.is_string())
            continue;
        auto name = action.get<std::string>();
        if (name != "no-op" && name != "read")
            return true;
    }
    return false;
}

} // namespace

std::string strip_ansi(std::string_view line) {
    std::string out;
    out.reserve(line.size());
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '\033' && i + 1 < line.size() && line[i + 1] == '[') {
            i += 2;
            while (i < line.size() && !(line[i] >= '@' && line[i] <= '~')) {
                ++i;
            }
            continue;
        }
        out.push_back(line[i]);
    }
    return out;
}

bool has_iam_changes(const std::vector<std::string> &plan_output) {
    for (const auto &line : plan_output) {
        std::string clean = strip_ansi(line);
        if (clean.find("aws_iam_") == std::string::npos)
            continue;
        if (clean.find("will be read") != std::string::npos)
            continue;
        if (std::regex_search(clean, iam_change_pattern()))
            return true;
    }
    return false;
}

bool has_iam_changes(const nlohmann::json &plan) {
    auto it = plan.find("resource_changes");
    if (it == plan.end() || !it->is_array())
        return false;
    for (const auto &change : *it) {
        std::string type = change.value("type", "");
        if (!type.starts_with("aws_iam"))
            continue;
        if (change.contains("change") && is_mutating(change["change"].value("actions", nlohmann::json::array())))
            return true;
    }
    return false;
}

std::vector<std::string> changed_resources(const nlohmann::json &plan) {
    std::vector<std::string> addresses;
    auto it = plan.find("resource_changes");
    if (it == plan.end() || !it->is_array())
        return addresses;
    for (const auto &change : *it) {
        if (change.contains("change") && is_mutating(change["change"].value("actions", nlohmann::json::array()))) {
            addresses.push_back(change.value("address", ""));
        }
    }
    return addresses;
}

} // namespace tfwrap
