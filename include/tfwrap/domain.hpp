#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace tfwrap {

enum class NodeKind : uint8_t { Regular, Symlink };

enum class NodeStatus : uint8_t { Pending, Running, Succeeded, Failed, Skipped };

// How the external tool's exit status is read. SuccessWithDiff is a plan that found changes.
enum class ExitClass : uint8_t { Success, SuccessWithDiff, Failure };

using EnvVars = std::map<std::string, std::string>;

struct DirectoryResult {
    NodeStatus status = NodeStatus::Pending;
    ExitClass exit_class = ExitClass::Success;
    int exit_code = 0;
    std::vector<std::string> output;
    bool iam_changes = false;
    std::vector<std::string> changed_resources; ///< Addresses from the plan snapshot, when one was written.
    std::string error; // set when the failure did not come from the tool itself

    bool has_changes() const {
        return exit_class == ExitClass::SuccessWithDiff;
    }
};

std::string_view to_string(NodeStatus status);
std::string_view to_string(NodeKind kind);

inline bool is_terminal(NodeStatus status) {
    return status == NodeStatus::Succeeded || status == NodeStatus::Failed || status == NodeStatus::Skipped;
}

} // namespace tfwrap
