#pragma once

#include "tfwrap/utility.hpp"

#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace tfwrap {

inline constexpr std::string_view AUTO_VARS_SUFFIX = ".auto.tfvars";

Result<std::string> read_file(const std::filesystem::path &path);

// Source files (`*.tf`) directly inside `directory`, sorted.
std::vector<std::filesystem::path> source_files(const std::filesystem::path &directory);

// Local module sources (`./` or `../`) referenced from `directory`, resolved to normalized absolute paths.
std::vector<std::string> module_dependencies(const std::filesystem::path &directory);

// Names declared with `variable "name"` blocks in `directory`.
std::set<std::string> declared_variables(const std::filesystem::path &directory);

// Top level assignments of a tfvars file.
std::set<std::string> assigned_variables(const std::filesystem::path &tfvars_file);

// True if any source file in `directory` declares a `backend "..."` block.
bool has_backend(const std::filesystem::path &directory);

bool is_auto_vars_file(const std::filesystem::path &path);

/**
 * @brief `*.auto.tfvars` files in the parents of `directory`, from `root` down, excluding `directory` itself
 * (the tool loads those on its own).
 */
std::vector<std::filesystem::path> parent_auto_var_files(const std::filesystem::path &directory,
                                                         const std::filesystem::path &root);

// Content with `#`, `//` and `/* */` comments blanked out, string literals preserved.
std::string strip_comments(std::string_view content);

} // namespace tfwrap
