#include "tfwrap/source_analysis.hpp"

#include "mmap.hpp"
#include "tfwrap/scanner.hpp"

#include <algorithm>
#include <regex>
#include <sstream>

namespace tfwrap {

namespace {

const std::regex &module_source_pattern() {
    static const std::regex re(R"re(\bsource\s*=\s*"(\.\.?/[^"]*)")re");
    return re;
}

const std::regex &variable_pattern() {
    static const std::regex re(R"re(\bvariable\s+"([^"]+)")re");
    return re;
}

const std::regex &backend_pattern() {
    static const std::regex re(R"re(\bbackend\s+"[^"]+"\s*\{)re");
    return re;
}

const std::regex &assignment_pattern() {
    static const std::regex re(R"re(^\s*"?([A-Za-z_][A-Za-z0-9_-]*)"?\s*=)re");
    return re;
}

std::string stripped_source(const std::filesystem::path &file) {
    auto content = read_file(file);
    if (!content)
        return {};
    return strip_comments(*content);
}

} // namespace

Result<std::string> read_file(const std::filesystem::path &path) {
    auto file = MappedFile::open_file(path);
    if (!file)
        return std::unexpected(file.error());
    return std::string((*file)->content());
}

std::vector<std::filesystem::path> source_files(const std::filesystem::path &directory) {
    std::vector<std::filesystem::path> files;
    std::error_code ec = for_each_entry(directory, [&](const std::filesystem::directory_entry &entry) {
        std::error_code entry_ec;
        if (entry.path().extension() == SOURCE_EXTENSION && entry.is_regular_file(entry_ec)) {
            files.push_back(entry.path());
        }
    });
    if (ec)
        return {};
    std::sort(files.begin(), files.end());
    return files;
}

std::vector<std::string> module_dependencies(const std::filesystem::path &directory) {
    std::vector<std::string> modules;
    for (const auto &file : source_files(directory)) {
        std::string content = stripped_source(file);
        for (auto it = std::sregex_iterator(content.begin(), content.end(), module_source_pattern());
             it != std::sregex_iterator(); ++it) {
            std::string source = (*it)[1].str();
            // `./modules/vpc//subdir` addresses a subdirectory of the package
            if (auto pos = source.find("//"); pos != std::string::npos) {
                source.replace(pos, 2, "/");
            }
            std::string resolved = normalize_path(directory / source);
            if (std::find(modules.begin(), modules.end(), resolved) == modules.end()) {
                modules.push_back(std::move(resolved));
            }
        }
    }
    return modules;
}

std::set<std::string> declared_variables(const std::filesystem::path &directory) {
    std::set<std::string> names;
    for (const auto &file : source_files(directory)) {
        std::string content = stripped_source(file);
        for (auto it = std::sregex_iterator(content.begin(), content.end(), variable_pattern());
             it != std::sregex_iterator(); ++it) {
            names.insert((*it)[1].str());
        }
    }
    return names;
}

std::set<std::string> assigned_variables(const std::filesystem::path &tfvars_file) {
    std::set<std::string> names;
    std::istringstream in(stripped_source(tfvars_file));
    std::string line;
    int depth = 0;
    while (std::getline(in, line)) {
        std::smatch match;
        if (depth == 0 && std::regex_search(line, match, assignment_pattern())) {
            names.insert(match[1].str());
        }
        bool in_string = false;
        for (size_t i = 0; i < line.size(); ++i) {
            char c = line[i];
            if (c == '"' && (i == 0 || line[i - 1] != '\\'))
                in_string = !in_string;
            if (in_string)
                continue;
            if (c == '{' || c == '[' || c == '(')
                ++depth;
            else if ((c == '}' || c == ']' || c == ')') && depth > 0)
                --depth;
        }
    }
    return names;
}

bool has_backend(const std::filesystem::path &directory) {
    for (const auto &file : source_files(directory)) {
        std::string content = stripped_source(file);
        if (std::regex_search(content, backend_pattern()))
            return true;
    }
    return false;
}

bool is_auto_vars_file(const std::filesystem::path &path) {
    return path.filename().string().ends_with(AUTO_VARS_SUFFIX);
}

std::vector<std::filesystem::path> parent_auto_var_files(const std::filesystem::path &directory,
                                                         const std::filesystem::path &root) {
    const std::string dir = normalize_path(directory);
    const std::string top = normalize_path(root);
    std::vector<std::filesystem::path> files;
    if (!is_within(dir, top) || dir == top)
        return files;

    std::vector<std::filesystem::path> parents{top};
    std::filesystem::path rel = relative_to(dir, top);
    std::filesystem::path current = top;
    for (const auto &part : rel.parent_path()) {
        current /= part;
        parents.push_back(current);
    }

    for (const auto &parent : parents) {
        std::vector<std::filesystem::path> found;
        std::error_code ec = for_each_entry(parent, [&](const std::filesystem::directory_entry &entry) {
            std::error_code entry_ec;
            if (is_auto_vars_file(entry.path()) && entry.is_regular_file(entry_ec)) {
                found.push_back(entry.path());
            }
        });
        if (ec)
            continue; // unreadable parent contributes no var files
        std::sort(found.begin(), found.end());
        files.insert(files.end(), found.begin(), found.end());
    }
    return files;
}

std::string strip_comments(std::string_view content) {
    std::string out(content);
    enum class State { Code, String, Line, Block } state = State::Code;
    for (size_t i = 0; i < out.size(); ++i) {
        char c = out[i];
        char next = i + 1 < out.size() ? out[i + 1] : '\0';
        switch (state) {
        case State::Code:
            if (c == '"') {
                state = State::String;
            } else if (c == '#' || (c == '/' && next == '/')) {
                state = State::Line;
                out[i] = ' ';
            } else if (c == '/' && next == '*') {
                state = State::Block;
                out[i] = ' ';
            }
            break;
        case State::String:
            if (c == '\\') {
                ++i;
            } else if (c == '"' || c == '\n') {
                state = State::Code;
            }
            break;
        case State::Line:
            if (c == '\n') {
                state = State::Code;
            } else {
                out[i] = ' ';
            }
            break;
        case State::Block:
            if (c == '*' && next == '/') {
                out[i] = ' ';
                out[i + 1] = ' ';
                ++i;
                state = State::Code;
            } else if (c != '\n') {
                out[i] = ' ';
            }
            break;
        }
    }
    return out;
}

} // namespace tfwrap
