#include "tfwrap/scanner.hpp"

#include <algorithm>
#include <filesystem>

namespace tfwrap {

namespace {

struct Frame {
    std::filesystem::path path;             // as reached from the root
    std::vector<std::string> real_ancestors; // canonical paths of this directory and its parents
};

Result<void> walk(const std::filesystem::path &root,
                  const std::function<void(const std::filesystem::path &, const std::string &)> &on_dir,
                  const std::function<void(const std::filesystem::path &)> &on_file) {
    std::error_code ec;
    auto real_root = std::filesystem::canonical(root, ec);
    if (ec) {
        return std::unexpected("Cannot resolve " + root.string() + ": " + ec.message());
    }
    if (!std::filesystem::is_directory(real_root, ec)) {
        return std::unexpected("Not a directory: " + root.string());
    }

    std::vector<Frame> stack;
    stack.push_back({real_root, {real_root.string()}});
    while (!stack.empty()) {
        Frame frame = std::move(stack.back());
        stack.pop_back();
        if (on_dir)
            on_dir(frame.path, frame.real_ancestors.back());

        std::vector<std::filesystem::path> subdirs;
        std::error_code list_ec = for_each_entry(frame.path, [&](const std::filesystem::directory_entry &entry) {
            std::error_code entry_ec;
            if (entry.is_directory(entry_ec)) {
                if (!is_ignored_directory(entry.path().filename().string()))
                    subdirs.push_back(entry.path());
            } else if (on_file && entry.is_regular_file(entry_ec)) {
                on_file(entry.path());
            }
        });
        if (list_ec) {
            return std::unexpected("Cannot list " + frame.path.string() + ": " + list_ec.message());
        }

        // Reverse order so the stack pops them alphabetically.
        std::sort(subdirs.begin(), subdirs.end(), std::greater<>());
        for (auto &sub : subdirs) {
            std::error_code canon_ec;
            auto real = std::filesystem::canonical(sub, canon_ec);
            if (canon_ec)
                continue; // dangling symlink
            const auto &chain = frame.real_ancestors;
            if (std::find(chain.begin(), chain.end(), real.string()) != chain.end())
                continue; // symlink loop
            Frame next{std::move(sub), chain};
            next.real_ancestors.push_back(real.string());
            stack.push_back(std::move(next));
        }
    }
    return {};
}

} // namespace

bool is_ignored_directory(std::string_view name) {
    return name == ".terraform" || name == ".git";
}

std::error_code for_each_entry(const std::filesystem::path &directory,
                               const std::function<void(const std::filesystem::directory_entry &)> &visit) {
    std::error_code ec;
    std::filesystem::directory_iterator it(directory, ec);
    for (const std::filesystem::directory_iterator end; !ec && it != end; it.increment(ec)) {
        visit(*it);
    }
    return ec;
}

bool has_source_files(const std::filesystem::path &directory) {
    bool found = false;
    // Unreadable directories count as holding no sources.
    std::error_code ec = for_each_entry(directory, [&](const std::filesystem::directory_entry &entry) {
        std::error_code entry_ec;
        if (entry.path().extension() == SOURCE_EXTENSION && entry.is_regular_file(entry_ec))
            found = true;
    });
    return found && !ec;
}

Result<ScanResult> scan_directories(const std::filesystem::path &root) {
    ScanResult result;
    auto res = walk(
        root,
        [&](const std::filesystem::path &dir, const std::string &real) {
            if (!has_source_files(dir))
                return;
            std::string path = normalize_path(dir);
            if (path == real) {
                result.directories.push_back(path);
            } else {
                result.symlinks.emplace(path, real);
            }
        },
        {});
    if (!res)
        return std::unexpected(res.error());

    std::sort(result.directories.begin(), result.directories.end());
    return result;
}

Result<void> walk_files(const std::filesystem::path &root,
                        const std::function<void(const std::filesystem::path &)> &visit) {
    return walk(root, {}, visit);
}

} // namespace tfwrap
