#pragma once

#include "tfwrap/utility.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace tfwrap {

// Read-only mapping of a whole configuration or manifest file. Empty files map to an empty view.
class MappedFile {
public:
    static Result<std::unique_ptr<MappedFile>> open_file(const std::filesystem::path &path) {
        int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd == -1) {
            return std::unexpected("Failed to open " + path.string() + ": " + std::strerror(errno));
        }

        struct stat sb;
        if (::fstat(fd, &sb) == -1) {
            int err = errno;
            ::close(fd);
            return std::unexpected("Failed to stat " + path.string() + ": " + std::strerror(err));
        }
        if (!S_ISREG(sb.st_mode)) {
            ::close(fd);
            return std::unexpected("Not a regular file: " + path.string());
        }

        std::unique_ptr<MappedFile> file(new MappedFile(fd, static_cast<size_t>(sb.st_size)));
        if (file->size_ == 0)
            return file;

        void *addr = ::mmap(nullptr, file->size_, PROT_READ, MAP_PRIVATE, fd, 0);
        if (addr == MAP_FAILED) {
            return std::unexpected("Failed to mmap " + path.string() + ": " + std::strerror(errno));
        }
        file->data_ = static_cast<const char *>(addr);
        return file;
    }

    ~MappedFile() {
        if (data_) {
            ::munmap(const_cast<char *>(data_), size_);
        }
        ::close(fd_);
    }

    MappedFile(const MappedFile &) = delete;
    MappedFile &operator=(const MappedFile &) = delete;

    std::string_view content() const {
        if (!data_)
            return {};
        return {data_, size_};
    }

    // Calls `visit(line, line_no)` for every line, 1-based, without the `\n` or a trailing `\r`.
    template <typename Visitor> void for_each_line(Visitor &&visit) const {
        std::string_view text = content();
        size_t line_no = 0;
        size_t start = 0;
        while (start < text.size()) {
            size_t end = text.find('\n', start);
            if (end == std::string_view::npos)
                end = text.size();
            std::string_view line = text.substr(start, end - start);
            if (!line.empty() && line.back() == '\r')
                line.remove_suffix(1);
            visit(line, ++line_no);
            start = end + 1;
        }
    }

private:
    MappedFile(int fd, size_t size) : fd_(fd), size_(size) {
    }

    int fd_;
    const char *data_ = nullptr;
    size_t size_;
};

} // namespace tfwrap
