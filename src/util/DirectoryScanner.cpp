#include "util/DirectoryScanner.hpp"
#include "util/Logger.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <sys/syscall.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <memory>
#include <system_error>

namespace music2json::util {

namespace {

// Linux dirent64 structure for getdents64 syscall
struct linux_dirent64 {
    uint64_t d_ino;           // Inode number
    int64_t  d_off;           // Offset to next structure
    uint16_t d_reclen;        // Size of this dirent
    uint8_t  d_type;          // File type
    char     d_name[];        // Filename (null-terminated)
};

// File type constants from dirent.h
constexpr uint8_t TYPE_UNKNOWN = 0;
constexpr uint8_t TYPE_DIR = 4;
constexpr uint8_t TYPE_REG = 8;

// Closes the directory descriptor on every exit path
class FdGuard {
public:
    explicit FdGuard(int fd) : fd_(fd) {}
    ~FdGuard() {
        if (fd_ >= 0 && ::close(fd_) != 0) {
            Logger::warn("DirectoryScanner: close() failed: " + std::string(std::strerror(errno)));
        }
    }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const { return fd_; }

private:
    int fd_;
};

}  // namespace

bool DirectoryScanner::is_audio_extension(std::string_view filename) {
    size_t dot = filename.rfind('.');
    if (dot == std::string_view::npos) return false;

    std::string ext(filename.substr(dot));
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    for (const auto& ae : AUDIO_EXTENSIONS) {
        if (ae == ext) return true;
    }
    return false;
}

std::vector<DirectoryScanner::Entry> DirectoryScanner::list_directory(const std::filesystem::path& dir) {
    int fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(), "Cannot open directory " + dir.string());
    }
    FdGuard guard(fd);

    std::vector<Entry> entries;
    auto buffer = std::make_unique<char[]>(BUFFER_SIZE);

    while (true) {
        long nread = syscall(SYS_getdents64, guard.get(), buffer.get(), BUFFER_SIZE);

        if (nread == -1) {
            throw std::system_error(errno, std::generic_category(), "Cannot read directory " + dir.string());
        }

        if (nread == 0) {
            // End of directory
            break;
        }

        for (long pos = 0; pos < nread;) {
            auto* d = reinterpret_cast<linux_dirent64*>(buffer.get() + pos);
            pos += d->d_reclen;

            if (strcmp(d->d_name, ".") == 0 || strcmp(d->d_name, "..") == 0) {
                continue;
            }

            Entry entry;
            entry.name = d->d_name;

            if (d->d_type == TYPE_REG) {
                entry.type = EntryType::File;
            } else if (d->d_type == TYPE_DIR) {
                entry.type = EntryType::Directory;
            } else if (d->d_type == TYPE_UNKNOWN) {
                // Filesystem doesn't support d_type, fall back to lstat semantics
                struct stat entry_stat;
                if (fstatat(guard.get(), d->d_name, &entry_stat, AT_SYMLINK_NOFOLLOW) == 0) {
                    if (S_ISREG(entry_stat.st_mode)) entry.type = EntryType::File;
                    else if (S_ISDIR(entry_stat.st_mode)) entry.type = EntryType::Directory;
                }
            }

            entries.push_back(std::move(entry));
        }
    }

    std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
        return a.name < b.name;
    });

    Logger::debug("DirectoryScanner: " + std::to_string(entries.size()) + " entries in " + dir.string());
    return entries;
}

}  // namespace music2json::util
