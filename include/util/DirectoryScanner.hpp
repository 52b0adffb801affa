#pragma once

#include <array>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace music2json::util {

/**
 * DirectoryScanner: single-level directory listing using the getdents64 syscall.
 *
 * Uses a 256KB buffer to batch syscalls and the d_type field to avoid stat()
 * calls. Falls back to fstatat() on filesystems that report DT_UNKNOWN.
 * Entries are returned sorted by name (byte order) so that callers see the
 * same order on every run regardless of on-disk layout.
 */
class DirectoryScanner {
public:
    enum class EntryType { File, Directory, Other };

    struct Entry {
        std::string name;
        EntryType type = EntryType::Other;

        [[nodiscard]] bool is_file() const { return type == EntryType::File; }
        [[nodiscard]] bool is_directory() const { return type == EntryType::Directory; }
    };

    /**
     * Lists the entries of one directory, skipping "." and "..".
     * Symbolic links are reported as EntryType::Other.
     *
     * @param dir Directory to list
     * @return Entries sorted by name
     * @throws std::system_error if the directory cannot be opened or read
     */
    [[nodiscard]] static std::vector<Entry> list_directory(const std::filesystem::path& dir);

    /**
     * Checks if a filename has a supported audio extension (case-insensitive).
     *
     * @param filename Filename to check
     * @return true if filename ends with .m4a, .aac, .mp4, .mp3, .flac or .ogg
     */
    [[nodiscard]] static bool is_audio_extension(std::string_view filename);

    static constexpr std::array<std::string_view, 6> AUDIO_EXTENSIONS = {
        ".m4a", ".aac", ".mp4", ".mp3", ".flac", ".ogg"
    };

private:
    static constexpr size_t BUFFER_SIZE = 256 * 1024;  // 256KB buffer for getdents64
};

}  // namespace music2json::util
