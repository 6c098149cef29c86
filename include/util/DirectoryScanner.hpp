#pragma once

#include <filesystem>
#include <vector>
#include <string>
#include <cstddef>

namespace maestro::util {

/**
 * DirectoryScanner: recursive file discovery using the getdents64 syscall.
 *
 * Uses large buffers to batch syscalls and the d_type field to avoid
 * unnecessary stat() calls. Hidden entries (leading '.') are skipped, which
 * keeps extras/.cache out of album scans.
 */
class DirectoryScanner {
public:
    /**
     * Collects all MP3 files below root_dir.
     *
     * @param root_dir Root directory to scan recursively
     * @return Absolute-or-root-relative file paths, sorted lexicographically
     */
    [[nodiscard]] static std::vector<std::filesystem::path> scan_mp3_files(
        const std::filesystem::path& root_dir
    );

    /**
     * Checks if a filename has an .mp3 extension (case-insensitive).
     */
    [[nodiscard]] static bool is_mp3_extension(const char* filename);

private:
    static constexpr size_t BUFFER_SIZE = 64 * 1024;

    static void scan_recursive(
        const std::string& dir_path,
        std::vector<std::filesystem::path>& out
    );
};

}  // namespace maestro::util
