#pragma once

#include <array>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace cadence::util {

/**
 * DirectoryScanner: recursive audio file discovery on top of getdents64.
 *
 * One syscall fills a 256KB buffer with thousands of entries, and d_type
 * avoids a stat() per entry on filesystems that report it.
 */
class DirectoryScanner {
public:
    struct ScanResult {
        std::vector<std::string> audio_files;  // absolute paths, sorted
        size_t directories = 0;
        size_t unreadable_directories = 0;
    };

    /// Walk root_dir and collect every file with a supported extension.
    /// Directories that cannot be opened are counted and skipped.
    [[nodiscard]] static ScanResult scan_directory(const std::filesystem::path& root_dir);

    /// Case-insensitive: "Song.MP3" counts.
    [[nodiscard]] static bool is_audio_extension(std::string_view filename);

private:
    static constexpr size_t BUFFER_SIZE = 256 * 1024;

    static constexpr std::array<std::string_view, 6> AUDIO_EXTENSIONS = {
        ".aac", ".flac", ".m4a", ".mp3", ".ogg", ".wav"
    };

    static void scan_recursive(const std::string& dir_path,
                               std::vector<char>& buffer,
                               ScanResult& result);
};

}  // namespace cadence::util
