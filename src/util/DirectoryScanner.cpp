#include "util/DirectoryScanner.hpp"
#include "util/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <unistd.h>

namespace cadence::util {

namespace {

// Kernel layout of the records getdents64 returns
struct linux_dirent64 {
    uint64_t d_ino;
    int64_t  d_off;
    uint16_t d_reclen;
    uint8_t  d_type;
    char     d_name[];
};

bool is_dot_entry(const char* name) {
    return std::strcmp(name, ".") == 0 || std::strcmp(name, "..") == 0;
}

}  // namespace

bool DirectoryScanner::is_audio_extension(std::string_view filename) {
    auto dot = filename.rfind('.');
    if (dot == std::string_view::npos) return false;

    std::string ext(filename.substr(dot));
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return std::find(AUDIO_EXTENSIONS.begin(), AUDIO_EXTENSIONS.end(), ext) != AUDIO_EXTENSIONS.end();
}

DirectoryScanner::ScanResult DirectoryScanner::scan_directory(const std::filesystem::path& root_dir) {
    ScanResult result;

    std::string root = root_dir.string();
    while (root.length() > 1 && root.back() == '/') {
        root.pop_back();
    }
    Logger::info("DirectoryScanner: Scanning " + root);

    // Shared across the whole walk; recursion only borrows it between reads
    std::vector<char> buffer(BUFFER_SIZE);
    scan_recursive(root, buffer, result);

    std::sort(result.audio_files.begin(), result.audio_files.end());

    Logger::info("DirectoryScanner: Found " + std::to_string(result.audio_files.size()) +
                 " audio files in " + std::to_string(result.directories) + " directories");
    if (result.unreadable_directories > 0) {
        Logger::warn("DirectoryScanner: Skipped " + std::to_string(result.unreadable_directories) +
                     " unreadable directories");
    }
    return result;
}

void DirectoryScanner::scan_recursive(const std::string& dir_path,
                                      std::vector<char>& buffer,
                                      ScanResult& result) {
    int fd = open(dir_path.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        Logger::debug("DirectoryScanner: Failed to open directory: " + dir_path);
        ++result.unreadable_directories;
        return;
    }
    ++result.directories;

    // Subdirectories are collected first and walked after the fd is closed,
    // so the buffer is free and deep trees don't hold one fd per level.
    std::vector<std::string> subdirs;

    while (true) {
        long nread = syscall(SYS_getdents64, fd, buffer.data(), buffer.size());
        if (nread == -1) {
            Logger::error("DirectoryScanner: getdents64 failed for " + dir_path);
            break;
        }
        if (nread == 0) break;

        for (long pos = 0; pos < nread;) {
            auto* d = reinterpret_cast<linux_dirent64*>(buffer.data() + pos);
            pos += d->d_reclen;

            if (is_dot_entry(d->d_name)) continue;

            std::string full_path = dir_path + "/" + d->d_name;
            unsigned char type = d->d_type;

            if (type == DT_UNKNOWN || type == DT_LNK) {
                struct stat st;
                if (fstatat(fd, d->d_name, &st, 0) != 0) continue;
                if (S_ISREG(st.st_mode)) type = DT_REG;
                else if (S_ISDIR(st.st_mode) && d->d_type == DT_UNKNOWN) type = DT_DIR;
                else continue;
            }

            if (type == DT_REG) {
                if (is_audio_extension(d->d_name)) {
                    result.audio_files.push_back(std::move(full_path));
                }
            } else if (type == DT_DIR) {
                subdirs.push_back(std::move(full_path));
            }
        }
    }

    close(fd);

    for (const auto& sub : subdirs) {
        scan_recursive(sub, buffer, result);
    }
}

}  // namespace cadence::util
