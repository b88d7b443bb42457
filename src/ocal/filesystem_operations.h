#ifndef EXPORTFLOW_FILESYSTEM_OPERATIONS_H
#define EXPORTFLOW_FILESYSTEM_OPERATIONS_H

#include <string>
#include <vector>
#include <filesystem>
#include <cstdint>

namespace exportflow {
namespace ocal {
namespace filesystem {

struct FileEntry {
    std::string fullPath;
    std::string name;
    std::uintmax_t size;
    std::filesystem::file_time_type lastModified;

    FileEntry() : size(0) {}
};

/**
 * Check if directory exists
 *
 * @param path Directory path to check
 * @return true if directory exists, false otherwise
 */
bool directoryExists(const std::string& path);

/**
 * Create directory (including parent directories if needed)
 *
 * @param path Directory path to create
 * @return true if the directory exists afterwards
 */
bool createDirectory(const std::string& path);

/**
 * List regular files directly inside a directory
 *
 * @param path Directory path to list
 * @return One entry per file; empty when the directory is missing or unreadable
 */
std::vector<FileEntry> listFiles(const std::string& path);

/**
 * Copy file from source to destination
 *
 * @param source Source file path
 * @param destination Destination file path
 * @param overwrite Whether to overwrite if destination exists
 * @param preserveTimestamps Whether to carry the source modification time over
 * @return true if successful, false otherwise
 */
bool copyFile(const std::string& source,
              const std::string& destination,
              bool overwrite = false,
              bool preserveTimestamps = true);

std::string getAbsolutePath(const std::string& path);

} // namespace filesystem
} // namespace ocal
} // namespace exportflow

#endif // EXPORTFLOW_FILESYSTEM_OPERATIONS_H
