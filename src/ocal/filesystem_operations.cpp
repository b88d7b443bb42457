#include "filesystem_operations.h"
#include "../common/structured_logger.h"

namespace exportflow {
namespace ocal {
namespace filesystem {

namespace fs = std::filesystem;

bool directoryExists(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool createDirectory(const std::string& path) {
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        return true;
    }
    fs::create_directories(path, ec);
    if (ec) {
        SLOG_ERROR().message("Failed to create directory").context("path", path).context("error", ec.message());
        return false;
    }
    SLOG_DEBUG().message("Created directory").context("path", path);
    return true;
}

std::vector<FileEntry> listFiles(const std::string& path) {
    std::vector<FileEntry> entries;

    std::error_code ec;
    fs::directory_iterator it(path, ec);
    if (ec) {
        SLOG_DEBUG().message("Directory not readable").context("path", path).context("error", ec.message());
        return entries;
    }

    for (const auto& item : it) {
        std::error_code itemError;
        if (!item.is_regular_file(itemError)) {
            continue;
        }

        FileEntry entry;
        entry.fullPath = item.path().string();
        entry.name = item.path().filename().string();
        entry.size = item.file_size(itemError);
        entry.lastModified = item.last_write_time(itemError);
        if (itemError) {
            // Removed between listing and stat
            continue;
        }
        entries.push_back(entry);
    }
    return entries;
}

bool copyFile(const std::string& source,
              const std::string& destination,
              bool overwrite,
              bool preserveTimestamps) {
    SLOG_DEBUG().message("Copying file").context("source", source).context("destination", destination);

    std::error_code ec;
    if (!fs::is_regular_file(source, ec)) {
        SLOG_ERROR().message("Source file does not exist").context("source", source);
        return false;
    }

    auto options = overwrite ? fs::copy_options::overwrite_existing : fs::copy_options::none;
    if (!fs::copy_file(source, destination, options, ec) || ec) {
        SLOG_ERROR().message("Failed to copy file")
            .context("source", source)
            .context("destination", destination)
            .context("error", ec.message());
        return false;
    }

    if (preserveTimestamps) {
        auto sourceTime = fs::last_write_time(source, ec);
        if (!ec) {
            fs::last_write_time(destination, sourceTime, ec);
        }
        if (ec) {
            SLOG_WARNING().message("Copied file but could not preserve timestamp")
                .context("destination", destination)
                .context("error", ec.message());
        }
    }
    return true;
}

std::string getAbsolutePath(const std::string& path) {
    std::error_code ec;
    fs::path absolute = fs::absolute(path, ec);
    if (ec) {
        return path;
    }
    return absolute.lexically_normal().string();
}

} // namespace filesystem
} // namespace ocal
} // namespace exportflow
