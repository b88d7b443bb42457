#include "export_watcher.h"
#include "../ocal/filesystem_operations.h"
#include "../common/string_utils.h"
#include "../common/error_handler.h"
#include "../common/structured_logger.h"

namespace exportflow {
namespace automation {

ExportWatcher::ExportWatcher(IClock& clock, std::chrono::milliseconds pollInterval)
    : m_clock(clock), m_pollInterval(pollInterval) {}

DirectorySnapshot ExportWatcher::snapshot(const std::string& directory) const {
    DirectorySnapshot result;
    for (const auto& entry : ocal::filesystem::listFiles(directory)) {
        result[ocal::filesystem::getAbsolutePath(entry.fullPath)] = entry.lastModified;
    }
    SLOG_DEBUG().message("Directory snapshot taken").context("directory", directory).context("files", result.size());
    return result;
}

std::optional<std::string> ExportWatcher::findChanged(const std::string& directory,
                                                      const DirectorySnapshot& baseline,
                                                      const std::string& pattern,
                                                      std::optional<std::filesystem::file_time_type> notBefore) const {
    std::optional<std::string> newest;
    std::filesystem::file_time_type newestTime;

    for (const auto& entry : ocal::filesystem::listFiles(directory)) {
        if (!utils::StringUtils::globMatch(pattern, entry.name)) {
            continue;
        }

        std::string path = ocal::filesystem::getAbsolutePath(entry.fullPath);
        auto previous = baseline.find(path);
        bool isNew = previous == baseline.end();
        bool isUpdated = !isNew && entry.lastModified > previous->second;
        if (!isNew && !isUpdated) {
            continue;
        }
        if (notBefore && entry.lastModified < *notBefore) {
            continue;
        }

        if (!newest || entry.lastModified > newestTime) {
            newest = path;
            newestTime = entry.lastModified;
        }
    }
    return newest;
}

std::string ExportWatcher::awaitExport(const std::string& directory,
                                       const DirectorySnapshot& baseline,
                                       const std::string& pattern,
                                       std::chrono::milliseconds timeout) const {
    SLOG_INFO().message("Waiting for export")
        .context("directory", directory)
        .context("pattern", pattern)
        .context("timeout_ms", timeout.count());

    std::chrono::milliseconds elapsed(0);
    auto found = pollFor<std::string>(m_clock, PollPolicy(m_pollInterval, timeout), [&]() {
        return findChanged(directory, baseline, pattern);
    }, &elapsed);

    if (!found) {
        throw ExportTimeoutError(directory, pattern, timeout, elapsed);
    }

    SLOG_INFO().message("Export detected").context("path", *found).context("elapsed_ms", elapsed.count());
    return *found;
}

} // namespace automation
} // namespace exportflow
