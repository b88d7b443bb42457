#include "process_operations.h"
#include "../common/os_utils.h"
#include "../common/structured_logger.h"

#ifndef _WIN32
#include <spawn.h>
#include <cerrno>
#include <cstring>
extern char** environ;
#endif

namespace exportflow {
namespace ocal {
namespace process {

#ifdef _WIN32

bool launchDetached(const std::string& path, unsigned long& processId) {
    std::wstring wPath = os::UnicodeUtils::utf8ToWideString(path);

    STARTUPINFOW si = {};
    si.cb = sizeof(si);
    PROCESS_INFORMATION pi = {};

    if (CreateProcessW(wPath.c_str(), NULL, NULL, NULL, FALSE, 0, NULL, NULL, &si, &pi)) {
        processId = static_cast<unsigned long>(pi.dwProcessId);
        CloseHandle(pi.hProcess);
        CloseHandle(pi.hThread);
        SLOG_INFO().message("Application launched").context("path", path).context("process_id", processId);
        return true;
    }

    SLOG_ERROR().message("Failed to launch application")
        .context("path", path)
        .context("error", static_cast<unsigned long>(GetLastError()));
    return false;
}

#else

bool launchDetached(const std::string& path, unsigned long& processId) {
    pid_t pid = 0;
    char* argv[] = {const_cast<char*>(path.c_str()), nullptr};
    int rc = posix_spawn(&pid, path.c_str(), nullptr, nullptr, argv, environ);
    if (rc != 0) {
        SLOG_ERROR().message("Failed to launch application").context("path", path).context("error", std::strerror(rc));
        return false;
    }
    processId = static_cast<unsigned long>(pid);
    SLOG_INFO().message("Application launched").context("path", path).context("process_id", processId);
    return true;
}

#endif // _WIN32

} // namespace process
} // namespace ocal
} // namespace exportflow
