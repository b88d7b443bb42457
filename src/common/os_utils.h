#ifndef EXPORTFLOW_OS_UTILS_H
#define EXPORTFLOW_OS_UTILS_H

#include <string>

// OS-specific headers and macro management
#ifdef _WIN32
    #ifndef WIN32_LEAN_AND_MEAN
        #define WIN32_LEAN_AND_MEAN
    #endif
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
    #include <windows.h>
    // Undefine Windows macros that collide with our identifiers
    #undef ERROR
    #undef max
    #undef min
    #undef CopyFile
#endif

namespace exportflow {
namespace os {

class PathUtils {
public:
    static std::string getFileName(const std::string& path);
    // Extension including the leading dot, empty when there is none
    static std::string getExtension(const std::string& path);
    static std::string join(const std::string& part1, const std::string& part2);

    // Separators rewritten to '\\' for fields of the remote application
    static std::string toWindowsPath(const std::string& path);
};

class UnicodeUtils {
public:
    static std::wstring utf8ToWideString(const std::string& utf8);
    static std::string wideStringToUtf8(const std::wstring& wide);
};

} // namespace os
} // namespace exportflow

#endif // EXPORTFLOW_OS_UTILS_H
