#include "os_utils.h"
#include <filesystem>
#include <cstdint>

namespace exportflow {
namespace os {

std::string PathUtils::getFileName(const std::string& path) {
    return std::filesystem::path(path).filename().string();
}

std::string PathUtils::getExtension(const std::string& path) {
    return std::filesystem::path(path).extension().string();
}

std::string PathUtils::join(const std::string& part1, const std::string& part2) {
    return (std::filesystem::path(part1) / part2).string();
}

std::string PathUtils::toWindowsPath(const std::string& path) {
    std::string result = path;
    for (auto& c : result) {
        if (c == '/') {
            c = '\\';
        }
    }
    return result;
}

std::wstring UnicodeUtils::utf8ToWideString(const std::string& utf8) {
    if (utf8.empty()) {
        return std::wstring();
    }
#ifdef _WIN32
    int size = MultiByteToWideChar(CP_UTF8, 0, utf8.data(), static_cast<int>(utf8.size()), nullptr, 0);
    if (size <= 0) {
        return std::wstring();
    }
    std::wstring result(static_cast<size_t>(size), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, utf8.data(), static_cast<int>(utf8.size()), &result[0], size);
    return result;
#else
    std::wstring result;
    size_t i = 0;
    while (i < utf8.size()) {
        unsigned char c = static_cast<unsigned char>(utf8[i]);
        uint32_t cp = 0;
        size_t extra = 0;
        if (c < 0x80) { cp = c; extra = 0; }
        else if ((c & 0xE0) == 0xC0) { cp = c & 0x1F; extra = 1; }
        else if ((c & 0xF0) == 0xE0) { cp = c & 0x0F; extra = 2; }
        else if ((c & 0xF8) == 0xF0) { cp = c & 0x07; extra = 3; }
        else { result += L'\xFFFD'; ++i; continue; }

        if (i + extra >= utf8.size()) {
            result += L'\xFFFD';
            break;
        }
        for (size_t k = 1; k <= extra; ++k) {
            cp = (cp << 6) | (static_cast<unsigned char>(utf8[i + k]) & 0x3F);
        }
        result += static_cast<wchar_t>(cp);
        i += extra + 1;
    }
    return result;
#endif
}

std::string UnicodeUtils::wideStringToUtf8(const std::wstring& wide) {
    if (wide.empty()) {
        return std::string();
    }
#ifdef _WIN32
    int size = WideCharToMultiByte(CP_UTF8, 0, wide.data(), static_cast<int>(wide.size()), nullptr, 0, nullptr, nullptr);
    if (size <= 0) {
        return std::string();
    }
    std::string result(static_cast<size_t>(size), '\0');
    WideCharToMultiByte(CP_UTF8, 0, wide.data(), static_cast<int>(wide.size()), &result[0], size, nullptr, nullptr);
    return result;
#else
    std::string result;
    for (wchar_t wc : wide) {
        uint32_t cp = static_cast<uint32_t>(wc);
        if (cp < 0x80) {
            result += static_cast<char>(cp);
        } else if (cp < 0x800) {
            result += static_cast<char>(0xC0 | (cp >> 6));
            result += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            result += static_cast<char>(0xE0 | (cp >> 12));
            result += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            result += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            result += static_cast<char>(0xF0 | (cp >> 18));
            result += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            result += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            result += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }
    return result;
#endif
}

} // namespace os
} // namespace exportflow
