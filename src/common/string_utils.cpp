#include "string_utils.h"
#include <cctype>
#include <cstdint>

namespace exportflow {
namespace utils {

namespace {

// Base letters for U+00C0..U+00FF. Empty entries are symbols (× and ÷).
const char* const kLatin1Fold[64] = {
    "A", "A", "A", "A", "A", "A", "AE", "C", "E", "E", "E", "E", "I", "I", "I", "I",
    "D", "N", "O", "O", "O", "O", "O", "", "O", "U", "U", "U", "U", "Y", "TH", "ss",
    "a", "a", "a", "a", "a", "a", "ae", "c", "e", "e", "e", "e", "i", "i", "i", "i",
    "d", "n", "o", "o", "o", "o", "o", "", "o", "u", "u", "u", "u", "y", "th", "y"
};

// Base letters for U+0100..U+017F, one per code point
const char kLatinExtAFold[] =
    "AaAaAa" "CcCcCcCc" "DdDd" "EeEeEeEeEe" "GgGgGgGg" "HhHh" "IiIiIiIiIi" "Ii" "Jj"
    "Kkk" "LlLlLlLlLl" "NnNnNnnNn" "OoOoOo" "Oo" "RrRrRr" "SsSsSsSs" "TtTtTt"
    "UuUuUuUuUuUu" "Ww" "YyY" "ZzZzZz" "s";

// Decodes one code point at pos; returns false on a malformed sequence
bool decodeUtf8(const std::string& str, size_t& pos, uint32_t& codePoint) {
    unsigned char lead = static_cast<unsigned char>(str[pos]);
    size_t length = 0;
    if (lead < 0x80) {
        codePoint = lead;
        length = 1;
    } else if ((lead & 0xE0) == 0xC0) {
        codePoint = lead & 0x1F;
        length = 2;
    } else if ((lead & 0xF0) == 0xE0) {
        codePoint = lead & 0x0F;
        length = 3;
    } else if ((lead & 0xF8) == 0xF0) {
        codePoint = lead & 0x07;
        length = 4;
    } else {
        ++pos;
        return false;
    }

    if (pos + length > str.size()) {
        ++pos;
        return false;
    }
    for (size_t i = 1; i < length; ++i) {
        unsigned char cont = static_cast<unsigned char>(str[pos + i]);
        if ((cont & 0xC0) != 0x80) {
            ++pos;
            return false;
        }
        codePoint = (codePoint << 6) | (cont & 0x3F);
    }
    pos += length;
    return true;
}

bool isAsciiAlnum(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

bool isNonAscii(char c) {
    return (static_cast<unsigned char>(c) & 0x80) != 0;
}

} // anonymous namespace

bool StringUtils::isWhitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string StringUtils::trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\n\r\f\v");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(first, last - first + 1);
}

std::vector<std::string> StringUtils::split(const std::string& str, const std::string& delimiter) {
    std::vector<std::string> result;
    if (delimiter.empty()) {
        result.push_back(str);
        return result;
    }

    size_t start = 0;
    size_t found;
    while ((found = str.find(delimiter, start)) != std::string::npos) {
        result.push_back(str.substr(start, found - start));
        start = found + delimiter.size();
    }
    result.push_back(str.substr(start));
    return result;
}

std::string StringUtils::join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += delimiter;
        }
        result += parts[i];
    }
    return result;
}

std::string StringUtils::toLowerCase(const std::string& str) {
    std::string result = str;
    for (auto& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

bool StringUtils::startsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

std::string StringUtils::replaceAll(const std::string& str, const std::string& from, const std::string& to) {
    if (from.empty()) {
        return str;
    }

    std::string result = str;
    size_t pos = 0;
    while ((pos = result.find(from, pos)) != std::string::npos) {
        result.replace(pos, from.size(), to);
        pos += to.size();
    }
    return result;
}

std::string StringUtils::foldDiacritics(const std::string& str) {
    std::string result;
    result.reserve(str.size());

    size_t pos = 0;
    while (pos < str.size()) {
        size_t begin = pos;
        uint32_t cp = 0;
        if (!decodeUtf8(str, pos, cp)) {
            result += ' ';
            continue;
        }

        if (cp < 0x80) {
            result += static_cast<char>(cp);
        } else if (cp >= 0x0300 && cp <= 0x036F) {
            // combining mark, dropped
        } else if (cp == 0x00AA) {
            result += 'a';
        } else if (cp == 0x00BA) {
            result += 'o';
        } else if (cp == 0x00B2) {
            result += '2';
        } else if (cp == 0x00B3) {
            result += '3';
        } else if (cp == 0x00B9) {
            result += '1';
        } else if (cp < 0x00C0) {
            result += ' ';
        } else if (cp <= 0x00FF) {
            const char* folded = kLatin1Fold[cp - 0x00C0];
            result += (*folded != '\0') ? folded : " ";
        } else if (cp <= 0x017F) {
            result += kLatinExtAFold[cp - 0x0100];
        } else if ((cp >= 0x2000 && cp <= 0x206F) || (cp >= 0x3000 && cp <= 0x303F)) {
            result += ' ';
        } else {
            result.append(str, begin, pos - begin);
        }
    }
    return result;
}

std::string StringUtils::normalizeLabel(const std::string& str) {
    std::string folded = foldDiacritics(str);
    std::string result;
    result.reserve(folded.size());

    bool pendingSpace = false;
    for (char c : folded) {
        if (isAsciiAlnum(c) || isNonAscii(c)) {
            if (pendingSpace && !result.empty()) {
                result += ' ';
            }
            pendingSpace = false;
            result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        } else {
            pendingSpace = true;
        }
    }
    return result;
}

std::string StringUtils::compactKey(const std::string& str) {
    std::string folded = foldDiacritics(str);
    std::string result;
    for (char c : folded) {
        if (isAsciiAlnum(c) || isNonAscii(c)) {
            result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    return result;
}

std::vector<std::string> StringUtils::tokens(const std::string& normalized) {
    std::vector<std::string> result;
    std::string current;
    for (char c : normalized) {
        if (isWhitespace(c)) {
            if (!current.empty()) {
                result.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        result.push_back(current);
    }
    return result;
}

std::string StringUtils::digitsOnly(const std::string& str) {
    std::string result;
    for (char c : str) {
        if (c >= '0' && c <= '9') {
            result += c;
        }
    }
    return result;
}

std::string StringUtils::canonicalInteger(const std::string& digits) {
    if (digits.empty()) {
        return "";
    }
    size_t first = digits.find_first_not_of('0');
    if (first == std::string::npos) {
        return "0";
    }
    return digits.substr(first);
}

bool StringUtils::globMatch(const std::string& pattern, const std::string& text, bool caseInsensitive) {
    auto fold = [caseInsensitive](char c) {
        return caseInsensitive ? static_cast<char>(std::tolower(static_cast<unsigned char>(c))) : c;
    };

    // Matches a bracket class starting at pattern[p] == '['. Sets classEnd to
    // the index after ']' or returns false with classEnd = npos for a literal '['.
    auto matchClass = [&](size_t p, char c, size_t& classEnd) -> bool {
        size_t i = p + 1;
        bool negate = false;
        if (i < pattern.size() && (pattern[i] == '!' || pattern[i] == '^')) {
            negate = true;
            ++i;
        }
        size_t bodyStart = i;
        bool matched = false;
        while (i < pattern.size() && (pattern[i] != ']' || i == bodyStart)) {
            char low = pattern[i];
            char high = low;
            if (i + 2 < pattern.size() && pattern[i + 1] == '-' && pattern[i + 2] != ']') {
                high = pattern[i + 2];
                i += 3;
            } else {
                ++i;
            }
            char fc = fold(c);
            if ((fc >= fold(low) && fc <= fold(high)) || (c >= low && c <= high)) {
                matched = true;
            }
        }
        if (i >= pattern.size()) {
            classEnd = std::string::npos;
            return false;
        }
        classEnd = i + 1;
        return matched != negate;
    };

    size_t p = 0;
    size_t t = 0;
    size_t starP = std::string::npos;
    size_t starT = 0;

    while (t < text.size()) {
        bool advanced = false;
        if (p < pattern.size()) {
            char pc = pattern[p];
            if (pc == '*') {
                starP = p++;
                starT = t;
                continue;
            }
            if (pc == '?') {
                ++p;
                ++t;
                advanced = true;
            } else if (pc == '[') {
                size_t classEnd = 0;
                bool hit = matchClass(p, text[t], classEnd);
                if (classEnd == std::string::npos) {
                    if (fold(text[t]) == '[') {
                        ++p;
                        ++t;
                        advanced = true;
                    }
                } else if (hit) {
                    p = classEnd;
                    ++t;
                    advanced = true;
                }
            } else if (fold(pc) == fold(text[t])) {
                ++p;
                ++t;
                advanced = true;
            }
        }

        if (!advanced) {
            if (starP == std::string::npos) {
                return false;
            }
            p = starP + 1;
            t = ++starT;
        }
    }

    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

} // namespace utils
} // namespace exportflow
