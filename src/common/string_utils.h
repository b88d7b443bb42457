#ifndef EXPORTFLOW_STRING_UTILS_H
#define EXPORTFLOW_STRING_UTILS_H

#include <string>
#include <vector>

namespace exportflow {
namespace utils {

/**
 * @brief String helpers shared by the locator, the normalizer and the file watcher
 *
 * All functions take and return UTF-8. Case folding only touches ASCII
 * letters after diacritics have been folded away.
 */
class StringUtils {
public:
    static std::string trim(const std::string& str);

    /**
     * @brief Split on a delimiter, keeping empty fields
     * @param str Source text
     * @param delimiter Non-empty delimiter
     * @return Fields in order; a single empty field for empty input
     */
    static std::vector<std::string> split(const std::string& str, const std::string& delimiter);

    static std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

    static std::string toLowerCase(const std::string& str);

    static bool startsWith(const std::string& str, const std::string& prefix);

    static std::string replaceAll(const std::string& str, const std::string& from, const std::string& to);

    /**
     * @brief Replace accented Latin letters with their base letters
     *
     * Covers Latin-1 Supplement, Latin Extended-A and the ordinal indicators
     * (º -> o, ª -> a). Combining marks are dropped. Symbols and punctuation
     * outside ASCII become a single space. Invalid UTF-8 bytes become a space.
     */
    static std::string foldDiacritics(const std::string& str);

    /**
     * @brief Label form used for fuzzy matching
     *
     * Diacritics folded, lowercase, every non-alphanumeric run collapsed to
     * one space, trimmed. "H181 RP1 (Produção)" -> "h181 rp1 producao".
     */
    static std::string normalizeLabel(const std::string& str);

    /**
     * @brief Header key: folded, lowercase, alphanumerics only
     *
     * "Nº Nota/Medida" -> "nonotamedida".
     */
    static std::string compactKey(const std::string& str);

    // Words of a normalized label
    static std::vector<std::string> tokens(const std::string& normalized);

    static std::string digitsOnly(const std::string& str);

    // Canonical decimal form: leading zeros removed, "0" for all zeros, "" for no digits
    static std::string canonicalInteger(const std::string& digits);

    /**
     * @brief Shell-style wildcard match supporting '*', '?' and '[...]' classes
     * @param caseInsensitive Compare ASCII letters without case
     */
    static bool globMatch(const std::string& pattern, const std::string& text, bool caseInsensitive = true);

private:
    static bool isWhitespace(char c);
};

} // namespace utils
} // namespace exportflow

#endif // EXPORTFLOW_STRING_UTILS_H
