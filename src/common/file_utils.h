#ifndef EXPORTFLOW_FILE_UTILS_H
#define EXPORTFLOW_FILE_UTILS_H

#include <string>
#include <nlohmann/json.hpp>

namespace exportflow {
namespace utils {

/**
 * @brief File I/O helpers used by configuration and artifact reading
 */
class FileUtils {
public:
    /**
     * @brief Load JSON from file
     * @param filePath Path to JSON file (must not be empty)
     * @param jsonOutput Parsed document (output parameter)
     * @return true if successful, false if missing or unparsable
     */
    static bool loadJsonFromFile(const std::string& filePath, nlohmann::json& jsonOutput);

    /**
     * @brief Save JSON to file through a temporary file and rename
     * @note Creates parent directories as needed
     */
    static bool saveJsonToFile(const std::string& filePath, const nlohmann::json& jsonData);

    static bool fileExists(const std::string& filePath);

    static bool createDirectoryIfNotExists(const std::string& directoryPath);

    // Reads raw bytes; no newline translation
    static bool readFileToString(const std::string& filePath, std::string& content);

private:
    static bool ensureParentDirectoryExists(const std::string& filePath);
};

} // namespace utils
} // namespace exportflow

#endif // EXPORTFLOW_FILE_UTILS_H
