#include "file_utils.h"
#include "structured_logger.h"
#include <fstream>
#include <filesystem>
#include <sstream>

namespace exportflow {
namespace utils {

bool FileUtils::loadJsonFromFile(const std::string& filePath, nlohmann::json& jsonOutput) {
    if (filePath.empty()) {
        SLOG_ERROR().message("Empty path provided to loadJsonFromFile");
        return false;
    }

    if (!fileExists(filePath)) {
        SLOG_DEBUG().message("JSON file not found").context("path", filePath);
        return false;
    }

    std::ifstream file(filePath);
    if (!file.is_open()) {
        SLOG_ERROR().message("Cannot open file for reading").context("path", filePath);
        return false;
    }

    try {
        file >> jsonOutput;
    } catch (const nlohmann::json::parse_error& e) {
        SLOG_ERROR().message("JSON parse error").context("path", filePath).context("error", e.what());
        return false;
    }

    SLOG_DEBUG().message("Loaded JSON from file").context("path", filePath);
    return true;
}

bool FileUtils::saveJsonToFile(const std::string& filePath, const nlohmann::json& jsonData) {
    if (filePath.empty()) {
        SLOG_ERROR().message("Empty path provided to saveJsonToFile");
        return false;
    }

    if (!ensureParentDirectoryExists(filePath)) {
        SLOG_ERROR().message("Cannot create parent directory").context("path", filePath);
        return false;
    }

    std::string tempFilePath = filePath + ".tmp";
    {
        std::ofstream tempFile(tempFilePath);
        if (!tempFile.is_open()) {
            SLOG_ERROR().message("Cannot create temporary file").context("temp_path", tempFilePath);
            return false;
        }
        tempFile << jsonData.dump(2);
        tempFile.flush();
        if (tempFile.fail()) {
            SLOG_ERROR().message("Failed to write JSON to temporary file").context("temp_path", tempFilePath);
            tempFile.close();
            std::error_code ignored;
            std::filesystem::remove(tempFilePath, ignored);
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(tempFilePath, filePath, ec);
    if (ec) {
        SLOG_ERROR().message("Failed to rename temporary file").context("path", filePath).context("error", ec.message());
        std::error_code ignored;
        std::filesystem::remove(tempFilePath, ignored);
        return false;
    }

    SLOG_INFO().message("Saved JSON to file").context("path", filePath);
    return true;
}

bool FileUtils::fileExists(const std::string& filePath) {
    if (filePath.empty()) {
        return false;
    }
    std::error_code ec;
    return std::filesystem::is_regular_file(filePath, ec);
}

bool FileUtils::createDirectoryIfNotExists(const std::string& directoryPath) {
    if (directoryPath.empty()) {
        SLOG_ERROR().message("Empty directory path provided to createDirectoryIfNotExists");
        return false;
    }

    std::error_code ec;
    if (std::filesystem::exists(directoryPath, ec)) {
        if (std::filesystem::is_directory(directoryPath, ec)) {
            return true;
        }
        SLOG_ERROR().message("Path exists but is not a directory").context("path", directoryPath);
        return false;
    }

    std::filesystem::create_directories(directoryPath, ec);
    if (ec) {
        SLOG_ERROR().message("Could not create directory").context("path", directoryPath).context("error", ec.message());
        return false;
    }
    SLOG_INFO().message("Created directory").context("path", directoryPath);
    return true;
}

bool FileUtils::readFileToString(const std::string& filePath, std::string& content) {
    if (!fileExists(filePath)) {
        SLOG_ERROR().message("File not found").context("path", filePath);
        return false;
    }

    std::ifstream file(filePath, std::ios::binary);
    if (!file.is_open()) {
        SLOG_ERROR().message("Cannot open file for reading").context("path", filePath);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        SLOG_ERROR().message("Error reading file content").context("path", filePath);
        return false;
    }

    content = buffer.str();
    SLOG_DEBUG().message("Read file content").context("path", filePath).context("bytes", content.size());
    return true;
}

bool FileUtils::ensureParentDirectoryExists(const std::string& filePath) {
    std::filesystem::path parent = std::filesystem::path(filePath).parent_path();
    if (parent.empty()) {
        return true;
    }
    return createDirectoryIfNotExists(parent.string());
}

} // namespace utils
} // namespace exportflow
