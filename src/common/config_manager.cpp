#include "config_manager.h"
#include "structured_logger.h"
#include "file_utils.h"
#include <filesystem>
#include <cstdlib>

namespace exportflow {

namespace {

nlohmann::json defaultConfig() {
    const AutomationSettings defaults;
    return nlohmann::json{
        {"connection", {
            {"server_label", defaults.connection.serverLabel},
            {"connection_label", defaults.connection.connectionLabel},
            {"launcher_path", defaults.connection.launcherPath},
            {"window_title_pattern", defaults.connection.windowTitlePattern},
            {"startup_timeout_seconds", 40},
            {"ui_search_timeout_seconds", 10},
            {"connect_attempts", defaults.connection.connectAttempts},
            {"min_match_score", defaults.connection.minMatchScore}
        }},
        {"credentials", {
            {"username", ""},
            {"password", ""},
            {"username_env", "EXPORTFLOW_USERNAME"},
            {"password_env", "EXPORTFLOW_PASSWORD"},
            {"client", ""},
            {"language", defaults.credentials.language}
        }},
        {"transactions", {
            {"code_a", defaults.transactions.codeA},
            {"code_b", defaults.transactions.codeB},
            {"category_marker", defaults.transactions.categoryMarker},
            {"report_variant", defaults.transactions.reportVariant},
            {"wildcard_filter", defaults.transactions.wildcardFilter},
            {"control_wait_timeout_seconds", 8}
        }},
        {"exports", {
            {"base_directory", "exports"},
            {"directory_a", ""},
            {"directory_b", ""},
            {"pattern_a", defaults.exports.patternA},
            {"fallback_pattern_a", defaults.exports.fallbackPatternA},
            {"pattern_b", defaults.exports.patternB},
            {"audit_copy_prefix", defaults.exports.auditCopyPrefix},
            {"timeout_seconds", 180},
            {"poll_interval_ms", 500}
        }},
        {"navigation", {
            {"max_back_presses", defaults.navigation.maxBackPresses},
            {"press_delay_ms", 300}
        }},
        {"records", {
            {"accepted_headers", defaults.records.acceptedHeaders},
            {"measure_marker", defaults.records.measureMarker}
        }},
        {"run", {
            {"lock_timeout_seconds", 0}
        }},
        {"logging", {
            {"level", "INFO"},
            {"file", "logs/exportflow.log"},
            {"format", "text"},
            {"max_size_mb", 10},
            {"max_files", 5}
        }}
    };
}

void requirePositive(std::chrono::milliseconds value, const std::string& key) {
    if (value.count() <= 0) {
        throw AutomationError(ErrorType::CONFIGURATION, "Configuration value must be positive: " + key,
                              std::to_string(value.count()) + " ms");
    }
}

void requireNonEmpty(const std::string& value, const std::string& key) {
    if (value.empty()) {
        throw AutomationError(ErrorType::CONFIGURATION, "Configuration value must not be empty: " + key);
    }
}

} // anonymous namespace

void AutomationSettings::validate() const {
    requirePositive(connection.startupTimeout, "connection.startup_timeout_seconds");
    requirePositive(connection.uiSearchTimeout, "connection.ui_search_timeout_seconds");
    requirePositive(transactions.controlWaitTimeout, "transactions.control_wait_timeout_seconds");
    requirePositive(exports.timeout, "exports.timeout_seconds");
    requirePositive(exports.pollInterval, "exports.poll_interval_ms");

    if (connection.connectAttempts < 1) {
        throw AutomationError(ErrorType::CONFIGURATION, "connection.connect_attempts must be at least 1",
                              std::to_string(connection.connectAttempts));
    }
    if (navigation.maxBackPresses < kNavigationMinPresses) {
        throw AutomationError(ErrorType::CONFIGURATION,
                              "navigation.max_back_presses is below the minimum of " +
                              std::to_string(kNavigationMinPresses),
                              std::to_string(navigation.maxBackPresses));
    }
    if (navigation.pressDelay.count() < 0 || runLockTimeout.count() < 0) {
        throw AutomationError(ErrorType::CONFIGURATION, "Delays must not be negative");
    }

    requireNonEmpty(connection.serverLabel, "connection.server_label");
    requireNonEmpty(connection.connectionLabel, "connection.connection_label");
    requireNonEmpty(transactions.codeA, "transactions.code_a");
    requireNonEmpty(transactions.codeB, "transactions.code_b");
    requireNonEmpty(exports.directoryA, "exports.directory_a");
    requireNonEmpty(exports.directoryB, "exports.directory_b");
    requireNonEmpty(exports.patternA, "exports.pattern_a");
    requireNonEmpty(exports.fallbackPatternA, "exports.fallback_pattern_a");
    requireNonEmpty(exports.patternB, "exports.pattern_b");
    requireNonEmpty(records.measureMarker, "records.measure_marker");
    if (records.acceptedHeaders.empty()) {
        throw AutomationError(ErrorType::CONFIGURATION, "records.accepted_headers must list at least one header");
    }
}

ConfigManager::ConfigManager() {
    setDefaults();
}

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::loadConfig(const std::string& configPath) {
    m_configPath = configPath;

    if (utils::FileUtils::loadJsonFromFile(configPath, m_config) && m_config.is_object()) {
        SLOG_INFO().message("Configuration loaded").context("config_path", configPath);
        return true;
    }

    if (utils::FileUtils::fileExists(configPath)) {
        SLOG_ERROR().message("Configuration file is not a valid JSON object").context("config_path", configPath);
        setDefaults();
        return false;
    }

    SLOG_WARNING().message("Config file not found, using defaults").context("config_path", configPath);
    setDefaults();
    saveConfig(configPath);
    return true;
}

void ConfigManager::saveConfig(const std::string& configPath) {
    if (!utils::FileUtils::saveJsonToFile(configPath, m_config)) {
        SLOG_ERROR().message("Failed to save configuration").context("config_path", configPath);
    }
}

void ConfigManager::setDefaults() {
    m_config = defaultConfig();
}

void ConfigManager::resetToDefaults() {
    setDefaults();
}

std::string ConfigManager::getEnvironmentVariable(const std::string& name) const {
    if (name.empty()) {
        return "";
    }
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : std::string();
}

nlohmann::json ConfigManager::lookup(const std::string& pointer) const {
    const nlohmann::json::json_pointer ptr(pointer);
    if (m_config.contains(ptr) && !m_config.at(ptr).is_null()) {
        return m_config.at(ptr);
    }
    static const nlohmann::json defaults = defaultConfig();
    if (defaults.contains(ptr)) {
        return defaults.at(ptr);
    }
    return nullptr;
}

AutomationSettings ConfigManager::getAutomationSettings() const {
    AutomationSettings settings;

    auto text = [this](const std::string& pointer) { return get<std::string>(pointer); };
    auto seconds = [this](const std::string& pointer) {
        return std::chrono::milliseconds(static_cast<long long>(get<double>(pointer) * 1000.0));
    };
    auto millis = [this](const std::string& pointer) {
        return std::chrono::milliseconds(get<long long>(pointer));
    };

    try {
        settings.connection.serverLabel = text("/connection/server_label");
        settings.connection.connectionLabel = text("/connection/connection_label");
        settings.connection.launcherPath = text("/connection/launcher_path");
        settings.connection.windowTitlePattern = text("/connection/window_title_pattern");
        settings.connection.startupTimeout = seconds("/connection/startup_timeout_seconds");
        settings.connection.uiSearchTimeout = seconds("/connection/ui_search_timeout_seconds");
        settings.connection.connectAttempts = get<int>("/connection/connect_attempts");
        settings.connection.minMatchScore = get<int>("/connection/min_match_score");

        settings.credentials.username = text("/credentials/username");
        settings.credentials.password = text("/credentials/password");
        settings.credentials.client = text("/credentials/client");
        settings.credentials.language = text("/credentials/language");

        std::string userFromEnv = getEnvironmentVariable(text("/credentials/username_env"));
        if (!userFromEnv.empty()) {
            settings.credentials.username = userFromEnv;
        }
        std::string passwordFromEnv = getEnvironmentVariable(text("/credentials/password_env"));
        if (!passwordFromEnv.empty()) {
            settings.credentials.password = passwordFromEnv;
        }

        settings.transactions.codeA = text("/transactions/code_a");
        settings.transactions.codeB = text("/transactions/code_b");
        settings.transactions.categoryMarker = text("/transactions/category_marker");
        settings.transactions.reportVariant = text("/transactions/report_variant");
        settings.transactions.wildcardFilter = text("/transactions/wildcard_filter");
        settings.transactions.controlWaitTimeout = seconds("/transactions/control_wait_timeout_seconds");

        std::filesystem::path base = text("/exports/base_directory");
        std::string dirA = text("/exports/directory_a");
        std::string dirB = text("/exports/directory_b");
        settings.exports.directoryA = std::filesystem::absolute(dirA.empty() ? base / "export-A" : std::filesystem::path(dirA)).lexically_normal().string();
        settings.exports.directoryB = std::filesystem::absolute(dirB.empty() ? base / "export-B" : std::filesystem::path(dirB)).lexically_normal().string();
        settings.exports.patternA = text("/exports/pattern_a");
        settings.exports.fallbackPatternA = text("/exports/fallback_pattern_a");
        settings.exports.patternB = text("/exports/pattern_b");
        settings.exports.auditCopyPrefix = text("/exports/audit_copy_prefix");
        settings.exports.timeout = seconds("/exports/timeout_seconds");
        settings.exports.pollInterval = millis("/exports/poll_interval_ms");

        settings.navigation.maxBackPresses = get<int>("/navigation/max_back_presses");
        settings.navigation.pressDelay = millis("/navigation/press_delay_ms");

        settings.records.acceptedHeaders = get<std::vector<std::string>>("/records/accepted_headers");
        settings.records.measureMarker = text("/records/measure_marker");

        settings.runLockTimeout = seconds("/run/lock_timeout_seconds");
    } catch (const nlohmann::json::exception& e) {
        throw AutomationError(ErrorType::CONFIGURATION, "Configuration value has the wrong type", e.what(), m_configPath);
    }

    settings.validate();
    return settings;
}

std::string ConfigManager::getLogFile() const {
    return get<std::string>("/logging/file");
}

std::string ConfigManager::getLogLevel() const {
    return get<std::string>("/logging/level");
}

std::string ConfigManager::getLogFormat() const {
    return get<std::string>("/logging/format");
}

int ConfigManager::getLogMaxSizeMb() const {
    return get<int>("/logging/max_size_mb");
}

int ConfigManager::getLogMaxFiles() const {
    return get<int>("/logging/max_files");
}

std::string ConfigManager::getConfigPath() const {
    return m_configPath;
}

} // namespace exportflow
