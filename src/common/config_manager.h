#ifndef EXPORTFLOW_CONFIG_MANAGER_H
#define EXPORTFLOW_CONFIG_MANAGER_H

#include <string>
#include <vector>
#include <chrono>
#include <nlohmann/json.hpp>
#include "error_handler.h"

namespace exportflow {

// Back presses between the two transactions are always within [min, upper bound]
constexpr int kNavigationMinPresses = 3;
constexpr int kNavigationUpperBound = 4;

struct ConnectionSettings {
    std::string serverLabel = "00 SAP ERP";
    std::string connectionLabel = "H181 RP1 ENEL SP CCS Produ\xC3\xA7\xC3\xA3o (without SSO)";
    std::string launcherPath = "C:\\Program Files (x86)\\SAP\\FrontEnd\\SAPgui\\saplogon.exe";
    std::string windowTitlePattern = "SAP Logon.*";
    std::chrono::milliseconds startupTimeout{40000};
    std::chrono::milliseconds uiSearchTimeout{10000};
    int connectAttempts = 1;
    int minMatchScore = 1;
};

struct CredentialSettings {
    std::string username;
    std::string password;
    std::string client;
    std::string language = "PT";
};

struct TransactionSettings {
    std::string codeA = "zucrm_039";
    std::string codeB = "iw59";
    std::string categoryMarker = "ov";
    std::string reportVariant = "/abap ov2";
    std::string wildcardFilter = "*";
    std::chrono::milliseconds controlWaitTimeout{8000};
};

struct ExportSettings {
    std::string directoryA;
    std::string directoryB;
    std::string patternA = "export*.XLSX";
    std::string fallbackPatternA = "*.XLSX";
    std::string patternB = "brs_*.XLSX";
    std::string auditCopyPrefix = "full_copy_";
    std::chrono::milliseconds timeout{180000};
    std::chrono::milliseconds pollInterval{500};
};

struct NavigationSettings {
    int maxBackPresses = kNavigationUpperBound;
    std::chrono::milliseconds pressDelay{300};
};

struct RecordSettings {
    std::vector<std::string> acceptedHeaders = {"N\xC2\xBA Nota/Medida", "No Nota/Medida", "N Nota/Medida"};
    std::string measureMarker = "/000";
};

/**
 * @brief Immutable view of everything the automation core reads from configuration
 */
struct AutomationSettings {
    ConnectionSettings connection;
    CredentialSettings credentials;
    TransactionSettings transactions;
    ExportSettings exports;
    NavigationSettings navigation;
    RecordSettings records;
    std::chrono::milliseconds runLockTimeout{0};

    // Throws AutomationError(CONFIGURATION) on the first invalid value
    void validate() const;
};

class ConfigManager {
public:
    static ConfigManager& getInstance();

    bool loadConfig(const std::string& configPath = "config/exportflow.json");
    void saveConfig(const std::string& configPath = "config/exportflow.json");

    /**
     * @brief Materialize and validate the settings used by the automation core
     *
     * Relative export directories are resolved against the working directory.
     * Credentials from the environment variables named in the file take
     * precedence over values stored in the file.
     */
    AutomationSettings getAutomationSettings() const;

    // Logging Configuration
    std::string getLogFile() const;
    std::string getLogLevel() const;
    std::string getLogFormat() const;
    int getLogMaxSizeMb() const;
    int getLogMaxFiles() const;

    std::string getConfigPath() const;

    // Generic access by JSON pointer, e.g. "/exports/timeout_seconds"
    template<typename T>
    T get(const std::string& pointer) const;

    template<typename T>
    void set(const std::string& pointer, const T& value);

    void resetToDefaults();

private:
    ConfigManager();
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    nlohmann::json m_config;
    std::string m_configPath;

    void setDefaults();
    nlohmann::json lookup(const std::string& pointer) const;
    std::string getEnvironmentVariable(const std::string& name) const;
};

template<typename T>
T ConfigManager::get(const std::string& pointer) const {
    nlohmann::json value = lookup(pointer);
    if (value.is_null()) {
        throw AutomationError(ErrorType::CONFIGURATION, "Configuration key not found: " + pointer);
    }
    return value.get<T>();
}

template<typename T>
void ConfigManager::set(const std::string& pointer, const T& value) {
    m_config[nlohmann::json::json_pointer(pointer)] = value;
}

} // namespace exportflow

#endif // EXPORTFLOW_CONFIG_MANAGER_H
