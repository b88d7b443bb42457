#include "test_support.h"
#include "common/config_manager.h"
#include "common/file_utils.h"
#include <cstdlib>

using namespace exportflow;
using namespace exportflow::testing;

namespace {

void setEnvironment(const std::string& name, const std::string& value) {
#ifdef _WIN32
    _putenv_s(name.c_str(), value.c_str());
#else
    setenv(name.c_str(), value.c_str(), 1);
#endif
}

void clearEnvironment(const std::string& name) {
#ifdef _WIN32
    _putenv_s(name.c_str(), "");
#else
    unsetenv(name.c_str());
#endif
}

ConfigManager& loadFrom(const std::string& path) {
    ConfigManager& config = ConfigManager::getInstance();
    config.resetToDefaults();
    expect(config.loadConfig(path), "configuration loads: " + path);
    return config;
}

} // anonymous namespace

void testMissingFileWritesDefaults() {
    TempDirectory temp;
    std::string path = temp.file("config/exportflow.json");

    ConfigManager& config = loadFrom(path);
    expect(utils::FileUtils::fileExists(path), "defaults written");
    expectEqual(config.getConfigPath(), path, "path remembered");

    AutomationSettings settings = config.getAutomationSettings();
    expectEqual(settings.exports.timeout.count(), 180000LL, "export timeout");
    expectEqual(settings.exports.pollInterval.count(), 500LL, "poll interval");
    expectEqual(settings.connection.startupTimeout.count(), 40000LL, "startup timeout");
    expectEqual(settings.transactions.controlWaitTimeout.count(), 8000LL, "control wait timeout");
    expectEqual(settings.navigation.maxBackPresses, 4, "back presses");
    expectEqual(settings.exports.patternB, std::string("brs_*.XLSX"), "pattern B");
    expect(std::filesystem::path(settings.exports.directoryA).is_absolute(), "directory A absolute");
    expectEqual(std::filesystem::path(settings.exports.directoryA).filename().string(), std::string("export-A"),
                "directory A under the base directory");
    expectEqual(config.getLogLevel(), std::string("INFO"), "log level");
}

void testFileValuesAndFallbacks() {
    TempDirectory temp;
    std::string path = temp.file("exportflow.json");
    nlohmann::json document = {
        {"exports", {{"directory_a", temp.file("in")}, {"timeout_seconds", 2.5}}},
        {"navigation", {{"max_back_presses", 3}}},
        {"logging", {{"level", "DEBUG"}, {"format", "json"}}}
    };
    writeFile(path, document.dump(2));

    ConfigManager& config = loadFrom(path);
    AutomationSettings settings = config.getAutomationSettings();

    expectEqual(settings.exports.timeout.count(), 2500LL, "fractional seconds");
    expectEqual(settings.exports.directoryA, temp.file("in"), "explicit directory A");
    expectEqual(settings.navigation.maxBackPresses, 3, "file value");
    expectEqual(settings.exports.patternA, std::string("export*.XLSX"), "missing key falls back to default");
    expectEqual(config.getLogFormat(), std::string("json"), "log format");
    expectEqual(config.getLogMaxFiles(), 5, "default max files");
}

void testEnvironmentOverridesCredentials() {
    TempDirectory temp;
    std::string path = temp.file("exportflow.json");
    nlohmann::json document = {
        {"credentials", {
            {"username", "file_user"},
            {"password", "file_password"},
            {"username_env", "EXPORTFLOW_TEST_USER"},
            {"password_env", "EXPORTFLOW_TEST_PASSWORD"}
        }}
    };
    writeFile(path, document.dump());

    setEnvironment("EXPORTFLOW_TEST_USER", "env_user");
    clearEnvironment("EXPORTFLOW_TEST_PASSWORD");

    AutomationSettings settings = loadFrom(path).getAutomationSettings();
    clearEnvironment("EXPORTFLOW_TEST_USER");

    expectEqual(settings.credentials.username, std::string("env_user"), "environment wins");
    expectEqual(settings.credentials.password, std::string("file_password"), "unset variable keeps file value");
}

void testInvalidValuesRejected() {
    TempDirectory temp;
    std::string path = temp.file("exportflow.json");

    writeFile(path, nlohmann::json({{"navigation", {{"max_back_presses", 2}}}}).dump());
    auto tooFew = expectThrows<AutomationError>([&]() { loadFrom(path).getAutomationSettings(); }, "below minimum");
    expect(tooFew.type() == ErrorType::CONFIGURATION, "configuration error");

    writeFile(path, nlohmann::json({{"exports", {{"timeout_seconds", 0}}}}).dump());
    expectThrows<AutomationError>([&]() { loadFrom(path).getAutomationSettings(); }, "zero timeout");

    writeFile(path, nlohmann::json({{"exports", {{"timeout_seconds", "soon"}}}}).dump());
    auto wrongType = expectThrows<AutomationError>([&]() { loadFrom(path).getAutomationSettings(); }, "wrong type");
    expect(wrongType.type() == ErrorType::CONFIGURATION, "type mismatch reported as configuration error");
    expectEqual(wrongType.getErrorInfo().context, path, "file named");
}

void testMalformedFileFailsToLoad() {
    TempDirectory temp;
    std::string path = temp.file("exportflow.json");
    writeFile(path, "{ \"exports\": ");

    ConfigManager& config = ConfigManager::getInstance();
    expect(!config.loadConfig(path), "parse error reported");

    writeFile(path, "[1, 2, 3]");
    expect(!config.loadConfig(path), "non-object rejected");
    config.resetToDefaults();
}

void testPointerAccess() {
    ConfigManager& config = ConfigManager::getInstance();
    config.resetToDefaults();

    config.set("/exports/pattern_b", std::string("lookup_*.csv"));
    expectEqual(config.get<std::string>("/exports/pattern_b"), std::string("lookup_*.csv"), "value set");
    expectEqual(config.get<int>("/navigation/press_delay_ms"), 300, "default read");
    expectThrows<AutomationError>([&]() { config.get<std::string>("/does/not/exist"); }, "unknown key");
    config.resetToDefaults();
}

int main() {
    return runTests("ConfigManager", {
        {"missing file writes defaults", testMissingFileWritesDefaults},
        {"file values and fallbacks", testFileValuesAndFallbacks},
        {"environment overrides credentials", testEnvironmentOverridesCredentials},
        {"invalid values rejected", testInvalidValuesRejected},
        {"malformed file fails to load", testMalformedFileFailsToLoad},
        {"pointer access", testPointerAccess}
    });
}
