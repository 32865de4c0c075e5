#include "host_config.hpp"
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

std::string envValue(const char* name) {
    const char* raw = std::getenv(name);
    return raw ? std::string(raw) : std::string();
}

std::string valueOrEnv(const Json::Value& configJson, const char* key, const char* envName) {
    std::string value = configJson.get(key, "").asString();
    if (value.empty()) {
        value = envValue(envName);
    }
    if (value.empty()) {
        throw std::runtime_error(std::string("Missing configuration value '") + key +
                                 "' (set it in the config file or " + envName + ")");
    }
    return value;
}

Json::Value readConfigFile(const std::string& configFile) {
    std::ifstream file(configFile);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + configFile);
    }
    Json::Value configJson;
    Json::Reader reader;
    if (!reader.parse(file, configJson)) {
        throw std::runtime_error("Failed to parse config file: " + configFile + ": " +
                                 reader.getFormattedErrorMessages());
    }
    return configJson;
}

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto timeT = std::chrono::system_clock::to_time_t(now);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", std::localtime(&timeT));
    return timeBuf;
}

// ODBC attribute value in braces, with '}' doubled.
std::string braced(const std::string& value) {
    std::string out = "{";
    for (char c : value) {
        out += c;
        if (c == '}') {
            out += '}';
        }
    }
    return out + "}";
}

void appendLine(const std::string& path, const std::string& line) {
    std::error_code ec;
    fs::path logPath(path);
    if (logPath.has_parent_path()) {
        fs::create_directories(logPath.parent_path(), ec);
    }
    std::ofstream log(path, std::ios::app);
    if (log.is_open()) {
        log << line << '\n';
        log.flush();
    } else {
        std::cerr << "Error: Cannot write to log file: " << path << std::endl;
    }
}

} // namespace

HostConfig::HostConfig(const std::string& configFile) : HostConfig(readConfigFile(configFile)) {}

HostConfig::HostConfig(const Json::Value& configJson) {
    driver = valueOrEnv(configJson, "driver", "DB_DRIVER");
    system = valueOrEnv(configJson, "system", "DB_SYSTEM");
    user = valueOrEnv(configJson, "user", "DB_USER");
    password = valueOrEnv(configJson, "password", "DB_PASSWORD");

    sshPort = configJson.get("ssh_port", kDefaultSshPort).asInt();
    if (sshPort <= 0 || sshPort > 65535) {
        throw std::runtime_error("Invalid ssh_port: " + std::to_string(sshPort));
    }
    loginTimeout = configJson.get("login_timeout", 0).asInt();
    sshTimeout = configJson.get("ssh_timeout", 0).asInt();

    logDir = configJson.get("log_dir", "./logs/").asString();
    if (!logDir.empty() && logDir.back() != '/') {
        logDir += '/';
    }
    logFile = logDir + "ilibrary.log";
    errorLogFile = logDir + "errors.log";

    telegramConfig = configJson["telegram"];
}

HostConfig HostConfig::fromEnvironment() {
    return HostConfig(Json::Value(Json::objectValue));
}

void HostConfig::logMessage(const std::string& message) const {
    std::string logEntry = "[" + timestamp() + "] " + message;
    std::cout << logEntry << std::endl;
    appendLine(logFile, logEntry);
}

void HostConfig::logError(const std::string& message) const {
    std::string logEntry = "[" + timestamp() + "] ERROR: " + message;
    std::cerr << logEntry << std::endl;
    appendLine(errorLogFile, logEntry);
}

std::string HostConfig::connectionString() const {
    return "DRIVER=" + braced(driver) + ";SYSTEM=" + braced(system) + ";UID=" + braced(user) +
           ";PWD=" + braced(password) + ";";
}
