/**
 * @file host_config.hpp
 * @brief Connection and logging configuration for iLibrary.
 *
 * Holds the IBM i host name, ODBC driver, credentials, SSH port and log locations. Values
 * come from a JSON file, with the credentials falling back to the DB_DRIVER, DB_SYSTEM,
 * DB_USER and DB_PASSWORD environment variables when the file leaves them out.
 *
 * @note The password is kept in memory for the ODBC connection and the SFTP login. It is
 * never written to the logs.
 */

#ifndef HOST_CONFIG_HPP
#define HOST_CONFIG_HPP

#include <string>
#include <json/json.h>

/**
 * @brief Configuration class for one IBM i host.
 */
class HostConfig {
public:
    static constexpr int kDefaultSshPort = 2222; ///< SSH port of the host's SFTP service.

    /**
     * @brief Constructs a configuration from a JSON file.
     *
     * @param configFile Path to the JSON configuration file.
     * @throws std::runtime_error If the file cannot be read or parsed, or credentials are missing.
     */
    explicit HostConfig(const std::string& configFile);

    /**
     * @brief Constructs a configuration from an already parsed JSON document.
     *
     * @param configJson Parsed configuration. Missing keys take their defaults.
     * @throws std::runtime_error If credentials are missing from both the JSON and the environment.
     */
    explicit HostConfig(const Json::Value& configJson);

    /**
     * @brief Builds a configuration only from DB_* environment variables.
     *
     * @throws std::runtime_error If one of the variables is missing.
     */
    static HostConfig fromEnvironment();

    /**
     * @brief Logs an informational message to stdout and the log file.
     *
     * @param message Message to log.
     */
    void logMessage(const std::string& message) const;

    /**
     * @brief Logs an error to stderr and the error log file.
     *
     * @param message Error message to log.
     */
    void logError(const std::string& message) const;

    /**
     * @brief Returns the ODBC connection string for this host.
     *
     * Format: DRIVER={driver};SYSTEM={system};UID={user};PWD={password};
     * Every value is enclosed in braces with '}' doubled, so ';' and '=' in a password are safe.
     */
    std::string connectionString() const;

    std::string driver;          ///< ODBC driver name (e.g. "IBM i Access ODBC Driver").
    std::string system;          ///< Host name of the IBM i system, used for ODBC and SSH.
    std::string user;            ///< User profile.
    std::string password;        ///< Password of the user profile.
    int sshPort;                 ///< SSH port for save file downloads.
    int loginTimeout;            ///< ODBC login timeout in seconds, 0 for driver default.
    int sshTimeout;              ///< SSH connect timeout in seconds, 0 for libssh default.
    std::string logDir;          ///< Directory for the log files.
    std::string logFile;         ///< Path to the log file.
    std::string errorLogFile;    ///< Path to the error log file.
    Json::Value telegramConfig;  ///< Telegram configuration for failure notifications.
};

#endif // HOST_CONFIG_HPP
