/******************************************************************************\
 * host_config_test.cpp - Unit tests for configuration loading and logging
 ******************************************************************************/

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>

#include "host_config.hpp"

#include "test_config.hpp"

#include "gtest/gtest.h"

namespace fs = std::filesystem;

namespace {

// Sets a variable for the lifetime of the object and restores the previous value.
class ScopedEnv
{
public:
    ScopedEnv(const char* name, const char* value)
        : m_name{name}
    {
        if (const char* old = std::getenv(name)) {
            m_old = old;
            m_hadOld = true;
        }
        if (value) {
            ::setenv(name, value, 1);
        } else {
            ::unsetenv(name);
        }
    }

    ~ScopedEnv()
    {
        if (m_hadOld) {
            ::setenv(m_name.c_str(), m_old.c_str(), 1);
        } else {
            ::unsetenv(m_name.c_str());
        }
    }

private:
    std::string m_name;
    std::string m_old;
    bool m_hadOld = false;
};

std::string readAll(const fs::path& path)
{
    std::ifstream in(path);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace

TEST(HostConfigTest, Defaults)
{
    HostConfig config = testConfig();

    EXPECT_EQ(config.sshPort, 2222);
    EXPECT_EQ(config.loginTimeout, 0);
    EXPECT_EQ(config.sshTimeout, 0);
    EXPECT_TRUE(config.telegramConfig.isNull());
    EXPECT_EQ(config.logFile, testLogDir().string() + "/ilibrary.log");
    EXPECT_EQ(config.errorLogFile, testLogDir().string() + "/errors.log");
}

TEST(HostConfigTest, ConnectionString)
{
    HostConfig config = testConfig();

    EXPECT_EQ(config.connectionString(),
        "DRIVER={IBM i Access ODBC Driver};SYSTEM={ibmi.example.test};UID={BACKUPUSR};PWD={secret};");
}

TEST(HostConfigTest, ConnectionStringQuotesSeparatorsInValues)
{
    Json::Value json(Json::objectValue);
    json["driver"] = "Driver;X=1";
    json["system"] = "ibmi.example.test";
    json["user"] = "BACKUPUSR";
    json["password"] = "pa;ss}word=";
    json["log_dir"] = testLogDir().string();

    EXPECT_EQ(HostConfig(json).connectionString(),
        "DRIVER={Driver;X=1};SYSTEM={ibmi.example.test};UID={BACKUPUSR};PWD={pa;ss}}word=};");
}

TEST(HostConfigTest, ReadsFile)
{
    fs::path file = fs::temp_directory_path() / "ilibrary-host-config-test.json";
    {
        std::ofstream out(file);
        out << R"({"driver": "IBM i Access ODBC Driver", "system": "pub400.com", "user": "U",)"
            << R"( "password": "P", "ssh_port": 22, "login_timeout": 15, "log_dir": "/tmp/il"})";
    }

    HostConfig config(file.string());
    EXPECT_EQ(config.system, "pub400.com");
    EXPECT_EQ(config.sshPort, 22);
    EXPECT_EQ(config.loginTimeout, 15);
    EXPECT_EQ(config.logDir, "/tmp/il/");

    fs::remove(file);
}

TEST(HostConfigTest, BadFilesThrow)
{
    EXPECT_THROW(HostConfig{std::string("/nonexistent/ilibrary.json")}, std::runtime_error);

    fs::path file = fs::temp_directory_path() / "ilibrary-host-config-broken.json";
    {
        std::ofstream out(file);
        out << "{ not json";
    }
    EXPECT_THROW(HostConfig{file.string()}, std::runtime_error);
    fs::remove(file);
}

TEST(HostConfigTest, CredentialsFallBackToEnvironment)
{
    ScopedEnv driver("DB_DRIVER", "IBM i Access ODBC Driver");
    ScopedEnv system("DB_SYSTEM", "envhost");
    ScopedEnv user("DB_USER", "ENVUSER");
    ScopedEnv password("DB_PASSWORD", "envpass");

    HostConfig config = HostConfig::fromEnvironment();
    EXPECT_EQ(config.system, "envhost");
    EXPECT_EQ(config.user, "ENVUSER");
    EXPECT_EQ(config.password, "envpass");

    Json::Value json(Json::objectValue);
    json["system"] = "filehost";
    EXPECT_EQ(HostConfig(json).system, "filehost");
}

TEST(HostConfigTest, MissingCredentialsThrow)
{
    ScopedEnv driver("DB_DRIVER", "IBM i Access ODBC Driver");
    ScopedEnv system("DB_SYSTEM", "envhost");
    ScopedEnv user("DB_USER", "ENVUSER");
    ScopedEnv password("DB_PASSWORD", nullptr);

    EXPECT_THROW(HostConfig::fromEnvironment(), std::runtime_error);
}

TEST(HostConfigTest, InvalidPortThrows)
{
    Json::Value json(Json::objectValue);
    json["driver"] = "d";
    json["system"] = "s";
    json["user"] = "u";
    json["password"] = "p";
    json["ssh_port"] = 70000;

    EXPECT_THROW(HostConfig{json}, std::runtime_error);
}

TEST(HostConfigTest, ErrorsGoToTheErrorLog)
{
    HostConfig config = testConfig();
    fs::remove(config.errorLogFile);

    config.logError("CPF9810 Library NOSUCH not found");

    std::string content = readAll(config.errorLogFile);
    ASSERT_FALSE(content.empty());
    EXPECT_NE(content.find("ERROR: CPF9810 Library NOSUCH not found"), std::string::npos);
    EXPECT_EQ(content.front(), '[');
}
