/******************************************************************************\
 * sftp_integration_test.cpp - SftpTransferSession against a real SSH server
 *
 * Skipped unless ILIBRARY_IT_HOST, ILIBRARY_IT_USER, ILIBRARY_IT_PASSWORD and
 * ILIBRARY_IT_REMOTE_FILE are set. ILIBRARY_IT_PORT defaults to 2222.
 ******************************************************************************/

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>

#include "transfer_session.hpp"

#include "gtest/gtest.h"

namespace fs = std::filesystem;

namespace {

std::optional<std::string> envValue(const char* key)
{
    const char* raw = std::getenv(key);
    if (!raw || !*raw) {
        return std::nullopt;
    }
    return std::string(raw);
}

} // namespace

class SftpIntegrationTest : public ::testing::Test
{
protected:
    TransferCredentials credentials;
    std::string remoteFile;
    fs::path localFile = fs::temp_directory_path() / "ilibrary-sftp-it.savf";

    void SetUp() override
    {
        auto host = envValue("ILIBRARY_IT_HOST");
        auto user = envValue("ILIBRARY_IT_USER");
        auto password = envValue("ILIBRARY_IT_PASSWORD");
        auto remote = envValue("ILIBRARY_IT_REMOTE_FILE");
        if (!host || !user || !password || !remote) {
            GTEST_SKIP() << "ILIBRARY_IT_* variables not set";
        }
        credentials.host = *host;
        credentials.user = *user;
        credentials.password = *password;
        credentials.timeoutSeconds = 30;
        if (auto port = envValue("ILIBRARY_IT_PORT")) {
            credentials.port = std::stoi(*port);
        }
        remoteFile = *remote;
        fs::remove(localFile);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove(localFile, ec);
    }
};

TEST_F(SftpIntegrationTest, DownloadsTheRemoteFile)
{
    SftpTransferSession session;

    auto result = session.download(remoteFile, localFile.string(), credentials);
    ASSERT_TRUE(result.has_value()) << result.error().describe();
    EXPECT_TRUE(fs::exists(localFile));
}

TEST_F(SftpIntegrationTest, WrongPasswordIsAnAuthenticationFailure)
{
    SftpTransferSession session;
    credentials.password += "-wrong";

    auto result = session.download(remoteFile, localFile.string(), credentials);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, TransferError::Kind::AuthenticationFailed);
    EXPECT_FALSE(fs::exists(localFile));
}

TEST_F(SftpIntegrationTest, MissingRemoteFileIsReported)
{
    SftpTransferSession session;

    auto result = session.download(remoteFile + ".does-not-exist", localFile.string(), credentials);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, TransferError::Kind::RemoteFileNotFound);
    EXPECT_FALSE(fs::exists(localFile));
}
