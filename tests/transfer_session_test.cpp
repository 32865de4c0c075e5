/******************************************************************************\
 * transfer_session_test.cpp - Unit tests for the SFTP session that need no server
 ******************************************************************************/

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>

// socket, bind, getsockname
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include "transfer_session.hpp"

#include "gtest/gtest.h"

namespace fs = std::filesystem;

namespace {

// Hands out `data` in chunks of at most `chunk` bytes.
ChunkReader readerFor(const std::string& data, std::size_t chunk = 4)
{
    auto offset = std::make_shared<std::size_t>(0);
    return [data, chunk, offset](char* buf, std::size_t size) -> long {
        std::size_t n = std::min({chunk, size, data.size() - *offset});
        std::memcpy(buf, data.data() + *offset, n);
        *offset += n;
        return static_cast<long>(n);
    };
}

// A loopback port nothing listens on: bound once to get a free number, then released.
int closedLoopbackPort()
{
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return -1;
    }
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    socklen_t len = sizeof(addr);
    int port = -1;
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 &&
        ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
        port = ntohs(addr.sin_port);
    }
    ::close(fd);
    return port;
}

} // namespace

class TransferSessionTest : public ::testing::Test
{
protected:
    fs::path dir = fs::temp_directory_path() / "ilibrary-transfer-session-test";
    fs::path localFile = dir / "TESTFI1E.savf";
    TransferCredentials credentials{"127.0.0.1", "BACKUPUSR", "secret", 2222, 5};

    void SetUp() override
    {
        fs::remove_all(dir);
        fs::create_directories(dir);
    }

    void TearDown() override
    {
        fs::remove_all(dir);
    }
};

TEST_F(TransferSessionTest, EmptyPathsFailWithoutConnecting)
{
    SftpTransferSession session;
    credentials.host = "host.invalid";

    auto noRemote = session.download("", localFile.string(), credentials);
    ASSERT_FALSE(noRemote.has_value());
    EXPECT_EQ(noRemote.error().kind, TransferError::Kind::ProtocolError);

    auto noLocal = session.download("/home/user/TESTFI1E.savf", "", credentials);
    ASSERT_FALSE(noLocal.has_value());
    EXPECT_EQ(noLocal.error().kind, TransferError::Kind::ProtocolError);

    EXPECT_FALSE(fs::exists(localFile));
}

TEST_F(TransferSessionTest, RefusedConnectionIsAProtocolError)
{
    int port = closedLoopbackPort();
    if (port <= 0) {
        GTEST_SKIP() << "no loopback socket available";
    }
    credentials.port = port;

    SftpTransferSession session;
    auto result = session.download("/home/user/TESTFI1E.savf", localFile.string(), credentials);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, TransferError::Kind::ProtocolError);
    EXPECT_FALSE(fs::exists(localFile));
}

TEST_F(TransferSessionTest, CopyWritesEveryChunk)
{
    std::string payload = "SAVF header and some library data";

    auto result = copyToLocalFile(localFile.string(), readerFor(payload));
    ASSERT_TRUE(result.has_value()) << result.error().describe();

    std::ifstream in(localFile, std::ios::binary);
    std::string written((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(written, payload);
}

TEST_F(TransferSessionTest, ReadErrorRemovesThePartialFile)
{
    int calls = 0;
    auto result = copyToLocalFile(localFile.string(), [&calls](char* buf, std::size_t) -> long {
        if (++calls == 1) {
            buf[0] = 'S';
            return 1;
        }
        return -1;
    });

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, TransferError::Kind::ProtocolError);
    EXPECT_FALSE(fs::exists(localFile));
}

TEST_F(TransferSessionTest, WriteErrorAtCloseIsNotASuccess)
{
    if (!fs::exists("/dev/full")) {
        GTEST_SKIP() << "/dev/full not available";
    }

    // Small enough to stay in the stream buffer until close.
    auto result = copyToLocalFile("/dev/full", readerFor("SAVF DATA", 9));

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, TransferError::Kind::ProtocolError);
    EXPECT_NE(result.error().message.find("Write error"), std::string::npos);
    EXPECT_TRUE(fs::exists("/dev/full"));
}

TEST_F(TransferSessionTest, UnwritableLocalPathFails)
{
    auto result = copyToLocalFile((dir / "missing" / "TESTFI1E.savf").string(), readerFor("SAVF"));

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, TransferError::Kind::ProtocolError);
}
