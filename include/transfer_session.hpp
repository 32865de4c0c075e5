/**
 * @file transfer_session.hpp
 * @brief Defines the single-file download session used to fetch save files.
 *
 * A session connects to the host over SSH, opens an SFTP channel, copies one remote file to
 * one local path and disconnects. Every handle is released on every exit path.
 *
 * @note Requires libssh. Install via apt (libssh-dev) on Linux or Homebrew on macOS.
 */

#ifndef TRANSFER_SESSION_HPP
#define TRANSFER_SESSION_HPP

#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include "ilibrary_errors.hpp"

/**
 * @brief Endpoint and credentials of one transfer.
 */
struct TransferCredentials {
    std::string host;      ///< Host name of the IBM i system.
    std::string user;      ///< User profile.
    std::string password;  ///< Password of the user profile.
    int port = 2222;       ///< SSH port.
    long timeoutSeconds = 0; ///< Connect timeout, 0 for the libssh default.
};

/**
 * @brief Interface for download sessions.
 */
class TransferSession {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~TransferSession() = default;

    /**
     * @brief Copies one remote file to a local path.
     *
     * @param remotePath Full path of the file on the host's IFS.
     * @param localPath Full local destination path. An existing file is overwritten.
     * @param credentials Host, user, password and port to connect with.
     * @return std::expected<void, TransferError> Success, or why the download failed.
     */
    virtual std::expected<void, TransferError> download(const std::string& remotePath,
                                                        const std::string& localPath,
                                                        const TransferCredentials& credentials) = 0;
};

/**
 * @brief Creates a fresh session for each transfer step.
 */
using TransferSessionFactory = std::function<std::unique_ptr<TransferSession>()>;

/**
 * @brief Source of download data: fills up to `size` bytes of `buf`.
 *
 * Returns the number of bytes written, 0 at end of data, or a negative value on error.
 */
using ChunkReader = std::function<long(char* buf, std::size_t size)>;

/**
 * @brief Writes everything `read` produces to a local file.
 *
 * The file is flushed and closed before success is reported. On any read, write or close
 * failure the partial file is removed.
 *
 * @return std::expected<void, TransferError> Success, or a ProtocolError.
 */
std::expected<void, TransferError> copyToLocalFile(const std::string& localPath, const ChunkReader& read);

/**
 * @brief SFTP download session based on libssh.
 *
 * Authenticates with the password. The host key is not checked against known_hosts, so
 * the first connection to a host is trusted as is.
 */
class SftpTransferSession : public TransferSession {
public:
    std::expected<void, TransferError> download(const std::string& remotePath,
                                                const std::string& localPath,
                                                const TransferCredentials& credentials) override;
};

#endif // TRANSFER_SESSION_HPP
