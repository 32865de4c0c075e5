#include "transfer_session.hpp"
#include <libssh/libssh.h>
#include <libssh/sftp.h>
#include <fcntl.h>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace {

struct SshSessionDeleter {
    void operator()(ssh_session ssh) const {
        ssh_disconnect(ssh);
        ssh_free(ssh);
    }
};

struct SftpSessionDeleter {
    void operator()(sftp_session sftp) const { sftp_free(sftp); }
};

struct SftpFileDeleter {
    void operator()(sftp_file file) const { sftp_close(file); }
};

using SshHandle = std::unique_ptr<ssh_session_struct, SshSessionDeleter>;
using SftpHandle = std::unique_ptr<sftp_session_struct, SftpSessionDeleter>;
using SftpFileHandle = std::unique_ptr<sftp_file_struct, SftpFileDeleter>;

std::unexpected<TransferError> fail(TransferError::Kind kind, std::string message) {
    return std::unexpected(TransferError{kind, std::move(message)});
}

void discardPartialFile(const std::string& localPath) {
    std::error_code ec;
    if (fs::is_regular_file(localPath, ec)) {
        fs::remove(localPath, ec);
    }
}

} // namespace

std::expected<void, TransferError> copyToLocalFile(const std::string& localPath, const ChunkReader& read) {
    std::ofstream output(localPath, std::ios::binary | std::ios::trunc);
    if (!output) {
        return fail(TransferError::Kind::ProtocolError, "Failed to open local file: " + localPath);
    }

    char buf[16384];
    for (;;) {
        long n = read(buf, sizeof(buf));
        if (n == 0) {
            break;
        }
        if (n < 0) {
            output.close();
            discardPartialFile(localPath);
            return fail(TransferError::Kind::ProtocolError, "Read error while receiving " + localPath);
        }
        output.write(buf, n);
        if (!output) {
            output.close();
            discardPartialFile(localPath);
            return fail(TransferError::Kind::ProtocolError, "Write error on local file: " + localPath);
        }
    }
    // Buffered data reaches the file only here.
    output.close();
    if (!output) {
        discardPartialFile(localPath);
        return fail(TransferError::Kind::ProtocolError, "Write error on local file: " + localPath);
    }
    return {};
}

std::expected<void, TransferError> SftpTransferSession::download(const std::string& remotePath,
                                                                 const std::string& localPath,
                                                                 const TransferCredentials& credentials) {
    if (localPath.empty()) {
        return fail(TransferError::Kind::ProtocolError, "A local file path is required");
    }
    if (remotePath.empty()) {
        return fail(TransferError::Kind::ProtocolError, "A remote path is required");
    }

    SshHandle ssh(ssh_new());
    if (!ssh) {
        return fail(TransferError::Kind::ProtocolError, "Failed to create SSH session");
    }
    int port = credentials.port;
    ssh_options_set(ssh.get(), SSH_OPTIONS_HOST, credentials.host.c_str());
    ssh_options_set(ssh.get(), SSH_OPTIONS_PORT, &port);
    ssh_options_set(ssh.get(), SSH_OPTIONS_USER, credentials.user.c_str());
    if (credentials.timeoutSeconds > 0) {
        long timeout = credentials.timeoutSeconds;
        ssh_options_set(ssh.get(), SSH_OPTIONS_TIMEOUT, &timeout);
    }

    if (ssh_connect(ssh.get()) != SSH_OK) {
        return fail(TransferError::Kind::ProtocolError,
                    "SSH connection to " + credentials.host + ":" + std::to_string(port) +
                        " failed: " + ssh_get_error(ssh.get()));
    }

    int auth = ssh_userauth_password(ssh.get(), nullptr, credentials.password.c_str());
    if (auth == SSH_AUTH_DENIED || auth == SSH_AUTH_PARTIAL) {
        return fail(TransferError::Kind::AuthenticationFailed,
                    "Authentication failed for " + credentials.user + ". Check your username and password.");
    }
    if (auth != SSH_AUTH_SUCCESS) {
        return fail(TransferError::Kind::ProtocolError,
                    std::string("SSH password authentication error: ") + ssh_get_error(ssh.get()));
    }

    SftpHandle sftp(sftp_new(ssh.get()));
    if (!sftp) {
        return fail(TransferError::Kind::ProtocolError,
                    std::string("SFTP initialization failed: ") + ssh_get_error(ssh.get()));
    }
    if (sftp_init(sftp.get()) != SSH_OK) {
        return fail(TransferError::Kind::ProtocolError,
                    "SFTP initialization failed with code " + std::to_string(sftp_get_error(sftp.get())));
    }

    SftpFileHandle file(sftp_open(sftp.get(), remotePath.c_str(), O_RDONLY, 0));
    if (!file) {
        int code = sftp_get_error(sftp.get());
        if (code == SSH_FX_NO_SUCH_FILE || code == SSH_FX_NO_SUCH_PATH) {
            return fail(TransferError::Kind::RemoteFileNotFound, "File not found on the remote host: " + remotePath);
        }
        return fail(TransferError::Kind::ProtocolError,
                    "Failed to open remote file " + remotePath + " (SFTP code " + std::to_string(code) + ")");
    }

    std::string readFailure;
    auto copied = copyToLocalFile(localPath, [&](char* buf, std::size_t size) -> long {
        ssize_t n = sftp_read(file.get(), buf, size);
        if (n < 0) {
            readFailure = ssh_get_error(ssh.get());
        }
        return static_cast<long>(n);
    });
    if (!copied && !readFailure.empty()) {
        return fail(TransferError::Kind::ProtocolError,
                    "Read error while downloading " + remotePath + ": " + readFailure);
    }
    return copied;
}
