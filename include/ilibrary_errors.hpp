/**
 * @file ilibrary_errors.hpp
 * @brief Error types shared by the iLibrary command, transfer and orchestration layers.
 *
 * Validation problems and compensation failures are thrown as exceptions so callers can
 * tell them apart from an ordinary failed step. Command and transfer failures are plain
 * values carried in std::expected.
 */

#ifndef ILIBRARY_ERRORS_HPP
#define ILIBRARY_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>

/**
 * @brief Raised when a request is malformed, before anything is sent to the host.
 *
 * Covers missing or oversized object names, characters that are not allowed in generated
 * CL commands, and an incomplete remote/local path pair.
 */
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& message) : std::invalid_argument(message) {}
};

/**
 * @brief Failure of a single command or query on the command connection.
 */
struct CommandError {
    std::string message;   ///< Diagnostic text reported by the driver (or by the caller).
    std::string sqlState;  ///< Five character SQLSTATE, empty when not available.
    long nativeCode = 0;   ///< Driver specific native error code.

    /**
     * @brief Formats the error for logs, e.g. "[42704] CPF9810 ... (native -443)".
     */
    std::string describe() const;
};

/**
 * @brief Failure of an SFTP download.
 */
struct TransferError {
    /**
     * @brief Distinguishes failures a caller may want to handle differently.
     */
    enum class Kind {
        AuthenticationFailed, ///< The host rejected the credentials.
        ProtocolError,        ///< Connection, SSH or SFTP level failure, or bad arguments.
        RemoteFileNotFound    ///< The remote file does not exist.
    };

    Kind kind = Kind::ProtocolError;
    std::string message;

    std::string describe() const;
};

/**
 * @brief Returns a stable name for a transfer error kind.
 */
const char* toString(TransferError::Kind kind);

/**
 * @brief Base for failures of a step that runs after remote objects already exist.
 *
 * When one of these is thrown the save file (or the stream file copied from it) may still
 * be present on the host.
 */
class CompensationError : public std::runtime_error {
public:
    explicit CompensationError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief The save file could not be downloaded.
 */
class TransferFailedError : public CompensationError {
public:
    TransferFailedError(const std::string& message, TransferError cause)
        : CompensationError(message), cause_(std::move(cause)) {}

    const TransferError& cause() const { return cause_; }

private:
    TransferError cause_;
};

/**
 * @brief The save file was downloaded but could not be deleted from the host afterward.
 */
class RemovalFailedError : public CompensationError {
public:
    RemovalFailedError(const std::string& message, CommandError cause)
        : CompensationError(message), cause_(std::move(cause)) {}

    const CommandError& cause() const { return cause_; }

private:
    CommandError cause_;
};

/**
 * @brief A metadata query could not be executed.
 */
class QueryError : public std::runtime_error {
public:
    explicit QueryError(CommandError cause)
        : std::runtime_error(cause.describe()), cause_(std::move(cause)) {}

    const CommandError& cause() const { return cause_; }

private:
    CommandError cause_;
};

#endif // ILIBRARY_ERRORS_HPP
