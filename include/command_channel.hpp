/**
 * @file command_channel.hpp
 * @brief Command connection to the IBM i host.
 *
 * CL commands are run through the QSYS2.QCMDEXC stored procedure with the command text
 * bound as its only parameter. Read-only SQL statements return their rows as text.
 *
 * @note Requires unixODBC and an IBM i Access ODBC driver on the client machine.
 */

#ifndef COMMAND_CHANNEL_HPP
#define COMMAND_CHANNEL_HPP

#include <expected>
#include <optional>
#include <string>
#include <vector>
#include "ilibrary_errors.hpp"

class HostConfig;

/**
 * @brief Rows returned by a query, every value rendered as text.
 *
 * Timestamps use the ISO-8601 'T' separator and decimals keep their exact digits.
 * SQL NULL is an empty optional.
 */
struct ResultSet {
    using Row = std::vector<std::optional<std::string>>;

    std::vector<std::string> columns; ///< Column names in result order.
    std::vector<Row> rows;            ///< Rows in fetch order.
};

/**
 * @brief Interface of the command connection.
 *
 * One instance serves one orchestration at a time. Callers that share a channel between
 * threads must serialise access themselves.
 */
class CommandChannel {
public:
    virtual ~CommandChannel() = default;

    /**
     * @brief Runs one CL command on the host.
     *
     * @param commandText Fully formed command, e.g. "DLTF FILE(MYLIB/MYSAVF)". Must not be empty.
     * @return std::expected<void, CommandError> Success or the driver's diagnostics.
     */
    virtual std::expected<void, CommandError> execute(const std::string& commandText) = 0;

    /**
     * @brief Runs a read-only SQL statement and fetches every row.
     */
    virtual std::expected<ResultSet, CommandError> query(const std::string& sql) = 0;

    /**
     * @brief Commits the connection's transaction.
     *
     * CL commands are not transactional, so this is bookkeeping over the connection and does
     * not undo or confirm a command's effect on the host.
     */
    virtual std::expected<void, CommandError> commit() = 0;

    /// @copydoc commit
    virtual std::expected<void, CommandError> rollback() = 0;
};

/**
 * @brief CommandChannel over an ODBC connection.
 *
 * The connection is opened by open() and released by close() or the destructor.
 */
class OdbcCommandChannel : public CommandChannel {
public:
    /**
     * @brief Prepares a channel for the given host. No connection is made yet.
     */
    explicit OdbcCommandChannel(const HostConfig& config);
    ~OdbcCommandChannel() override;

    OdbcCommandChannel(const OdbcCommandChannel&) = delete;
    OdbcCommandChannel& operator=(const OdbcCommandChannel&) = delete;

    /**
     * @brief Connects with autocommit enabled.
     *
     * @throws std::runtime_error With the SQLSTATE if the connection fails.
     */
    void open();

    /**
     * @brief Disconnects and frees the ODBC handles. Safe to call more than once.
     */
    void close();

    bool isOpen() const { return dbc_ != nullptr; }

    std::expected<void, CommandError> execute(const std::string& commandText) override;
    std::expected<ResultSet, CommandError> query(const std::string& sql) override;
    std::expected<void, CommandError> commit() override;
    std::expected<void, CommandError> rollback() override;

private:
    std::expected<void, CommandError> endTransaction(short completionType);

    const HostConfig& config_;
    void* env_ = nullptr; ///< SQLHENV
    void* dbc_ = nullptr; ///< SQLHDBC, non-null while connected.
};

#endif // COMMAND_CHANNEL_HPP
