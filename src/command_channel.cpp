#include "command_channel.hpp"
#include "host_config.hpp"
#include <sql.h>
#include <sqlext.h>
#include <cstdint>
#include <memory>
#include <stdexcept>

namespace {

constexpr const char* kQcmdexcCall = "CALL QSYS2.QCMDEXC(?)";

// Collects the first diagnostic record of a handle.
CommandError diagnostics(SQLSMALLINT handleType, SQLHANDLE handle, const std::string& context) {
    CommandError error;
    SQLCHAR state[6] = {0};
    SQLINTEGER native = 0;
    SQLCHAR text[SQL_MAX_MESSAGE_LENGTH] = {0};
    SQLSMALLINT textLength = 0;
    if (handle != SQL_NULL_HANDLE &&
        SQL_SUCCEEDED(SQLGetDiagRec(handleType, handle, 1, state, &native, text, sizeof(text), &textLength))) {
        error.sqlState = reinterpret_cast<const char*>(state);
        error.nativeCode = native;
        error.message = context + ": " + reinterpret_cast<const char*>(text);
    } else {
        error.message = context;
    }
    return error;
}

struct StatementDeleter {
    void operator()(void* stmt) const {
        if (stmt) {
            SQLFreeHandle(SQL_HANDLE_STMT, stmt);
        }
    }
};

using StatementHandle = std::unique_ptr<void, StatementDeleter>;

std::expected<StatementHandle, CommandError> allocateStatement(void* dbc) {
    if (!dbc) {
        return std::unexpected(CommandError{"The command connection is not open", "08003", 0});
    }
    SQLHSTMT stmt = SQL_NULL_HSTMT;
    if (!SQL_SUCCEEDED(SQLAllocHandle(SQL_HANDLE_STMT, dbc, &stmt))) {
        return std::unexpected(diagnostics(SQL_HANDLE_DBC, dbc, "Failed to allocate statement"));
    }
    return StatementHandle(stmt);
}

bool isTimestampType(SQLSMALLINT type) {
    return type == SQL_TYPE_TIMESTAMP || type == SQL_TIMESTAMP;
}

// Reads one column of the current row as text, in chunks for long values.
std::expected<std::optional<std::string>, CommandError> readColumn(SQLHSTMT stmt, SQLUSMALLINT column) {
    std::string value;
    char buf[1024];
    for (;;) {
        SQLLEN indicator = 0;
        SQLRETURN ret = SQLGetData(stmt, column, SQL_C_CHAR, buf, sizeof(buf), &indicator);
        if (ret == SQL_NO_DATA) {
            break;
        }
        if (!SQL_SUCCEEDED(ret)) {
            return std::unexpected(diagnostics(SQL_HANDLE_STMT, stmt, "Failed to read column " + std::to_string(column)));
        }
        if (indicator == SQL_NULL_DATA) {
            return std::optional<std::string>();
        }
        std::size_t chunk = (indicator == SQL_NO_TOTAL || indicator >= static_cast<SQLLEN>(sizeof(buf)))
                                ? sizeof(buf) - 1
                                : static_cast<std::size_t>(indicator);
        value.append(buf, chunk);
        if (ret == SQL_SUCCESS) {
            break;
        }
    }
    return std::optional<std::string>(std::move(value));
}

} // namespace

OdbcCommandChannel::OdbcCommandChannel(const HostConfig& config) : config_(config) {}

OdbcCommandChannel::~OdbcCommandChannel() {
    close();
}

void OdbcCommandChannel::open() {
    if (dbc_) {
        return;
    }
    SQLHENV env = SQL_NULL_HENV;
    if (!SQL_SUCCEEDED(SQLAllocHandle(SQL_HANDLE_ENV, SQL_NULL_HANDLE, &env))) {
        throw std::runtime_error("Failed to allocate ODBC environment");
    }
    env_ = env;
    SQLSetEnvAttr(env, SQL_ATTR_ODBC_VERSION, reinterpret_cast<SQLPOINTER>(SQL_OV_ODBC3), 0);

    SQLHDBC dbc = SQL_NULL_HDBC;
    if (!SQL_SUCCEEDED(SQLAllocHandle(SQL_HANDLE_DBC, env, &dbc))) {
        CommandError error = diagnostics(SQL_HANDLE_ENV, env, "Failed to allocate ODBC connection");
        close();
        throw std::runtime_error(error.describe());
    }
    if (config_.loginTimeout > 0) {
        SQLSetConnectAttr(dbc, SQL_ATTR_LOGIN_TIMEOUT,
                          reinterpret_cast<SQLPOINTER>(static_cast<std::intptr_t>(config_.loginTimeout)), 0);
    }
    SQLSetConnectAttr(dbc, SQL_ATTR_AUTOCOMMIT, reinterpret_cast<SQLPOINTER>(SQL_AUTOCOMMIT_ON), 0);

    std::string connStr = config_.connectionString();
    SQLRETURN ret = SQLDriverConnect(dbc, nullptr, reinterpret_cast<SQLCHAR*>(connStr.data()), SQL_NTS,
                                     nullptr, 0, nullptr, SQL_DRIVER_NOPROMPT);
    if (!SQL_SUCCEEDED(ret)) {
        CommandError error = diagnostics(SQL_HANDLE_DBC, dbc, "Database connection failed");
        SQLFreeHandle(SQL_HANDLE_DBC, dbc);
        close();
        config_.logError("Database connection to " + config_.system + " failed with error: " + error.sqlState);
        throw std::runtime_error(error.describe());
    }
    dbc_ = dbc;
    config_.logMessage("Connected to " + config_.system + " as " + config_.user);
}

void OdbcCommandChannel::close() {
    if (dbc_) {
        SQLDisconnect(dbc_);
        SQLFreeHandle(SQL_HANDLE_DBC, dbc_);
        dbc_ = nullptr;
    }
    if (env_) {
        SQLFreeHandle(SQL_HANDLE_ENV, env_);
        env_ = nullptr;
    }
}

std::expected<void, CommandError> OdbcCommandChannel::execute(const std::string& commandText) {
    if (commandText.empty()) {
        return std::unexpected(CommandError{"An empty command cannot be executed", "", 0});
    }
    auto stmt = allocateStatement(dbc_);
    if (!stmt) {
        return std::unexpected(stmt.error());
    }
    SQLHSTMT handle = stmt->get();

    if (!SQL_SUCCEEDED(SQLPrepare(handle, reinterpret_cast<SQLCHAR*>(const_cast<char*>(kQcmdexcCall)), SQL_NTS))) {
        return std::unexpected(diagnostics(SQL_HANDLE_STMT, handle, "Failed to prepare QCMDEXC call"));
    }

    std::string buffer(commandText);
    SQLLEN indicator = SQL_NTS;
    SQLRETURN ret = SQLBindParameter(handle, 1, SQL_PARAM_INPUT, SQL_C_CHAR, SQL_VARCHAR,
                                     buffer.size(), 0, buffer.data(),
                                     static_cast<SQLLEN>(buffer.size() + 1), &indicator);
    if (!SQL_SUCCEEDED(ret)) {
        return std::unexpected(diagnostics(SQL_HANDLE_STMT, handle, "Failed to bind command text"));
    }

    ret = SQLExecute(handle);
    if (!SQL_SUCCEEDED(ret) && ret != SQL_NO_DATA) {
        return std::unexpected(diagnostics(SQL_HANDLE_STMT, handle, "Command failed: " + commandText));
    }
    return {};
}

std::expected<ResultSet, CommandError> OdbcCommandChannel::query(const std::string& sql) {
    auto stmt = allocateStatement(dbc_);
    if (!stmt) {
        return std::unexpected(stmt.error());
    }
    SQLHSTMT handle = stmt->get();

    std::string text(sql);
    SQLRETURN ret = SQLExecDirect(handle, reinterpret_cast<SQLCHAR*>(text.data()), SQL_NTS);
    if (!SQL_SUCCEEDED(ret) && ret != SQL_NO_DATA) {
        return std::unexpected(diagnostics(SQL_HANDLE_STMT, handle, "Query failed"));
    }

    SQLSMALLINT columnCount = 0;
    if (!SQL_SUCCEEDED(SQLNumResultCols(handle, &columnCount))) {
        return std::unexpected(diagnostics(SQL_HANDLE_STMT, handle, "Failed to read result columns"));
    }

    ResultSet result;
    std::vector<SQLSMALLINT> types(columnCount, SQL_UNKNOWN_TYPE);
    for (SQLUSMALLINT i = 1; i <= static_cast<SQLUSMALLINT>(columnCount); ++i) {
        SQLCHAR name[256] = {0};
        SQLSMALLINT nameLength = 0;
        SQLULEN size = 0;
        SQLSMALLINT digits = 0;
        SQLSMALLINT nullable = 0;
        SQLDescribeCol(handle, i, name, sizeof(name), &nameLength, &types[i - 1], &size, &digits, &nullable);
        result.columns.emplace_back(reinterpret_cast<const char*>(name));
    }

    while ((ret = SQLFetch(handle)) != SQL_NO_DATA) {
        if (!SQL_SUCCEEDED(ret)) {
            return std::unexpected(diagnostics(SQL_HANDLE_STMT, handle, "Failed to fetch row"));
        }
        ResultSet::Row row;
        row.reserve(columnCount);
        for (SQLUSMALLINT i = 1; i <= static_cast<SQLUSMALLINT>(columnCount); ++i) {
            auto value = readColumn(handle, i);
            if (!value) {
                return std::unexpected(value.error());
            }
            if (*value && isTimestampType(types[i - 1]) && (*value)->size() > 10 && (**value)[10] == ' ') {
                (**value)[10] = 'T';
            }
            row.push_back(std::move(*value));
        }
        result.rows.push_back(std::move(row));
    }
    return result;
}

std::expected<void, CommandError> OdbcCommandChannel::commit() {
    return endTransaction(SQL_COMMIT);
}

std::expected<void, CommandError> OdbcCommandChannel::rollback() {
    return endTransaction(SQL_ROLLBACK);
}

std::expected<void, CommandError> OdbcCommandChannel::endTransaction(short completionType) {
    if (!dbc_) {
        return std::unexpected(CommandError{"The command connection is not open", "08003", 0});
    }
    if (!SQL_SUCCEEDED(SQLEndTran(SQL_HANDLE_DBC, dbc_, completionType))) {
        return std::unexpected(diagnostics(SQL_HANDLE_DBC, dbc_,
                                           completionType == SQL_COMMIT ? "Commit failed" : "Rollback failed"));
    }
    return {};
}
