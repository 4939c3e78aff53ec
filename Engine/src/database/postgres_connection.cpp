/**
 * @file postgres_connection.cpp
 * @brief PostgreSQL connection implementation
 */

#include <database/postgres_connection.hpp>
#include <utils/logger.hpp>
#include <stdexcept>
#include <cstdlib>
#include <sstream>

namespace Stanchion {

PostgresConnection::PostgresConnection() {
    connect(conninfo_from_env());
}

PostgresConnection::PostgresConnection(const std::string& conninfo) {
    connect(conninfo);
}

PostgresConnection::~PostgresConnection() {
    disconnect();
}

PostgresConnection::PostgresConnection(PostgresConnection&& other) noexcept
    : conn_(other.conn_), last_error_(std::move(other.last_error_)) {
    other.conn_ = nullptr;
}

PostgresConnection& PostgresConnection::operator=(PostgresConnection&& other) noexcept {
    if (this != &other) {
        disconnect();
        conn_ = other.conn_;
        last_error_ = std::move(other.last_error_);
        other.conn_ = nullptr;
    }
    return *this;
}

std::string PostgresConnection::conninfo_from_env() {
    std::ostringstream conninfo;

    const char* host = std::getenv("PGHOST");
    const char* port = std::getenv("PGPORT");
    const char* dbname = std::getenv("PGDATABASE");
    const char* user = std::getenv("PGUSER");
    const char* password = std::getenv("PGPASSWORD");

    conninfo << "host=" << (host ? host : "localhost") << " ";
    conninfo << "port=" << (port ? port : "5432") << " ";
    conninfo << "dbname=" << (dbname ? dbname : "stanchion") << " ";
    conninfo << "user=" << (user ? user : "postgres") << " ";

    if (password) {
        conninfo << "password=" << password << " ";
    }

    return conninfo.str();
}

void PostgresConnection::connect(const std::string& conninfo) {
    conn_ = PQconnectdb(conninfo.c_str());

    if (PQstatus(conn_) != CONNECTION_OK) {
        last_error_ = PQerrorMessage(conn_);
        PQfinish(conn_);
        conn_ = nullptr;
        throw std::runtime_error("PostgreSQL connection failed: " + last_error_);
    }

    Logger::debug("Connected to PostgreSQL database " + std::string(PQdb(conn_)));
}

void PostgresConnection::disconnect() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

bool PostgresConnection::is_connected() const {
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

void PostgresConnection::require_connection() const {
    if (!is_connected()) {
        throw std::runtime_error("Not connected to database");
    }
}

void PostgresConnection::check_result(PGresult* result) {
    ExecStatusType status = PQresultStatus(result);

    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
        last_error_ = PQerrorMessage(conn_);
        PQclear(result);
        throw std::runtime_error("PostgreSQL query failed: " + last_error_);
    }
}

PGresult* PostgresConnection::exec_params(const std::string& sql, const std::vector<std::string>& params) {
    require_connection();

    std::vector<const char*> param_values;
    param_values.reserve(params.size());
    for (const auto& p : params) {
        param_values.push_back(p.c_str());
    }

    PGresult* result = PQexecParams(
        conn_,
        sql.c_str(),
        static_cast<int>(params.size()),
        nullptr,
        param_values.data(),
        nullptr,
        nullptr,
        0  // Text format
    );

    check_result(result);
    return result;
}

void PostgresConnection::execute(const std::string& sql) {
    require_connection();

    PGresult* result = PQexec(conn_, sql.c_str());
    check_result(result);
    PQclear(result);
}

void PostgresConnection::execute(const std::string& sql, const std::vector<std::string>& params) {
    PGresult* result = exec_params(sql, params);
    PQclear(result);
}

long PostgresConnection::execute_count(const std::string& sql, const std::vector<std::string>& params) {
    PGresult* result = exec_params(sql, params);
    const char* tuples = PQcmdTuples(result);
    long count = (tuples && *tuples) ? std::strtol(tuples, nullptr, 10) : 0;
    PQclear(result);
    return count;
}

std::optional<std::string> PostgresConnection::query_single(const std::string& sql, const std::vector<std::string>& params) {
    PGresult* result = exec_params(sql, params);

    std::optional<std::string> value;

    if (PQntuples(result) > 0 && PQnfields(result) > 0 && !PQgetisnull(result, 0, 0)) {
        value = PQgetvalue(result, 0, 0);
    }

    PQclear(result);
    return value;
}

void PostgresConnection::query(const std::string& sql, RowCallback callback) {
    query(sql, {}, std::move(callback));
}

void PostgresConnection::query(const std::string& sql, const std::vector<std::string>& params,
                               RowCallback callback) {
    PGresult* result = exec_params(sql, params);

    int nrows = PQntuples(result);
    int nfields = PQnfields(result);

    try {
        for (int i = 0; i < nrows; ++i) {
            Row row;
            row.reserve(nfields);

            for (int j = 0; j < nfields; ++j) {
                row.push_back(PQgetvalue(result, i, j));
            }

            callback(row);
        }
    } catch (...) {
        PQclear(result);
        throw;
    }

    PQclear(result);
}

void PostgresConnection::begin() {
    execute("BEGIN");
}

void PostgresConnection::commit() {
    execute("COMMIT");
}

void PostgresConnection::rollback() {
    execute("ROLLBACK");
}

// Transaction RAII
PostgresConnection::Transaction::Transaction(PostgresConnection& conn) : conn_(conn) {
    conn_.begin();
}

PostgresConnection::Transaction::~Transaction() {
    if (!committed_) {
        try {
            conn_.rollback();
        } catch (const std::exception& e) {
            Logger::warn(std::string("Rollback failed: ") + e.what());
        }
    }
}

void PostgresConnection::Transaction::commit() {
    conn_.commit();
    committed_ = true;
}

} // namespace Stanchion
