/**
 * @file postgres_connection.hpp
 * @brief PostgreSQL connection and query interface
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <libpq-fe.h>

namespace Stanchion {

/**
 * @brief PostgreSQL connection wrapper
 *
 * Not thread-safe: callers sharing one connection serialize access.
 */
class PostgresConnection {
public:
    using Row = std::vector<std::string>;
    using RowCallback = std::function<void(const Row&)>;

    /**
     * @brief Connect using environment variables
     *
     * Uses: PGHOST, PGPORT, PGDATABASE, PGUSER, PGPASSWORD
     * Defaults: localhost, 5432, stanchion, postgres, (no password)
     */
    PostgresConnection();

    /**
     * @brief Connect with explicit connection string
     */
    explicit PostgresConnection(const std::string& conninfo);

    ~PostgresConnection();

    PostgresConnection(const PostgresConnection&) = delete;
    PostgresConnection& operator=(const PostgresConnection&) = delete;

    PostgresConnection(PostgresConnection&& other) noexcept;
    PostgresConnection& operator=(PostgresConnection&& other) noexcept;

    /**
     * @brief Build a conninfo string from the PG* environment
     */
    static std::string conninfo_from_env();

    bool is_connected() const;

    /**
     * @brief Execute statement (no results expected)
     */
    void execute(const std::string& sql);

    /**
     * @brief Execute statement with $n parameters (no results)
     */
    void execute(const std::string& sql, const std::vector<std::string>& params);

    /**
     * @brief Execute and return number of affected rows
     */
    long execute_count(const std::string& sql, const std::vector<std::string>& params);

    /**
     * @brief Execute query and return first column of first row
     */
    std::optional<std::string> query_single(const std::string& sql, const std::vector<std::string>& params = {});

    /**
     * @brief Execute query and iterate rows
     */
    void query(const std::string& sql, RowCallback callback);

    /**
     * @brief Execute query with params and iterate rows
     */
    void query(const std::string& sql, const std::vector<std::string>& params, RowCallback callback);

    /**
     * @brief RAII transaction guard. Rolls back unless committed.
     */
    class Transaction {
    public:
        explicit Transaction(PostgresConnection& conn);
        ~Transaction();

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        void commit();

    private:
        PostgresConnection& conn_;
        bool committed_ = false;
    };

private:
    void begin();
    void commit();
    void rollback();
    void connect(const std::string& conninfo);
    void disconnect();
    void require_connection() const;
    PGresult* exec_params(const std::string& sql, const std::vector<std::string>& params);
    void check_result(PGresult* result);

    PGconn* conn_ = nullptr;
    std::string last_error_;
};

} // namespace Stanchion
