#pragma once

#ifdef __cplusplus

#include "errors.hpp"

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace docmap {

/// A single SQLite cell
using column_value_t = std::variant<std::nullptr_t, int64_t, double, std::string>;

// ============================================================================
// database - thin owner of one sqlite3 connection
//
// Opened with JSON1 available (checked on open) since collections keep their
// documents as JSON text. Errors surface as db_error carrying the extended
// result code.
// ============================================================================

class database {
public:
    explicit database(const std::string& path);
    ~database();

    database(const database&) = delete;
    database& operator=(const database&) = delete;

    using row_t = std::unordered_map<std::string, column_value_t>;

    /// Runs a statement and returns every row, keyed by column name.
    std::vector<row_t> query(const std::string& sql,
                             const std::vector<column_value_t>& params = {});

    /// Runs a statement and returns the number of rows it changed.
    int64_t execute(const std::string& sql,
                    const std::vector<column_value_t>& params = {});

    bool index_exists(const std::string& name);

    const std::string& path() const { return path_; }

private:
    friend class transaction;

    struct statement_deleter {
        void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
    };
    using statement = std::unique_ptr<sqlite3_stmt, statement_deleter>;

    statement prepare(const std::string& sql, const std::vector<column_value_t>& params);
    [[noreturn]] void fail(const char* what, const std::string& sql);

    sqlite3* db_ = nullptr;
    std::string path_;
    int savepoint_depth_ = 0;
};

/// Scoped savepoint; rolled back on destruction unless committed. Nests.
class transaction {
public:
    explicit transaction(database& db);
    ~transaction();

    transaction(const transaction&) = delete;
    transaction& operator=(const transaction&) = delete;

    void commit();

private:
    database& db_;
    std::string name_;
    bool completed_ = false;
};

} // namespace docmap

#endif // __cplusplus
