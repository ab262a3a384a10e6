#include "docmap/db.hpp"
#include "docmap/log.hpp"

#include <type_traits>

namespace docmap {

database::database(const std::string& path) : path_(path) {
    int flags = SQLITE_OPEN_FULLMUTEX | SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_ERROR("db", "Cannot open %s: %s", path.c_str(), message.c_str());
        throw db_error("Cannot open store " + path + ": " + message);
    }
    sqlite3_extended_result_codes(db_, 1);
    sqlite3_busy_timeout(db_, 5000);

    try {
        if (path != ":memory:") {
            query("PRAGMA journal_mode = WAL");
        }
        query("SELECT json_extract('{\"a\":1}', '$.a') AS probe");
    } catch (const db_error& e) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw db_error("Store " + path + " is unusable (JSON functions required): " + e.what(), e.code());
    }
    LOG_DEBUG("db", "Opened %s", path.c_str());
}

database::~database() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void database::fail(const char* what, const std::string& sql) {
    int code = sqlite3_extended_errcode(db_);
    std::string message = sqlite3_errmsg(db_);
    if (code == SQLITE_CONSTRAINT_UNIQUE || code == SQLITE_CONSTRAINT_PRIMARYKEY) {
        LOG_WARN("db", "Duplicate key: %s", message.c_str());
        throw db_error("Duplicate key: " + message, code);
    }
    LOG_ERROR("db", "%s failed: %s (SQL: %s)", what, message.c_str(), sql.c_str());
    throw db_error(std::string(what) + " failed: " + message + " (SQL: " + sql + ")", code);
}

database::statement database::prepare(const std::string& sql, const std::vector<column_value_t>& params) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
        fail("Prepare", sql);
    }
    statement stmt(raw);

    int index = 1;
    for (const auto& param : params) {
        int rc = std::visit([&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                return sqlite3_bind_null(raw, index);
            } else if constexpr (std::is_same_v<T, int64_t>) {
                return sqlite3_bind_int64(raw, index, v);
            } else if constexpr (std::is_same_v<T, double>) {
                return sqlite3_bind_double(raw, index, v);
            } else {
                return sqlite3_bind_text(raw, index, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
            }
        }, param);
        if (rc != SQLITE_OK) {
            fail("Bind", sql);
        }
        ++index;
    }
    return stmt;
}

std::vector<database::row_t> database::query(const std::string& sql,
                                             const std::vector<column_value_t>& params) {
    auto stmt = prepare(sql, params);
    int columns = sqlite3_column_count(stmt.get());

    std::vector<row_t> rows;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        row_t row;
        for (int i = 0; i < columns; ++i) {
            column_value_t cell;
            switch (sqlite3_column_type(stmt.get(), i)) {
                case SQLITE_INTEGER:
                    cell = static_cast<int64_t>(sqlite3_column_int64(stmt.get(), i));
                    break;
                case SQLITE_FLOAT:
                    cell = sqlite3_column_double(stmt.get(), i);
                    break;
                case SQLITE_TEXT:
                case SQLITE_BLOB: {
                    auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), i));
                    cell = std::string(text ? text : "", sqlite3_column_bytes(stmt.get(), i));
                    break;
                }
                default:
                    cell = nullptr;
                    break;
            }
            row.emplace(sqlite3_column_name(stmt.get(), i), std::move(cell));
        }
        rows.push_back(std::move(row));
    }
    if (rc != SQLITE_DONE) {
        fail("Query", sql);
    }
    return rows;
}

int64_t database::execute(const std::string& sql, const std::vector<column_value_t>& params) {
    auto stmt = prepare(sql, params);
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    }
    if (rc != SQLITE_DONE) {
        fail("Statement", sql);
    }
    return sqlite3_changes64(db_);
}

bool database::index_exists(const std::string& name) {
    return !query("SELECT 1 FROM sqlite_master WHERE type = 'index' AND name = ?", {name}).empty();
}

// ============================================================================
// transaction
// ============================================================================

transaction::transaction(database& db)
    : db_(db), name_("docmap_sp" + std::to_string(db.savepoint_depth_)) {
    db_.execute("SAVEPOINT " + name_);
    ++db_.savepoint_depth_;
}

transaction::~transaction() {
    if (completed_) return;
    --db_.savepoint_depth_;
    try {
        db_.execute("ROLLBACK TO " + name_);
        db_.execute("RELEASE " + name_);
    } catch (const db_error& e) {
        LOG_ERROR("db", "Rollback of %s failed: %s", name_.c_str(), e.what());
    }
}

void transaction::commit() {
    db_.execute("RELEASE " + name_);
    --db_.savepoint_depth_;
    completed_ = true;
}

} // namespace docmap
