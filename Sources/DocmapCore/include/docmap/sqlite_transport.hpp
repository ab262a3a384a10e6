#pragma once

#ifdef __cplusplus

#include "transport.hpp"
#include "db.hpp"

#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace docmap {

// ============================================================================
// sqlite_transport - embedded document store on top of SQLite
//
// Each collection is a table (id TEXT PRIMARY KEY, body TEXT). `id` holds the
// canonical JSON of the document's `_id`, `body` the whole document. Filters and
// indexes are expressed over json_extract(body, '$."field"...').
// ============================================================================

class sqlite_transport : public transport {
public:
    explicit sqlite_transport(const std::string& path,
                              std::string database_name = "docmap",
                              std::string connection_name = "default");

    document_t execute(const document_t& command) override;

    std::unique_ptr<cursor> find(const std::string& collection,
                                 const document_t& filter,
                                 const find_options& options = {}) override;

    std::string connection_name() const override { return connection_name_; }
    std::string database_name() const override { return database_name_; }

    database& db() { return db_; }

    /// Applies an update document ({$set, $unset, $inc} or a full replacement) in memory.
    static document_t apply_update(const document_t& doc, const document_t& update);

private:
    struct sql_fragment {
        std::string sql;
        std::vector<column_value_t> params;
    };

    void ensure_collection(const std::string& collection);

    document_t create_indexes(const std::string& collection, const document_t& command);
    document_t insert(const std::string& collection, const document_t& command);
    document_t update(const std::string& collection, const document_t& command);
    document_t remove(const std::string& collection, const document_t& command);
    document_t count(const std::string& collection, const document_t& command);
    document_t drop(const std::string& collection);

    void insert_one(const std::string& collection, document_t doc);
    std::vector<std::pair<std::string, document_t>> select(const std::string& collection,
                                                           const document_t& filter,
                                                           int64_t limit);

    static std::string quote_identifier(const std::string& name);
    static std::string json_path(const std::string& dotted);
    static std::string quote_literal(const std::string& text);

    sql_fragment translate_filter(const document_t& filter) const;
    sql_fragment translate_field(const std::string& field, const document_t& condition) const;
    sql_fragment equality(const std::string& path, const document_t& expected) const;
    sql_fragment comparison(const std::string& path, const char* op, const document_t& bound) const;

    database db_;
    std::string database_name_;
    std::string connection_name_;
    std::recursive_mutex mutex_;
    std::set<std::string> known_collections_;
};

} // namespace docmap

#endif // __cplusplus
