#include "docmap/sqlite_transport.hpp"
#include "docmap/log.hpp"

#include <array>
#include <cctype>
#include <limits>
#include <sstream>

namespace docmap {

namespace {

bool is_operator_document(const document_t& doc) {
    if (!doc.is_object() || doc.empty() || detail::is_native_marker(doc)) return false;
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        if (it.key().empty() || it.key()[0] != '$') return false;
    }
    return true;
}

// Unsigned values past the int64 range are bound as reals instead of wrapping
column_value_t numeric_param(const document_t& n) {
    if (n.is_number_float()) {
        return n.get<double>();
    }
    if (n.is_number_unsigned() && n.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return static_cast<double>(n.get<uint64_t>());
    }
    return n.get<int64_t>();
}

std::vector<std::string> split_path(const std::string& dotted) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : dotted) {
        if (c == '.') {
            parts.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    parts.push_back(current);
    return parts;
}

void set_path(document_t& doc, const std::string& dotted, const document_t& v) {
    auto parts = split_path(dotted);
    document_t* cur = &doc;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        if (!cur->is_object()) *cur = document_t::object();
        cur = &(*cur)[parts[i]];
    }
    if (!cur->is_object()) *cur = document_t::object();
    (*cur)[parts.back()] = v;
}

const document_t* find_path(const document_t& doc, const std::string& dotted) {
    const document_t* cur = &doc;
    for (const auto& part : split_path(dotted)) {
        if (!cur->is_object()) return nullptr;
        auto it = cur->find(part);
        if (it == cur->end()) return nullptr;
        cur = &*it;
    }
    return cur;
}

void unset_path(document_t& doc, const std::string& dotted) {
    auto parts = split_path(dotted);
    document_t* cur = &doc;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        if (!cur->is_object() || !cur->contains(parts[i])) return;
        cur = &(*cur)[parts[i]];
    }
    if (cur->is_object()) cur->erase(parts.back());
}

std::string join(const std::vector<std::string>& parts, const char* sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

const char* command_name(const document_t& command) {
    static const std::array<const char*, 6> names = {
        "createIndexes", "insert", "update", "delete", "count", "drop"
    };
    for (const char* name : names) {
        auto it = command.find(name);
        if (it != command.end() && it->is_string()) return name;
    }
    return nullptr;
}

} // namespace

sqlite_transport::sqlite_transport(const std::string& path,
                                   std::string database_name,
                                   std::string connection_name)
    : db_(path),
      database_name_(std::move(database_name)),
      connection_name_(std::move(connection_name)) {
    LOG_INFO("sqlite", "Connection %s opened on %s", connection_name_.c_str(), path.c_str());
}

// ============================================================================
// SQL helpers
// ============================================================================

std::string sqlite_transport::quote_identifier(const std::string& name) {
    std::string out = "\"";
    for (char c : name) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string sqlite_transport::quote_literal(const std::string& text) {
    std::string out = "'";
    for (char c : text) {
        if (c == '\'') out += '\'';
        out += c;
    }
    out += '\'';
    return out;
}

std::string sqlite_transport::json_path(const std::string& dotted) {
    std::string path = "$";
    for (const auto& part : split_path(dotted)) {
        bool numeric = !part.empty();
        for (char c : part) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                numeric = false;
                break;
            }
        }
        if (numeric) {
            path += "[" + part + "]";
        } else {
            path += ".\"" + part + "\"";
        }
    }
    return quote_literal(path);
}

void sqlite_transport::ensure_collection(const std::string& collection) {
    if (known_collections_.count(collection)) return;
    db_.execute("CREATE TABLE IF NOT EXISTS " + quote_identifier(collection) +
                " (id TEXT PRIMARY KEY, body TEXT NOT NULL)");
    known_collections_.insert(collection);
}

// ============================================================================
// Filter translation
// ============================================================================

sqlite_transport::sql_fragment sqlite_transport::equality(const std::string& path,
                                                          const document_t& expected) const {
    auto p = json_path(path);
    auto type = "json_type(body, " + p + ")";
    auto extract = "json_extract(body, " + p + ")";

    switch (expected.type()) {
        case document_t::value_t::null:
        case document_t::value_t::discarded:
            return {"(" + type + " IS NULL OR " + type + " = 'null')", {}};
        case document_t::value_t::boolean:
            return {"COALESCE(" + type + (expected.get<bool>() ? " = 'true'" : " = 'false'") + ", 0)", {}};
        case document_t::value_t::number_integer:
        case document_t::value_t::number_unsigned:
        case document_t::value_t::number_float:
            return {"COALESCE(" + type + " IN ('integer', 'real') AND " + extract + " = ?, 0)",
                    {numeric_param(expected)}};
        case document_t::value_t::string:
            return {"COALESCE(" + type + " = 'text' AND " + extract + " = ?, 0)",
                    {expected.get<std::string>()}};
        case document_t::value_t::object:
        case document_t::value_t::array:
        case document_t::value_t::binary:
            return {"COALESCE(" + type + " IN ('object', 'array') AND " + extract + " = ?, 0)",
                    {expected.dump()}};
    }
    return {"0", {}};
}

sqlite_transport::sql_fragment sqlite_transport::comparison(const std::string& path, const char* op,
                                                            const document_t& bound) const {
    if (detail::is_native_marker(bound) && bound.contains("$date")) {
        return comparison(path + ".$date", op, bound["$date"]);
    }

    auto p = json_path(path);
    auto type = "json_type(body, " + p + ")";
    auto extract = "json_extract(body, " + p + ")";

    if (bound.is_number()) {
        return {"COALESCE(" + type + " IN ('integer', 'real') AND " + extract + " " + op + " ?, 0)",
                {numeric_param(bound)}};
    }
    if (bound.is_string()) {
        return {"COALESCE(" + type + " = 'text' AND " + extract + " " + op + " ?, 0)",
                {bound.get<std::string>()}};
    }
    throw db_error("Unsupported comparison operand for " + path + ": " + bound.dump());
}

sqlite_transport::sql_fragment sqlite_transport::translate_field(const std::string& field,
                                                                 const document_t& condition) const {
    if (!is_operator_document(condition)) {
        return equality(field, condition);
    }

    std::vector<std::string> clauses;
    std::vector<column_value_t> params;
    auto append = [&](sql_fragment f) {
        clauses.push_back(std::move(f.sql));
        params.insert(params.end(), f.params.begin(), f.params.end());
    };
    auto any_of = [&](const document_t& values) -> sql_fragment {
        if (!values.is_array()) {
            throw db_error("$in/$nin on " + field + " needs an array");
        }
        if (values.empty()) return {"0", {}};
        std::vector<std::string> alternatives;
        std::vector<column_value_t> alt_params;
        for (const auto& v : values) {
            auto f = equality(field, v);
            alternatives.push_back(std::move(f.sql));
            alt_params.insert(alt_params.end(), f.params.begin(), f.params.end());
        }
        return {"(" + join(alternatives, " OR ") + ")", std::move(alt_params)};
    };

    for (auto it = condition.begin(); it != condition.end(); ++it) {
        const auto& op = it.key();
        const auto& operand = it.value();
        if (op == "$eq") {
            append(equality(field, operand));
        } else if (op == "$ne") {
            auto f = equality(field, operand);
            append({"NOT " + f.sql, std::move(f.params)});
        } else if (op == "$gt") {
            append(comparison(field, ">", operand));
        } else if (op == "$gte") {
            append(comparison(field, ">=", operand));
        } else if (op == "$lt") {
            append(comparison(field, "<", operand));
        } else if (op == "$lte") {
            append(comparison(field, "<=", operand));
        } else if (op == "$in") {
            append(any_of(operand));
        } else if (op == "$nin") {
            auto f = any_of(operand);
            append({"NOT " + f.sql, std::move(f.params)});
        } else if (op == "$exists") {
            bool exists = !detail::is_empty(operand);
            append({"json_type(body, " + json_path(field) + (exists ? ") IS NOT NULL" : ") IS NULL"), {}});
        } else {
            throw db_error("Unsupported filter operator " + op);
        }
    }
    return {"(" + join(clauses, " AND ") + ")", std::move(params)};
}

sqlite_transport::sql_fragment sqlite_transport::translate_filter(const document_t& filter) const {
    if (filter.is_null() || (filter.is_object() && filter.empty())) {
        return {"1", {}};
    }
    if (!filter.is_object()) {
        throw db_error("Filter must be a document: " + filter.dump());
    }

    std::vector<std::string> clauses;
    std::vector<column_value_t> params;

    for (auto it = filter.begin(); it != filter.end(); ++it) {
        const auto& key = it.key();
        if (key == "$and" || key == "$or" || key == "$nor") {
            if (!it->is_array() || it->empty()) {
                throw db_error(key + " needs a non-empty array");
            }
            std::vector<std::string> parts;
            for (const auto& sub : *it) {
                auto f = translate_filter(sub);
                parts.push_back(std::move(f.sql));
                params.insert(params.end(), f.params.begin(), f.params.end());
            }
            if (key == "$and") {
                clauses.push_back("(" + join(parts, " AND ") + ")");
            } else if (key == "$or") {
                clauses.push_back("(" + join(parts, " OR ") + ")");
            } else {
                clauses.push_back("NOT (" + join(parts, " OR ") + ")");
            }
        } else if (!key.empty() && key[0] == '$') {
            throw db_error("Unsupported top-level operator " + key);
        } else {
            auto f = translate_field(key, it.value());
            clauses.push_back(std::move(f.sql));
            params.insert(params.end(), f.params.begin(), f.params.end());
        }
    }
    return {join(clauses, " AND "), std::move(params)};
}

// ============================================================================
// Commands
// ============================================================================

document_t sqlite_transport::execute(const document_t& command) {
    if (!command.is_object()) {
        throw db_error("Command must be a document");
    }
    const char* name = command_name(command);
    if (!name) {
        throw db_error("Unknown command " + command.dump());
    }
    std::string collection = command[name].get<std::string>();
    if (collection.empty()) {
        throw db_error(std::string(name) + " needs a collection name");
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    LOG_DEBUG("sqlite", "%s on %s.%s", name, database_name_.c_str(), collection.c_str());

    std::string cmd = name;
    if (cmd == "drop") return drop(collection);

    ensure_collection(collection);
    if (cmd == "createIndexes") return create_indexes(collection, command);
    if (cmd == "insert") return insert(collection, command);
    if (cmd == "update") return update(collection, command);
    if (cmd == "delete") return remove(collection, command);
    return count(collection, command);
}

document_t sqlite_transport::create_indexes(const std::string& collection, const document_t& command) {
    auto indexes = command.value("indexes", document_t::array());
    size_t created = 0;

    for (const auto& index : indexes) {
        const auto& key = index.at("key");
        if (!key.is_object() || key.empty()) {
            throw db_error("Index on " + collection + " has no key");
        }
        std::string index_name = collection + "_" + index.value("name", std::string("index"));
        if (db_.index_exists(index_name)) continue;

        std::vector<std::string> columns;
        std::vector<std::string> present;
        for (auto it = key.begin(); it != key.end(); ++it) {
            bool desc = it->is_number() && it->get<double>() < 0;
            columns.push_back("json_extract(body, " + json_path(it.key()) + ")" + (desc ? " DESC" : ""));
            present.push_back("json_type(body, " + json_path(it.key()) + ") IS NOT NULL");
        }

        std::ostringstream sql;
        sql << "CREATE " << (index.value("unique", false) ? "UNIQUE " : "")
            << "INDEX IF NOT EXISTS " << quote_identifier(index_name)
            << " ON " << quote_identifier(collection) << " (" << join(columns, ", ") << ")";
        if (index.value("sparse", false)) {
            sql << " WHERE " << join(present, " AND ");
        }
        db_.execute(sql.str());
        ++created;
    }

    return document_t{{"ok", 1}, {"created", created}};
}

void sqlite_transport::insert_one(const std::string& collection, document_t doc) {
    if (!doc.is_object()) {
        throw db_error("Cannot insert a non-document into " + collection);
    }
    if (!doc.contains("_id") || doc["_id"].is_null()) {
        doc["_id"] = detail::object_id_to_document(object_id::generate());
    }
    db_.execute("INSERT INTO " + quote_identifier(collection) + " (id, body) VALUES (?, ?)",
                {doc["_id"].dump(), doc.dump()});
}

document_t sqlite_transport::insert(const std::string& collection, const document_t& command) {
    auto documents = command.value("documents", document_t::array());
    transaction tx(db_);
    for (const auto& doc : documents) {
        insert_one(collection, doc);
    }
    tx.commit();
    return document_t{{"ok", 1}, {"n", documents.size()}};
}

std::vector<std::pair<std::string, document_t>>
sqlite_transport::select(const std::string& collection, const document_t& filter, int64_t limit) {
    auto where = translate_filter(filter);
    std::string sql = "SELECT id, body FROM " + quote_identifier(collection) +
                      " WHERE " + where.sql + " ORDER BY rowid";
    if (limit > 0) {
        sql += " LIMIT " + std::to_string(limit);
    }

    std::vector<std::pair<std::string, document_t>> out;
    for (auto& row : db_.query(sql, where.params)) {
        out.emplace_back(std::get<std::string>(row["id"]),
                         document_t::parse(std::get<std::string>(row["body"])));
    }
    return out;
}

document_t sqlite_transport::apply_update(const document_t& doc, const document_t& update) {
    if (!update.is_object()) {
        throw db_error("Update must be a document");
    }

    bool has_operators = false;
    for (auto it = update.begin(); it != update.end(); ++it) {
        if (!it.key().empty() && it.key()[0] == '$') {
            has_operators = true;
            break;
        }
    }

    if (!has_operators) {
        // Replacement keeps the identifier
        document_t replaced = update;
        if (doc.contains("_id")) replaced["_id"] = doc["_id"];
        return replaced;
    }

    document_t result = doc.is_object() ? doc : document_t::object();
    for (auto it = update.begin(); it != update.end(); ++it) {
        const auto& op = it.key();
        if (!it->is_object()) {
            throw db_error(op + " needs a document");
        }
        for (auto field = it->begin(); field != it->end(); ++field) {
            if (op == "$set") {
                set_path(result, field.key(), field.value());
            } else if (op == "$unset") {
                unset_path(result, field.key());
            } else if (op == "$inc") {
                const document_t* found = find_path(result, field.key());
                document_t current = found ? *found : document_t(0);
                if (current.is_number_integer() && field->is_number_integer()) {
                    set_path(result, field.key(), current.get<int64_t>() + field->get<int64_t>());
                } else if (current.is_number() && field->is_number()) {
                    set_path(result, field.key(), current.get<double>() + field->get<double>());
                } else {
                    throw db_error("$inc on non-numeric field " + field.key());
                }
            } else {
                throw db_error("Unsupported update operator " + op);
            }
        }
    }
    return result;
}

document_t sqlite_transport::update(const std::string& collection, const document_t& command) {
    auto updates = command.value("updates", document_t::array());
    int64_t matched = 0;
    int64_t modified = 0;
    document_t upserted = document_t::array();

    transaction tx(db_);
    for (size_t i = 0; i < updates.size(); ++i) {
        const auto& entry = updates[i];
        auto q = entry.value("q", document_t::object());
        const auto& u = entry.at("u");
        bool multi = entry.value("multi", false);
        bool upsert = entry.value("upsert", false);

        auto rows = select(collection, q, multi ? 0 : 1);
        matched += static_cast<int64_t>(rows.size());

        for (const auto& [id, body] : rows) {
            auto changed = apply_update(body, u);
            changed["_id"] = body["_id"];
            if (changed == body) continue;
            db_.execute("UPDATE " + quote_identifier(collection) + " SET body = ? WHERE id = ?",
                        {changed.dump(), id});
            ++modified;
        }

        if (rows.empty() && upsert) {
            // Seed the new document with the selector's equality fields
            document_t seed = document_t::object();
            for (auto it = q.begin(); it != q.end(); ++it) {
                if (it.key().empty() || it.key()[0] == '$') continue;
                if (is_operator_document(it.value())) {
                    if (it->contains("$eq")) set_path(seed, it.key(), (*it)["$eq"]);
                    continue;
                }
                set_path(seed, it.key(), it.value());
            }
            auto doc = apply_update(seed, u);
            if (!doc.contains("_id") || doc["_id"].is_null()) {
                doc["_id"] = detail::object_id_to_document(object_id::generate());
            }
            insert_one(collection, doc);
            upserted.push_back(document_t{{"index", i}, {"_id", doc["_id"]}});
            ++matched;
        }
    }
    tx.commit();

    document_t result{{"ok", 1}, {"n", matched}, {"nModified", modified}};
    if (!upserted.empty()) result["upserted"] = upserted;
    return result;
}

document_t sqlite_transport::remove(const std::string& collection, const document_t& command) {
    auto deletes = command.value("deletes", document_t::array());
    int64_t removed = 0;

    transaction tx(db_);
    for (const auto& entry : deletes) {
        auto where = translate_filter(entry.value("q", document_t::object()));
        auto table = quote_identifier(collection);
        std::string sql;
        if (entry.value("limit", 0) == 1) {
            sql = "DELETE FROM " + table + " WHERE id IN (SELECT id FROM " + table +
                  " WHERE " + where.sql + " ORDER BY rowid LIMIT 1)";
        } else {
            sql = "DELETE FROM " + table + " WHERE " + where.sql;
        }
        removed += db_.execute(sql, where.params);
    }
    tx.commit();

    return document_t{{"ok", 1}, {"n", removed}};
}

document_t sqlite_transport::count(const std::string& collection, const document_t& command) {
    auto where = translate_filter(command.value("query", document_t::object()));
    auto rows = db_.query("SELECT COUNT(*) AS n FROM " + quote_identifier(collection) +
                          " WHERE " + where.sql, where.params);
    int64_t n = rows.empty() ? 0 : std::get<int64_t>(rows[0]["n"]);
    return document_t{{"ok", 1}, {"n", n}};
}

document_t sqlite_transport::drop(const std::string& collection) {
    db_.execute("DROP TABLE IF EXISTS " + quote_identifier(collection));
    known_collections_.erase(collection);
    return document_t{{"ok", 1}};
}

std::unique_ptr<cursor> sqlite_transport::find(const std::string& collection,
                                               const document_t& filter,
                                               const find_options& options) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ensure_collection(collection);

    auto where = translate_filter(filter);
    std::string sql = "SELECT body FROM " + quote_identifier(collection) + " WHERE " + where.sql;

    std::vector<std::string> order;
    if (options.sort.is_object()) {
        for (auto it = options.sort.begin(); it != options.sort.end(); ++it) {
            bool desc = it->is_number() && it->get<double>() < 0;
            order.push_back("json_extract(body, " + json_path(it.key()) + ")" + (desc ? " DESC" : " ASC"));
        }
    }
    order.push_back("rowid");
    sql += " ORDER BY " + join(order, ", ");

    if (options.limit > 0 || options.skip > 0) {
        sql += " LIMIT " + std::to_string(options.limit > 0 ? options.limit : -1);
        if (options.skip > 0) sql += " OFFSET " + std::to_string(options.skip);
    }

    std::vector<document_t> docs;
    for (auto& row : db_.query(sql, where.params)) {
        docs.push_back(document_t::parse(std::get<std::string>(row["body"])));
    }
    LOG_DEBUG("sqlite", "find on %s returned %zu documents", collection.c_str(), docs.size());
    return std::make_unique<vector_cursor>(std::move(docs));
}

} // namespace docmap
