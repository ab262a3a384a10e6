#pragma once

#ifdef __cplusplus

#include "types.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace docmap {

// ============================================================================
// Document store transport
//
// Commands are documents whose first key names the command and the target
// collection:
//
//   {"createIndexes": "users", "indexes": [{key, name, unique, sparse, background}]}
//   {"insert": "users", "documents": [...], "ordered": true}
//   {"update": "users", "updates": [{"q": {...}, "u": {"$set": {...}}, "upsert": false, "multi": false}], "ordered": true}
//   {"delete": "users", "deletes": [{"q": {...}, "limit": 0}]}
//   {"count":  "users", "query": {...}}
//   {"drop":   "users"}
//
// Every result carries "ok": 1 and, for write commands, "n" (documents affected).
// ============================================================================

/// Forward-only sequence of documents.
class cursor {
public:
    virtual ~cursor() = default;

    /// Next document, or nullopt once exhausted.
    virtual std::optional<document_t> next() = 0;

    std::vector<document_t> to_vector() {
        std::vector<document_t> out;
        while (auto doc = next()) {
            out.push_back(std::move(*doc));
        }
        return out;
    }
};

class vector_cursor : public cursor {
public:
    explicit vector_cursor(std::vector<document_t> docs) : docs_(std::move(docs)) {}

    std::optional<document_t> next() override {
        if (pos_ >= docs_.size()) return std::nullopt;
        return std::move(docs_[pos_++]);
    }

private:
    std::vector<document_t> docs_;
    size_t pos_ = 0;
};

struct find_options {
    document_t sort;       // {field: 1|-1, ...}, null for natural order
    int64_t limit = 0;     // 0 = unlimited
    int64_t skip = 0;
};

class transport {
public:
    virtual ~transport() = default;

    /// Runs a command document. Failures are raised as exceptions.
    virtual document_t execute(const document_t& command) = 0;

    virtual std::unique_ptr<cursor> find(const std::string& collection,
                                         const document_t& filter,
                                         const find_options& options = {}) = 0;

    virtual std::string connection_name() const = 0;
    virtual std::string database_name() const = 0;
};

} // namespace docmap

#endif // __cplusplus
