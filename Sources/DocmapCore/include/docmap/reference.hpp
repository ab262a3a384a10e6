#pragma once

#ifdef __cplusplus

#include "types.hpp"

#include <memory>
#include <string>

namespace docmap {

class object;

/// Loads and persists reference targets. Implemented by the mapper.
class reference_resolver {
public:
    virtual ~reference_resolver() = default;

    /// Loads the document `id` of `collection`. Throws reference_resolution_error
    /// when it no longer exists.
    virtual std::shared_ptr<object> resolve(const std::string& collection, const document_t& id) = 0;

    virtual void persist(object& target) = 0;
};

// ============================================================================
// reference - lazy pointer to a document of another collection
//
//   {"$ref": "users", "$id": {"$oid": "..."}, "__cache": {"email": "x@y"}}
//
// Owns nothing until first dereference, then holds the resolved object. The
// resolver is held weakly: once the mapper that loaded the reference is gone,
// dereferencing an unresolved reference throws reference_resolution_error.
// ============================================================================

class reference {
public:
    reference(std::string collection, document_t id, document_t cache = document_t::object(),
              std::weak_ptr<reference_resolver> resolver = {});

    /// Wraps an already loaded target.
    static std::shared_ptr<reference> to(std::shared_ptr<object> target, std::string collection,
                                         document_t id, document_t cache = document_t::object());

    /// True for {"$ref": <non-empty>, "$id": <non-empty>}.
    static bool is_reference_document(const document_t& doc);
    static std::shared_ptr<reference> from_document(const document_t& doc,
                                                    std::weak_ptr<reference_resolver> resolver = {});
    static document_t make_document(const std::string& collection, const document_t& id,
                                    const document_t& cache);

    const std::string& collection() const { return collection_; }
    const document_t& id() const { return id_; }
    const document_t& cache() const { return cache_; }
    bool is_resolved() const { return target_ != nullptr; }

    void bind(std::weak_ptr<reference_resolver> resolver) { resolver_ = std::move(resolver); }

    /// Resolves on first call.
    std::shared_ptr<object> get_object();

    /// Reads a public field of the target, resolving it first.
    value get(const std::string& field);
    void set(const std::string& field, value v);

    /// Field captured when the reference was stored, without resolving.
    document_t cached(const std::string& field) const;

    /// Persists the target if it was resolved. Throws reference_resolution_error
    /// when the resolver no longer exists.
    void save();

    document_t to_document() const { return make_document(collection_, id_, cache_); }

private:
    std::string collection_;
    document_t id_;
    document_t cache_;
    std::weak_ptr<reference_resolver> resolver_;
    std::shared_ptr<object> target_;
};

} // namespace docmap

#endif // __cplusplus
