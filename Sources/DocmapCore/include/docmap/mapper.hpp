#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "schema.hpp"
#include "metadata_cache.hpp"
#include "registry.hpp"
#include "serializer.hpp"
#include "events.hpp"
#include "diff.hpp"
#include "hydrator.hpp"
#include "reference.hpp"
#include "transport.hpp"
#include "introspection.hpp"
#include "validation.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace docmap {

// ============================================================================
// Configuration
// ============================================================================

struct configuration {
    /// SQLite file backing the default transport. ":memory:" for an in-memory store.
    std::string path = ":memory:";

    std::string database_name = "docmap";
    std::string connection_name = "default";

    /// Send createIndexes the first time a type's definition is built.
    bool auto_create_indexes = true;

    /// Caller supplied transport. nullptr = sqlite_transport over `path`.
    std::shared_ptr<docmap::transport> custom_transport;

    // Default constructor - in-memory store
    configuration() = default;

    // Path only - file-based store
    explicit configuration(const std::string& p) : path(p) {}

    // Caller supplied transport
    explicit configuration(std::shared_ptr<docmap::transport> t)
        : custom_transport(std::move(t)) {}
};

// ============================================================================
// mapper - saves, loads and queries mapped objects
//
// Composes the registry, serializer, hydrator, diff engine and dispatcher over
// one transport. A save runs:
//
//   saving -> creating|updating -> validate + serialize -> execute
//          -> snapshot -> created|updated -> saved
//
// and an update with an empty diff sends nothing. An update that matches no
// stored document throws not_found_error and keeps the old baseline. The mapper is also the
// reference_resolver of everything it loads; references reach it through a
// shared handle that dies with the mapper.
// ============================================================================

class mapper : public reference_resolver {
public:
    explicit mapper(configuration config = {},
                    const type_introspector& types = type_catalog::instance(),
                    const validator_registry& validators = validator_registry::instance());
    ~mapper() override = default;

    mapper(const mapper&) = delete;
    mapper& operator=(const mapper&) = delete;

    // Persistence
    void save(object& obj);
    void remove(object& obj);

    // Queries. Types sharing an ancestor's collection only match their own documents.
    std::vector<std::shared_ptr<object>> find(const std::string& type_name,
                                              const document_t& filter = document_t::object(),
                                              const find_options& options = {});
    std::shared_ptr<object> find_one(const std::string& type_name,
                                     const document_t& filter = document_t::object());
    /// Throws not_found_error when nothing matches.
    std::shared_ptr<object> find_or_fail(const std::string& type_name, const document_t& filter);

    /// First match, or a new unsaved instance carrying the filter's fields.
    std::shared_ptr<object> first_or_new(const std::string& type_name, const document_t& filter);
    /// Like first_or_new, saving the new instance.
    std::shared_ptr<object> first_or_create(const std::string& type_name, const document_t& filter);

    std::shared_ptr<object> create(const std::string& type_name,
                                   const std::map<std::string, value>& fields);

    int64_t count(const std::string& type_name, const document_t& filter = document_t::object());

    /// Bulk $set, bypassing hooks and validation. Returns the number of matched documents.
    int64_t update_where(const std::string& type_name, const document_t& selector,
                         const document_t& set, bool multi = true);
    int64_t delete_where(const std::string& type_name, const document_t& selector);
    void truncate(const std::string& type_name);

    document_t create_indexes(const std::string& type_name);
    void observe(const std::string& type_name, const std::string& observer_type);

    /// Runs the type's `scope<Name>` method on `filter` and returns the refined filter.
    document_t apply_scope(const std::string& type_name, const std::string& scope,
                           const document_t& filter, const std::vector<value>& args = {});

    /// Unvalidated document for display; references are not saved.
    document_t to_document(object& obj);
    std::string to_json(object& obj);
    bool is_dirty(object& obj);

    /// Field name of the type's identifier.
    std::string key_name(const std::string& type_name);
    schema_ptr metadata(const std::string& type_name);

    /// Builds a loaded object from a stored document (snapshotted, fires `retrieved`).
    std::shared_ptr<object> hydrate(const std::string& type_name, const document_t& doc);

    // reference_resolver
    std::shared_ptr<object> resolve(const std::string& collection, const document_t& id) override;
    void persist(object& target) override;

    metadata_registry& registry() { return registry_; }
    metadata_cache& cache() { return cache_; }
    event_dispatcher& events() { return events_; }
    diff_engine& changes() { return diff_; }
    docmap::transport& store() { return *transport_; }
    const configuration& config() const { return config_; }

private:
    /// Marks an object as being saved for the lifetime of the scope.
    class save_scope {
    public:
        save_scope(mapper& m, const object& obj);
        ~save_scope();
        bool reentrant() const { return reentrant_; }
    private:
        mapper& mapper_;
        const object* obj_;
        bool reentrant_ = false;
    };

    /// Forwards to the owning mapper; references keep only a weak_ptr to it.
    class resolver_handle : public reference_resolver {
    public:
        explicit resolver_handle(mapper& owner) : owner_(owner) {}
        std::shared_ptr<object> resolve(const std::string& collection, const document_t& id) override {
            return owner_.resolve(collection, id);
        }
        void persist(object& target) override { owner_.persist(target); }
    private:
        mapper& owner_;
    };

    document_t scoped_filter(const schema_definition& schema, const document_t& filter) const;
    std::shared_ptr<object> instantiate_with(const schema_definition& schema,
                                             const std::map<std::string, value>& fields);

    configuration config_;
    metadata_cache cache_;
    std::shared_ptr<docmap::transport> transport_;
    metadata_registry registry_;
    std::shared_ptr<reference_resolver> resolver_handle_;
    serializer serializer_;
    event_dispatcher events_;
    diff_engine diff_;
    hydrator hydrator_;

    std::mutex saving_mutex_;
    std::set<const object*> saving_;
};

} // namespace docmap

#endif // __cplusplus
