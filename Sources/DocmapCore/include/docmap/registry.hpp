#pragma once

#ifdef __cplusplus

#include "schema.hpp"
#include "metadata_cache.hpp"

#include <atomic>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace docmap {

class object;
class transport;
class type_introspector;

// ============================================================================
// metadata_registry - process-wide schema definitions
//
// of(type) builds each definition at most once: concurrent first callers for
// the same type wait on the builder's shared_future. Definitions are cached in
// the metadata_cache under "docmap.schema.<type>" with every source file of the
// lineage watched; invalidating that entry drops the definition here too.
// ============================================================================

class metadata_registry {
public:
    metadata_registry(const type_introspector& types, metadata_cache& cache);
    ~metadata_registry();

    metadata_registry(const metadata_registry&) = delete;
    metadata_registry& operator=(const metadata_registry&) = delete;

    schema_ptr of(const std::string& type_name);
    schema_ptr of(const object& obj);

    /// Definition of the type mapped to `collection`, or nullptr if unmapped.
    schema_ptr of_collection(const std::string& collection);

    void map_collection(const std::string& collection, const std::string& type_name);
    std::optional<std::string> collection_type(const std::string& collection) const;

    /// Sends one createIndexes command for the definition's indexes. Returns
    /// the transport result, or null when there was nothing to send.
    document_t create_indexes(const schema_definition& schema);

    void set_transport(transport* t) { transport_ = t; }
    transport* get_transport() const { return transport_; }
    void set_auto_create_indexes(bool enabled) { auto_create_indexes_ = enabled; }

    /// Drops the process-cached definition (and its cache entry).
    void invalidate(const std::string& type_name);
    bool is_loaded(const std::string& type_name) const;

    const type_introspector& types() const { return types_; }
    metadata_cache& cache() { return cache_; }

    /// Number of extractions performed so far.
    size_t build_count() const { return build_count_.load(); }

    static std::string cache_key(const std::string& type_name);

private:
    schema_ptr build(const std::string& type_name);
    void on_invalidated(const std::string& key);

    const type_introspector& types_;
    metadata_cache& cache_;
    metadata_cache::listener_id listener_ = 0;
    transport* transport_ = nullptr;
    std::atomic<bool> auto_create_indexes_{true};
    std::atomic<size_t> build_count_{0};

    mutable std::mutex mutex_;
    std::unordered_map<std::string, schema_ptr> instances_;
    std::unordered_map<std::string, std::shared_future<schema_ptr>> in_flight_;
    std::unordered_map<std::string, std::string> collections_;
};

} // namespace docmap

#endif // __cplusplus
