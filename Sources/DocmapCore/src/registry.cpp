#include "docmap/registry.hpp"
#include "docmap/extractor.hpp"
#include "docmap/introspection.hpp"
#include "docmap/object.hpp"
#include "docmap/transport.hpp"
#include "docmap/errors.hpp"
#include "docmap/log.hpp"

namespace docmap {

namespace {
constexpr const char* cache_prefix = "docmap.schema.";
}

metadata_registry::metadata_registry(const type_introspector& types, metadata_cache& cache)
    : types_(types), cache_(cache) {
    listener_ = cache_.on_invalidate([this](const std::string& key) { on_invalidated(key); });
}

metadata_registry::~metadata_registry() {
    cache_.remove_listener(listener_);
}

std::string metadata_registry::cache_key(const std::string& type_name) {
    return cache_prefix + type_name;
}

schema_ptr metadata_registry::of(const object& obj) {
    return of(obj.type_name());
}

schema_ptr metadata_registry::of(const std::string& type_name) {
    std::shared_future<schema_ptr> pending;
    std::promise<schema_ptr> promise;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = instances_.find(type_name);
        if (it != instances_.end()) {
            return it->second;
        }
        auto flight = in_flight_.find(type_name);
        if (flight != in_flight_.end()) {
            pending = flight->second;
        } else {
            in_flight_.emplace(type_name, promise.get_future().share());
        }
    }

    if (pending.valid()) {
        // Another thread is building this type
        return pending.get();
    }

    schema_ptr schema;
    try {
        schema = build(type_name);
    } catch (...) {
        promise.set_exception(std::current_exception());
        std::lock_guard<std::mutex> lock(mutex_);
        in_flight_.erase(type_name);
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        instances_[type_name] = schema;
        if (schema->has_own_collection()) {
            collections_[schema->collection_name()] = type_name;
        }
        in_flight_.erase(type_name);
    }
    promise.set_value(schema);
    return schema;
}

schema_ptr metadata_registry::build(const std::string& type_name) {
    return cache_.cached<schema_definition>(cache_key(type_name), [&](watch_list& sources) {
        schema_extractor extractor(types_, *this);
        auto schema = extractor.extract(type_name);
        ++build_count_;

        // A new (or changed) definition redeclares its indexes
        if (auto_create_indexes_) {
            create_indexes(*schema);
        }

        sources.insert(schema->watched_sources().begin(), schema->watched_sources().end());
        LOG_INFO("registry", "Loaded %s (collection %s)", type_name.c_str(),
                 schema->collection_name().c_str());
        return schema;
    });
}

schema_ptr metadata_registry::of_collection(const std::string& collection) {
    if (auto type_name = collection_type(collection)) {
        return of(*type_name);
    }

    // Not loaded yet in this process: look for a declared type naming it
    for (const auto& name : types_.type_names()) {
        if (is_loaded(name)) {
            continue;
        }
        const type_decl* decl = types_.find(name);
        if (!decl || schema_extractor::declared_collection(*decl) != collection) {
            continue;
        }
        of(name);
        if (auto type_name = collection_type(collection)) {
            LOG_DEBUG("registry", "Collection %s resolved to %s", collection.c_str(), type_name->c_str());
            return of(*type_name);
        }
    }
    return nullptr;
}

void metadata_registry::map_collection(const std::string& collection, const std::string& type_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    collections_[collection] = type_name;
}

std::optional<std::string> metadata_registry::collection_type(const std::string& collection) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = collections_.find(collection);
    if (it == collections_.end()) {
        return std::nullopt;
    }
    return it->second;
}

document_t metadata_registry::create_indexes(const schema_definition& schema) {
    if (schema.indexes().empty()) {
        return nullptr;
    }
    if (!transport_) {
        LOG_WARN("registry", "No transport, indexes of %s not created", schema.type_name().c_str());
        return nullptr;
    }

    document_t indexes = document_t::array();
    for (const auto& index : schema.indexes()) {
        indexes.push_back(index.to_document());
    }
    LOG_DEBUG("registry", "Creating %zu indexes on %s", schema.indexes().size(),
              schema.collection_name().c_str());
    return transport_->execute(document_t{
        {"createIndexes", schema.collection_name()},
        {"indexes", indexes},
    });
}

void metadata_registry::invalidate(const std::string& type_name) {
    cache_.invalidate(cache_key(type_name));
    std::lock_guard<std::mutex> lock(mutex_);
    instances_.erase(type_name);
}

bool metadata_registry::is_loaded(const std::string& type_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return instances_.count(type_name) != 0;
}

void metadata_registry::on_invalidated(const std::string& key) {
    if (key.compare(0, std::char_traits<char>::length(cache_prefix), cache_prefix) != 0) {
        return;
    }
    auto type_name = key.substr(std::char_traits<char>::length(cache_prefix));
    std::lock_guard<std::mutex> lock(mutex_);
    if (instances_.erase(type_name)) {
        LOG_INFO("registry", "Definition of %s invalidated", type_name.c_str());
    }
}

} // namespace docmap
