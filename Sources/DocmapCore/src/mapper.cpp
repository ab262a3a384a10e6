#include "docmap/mapper.hpp"
#include "docmap/object.hpp"
#include "docmap/sqlite_transport.hpp"
#include "docmap/errors.hpp"
#include "docmap/log.hpp"

namespace docmap {

namespace {

std::shared_ptr<transport> open_transport(const configuration& config) {
    if (config.custom_transport) {
        return config.custom_transport;
    }
    return std::make_shared<sqlite_transport>(config.path, config.database_name, config.connection_name);
}

int64_t affected(const document_t& result) {
    auto n = result.find("n");
    return n != result.end() && n->is_number() ? n->get<int64_t>() : 0;
}

} // namespace

// ============================================================================
// save_scope
// ============================================================================

mapper::save_scope::save_scope(mapper& m, const object& obj) : mapper_(m), obj_(&obj) {
    std::lock_guard<std::mutex> lock(mapper_.saving_mutex_);
    reentrant_ = !mapper_.saving_.insert(obj_).second;
}

mapper::save_scope::~save_scope() {
    if (reentrant_) return;
    std::lock_guard<std::mutex> lock(mapper_.saving_mutex_);
    mapper_.saving_.erase(obj_);
}

// ============================================================================
// mapper
// ============================================================================

mapper::mapper(configuration config, const type_introspector& types, const validator_registry& validators)
    : config_(std::move(config)),
      transport_(open_transport(config_)),
      registry_(types, cache_),
      resolver_handle_(std::make_shared<resolver_handle>(*this)),
      serializer_(registry_, validators, this),
      events_(registry_),
      diff_(serializer_, events_, registry_),
      hydrator_(registry_, diff_, events_, resolver_handle_) {
    registry_.set_transport(transport_.get());
    registry_.set_auto_create_indexes(config_.auto_create_indexes);
    LOG_INFO("mapper", "Using %s/%s", transport_->connection_name().c_str(),
             transport_->database_name().c_str());
}

void mapper::save(object& obj) {
    save_scope scope(*this, obj);
    if (scope.reentrant()) {
        // Reached again through a reference cycle
        LOG_DEBUG("mapper", "Skipping nested save of %s", obj.type_name().c_str());
        return;
    }

    auto cmd = diff_.get_save_command(obj, transport_.get());
    bool creating = cmd.command == save_command::kind::create;
    if (cmd.is_noop()) {
        LOG_DEBUG("mapper", "%s unchanged, nothing sent", obj.type_name().c_str());
    } else {
        auto result = transport_->execute(cmd.to_command());
        auto matched = result.find("n");
        if (!creating && matched != result.end() && matched->is_number() && *matched == 0) {
            LOG_WARN("mapper", "Update of %s matched no document in %s", obj.type_name().c_str(),
                     cmd.collection.c_str());
            throw not_found_error("No " + obj.type_name() + " matches " + cmd.selector.dump() +
                                  " in " + cmd.collection);
        }
    }

    // Baseline follows the store before the post-save hooks run
    diff_.snapshot(obj);
    events_.trigger(obj, creating ? event_kind::created : event_kind::updated);
    events_.trigger(obj, event_kind::saved);
}

void mapper::remove(object& obj) {
    auto schema = registry_.of(obj);
    const auto& id_prop = schema->id_property();
    auto id = detail::scalar_to_document(member_access::read(obj, id_prop.field_name, id_prop.access));
    if (detail::is_empty(id)) {
        throw not_found_error("Cannot delete an unsaved " + obj.type_name());
    }

    events_.trigger(obj, event_kind::deleting);
    transport_->execute(document_t{
        {"delete", schema->collection_name()},
        {"deletes", document_t::array({document_t{{"q", {{"_id", id}}}, {"limit", 1}}})},
    });
    events_.trigger(obj, event_kind::deleted);
    diff_.forget(obj);
}

document_t mapper::scoped_filter(const schema_definition& schema, const document_t& filter) const {
    document_t base = filter.is_null() ? document_t::object() : filter;
    if (schema.has_own_collection()) {
        return base;
    }
    document_t discriminator = {{"__type.class", schema.type_name()}};
    if (base.empty()) {
        return discriminator;
    }
    return document_t{{"$and", document_t::array({base, discriminator})}};
}

std::vector<std::shared_ptr<object>> mapper::find(const std::string& type_name, const document_t& filter,
                                                  const find_options& options) {
    auto schema = registry_.of(type_name);
    auto results = transport_->find(schema->collection_name(), scoped_filter(*schema, filter), options);

    std::vector<std::shared_ptr<object>> out;
    while (auto doc = results->next()) {
        out.push_back(hydrator_.new_instance(*schema, *doc));
    }
    return out;
}

std::shared_ptr<object> mapper::find_one(const std::string& type_name, const document_t& filter) {
    find_options options;
    options.limit = 1;
    auto found = find(type_name, filter, options);
    return found.empty() ? nullptr : found.front();
}

std::shared_ptr<object> mapper::find_or_fail(const std::string& type_name, const document_t& filter) {
    auto found = find_one(type_name, filter);
    if (!found) {
        throw not_found_error("No " + type_name + " matches " + filter.dump());
    }
    return found;
}

std::shared_ptr<object> mapper::instantiate_with(const schema_definition& schema,
                                                 const std::map<std::string, value>& fields) {
    auto obj = registry_.types().instantiate(schema.type_name());
    for (const auto& [name, v] : fields) {
        const property_def* prop = schema.find_property(name);
        if (prop) {
            member_access::write(*obj, prop->field_name, v, prop->access);
        } else {
            obj->set(name, v);
        }
    }
    return obj;
}

std::shared_ptr<object> mapper::first_or_new(const std::string& type_name, const document_t& filter) {
    if (auto found = find_one(type_name, filter)) {
        return found;
    }

    std::map<std::string, value> fields;
    for (auto it = filter.begin(); filter.is_object() && it != filter.end(); ++it) {
        // Operators ($or, {$gt: ...}) carry no value to copy
        if (it.key().compare(0, 1, "$") == 0) continue;
        if (it->is_object() && !detail::is_native_marker(*it) && !it->empty() &&
            it->begin().key().compare(0, 1, "$") == 0) {
            continue;
        }
        fields.emplace(it.key(), detail::value_from_document(*it));
    }
    return instantiate_with(*registry_.of(type_name), fields);
}

std::shared_ptr<object> mapper::first_or_create(const std::string& type_name, const document_t& filter) {
    auto obj = first_or_new(type_name, filter);
    if (!obj->is_persisted()) {
        save(*obj);
    }
    return obj;
}

std::shared_ptr<object> mapper::create(const std::string& type_name,
                                       const std::map<std::string, value>& fields) {
    auto obj = instantiate_with(*registry_.of(type_name), fields);
    save(*obj);
    return obj;
}

int64_t mapper::count(const std::string& type_name, const document_t& filter) {
    auto schema = registry_.of(type_name);
    return affected(transport_->execute(document_t{
        {"count", schema->collection_name()},
        {"query", scoped_filter(*schema, filter)},
    }));
}

int64_t mapper::update_where(const std::string& type_name, const document_t& selector,
                             const document_t& set, bool multi) {
    auto schema = registry_.of(type_name);
    document_t update = {
        {"q", scoped_filter(*schema, selector)},
        {"u", {{"$set", set}}},
        {"upsert", false},
        {"multi", multi},
    };
    return affected(transport_->execute(document_t{
        {"update", schema->collection_name()},
        {"updates", document_t::array({update})},
        {"ordered", true},
    }));
}

int64_t mapper::delete_where(const std::string& type_name, const document_t& selector) {
    auto schema = registry_.of(type_name);
    return affected(transport_->execute(document_t{
        {"delete", schema->collection_name()},
        {"deletes", document_t::array({document_t{{"q", scoped_filter(*schema, selector)}, {"limit", 0}}})},
    }));
}

void mapper::truncate(const std::string& type_name) {
    auto schema = registry_.of(type_name);
    if (!schema->has_own_collection()) {
        // Shared collection, only this type's documents go
        delete_where(type_name, document_t::object());
        return;
    }
    transport_->execute(document_t{{"drop", schema->collection_name()}});
    LOG_INFO("mapper", "Dropped %s", schema->collection_name().c_str());
}

document_t mapper::create_indexes(const std::string& type_name) {
    return registry_.create_indexes(*registry_.of(type_name));
}

void mapper::observe(const std::string& type_name, const std::string& observer_type) {
    events_.observe(type_name, observer_type);
}

document_t mapper::apply_scope(const std::string& type_name, const std::string& scope,
                               const document_t& filter, const std::vector<value>& args) {
    auto schema = registry_.of(type_name);
    const scope_ref* s = schema->find_scope(scope);
    if (!s || !s->invoke || !schema->prototype()) {
        throw configuration_error("Unknown scope " + scope + " on " + type_name);
    }
    if (args.size() != s->arity) {
        throw configuration_error("Scope " + scope + " of " + type_name + " takes " +
                                  std::to_string(s->arity) + " arguments, " +
                                  std::to_string(args.size()) + " given");
    }

    std::vector<value> call{value::native(filter)};
    call.insert(call.end(), args.begin(), args.end());
    value result = s->invoke(*schema->prototype(), call);

    if (result.is_null()) {
        return filter;
    }
    if (auto* doc = result.get_if<document_t>()) {
        return *doc;
    }
    if (result.is<value::map_t>()) {
        return detail::scalar_to_document(result);
    }
    throw configuration_error("Scope " + scope + " of " + type_name + " did not return a filter");
}

document_t mapper::to_document(object& obj) {
    return serializer_.to_document(obj, false, false, false);
}

std::string mapper::to_json(object& obj) {
    return to_document(obj).dump();
}

bool mapper::is_dirty(object& obj) {
    return diff_.is_dirty(obj);
}

std::string mapper::key_name(const std::string& type_name) {
    return registry_.of(type_name)->id_property_key();
}

schema_ptr mapper::metadata(const std::string& type_name) {
    return registry_.of(type_name);
}

std::shared_ptr<object> mapper::hydrate(const std::string& type_name, const document_t& doc) {
    return hydrator_.new_instance(type_name, doc);
}

std::shared_ptr<object> mapper::resolve(const std::string& collection, const document_t& id) {
    auto schema = registry_.of_collection(collection);
    if (!schema) {
        throw configuration_error("No type is mapped to collection " + collection);
    }
    find_options options;
    options.limit = 1;
    auto doc = transport_->find(collection, document_t{{"_id", id}}, options)->next();
    if (!doc) {
        throw reference_resolution_error(collection, id);
    }
    return hydrator_.new_instance(*schema, *doc);
}

void mapper::persist(object& target) {
    save(target);
}

} // namespace docmap
