#include "docmap/serializer.hpp"
#include "docmap/registry.hpp"
#include "docmap/object.hpp"
#include "docmap/reference.hpp"
#include "docmap/validation.hpp"
#include "docmap/errors.hpp"
#include "docmap/log.hpp"

#include <algorithm>

namespace docmap {

namespace {

bool is_internal(const std::string& name) {
    return name.compare(0, 2, "__") == 0;
}

document_t type_marker(const std::string& type_name) {
    return document_t{{"class", type_name}};
}

} // namespace

document_t serializer::to_document(object& obj, bool validate, bool generate_id,
                                   bool persist_references) {
    context ctx;
    ctx.validate = validate;
    ctx.persist = persist_references;
    auto schema = registry_.of(obj);
    return serialize_object(obj, *schema, generate_id, ctx);
}

document_t serializer::snapshot_document(object& obj) {
    context ctx;
    ctx.validate = false;
    ctx.persist = false;
    auto schema = registry_.of(obj);
    return serialize_object(obj, *schema, false, ctx);
}

void serializer::assign_id(object& obj, const schema_definition& schema) {
    const auto& id = schema.id_property();
    const value& current = member_access::read(obj, id.field_name, id.access);
    if (!detail::is_empty(detail::scalar_to_document(current))) {
        return;
    }
    auto generated = object_id::generate();
    member_access::write(obj, id.field_name, value(generated), id.access);
    LOG_DEBUG("serializer", "Generated id %s for %s", generated.to_string().c_str(),
              obj.type_name().c_str());
}

document_t serializer::serialize_object(object& obj, const schema_definition& schema,
                                        bool generate_id, context& ctx) {
    if (std::find(ctx.stack.begin(), ctx.stack.end(), &obj) != ctx.stack.end()) {
        throw configuration_error("Cannot serialize " + obj.type_name() + ": the object graph is cyclic");
    }
    ctx.stack.push_back(&obj);

    // Assigned up front so references back to this object see the id
    if (generate_id) {
        assign_id(obj, schema);
    }

    document_t out = document_t::object();
    for (const property_def* prop : schema.lineage_properties()) {
        // Unset public fields are left out, required ones still fail validation
        if (prop->is_public() && !obj.has(prop->field_name) && !prop->required) {
            continue;
        }
        const value& v = member_access::read(obj, prop->field_name, prop->access);
        auto serialized = serialize_value(prop->field_name, v, prop, prop->type, ctx);
        if (!serialized) {
            continue;
        }
        if (ctx.validate) {
            validate_property(prop->field_name, *serialized, *prop, validators_);
        }
        out[prop->stored_name] = std::move(*serialized);
    }

    // Runtime fields that are not part of the declared schema
    for (const auto& [name, v] : obj.fields()) {
        if (schema.find_property(name)) {
            continue;
        }
        auto serialized = serialize_value(name, v, nullptr, type_descriptor::untyped(), ctx);
        if (serialized) {
            out[name] = std::move(*serialized);
        }
    }

    if (!schema.has_own_collection()) {
        out["__type"] = type_marker(obj.type_name());
    }

    ctx.stack.pop_back();
    return out;
}

std::optional<document_t> serializer::serialize_value(const std::string& name, const value& v,
                                                      const property_def* prop,
                                                      const type_descriptor& type, context& ctx) {
    if (is_internal(name) || v.is<resource_handle>()) {
        return std::nullopt;
    }

    if (auto* ref = v.get_if<value::reference_ptr>()) {
        if (!*ref) return document_t(nullptr);
        if ((*ref)->is_resolved() && prop && prop->is_reference()) {
            // Re-project so the inline cache follows the target
            auto target = (*ref)->get_object();
            if (ctx.persist && resolver_) resolver_->persist(*target);
            return make_reference(*target, *prop->reference, ctx);
        }
        if (ctx.persist) (*ref)->save();
        return (*ref)->to_document();
    }

    if (auto* native = v.get_if<document_t>()) {
        return *native;
    }

    const value coerced = coerce(v, type);

    if (coerced.is_null() || coerced.is_scalar() || coerced.is<timestamp_t>() || coerced.is<object_id>()) {
        return detail::scalar_to_document(coerced);
    }

    const type_descriptor element = (type.is_array() && type.element) ? *type.element
                                                                      : type_descriptor::untyped();

    if (auto* items = coerced.get_if<value::array_t>()) {
        document_t out = document_t::array();
        for (const auto& item : *items) {
            auto serialized = serialize_value(name, item, nullptr, element, ctx);
            out.push_back(serialized ? std::move(*serialized) : document_t(nullptr));
        }
        return out;
    }

    if (auto* fields = coerced.get_if<value::map_t>()) {
        document_t out = document_t::object();
        for (const auto& [key, item] : *fields) {
            if (is_internal(key)) continue;
            auto serialized = serialize_value(name, item, nullptr, element, ctx);
            if (serialized) out[key] = std::move(*serialized);
        }
        return out;
    }

    if (auto* nested = coerced.get_if<value::object_ptr>()) {
        if (!*nested) return document_t(nullptr);
        object& target = **nested;

        if (prop && prop->is_reference()) {
            if (ctx.persist && resolver_) {
                resolver_->persist(target);
            }
            return make_reference(target, *prop->reference, ctx);
        }

        auto nested_schema = registry_.of(target);
        auto doc = serialize_object(target, *nested_schema, false, ctx);
        if (!type.is_class() || !detail::iequals(type.class_name, target.type_name())) {
            // Needed to hydrate the embedded value back into the right type
            doc["__type"] = type_marker(target.type_name());
        }
        return doc;
    }

    return std::nullopt;
}

document_t serializer::make_reference(object& target, const reference_def& ref_def, context& ctx) {
    auto schema = registry_.of(target);
    const auto& id = schema->id_property();
    auto id_doc = detail::scalar_to_document(member_access::read(target, id.field_name, id.access));

    document_t cache = document_t::object();
    for (const auto& field : ref_def.with_fields) {
        const property_def* p = schema->find_property(field);
        const value& v = p ? member_access::read(target, p->field_name, p->access) : target.get(field);

        context inner;
        inner.validate = false;
        inner.persist = false;
        inner.stack = ctx.stack;
        auto serialized = serialize_value(field, v, nullptr,
                                          p ? p->type : type_descriptor::untyped(), inner);
        cache[field] = serialized ? std::move(*serialized) : document_t(nullptr);
    }

    return reference::make_document(schema->collection_name(), id_doc, cache);
}

value serializer::coerce(const value& v, const type_descriptor& type) {
    if (type.category == value_category::array) {
        if (v.is_null()) return value(value::array_t{});
        if (v.is_scalar() || v.is<timestamp_t>() || v.is<object_id>()) {
            return value(value::array_t{v});
        }
        return v;
    }
    if (type.category != value_category::scalar) {
        return v;
    }

    bool coercible = v.is_null() || v.is_scalar();
    switch (type.kind) {
        case scalar_kind::integer:
            return coercible ? value(v.as_int()) : v;
        case scalar_kind::floating:
            return coercible ? value(v.as_double()) : v;
        case scalar_kind::boolean:
            return coercible ? value(v.as_bool()) : v;
        case scalar_kind::string:
            return coercible ? value(v.as_string()) : v;
        case scalar_kind::object: {
            if (v.is_null()) return value(value::map_t{});
            if (auto* items = v.get_if<value::array_t>()) {
                value::map_t fields;
                for (size_t i = 0; i < items->size(); ++i) {
                    fields.emplace(std::to_string(i), (*items)[i]);
                }
                return value(std::move(fields));
            }
            if (v.is_scalar()) return value(value::map_t{{"scalar", v}});
            return v;
        }
    }
    return v;
}

} // namespace docmap
