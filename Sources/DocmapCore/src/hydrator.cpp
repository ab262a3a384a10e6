#include "docmap/hydrator.hpp"
#include "docmap/diff.hpp"
#include "docmap/events.hpp"
#include "docmap/object.hpp"
#include "docmap/reference.hpp"
#include "docmap/registry.hpp"
#include "docmap/log.hpp"

namespace docmap {

namespace {

/// "__type": {"class": "app::Admin"} -> "app::Admin"
std::string embedded_type(const document_t& doc) {
    auto marker = doc.find("__type");
    if (marker == doc.end() || !marker->is_object()) return {};
    auto name = marker->find("class");
    if (name == marker->end() || !name->is_string()) return {};
    return name->get<std::string>();
}

} // namespace

std::shared_ptr<object> hydrator::new_instance(const std::string& type_name, const document_t& doc,
                                               bool nested) {
    auto schema = registry_.of(type_name);
    return new_instance(*schema, doc, nested);
}

std::shared_ptr<object> hydrator::new_instance(const schema_definition& schema, const document_t& doc,
                                               bool nested) {
    const schema_definition* target = &schema;
    schema_ptr concrete;
    auto type_name = embedded_type(doc);
    if (!type_name.empty() && type_name != schema.type_name()) {
        concrete = registry_.of(type_name);
        target = concrete.get();
    }

    // Factory construction, no user initialization
    auto obj = registry_.types().instantiate(target->type_name());

    for (auto it = doc.begin(); it != doc.end(); ++it) {
        const std::string& key = it.key();
        if (key.compare(0, 2, "__") == 0) {
            continue;
        }
        const property_def* prop = target->find_property(key);
        if (prop) {
            member_access::write(*obj, prop->field_name, hydrate_value(it.value(), prop->type), prop->access);
        } else {
            obj->set(key, hydrate_value(it.value(), type_descriptor::untyped()));
        }
    }

    if (!nested) {
        diff_.snapshot(*obj);
        events_.trigger(*obj, event_kind::retrieved);
    }
    return obj;
}

value hydrator::hydrate_value(const document_t& doc, const type_descriptor& type) {
    if (doc.is_object()) {
        if (reference::is_reference_document(doc)) {
            return value(reference::from_document(doc, resolver_));
        }
        if (detail::is_native_marker(doc)) {
            return detail::value_from_document(doc);
        }
        auto embedded = embedded_type(doc);
        if (!embedded.empty()) {
            return value(new_instance(embedded, doc, true));
        }
        if (type.is_class() && !doc.empty()) {
            return value(new_instance(type.class_name, doc, true));
        }

        value::map_t fields;
        for (auto it = doc.begin(); it != doc.end(); ++it) {
            fields.emplace(it.key(), hydrate_value(it.value(), type_descriptor::untyped()));
        }
        return value(std::move(fields));
    }

    if (doc.is_array()) {
        const type_descriptor element = (type.is_array() && type.element) ? *type.element
                                                                          : type_descriptor::untyped();
        value::array_t items;
        items.reserve(doc.size());
        for (const auto& item : doc) {
            items.push_back(hydrate_value(item, element));
        }
        return value(std::move(items));
    }

    return detail::value_from_document(doc);
}

} // namespace docmap
