#include "docmap/schema.hpp"
#include "docmap/errors.hpp"

#include <array>

namespace docmap {

// ============================================================================
// type_descriptor
// ============================================================================

type_descriptor type_descriptor::scalar(scalar_kind k) {
    type_descriptor t;
    t.category = value_category::scalar;
    t.kind = k;
    return t;
}

type_descriptor type_descriptor::array_of(std::optional<type_descriptor> element) {
    type_descriptor t;
    t.category = value_category::array;
    if (element) {
        t.element = std::make_shared<const type_descriptor>(std::move(*element));
    }
    return t;
}

type_descriptor type_descriptor::class_of(std::string name) {
    type_descriptor t;
    t.category = value_category::class_type;
    t.class_name = std::move(name);
    return t;
}

type_descriptor type_descriptor::id() {
    type_descriptor t;
    t.category = value_category::id;
    return t;
}

bool is_type_annotation(std::string_view name) {
    static const std::array<std::string_view, 12> names = {
        "int", "integer", "float", "double", "array", "bool",
        "boolean", "string", "object", "class", "type", "id"
    };
    for (auto n : names) {
        if (detail::iequals(n, name)) return true;
    }
    return false;
}

namespace {

std::optional<type_descriptor> descriptor_from_name(const std::string& name) {
    if (name == "int" || name == "integer") return type_descriptor::scalar(scalar_kind::integer);
    if (name == "float" || name == "double") return type_descriptor::scalar(scalar_kind::floating);
    if (name == "bool" || name == "boolean") return type_descriptor::scalar(scalar_kind::boolean);
    if (name == "string") return type_descriptor::scalar(scalar_kind::string);
    if (name == "object") return type_descriptor::scalar(scalar_kind::object);
    if (name == "array") return type_descriptor::array_of(std::nullopt);
    if (name == "id") return type_descriptor::id();
    return std::nullopt;
}

} // namespace

std::optional<type_descriptor> type_descriptor::from_annotation(const annotation& a) {
    if (!is_type_annotation(a.name)) return std::nullopt;

    if (a.name == "class") {
        auto cls = a.arg(0);
        if (!cls.is_string()) {
            throw configuration_error("class() type annotation needs a type name");
        }
        return class_of(cls.get<std::string>());
    }

    if (a.name == "array") {
        // array(int), array(class("app::Tag")) or array("string")
        if (!a.has_arg(0)) return array_of(std::nullopt);
        const auto& first = a.args[0];
        if (first.is_annotation()) {
            return array_of(from_annotation(*first.nested));
        }
        if (first.literal.is_string()) {
            return array_of(descriptor_from_name(detail::to_lower(first.literal.get<std::string>())));
        }
        return array_of(std::nullopt);
    }

    if (a.name == "type") {
        // type("int") or type(class="app::Address")
        if (auto cls = a.kwarg("class"); cls && cls->is_string()) {
            return class_of(cls->get<std::string>());
        }
        auto inner = a.arg(0);
        if (inner.is_string()) {
            auto name = detail::to_lower(inner.get<std::string>());
            if (auto t = descriptor_from_name(name)) return t;
            return class_of(inner.get<std::string>());
        }
        if (a.has_arg(0) && a.args[0].is_annotation()) {
            return from_annotation(*a.args[0].nested);
        }
        return untyped();
    }

    return descriptor_from_name(a.name);
}

// ============================================================================
// index_def
// ============================================================================

std::string index_def::make_name(const std::vector<index_key>& key, bool unique) {
    std::string name = unique ? "unique" : "index";
    for (const auto& k : key) {
        name += "_" + k.field + (k.direction == sort_direction::asc ? "_asc" : "_desc");
    }
    return name;
}

document_t index_def::to_document() const {
    document_t keys = document_t::object();
    for (const auto& k : key) {
        keys[k.field] = static_cast<int>(k.direction);
    }
    return document_t{
        {"key", keys},
        {"name", name},
        {"unique", unique},
        {"sparse", sparse},
        {"background", background},
    };
}

index_def make_index(std::vector<index_key> key, bool unique, bool sparse) {
    index_def idx;
    idx.name = index_def::make_name(key, unique);
    idx.key = std::move(key);
    idx.unique = unique;
    idx.sparse = sparse;
    return idx;
}

// ============================================================================
// Events
// ============================================================================

const char* event_kind_name(event_kind kind) {
    switch (kind) {
        case event_kind::retrieved: return "retrieved";
        case event_kind::creating:  return "creating";
        case event_kind::created:   return "created";
        case event_kind::updating:  return "updating";
        case event_kind::updated:   return "updated";
        case event_kind::saving:    return "saving";
        case event_kind::saved:     return "saved";
        case event_kind::deleting:  return "deleting";
        case event_kind::deleted:   return "deleted";
    }
    return "unknown";
}

namespace {

const std::map<event_kind, std::vector<std::string>>& alias_table() {
    static const std::map<event_kind, std::vector<std::string>> table = {
        {event_kind::retrieved, {"retrieved"}},
        {event_kind::creating,  {"creating", "before_create", "beforeCreate"}},
        {event_kind::created,   {"created", "after_create", "afterCreate"}},
        {event_kind::updating,  {"updating", "before_update", "beforeUpdate"}},
        {event_kind::updated,   {"updated", "after_update", "afterUpdate"}},
        {event_kind::saving,    {"saving", "before_save", "beforeSave"}},
        {event_kind::saved,     {"saved", "after_save", "afterSave"}},
        {event_kind::deleting,  {"deleting", "before_delete", "beforeDelete"}},
        {event_kind::deleted,   {"deleted", "after_delete", "afterDelete"}},
    };
    return table;
}

} // namespace

const std::vector<std::string>& event_aliases(event_kind kind) {
    return alias_table().at(kind);
}

std::optional<event_kind> event_from_alias(std::string_view alias) {
    for (const auto& [kind, aliases] : alias_table()) {
        for (const auto& a : aliases) {
            if (detail::iequals(a, alias)) return kind;
        }
    }
    return std::nullopt;
}

// ============================================================================
// schema_definition
// ============================================================================

const property_def& schema_definition::id_property() const {
    for (const schema_definition* s = this; s; s = s->parent_.get()) {
        if (auto* p = s->property_by_field(id_property_key_)) return *p;
    }
    throw configuration_error("Type " + type_name_ + " has no identifier property");
}

const property_def* schema_definition::property_by_field(const std::string& field_name) const {
    auto it = by_field_.find(field_name);
    return it != by_field_.end() ? &properties_[it->second] : nullptr;
}

const property_def* schema_definition::property_by_stored(const std::string& stored_name) const {
    auto it = by_stored_.find(stored_name);
    return it != by_stored_.end() ? &properties_[it->second] : nullptr;
}

const property_def* schema_definition::find_property(const std::string& name) const {
    for (const schema_definition* s = this; s; s = s->parent_.get()) {
        if (auto* p = s->property_by_stored(name)) return p;
    }
    for (const schema_definition* s = this; s; s = s->parent_.get()) {
        if (auto* p = s->property_by_field(name)) return p;
    }
    return nullptr;
}

std::vector<const property_def*> schema_definition::lineage_properties() const {
    std::vector<const schema_definition*> chain;
    for (const schema_definition* s = this; s; s = s->parent_.get()) {
        chain.push_back(s);
    }

    std::vector<const property_def*> out;
    std::set<std::string> seen;
    // Most-derived first so overrides win, then reversed to root-most first
    for (const auto* s : chain) {
        for (auto it = s->properties_.rbegin(); it != s->properties_.rend(); ++it) {
            if (seen.insert(it->field_name).second) {
                out.push_back(&*it);
            }
        }
    }
    return {out.rbegin(), out.rend()};
}

const std::vector<event_hook>& schema_definition::hooks(event_kind kind) const {
    static const std::vector<event_hook> none;
    auto it = events_.find(kind);
    return it != events_.end() ? it->second : none;
}

const scope_ref* schema_definition::find_scope(std::string_view name) const {
    auto it = scopes_.find(detail::to_lower(name));
    return it != scopes_.end() ? &it->second : nullptr;
}

bool schema_definition::is_a(const std::string& type_name) const {
    for (const schema_definition* s = this; s; s = s->parent_.get()) {
        if (s->type_name_ == type_name) return true;
    }
    return false;
}

void schema_definition::add_property(property_def prop) {
    if (by_field_.count(prop.field_name)) {
        throw configuration_error("Duplicate property " + prop.field_name + " in " + type_name_);
    }
    if (by_stored_.count(prop.stored_name)) {
        throw configuration_error("Stored name " + prop.stored_name + " is used twice in " + type_name_);
    }
    size_t index = properties_.size();
    by_field_.emplace(prop.field_name, index);
    by_stored_.emplace(prop.stored_name, index);
    properties_.push_back(std::move(prop));
}

} // namespace docmap
