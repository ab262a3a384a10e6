#include "docmap/extractor.hpp"
#include "docmap/registry.hpp"
#include "docmap/inflector.hpp"
#include "docmap/errors.hpp"
#include "docmap/log.hpp"

#include <regex>
#include <set>

namespace docmap {

namespace {

bool truthy(const std::optional<document_t>& v) {
    return v.has_value() && !detail::is_empty(*v);
}

} // namespace

schema_ptr schema_extractor::extract(const std::string& type_name) const {
    const type_decl* decl = types_.find(type_name);
    if (!decl) {
        throw type_not_found(type_name);
    }
    check_lineage(*decl);

    auto schema = std::make_shared<schema_definition>(type_name);
    schema->is_abstract_ = decl->is_abstract;
    if (!decl->source.empty()) {
        schema->watched_sources_.insert(decl->source);
    }

    read_collection(*schema, *decl);
    read_properties(*schema, *decl);
    read_methods(*schema, *decl);
    resolve_id(*schema);

    if (!decl->is_abstract) {
        // Built through the factory, user initialization never runs
        schema->prototype_ = types_.instantiate(type_name);
    }

    LOG_DEBUG("extractor", "%s -> %s (%zu properties, %zu indexes)", type_name.c_str(),
              schema->collection_name_.c_str(), schema->properties_.size(), schema->indexes_.size());
    return schema;
}

void schema_extractor::check_lineage(const type_decl& decl) const {
    std::set<std::string> seen{decl.name};
    std::string parent = decl.parent;
    while (!parent.empty()) {
        if (!seen.insert(parent).second) {
            throw configuration_error("Type " + decl.name + " has a cyclic inheritance chain through " + parent);
        }
        const type_decl* p = types_.find(parent);
        if (!p) {
            throw type_not_found(parent);
        }
        parent = p->parent;
    }
}

void schema_extractor::read_collection(schema_definition& schema, const type_decl& decl) const {
    std::string inherited;

    if (!decl.parent.empty()) {
        auto parent = registry_.of(decl.parent);
        schema.parent_ = parent;
        const auto& sources = parent->watched_sources();
        schema.watched_sources_.insert(sources.begin(), sources.end());

        for (const schema_definition* s = parent.get(); s; s = s->parent().get()) {
            if (s->single_collection_root()) {
                inherited = s->collection_name();
                schema.has_own_collection_ = false;
                break;
            }
        }
    }

    schema.collection_name_ = inherited.empty() ? declared_collection(decl) : inherited;
    schema.single_collection_root_ = decl.annotations.has("singlecollection");
}

std::string schema_extractor::declared_collection(const type_decl& decl) {
    auto* named = decl.annotations.get_one({"persist", "table", "collection"});
    if (named && named->arg(0).is_string()) {
        return named->arg(0).get<std::string>();
    }
    return detail::to_lower(inflector::pluralize(decl.simple_name()));
}

std::vector<validation_rule> schema_extractor::read_validations(const annotation_set& annotations) {
    std::vector<validation_rule> rules;
    for (const annotation* v : annotations.get("validate")) {
        for (const auto& arg : v->args) {
            if (arg.is_annotation()) {
                // validate(between(0, 99))
                rules.push_back({arg.nested->name, arg.nested->args_document()});
            } else if (arg.literal.is_string()) {
                // validate(is_email) or validate("app::checks::is_slug")
                rules.push_back({detail::to_lower(arg.literal.get<std::string>()), document_t::array()});
            } else {
                throw configuration_error("Invalid validate() argument " + arg.literal.dump());
            }
        }
    }
    return rules;
}

property_def schema_extractor::make_property(const property_decl& decl) {
    const auto& annotations = decl.annotations;

    property_def prop;
    prop.field_name = decl.name;
    prop.stored_name = decl.name;
    if (auto* field = annotations.get_one("field"); field && field->arg(0).is_string()) {
        prop.stored_name = field->arg(0).get<std::string>();
    }

    if (auto* typed = annotations.get_one({"int", "integer", "float", "double", "array", "bool",
                                           "boolean", "string", "object", "class", "type", "id"})) {
        if (auto t = type_descriptor::from_annotation(*typed)) {
            prop.type = std::move(*t);
        }
    }

    prop.required = annotations.has("required");
    prop.validations = read_validations(annotations);
    prop.access = decl.access;
    prop.raw_annotations = annotations;

    if (auto* ref = annotations.get_one("reference")) {
        reference_def ref_def;
        auto with = ref->kwarg("with");
        if (with && with->is_array()) {
            for (const auto& f : *with) {
                if (f.is_string()) ref_def.with_fields.insert(f.get<std::string>());
            }
        } else if (with && with->is_string()) {
            ref_def.with_fields.insert(with->get<std::string>());
        }
        for (size_t i = 0; ref->has_arg(i); ++i) {
            auto f = ref->arg(i);
            if (f.is_string()) ref_def.with_fields.insert(f.get<std::string>());
        }
        prop.reference = std::move(ref_def);
    }
    return prop;
}

std::optional<index_def> schema_extractor::read_index(const property_def& prop) {
    const annotation* index = prop.raw_annotations.get_one({"index", "unique"});
    if (!index) return std::nullopt;

    auto direction = sort_direction::asc;
    if (truthy(index->kwarg("asc")) || index->has_flag("asc")) {
        direction = sort_direction::asc;
    } else if (truthy(index->kwarg("desc")) || index->has_flag("desc")) {
        direction = sort_direction::desc;
    }
    bool sparse = truthy(index->kwarg("sparse")) || index->has_flag("sparse");

    return make_index({index_key{prop.stored_name, direction}}, index->name == "unique", sparse);
}

void schema_extractor::read_properties(schema_definition& schema, const type_decl& decl) const {
    for (const auto& p : decl.properties) {
        if (p.access != visibility::public_member && p.name.compare(0, 2, "__") == 0) {
            continue;
        }

        auto prop = make_property(p);
        if (prop.raw_annotations.has("id")) {
            if (schema.id_property_key_.empty()) {
                prop.stored_name = "_id";
                schema.id_property_key_ = prop.field_name;
            } else {
                LOG_WARN("extractor", "%s: %s is a second identifier, keeping %s", decl.name.c_str(),
                         prop.field_name.c_str(), schema.id_property_key_.c_str());
            }
        }

        if (auto index = read_index(prop)) {
            schema.indexes_.push_back(std::move(*index));
        }
        schema.add_property(std::move(prop));
    }
}

void schema_extractor::read_methods(schema_definition& schema, const type_decl& decl) const {
    static const std::regex scope_pattern("^scope(.+)", std::regex::icase);

    for (const auto& m : decl.methods) {
        std::smatch match;
        if (!decl.is_abstract && std::regex_search(m.name, match, scope_pattern)) {
            scope_ref scope;
            scope.method = m.name;
            scope.arity = m.parameter_count > 0 ? m.parameter_count - 1 : 0;
            scope.invoke = m.invoke;
            schema.scopes_[detail::to_lower(match[1].str())] = std::move(scope);
        }

        for (const auto& a : m.annotations) {
            auto kind = event_from_alias(a.name);
            if (!kind) continue;

            event_hook hook;
            hook.method = m.name;
            hook.is_public = m.access == visibility::public_member;
            for (const auto& arg : a.args_document()) {
                hook.args.push_back(detail::value_from_document(arg));
            }
            hook.invoke = m.invoke;
            schema.events_[*kind].push_back(std::move(hook));
        }
    }
}

void schema_extractor::resolve_id(schema_definition& schema) const {
    if (!schema.id_property_key_.empty()) return;

    if (schema.parent_) {
        schema.id_property_key_ = schema.parent_->id_property_key();
        return;
    }

    property_def id;
    id.stored_name = "_id";
    id.field_name = "id";
    id.type = type_descriptor::id();
    id.required = false;
    id.access = visibility::public_member;
    schema.id_property_key_ = id.field_name;
    schema.add_property(std::move(id));
}

} // namespace docmap
