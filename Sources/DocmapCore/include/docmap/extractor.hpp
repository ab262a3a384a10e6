#pragma once

#ifdef __cplusplus

#include "schema.hpp"
#include "introspection.hpp"

#include <string>

namespace docmap {

class metadata_registry;

// ============================================================================
// schema_extractor - turns one declared type into a schema_definition
//
// Parent definitions are obtained through the registry, so extracting a type
// may recursively build its ancestors. Index creation is left to the registry.
// ============================================================================

class schema_extractor {
public:
    schema_extractor(const type_introspector& types, metadata_registry& registry)
        : types_(types), registry_(registry) {}

    schema_ptr extract(const std::string& type_name) const;

    /// Collection a type names for itself (annotation or pluralized simple
    /// name), ignoring any single-collection ancestor.
    static std::string declared_collection(const type_decl& decl);

private:
    void check_lineage(const type_decl& decl) const;
    void read_collection(schema_definition& schema, const type_decl& decl) const;
    void read_properties(schema_definition& schema, const type_decl& decl) const;
    void read_methods(schema_definition& schema, const type_decl& decl) const;
    void resolve_id(schema_definition& schema) const;

    static property_def make_property(const property_decl& decl);
    static std::vector<validation_rule> read_validations(const annotation_set& annotations);
    static std::optional<index_def> read_index(const property_def& prop);

    const type_introspector& types_;
    metadata_registry& registry_;
};

} // namespace docmap

#endif // __cplusplus
