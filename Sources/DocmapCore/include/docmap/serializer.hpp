#pragma once

#ifdef __cplusplus

#include "schema.hpp"
#include "types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace docmap {

class metadata_registry;
class object;
class reference_resolver;
class validator_registry;

// ============================================================================
// serializer - object -> stored document
//
// Typed properties (over the whole lineage) are written under their stored
// names, then any untyped runtime fields by their raw names. Nested objects
// are serialized with their own definition, reference properties collapse to
// {"$ref", "$id", "__cache"} projections after their target is persisted.
// ============================================================================

class serializer {
public:
    serializer(metadata_registry& registry, const validator_registry& validators,
               reference_resolver* resolver = nullptr)
        : registry_(registry), validators_(validators), resolver_(resolver) {}

    void set_resolver(reference_resolver* resolver) { resolver_ = resolver; }

    /// `validate` enforces required/predicate rules, failing on the first
    /// violation. `generate_id` assigns a fresh object_id to objects without one.
    /// With `persist_references`, reference targets are saved before projection.
    document_t to_document(object& obj, bool validate = true, bool generate_id = false,
                           bool persist_references = true);

    /// State capture for the diff baseline: no validation, no reference persistence.
    document_t snapshot_document(object& obj);

    /// Settype-style coercion of a runtime value to a declared type.
    static value coerce(const value& v, const type_descriptor& type);

private:
    struct context {
        bool validate = true;
        bool persist = true;
        std::vector<const object*> stack;   // embedded objects being serialized
    };

    document_t serialize_object(object& obj, const schema_definition& schema,
                                bool generate_id, context& ctx);
    std::optional<document_t> serialize_value(const std::string& name, const value& v,
                                              const property_def* prop,
                                              const type_descriptor& type, context& ctx);
    document_t make_reference(object& target, const reference_def& ref_def, context& ctx);
    void assign_id(object& obj, const schema_definition& schema);

    metadata_registry& registry_;
    const validator_registry& validators_;
    reference_resolver* resolver_;
};

} // namespace docmap

#endif // __cplusplus
