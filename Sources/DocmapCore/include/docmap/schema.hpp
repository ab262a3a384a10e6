#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "introspection.hpp"

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace docmap {

class object;

// ============================================================================
// Value type descriptors
// ============================================================================

enum class value_category {
    untyped,     // no declared type, values pass through
    scalar,      // int, float, bool, string, object
    array,       // homogeneous array of `element`
    class_type,  // embedded document of a mapped type
    id           // document identifier
};

enum class scalar_kind {
    integer,
    floating,
    boolean,
    string,
    object
};

struct type_descriptor {
    value_category category = value_category::untyped;
    scalar_kind kind = scalar_kind::string;
    std::string class_name;                          // class_type only
    std::shared_ptr<const type_descriptor> element;  // array only, may be null

    static type_descriptor untyped() { return {}; }
    static type_descriptor scalar(scalar_kind k);
    static type_descriptor array_of(std::optional<type_descriptor> element);
    static type_descriptor class_of(std::string name);
    static type_descriptor id();

    /// Parses one type annotation (`int`, `array(string)`, `class("app::Address")`, ...).
    /// Returns nullopt if the annotation is not a type annotation.
    static std::optional<type_descriptor> from_annotation(const annotation& a);

    bool is_untyped() const { return category == value_category::untyped; }
    bool is_class() const { return category == value_category::class_type; }
    bool is_array() const { return category == value_category::array; }
};

/// Annotation names that declare a value type.
bool is_type_annotation(std::string_view name);

// ============================================================================
// Property definitions
// ============================================================================

struct validation_rule {
    std::string predicate;   // lower-cased registry name
    document_t args;         // JSON array of predicate arguments
};

struct reference_def {
    std::set<std::string> with_fields;
};

struct property_def {
    std::string stored_name;
    std::string field_name;
    type_descriptor type;
    bool required = false;
    std::vector<validation_rule> validations;
    visibility access = visibility::public_member;
    std::optional<reference_def> reference;
    annotation_set raw_annotations;

    bool is_public() const { return access == visibility::public_member; }
    bool is_reference() const { return reference.has_value(); }
};

// ============================================================================
// Index definitions
// ============================================================================

enum class sort_direction {
    asc = 1,
    desc = -1
};

struct index_key {
    std::string field;
    sort_direction direction = sort_direction::asc;
};

struct index_def {
    std::vector<index_key> key;
    bool unique = false;
    bool sparse = false;
    bool background = true;
    std::string name;

    /// "unique"|"index" followed by field_asc|field_desc for each key, joined by '_'
    static std::string make_name(const std::vector<index_key>& key, bool unique);

    /// {key: {field: 1|-1}, name, unique, sparse, background}
    document_t to_document() const;
};

index_def make_index(std::vector<index_key> key, bool unique, bool sparse = false);

// ============================================================================
// Lifecycle events
// ============================================================================

enum class event_kind {
    retrieved,
    creating,
    created,
    updating,
    updated,
    saving,
    saved,
    deleting,
    deleted
};

const char* event_kind_name(event_kind kind);

/// Recognized annotation/observer method names for `kind`, canonical name first.
const std::vector<std::string>& event_aliases(event_kind kind);

/// Maps an alias (case-insensitive) to its event kind.
std::optional<event_kind> event_from_alias(std::string_view alias);

struct event_hook {
    std::string method;
    bool is_public = true;
    std::vector<value> args;   // captured annotation arguments
    method_invoker invoke;
};

struct scope_ref {
    std::string method;
    size_t arity = 0;          // parameters minus the implicit query receiver
    method_invoker invoke;
};

/// An instantiated observer type.
struct observer_handle {
    std::string type_name;
    std::shared_ptr<object> instance;
};

// ============================================================================
// schema_definition - how one type maps to a collection
// ============================================================================

class schema_definition {
public:
    explicit schema_definition(std::string type_name) : type_name_(std::move(type_name)) {}

    const std::string& type_name() const { return type_name_; }
    const std::string& collection_name() const { return collection_name_; }
    bool single_collection_root() const { return single_collection_root_; }
    bool has_own_collection() const { return has_own_collection_; }
    bool is_abstract() const { return is_abstract_; }

    /// Field name of the identifier property.
    const std::string& id_property_key() const { return id_property_key_; }
    const property_def& id_property() const;

    /// Own properties in declaration order
    const std::vector<property_def>& properties() const { return properties_; }
    const property_def* property_by_field(const std::string& field_name) const;
    const property_def* property_by_stored(const std::string& stored_name) const;

    /// Resolves over the lineage; stored-name lookup takes precedence and own
    /// definitions shadow ancestor ones.
    const property_def* find_property(const std::string& name) const;

    /// All properties of the lineage, root-most first, overridden ones removed.
    std::vector<const property_def*> lineage_properties() const;

    const std::vector<index_def>& indexes() const { return indexes_; }
    const std::vector<event_hook>& hooks(event_kind kind) const;
    const std::map<event_kind, std::vector<event_hook>>& events() const { return events_; }
    const std::map<std::string, scope_ref>& scopes() const { return scopes_; }
    const scope_ref* find_scope(std::string_view name) const;

    const std::set<std::string>& watched_sources() const { return watched_sources_; }
    const std::shared_ptr<object>& prototype() const { return prototype_; }
    const std::shared_ptr<const schema_definition>& parent() const { return parent_; }

    /// True if `type_name` is this type or one of its ancestors.
    bool is_a(const std::string& type_name) const;

    // Observers are the only runtime-mutable part of a definition
    void add_observer(observer_handle observer) { observers_.push_back(std::move(observer)); }
    const std::vector<observer_handle>& observers() const { return observers_; }

private:
    friend class schema_extractor;

    void add_property(property_def prop);

    std::string type_name_;
    std::string collection_name_;
    bool single_collection_root_ = false;
    bool has_own_collection_ = true;
    bool is_abstract_ = false;
    std::string id_property_key_;

    std::vector<property_def> properties_;
    std::unordered_map<std::string, size_t> by_field_;
    std::unordered_map<std::string, size_t> by_stored_;

    std::vector<index_def> indexes_;
    std::map<event_kind, std::vector<event_hook>> events_;
    std::map<std::string, scope_ref> scopes_;
    std::vector<observer_handle> observers_;
    std::set<std::string> watched_sources_;
    std::shared_ptr<object> prototype_;
    std::shared_ptr<const schema_definition> parent_;
};

using schema_ptr = std::shared_ptr<schema_definition>;

} // namespace docmap

#endif // __cplusplus
