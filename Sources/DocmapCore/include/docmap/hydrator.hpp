#pragma once

#ifdef __cplusplus

#include "schema.hpp"
#include "types.hpp"

#include <memory>

namespace docmap {

class diff_engine;
class event_dispatcher;
class metadata_registry;
class object;
class reference_resolver;

// ============================================================================
// hydrator - stored document -> object
//
// The concrete type is taken from "__type": {"class": ...} when present. Each
// field is matched to a property (stored name first, then field name), turned
// back into a value and written with the property's visibility. Top-level
// instances are snapshotted and fire `retrieved`; nested ones do neither.
// ============================================================================

class hydrator {
public:
    hydrator(metadata_registry& registry, diff_engine& diff, event_dispatcher& events,
             std::weak_ptr<reference_resolver> resolver = {})
        : registry_(registry), diff_(diff), events_(events), resolver_(std::move(resolver)) {}

    /// Resolver handed to every reference this hydrator creates.
    void set_resolver(std::weak_ptr<reference_resolver> resolver) { resolver_ = std::move(resolver); }

    std::shared_ptr<object> new_instance(const schema_definition& schema, const document_t& doc,
                                         bool nested = false);

    /// Convenience overload resolving the definition by type name.
    std::shared_ptr<object> new_instance(const std::string& type_name, const document_t& doc,
                                         bool nested = false);

private:
    value hydrate_value(const document_t& doc, const type_descriptor& type);

    metadata_registry& registry_;
    diff_engine& diff_;
    event_dispatcher& events_;
    std::weak_ptr<reference_resolver> resolver_;
};

} // namespace docmap

#endif // __cplusplus
