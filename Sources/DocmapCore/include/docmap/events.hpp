#pragma once

#ifdef __cplusplus

#include "schema.hpp"

#include <string>

namespace docmap {

class metadata_registry;
class object;

// ============================================================================
// event_dispatcher - lifecycle hooks and observers
//
// trigger(obj, kind) runs, in order:
//   1. hooks the type declares for `kind`, then hooks inherited from ancestors
//      (an ancestor hook overridden by a more derived type runs only once,
//      through the override)
//   2. observers of the type, then of its ancestors, through any public method
//      named after one of the aliases of `kind`
//
// An exception thrown by a hook or observer stops the dispatch and reaches the
// caller of the persistence operation.
// ============================================================================

class event_dispatcher {
public:
    explicit event_dispatcher(metadata_registry& registry) : registry_(registry) {}

    void trigger(object& obj, event_kind kind);

    /// Registers an instance of `observer_type` on `type_name`.
    void observe(const std::string& type_name, const std::string& observer_type);

private:
    void run_hooks(object& obj, const schema_definition& schema, event_kind kind);
    void notify_observers(object& obj, const schema_definition& schema, event_kind kind);

    metadata_registry& registry_;
};

} // namespace docmap

#endif // __cplusplus
