#pragma once

#ifdef __cplusplus

#include "types.hpp"

#include <string>

namespace docmap {

class event_dispatcher;
class metadata_registry;
class object;
class serializer;
class transport;

/// What a save has to send, plus where to send it.
struct save_command {
    enum class kind { create, update };

    kind command = kind::create;
    std::string connection;
    std::string database_name;
    std::string namespace_name;   // "<database>.<collection>"
    std::string collection;
    document_t selector;          // update only: {_id: <previous id>}
    document_t document;          // full document (create) or {$set, $unset} (update)

    /// An update with nothing to set or unset.
    bool is_noop() const { return command == kind::update && document.empty(); }

    /// insert{documents, ordered} or update{updates: [{q, u, upsert, multi}], ordered}
    document_t to_command() const;
};

// ============================================================================
// diff_engine - change tracking against the last persisted document
// ============================================================================

class diff_engine {
public:
    diff_engine(serializer& ser, event_dispatcher& events, metadata_registry& registry)
        : serializer_(ser), events_(events), registry_(registry) {}

    /// {$set: keys new or changed in `current`, $unset: keys gone from `previous`}.
    /// Nested documents and arrays are compared and replaced whole; empty parts
    /// are omitted, so identical documents give {}.
    static document_t diff(const document_t& current, const document_t& previous);

    /// Records the object's current state as its persisted baseline.
    void snapshot(object& obj);
    void forget(object& obj);

    /// Fires saving + creating/updating, then builds the command. Runs
    /// validation; the object's id is generated on create.
    save_command get_save_command(object& obj, const transport* target = nullptr);

    /// True when the object differs from its baseline (or has none).
    bool is_dirty(object& obj);

private:
    serializer& serializer_;
    event_dispatcher& events_;
    metadata_registry& registry_;
};

} // namespace docmap

#endif // __cplusplus
