#include "docmap/diff.hpp"
#include "docmap/events.hpp"
#include "docmap/object.hpp"
#include "docmap/registry.hpp"
#include "docmap/serializer.hpp"
#include "docmap/transport.hpp"
#include "docmap/log.hpp"

namespace docmap {

document_t save_command::to_command() const {
    if (command == kind::create) {
        return document_t{
            {"insert", collection},
            {"documents", document_t::array({document})},
            {"ordered", true},
        };
    }
    document_t update = {
        {"q", selector},
        {"u", document},
        {"upsert", false},
        {"multi", false},
    };
    return document_t{
        {"update", collection},
        {"updates", document_t::array({update})},
        {"ordered", true},
    };
}

document_t diff_engine::diff(const document_t& current, const document_t& previous) {
    document_t set = document_t::object();
    document_t unset = document_t::object();

    for (auto it = current.begin(); it != current.end(); ++it) {
        auto old = previous.find(it.key());
        if (old == previous.end() || *old != it.value()) {
            set[it.key()] = it.value();
        }
    }
    for (auto it = previous.begin(); it != previous.end(); ++it) {
        if (!current.contains(it.key())) {
            unset[it.key()] = "";
        }
    }

    document_t out = document_t::object();
    if (!set.empty()) out["$set"] = std::move(set);
    if (!unset.empty()) out["$unset"] = std::move(unset);
    return out;
}

void diff_engine::snapshot(object& obj) {
    obj.last_persisted_ = serializer_.snapshot_document(obj);
}

void diff_engine::forget(object& obj) {
    obj.last_persisted_.reset();
}

save_command diff_engine::get_save_command(object& obj, const transport* target) {
    auto schema = registry_.of(obj);

    save_command cmd;
    cmd.collection = schema->collection_name();
    if (target) {
        cmd.connection = target->connection_name();
        cmd.database_name = target->database_name();
    }
    cmd.namespace_name = cmd.database_name.empty() ? cmd.collection
                                                   : cmd.database_name + "." + cmd.collection;

    events_.trigger(obj, event_kind::saving);

    if (!obj.last_persisted_) {
        events_.trigger(obj, event_kind::creating);
        cmd.command = save_command::kind::create;
        cmd.document = serializer_.to_document(obj, true, true);
        return cmd;
    }

    events_.trigger(obj, event_kind::updating);
    const document_t& previous = *obj.last_persisted_;
    auto current = serializer_.to_document(obj, true, false);

    cmd.command = save_command::kind::update;
    auto id = previous.find("_id");
    cmd.selector = document_t{{"_id", id != previous.end() ? *id : document_t(nullptr)}};
    cmd.document = diff(current, previous);
    LOG_DEBUG("diff", "%s update %s", cmd.namespace_name.c_str(), cmd.document.dump().c_str());
    return cmd;
}

bool diff_engine::is_dirty(object& obj) {
    if (!obj.last_persisted_) {
        return true;
    }
    return !diff(serializer_.snapshot_document(obj), *obj.last_persisted_).empty();
}

} // namespace docmap
