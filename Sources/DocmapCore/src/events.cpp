#include "docmap/events.hpp"
#include "docmap/registry.hpp"
#include "docmap/object.hpp"
#include "docmap/errors.hpp"
#include "docmap/log.hpp"

#include <set>

namespace docmap {

void event_dispatcher::trigger(object& obj, event_kind kind) {
    auto schema = registry_.of(obj);
    LOG_DEBUG("events", "%s on %s", event_kind_name(kind), obj.type_name().c_str());
    run_hooks(obj, *schema, kind);
    notify_observers(obj, *schema, kind);
}

void event_dispatcher::run_hooks(object& obj, const schema_definition& schema, event_kind kind) {
    const auto& types = registry_.types();
    std::set<std::string> overridden;

    for (const schema_definition* s = &schema; s; s = s->parent().get()) {
        for (const auto& hook : s->hooks(kind)) {
            if (overridden.count(hook.method)) {
                continue;
            }
            if (!hook.is_public || !hook.invoke) {
                throw configuration_error("Only public methods can be events (" + s->type_name() +
                                          "::" + hook.method + ")");
            }
            hook.invoke(obj, hook.args);
        }

        if (const type_decl* decl = types.find(s->type_name())) {
            for (const auto& m : decl->methods) {
                overridden.insert(m.name);
            }
        }
    }
}

void event_dispatcher::notify_observers(object& obj, const schema_definition& schema, event_kind kind) {
    const auto& types = registry_.types();
    const auto& aliases = event_aliases(kind);

    for (const schema_definition* s = &schema; s; s = s->parent().get()) {
        for (const auto& observer : s->observers()) {
            for (const auto& alias : aliases) {
                const method_decl* method = types.find_method(observer.type_name, alias);
                if (!method || method->access != visibility::public_member || !method->invoke) {
                    continue;
                }
                method->invoke(*observer.instance, {value(member_access::share(obj))});
            }
        }
    }
}

void event_dispatcher::observe(const std::string& type_name, const std::string& observer_type) {
    auto schema = registry_.of(type_name);
    if (!registry_.types().find(observer_type)) {
        throw type_not_found(observer_type);
    }
    auto instance = registry_.types().instantiate(observer_type);
    schema->add_observer({observer_type, std::move(instance)});
    LOG_INFO("events", "%s observes %s", observer_type.c_str(), type_name.c_str());
}

} // namespace docmap
