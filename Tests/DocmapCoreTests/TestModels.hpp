#pragma once

#include <DocmapCore.hpp>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

// ============================================================================
// Model Definitions
//
//   models::User           users, unique email, private password, hooks, scope
//   models::Person         no annotations: "people", synthesized _id
//   models::Address        embedded in Post
//   models::Post           "articles", required title, reference author
//   models::Account/Admin  single collection hierarchy
//   models::Node           reference cycles
//   models::Gauge          declared scalar types (coercion)
//   models::AuditObserver  observer of User
//   models::Mailer         afterCreate hook that fails
//   models::Locked         saving hook that fails, LockObserver watching it
// ============================================================================

namespace models {

using docmap::annotation;
using docmap::document_t;
using docmap::object;
using docmap::type_builder;
using docmap::value;
using docmap::visibility;

/// Hooks and observer methods that ran, in order.
inline std::vector<std::string>& event_log() {
    static std::vector<std::string> log;
    return log;
}

inline bool logged(const std::string& entry) {
    for (const auto& e : event_log()) {
        if (e == entry) return true;
    }
    return false;
}

inline const char* models_source() {
    return __FILE__;
}

class User : public object {
public:
    User() : object("models::User") {}

    std::string password() const { return get_private("password").as_string(); }
    void set_password(std::string p) { set_private("password", std::move(p)); }
};

class Person : public object {
public:
    Person() : object("models::Person") {}
};

class Address : public object {
public:
    Address() : object("models::Address") {}
    Address(std::string street, std::string city) : object("models::Address") {
        set("street", std::move(street));
        set("city", std::move(city));
    }
};

class Post : public object {
public:
    Post() : object("models::Post") {}
};

class Account : public object {
public:
    Account() : object("models::Account") {}
protected:
    explicit Account(std::string type_name) : object(std::move(type_name)) {}
};

class Admin : public Account {
public:
    Admin() : Account("models::Admin") {}
};

/// Counts factory calls, slowly.
inline std::atomic<int>& slow_factory_calls() {
    static std::atomic<int> calls{0};
    return calls;
}

inline void log_hook(const std::string& entry) {
    event_log().push_back(entry);
}

inline void declare_models(docmap::type_catalog& c) {
    type_builder("models::User")
        .source(models_source())
        .property("id", {{"id"}})
        .property("name", {{"string"}})
        .property("email", {{"unique"}, {"validate", {"is_email"}}})
        .property("age", {{"int"}, {"validate", {annotation("between", {0, 150})}}})
        .property("password", {}, visibility::private_member)
        .property("__token", {}, visibility::private_member)
        .method("touch", 0, {{"before_save"}}, [](object&, const std::vector<value>&) {
            log_hook("User.saving");
            return value();
        })
        .method("stamp", 1, {{"creating", {"created_by_hook"}}}, [](object& self, const std::vector<value>& args) {
            self.set("origin", args.empty() ? value() : args[0]);
            log_hook("User.creating");
            return value();
        })
        .method("welcome", 0, {{"afterCreate"}}, [](object&, const std::vector<value>&) {
            log_hook("User.created");
            return value();
        })
        .method("reload", 0, {{"retrieved"}}, [](object&, const std::vector<value>&) {
            log_hook("User.retrieved");
            return value();
        })
        .method("scopeAdults", 2, {}, [](object&, const std::vector<value>& args) {
            document_t query = args[0].get<document_t>();
            query["age"] = {{"$gte", args[1].as_int()}};
            return value::native(query);
        })
        .factory<User>()
        .declare(c);

    type_builder("models::Person")
        .property("name")
        .factory<Person>()
        .declare(c);

    type_builder("models::Address")
        .property("street", {{"string"}})
        .property("city", {{"string"}})
        .factory<Address>()
        .declare(c);

    type_builder("models::Post")
        .annotate({"collection", {"articles"}})
        .property("title", {{"required"}, {"string"}})
        .property("author", {{"reference", {}, {{"with", document_t::array({"email"})}}}})
        .property("tags", {{"array", {"string"}}})
        .property("address", {{"class", {"models::Address"}}})
        .property("views", {{"index", {"desc"}}})
        .factory<Post>()
        .declare(c);

    type_builder("models::Account")
        .annotate({"singlecollection"})
        .annotate({"collection", {"accounts"}})
        .property("id", {{"id"}})
        .property("login", {{"string"}})
        .method("audit", 0, {{"saving"}}, [](object& self, const std::vector<value>&) {
            log_hook(self.type_name() + " via Account.saving");
            return value();
        })
        .method("describe", 0, {{"retrieved"}}, [](object&, const std::vector<value>&) {
            log_hook("Account.retrieved");
            return value();
        })
        .factory<Account>()
        .declare(c);

    // Overrides describe() without its hook
    type_builder("models::Admin")
        .extends("models::Account")
        .property("level", {{"int"}})
        .method("describe", 0, {}, [](object&, const std::vector<value>&) {
            log_hook("Admin.describe");
            return value();
        })
        .factory<Admin>()
        .declare(c);

    type_builder("models::Node")
        .property("label")
        .property("peer", {{"reference", {"label"}}})
        .factory([] { return std::make_shared<object>("models::Node"); })
        .declare(c);

    type_builder("models::Gauge")
        .property("count", {{"int"}})
        .property("ratio", {{"float"}})
        .property("flag", {{"bool"}})
        .property("label", {{"string"}})
        .property("items", {{"array"}})
        .property("meta", {{"object"}})
        .factory([] { return std::make_shared<object>("models::Gauge"); })
        .declare(c);

    type_builder("models::AuditObserver")
        .method("saved", 1, {}, [](object&, const std::vector<value>& args) {
            log_hook("Audit.saved " + args[0].as_object()->type_name());
            return value();
        })
        .method("before_delete", 1, {}, [](object&, const std::vector<value>& args) {
            log_hook("Audit.deleting " + args[0].as_object()->type_name());
            return value();
        })
        .method("deleted", 1, {}, [](object&, const std::vector<value>&) {
            log_hook("Audit.hidden");
            return value();
        }, visibility::private_member)
        .factory([] { return std::make_shared<object>("models::AuditObserver"); })
        .declare(c);

    type_builder("models::Broken")
        .property("name")
        .method("hidden", 0, {{"saving"}}, [](object&, const std::vector<value>&) {
            return value();
        }, visibility::private_member)
        .factory([] { return std::make_shared<object>("models::Broken"); })
        .declare(c);

    type_builder("models::Slow")
        .property("name")
        .factory([] {
            ++slow_factory_calls();
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            return std::make_shared<object>("models::Slow");
        })
        .declare(c);

    type_builder("models::Mailer")
        .property("to", {{"string"}})
        .method("notify", 0, {{"afterCreate"}}, [](object&, const std::vector<value>&) -> value {
            log_hook("Mailer.created");
            throw std::runtime_error("mail server down");
        })
        .method("confirm", 0, {{"saved"}}, [](object&, const std::vector<value>&) {
            log_hook("Mailer.saved");
            return value();
        })
        .factory([] { return std::make_shared<object>("models::Mailer"); })
        .declare(c);

    type_builder("models::Locked")
        .property("name")
        .method("guard", 0, {{"saving"}}, [](object&, const std::vector<value>&) -> value {
            log_hook("Locked.guard");
            throw std::runtime_error("record is locked");
        })
        .method("later", 0, {{"before_save"}}, [](object&, const std::vector<value>&) {
            log_hook("Locked.later");
            return value();
        })
        .method("stamp", 0, {{"creating"}}, [](object&, const std::vector<value>&) {
            log_hook("Locked.creating");
            return value();
        })
        .factory([] { return std::make_shared<object>("models::Locked"); })
        .declare(c);

    type_builder("models::LockObserver")
        .method("saving", 1, {}, [](object&, const std::vector<value>&) {
            log_hook("LockObserver.saving");
            return value();
        })
        .method("creating", 1, {}, [](object&, const std::vector<value>&) {
            log_hook("LockObserver.creating");
            return value();
        })
        .factory([] { return std::make_shared<object>("models::LockObserver"); })
        .declare(c);

    type_builder("models::Shape")
        .abstract()
        .property("sides", {{"int"}})
        .declare(c);
}

/// Catalog holding every test model.
inline docmap::type_catalog& catalog() {
    static docmap::type_catalog* c = [] {
        auto* created = new docmap::type_catalog();
        declare_models(*created);
        return created;
    }();
    return *c;
}

// ============================================================================
// recording_transport - SQLite transport that keeps every command it ran
// ============================================================================

class recording_transport : public docmap::transport {
public:
    recording_transport() : inner_(":memory:", "testdb", "recording") {}

    document_t execute(const document_t& command) override {
        commands.push_back(command);
        if (fail_updates && command.contains("update")) {
            throw docmap::db_error("update rejected by the store");
        }
        return inner_.execute(command);
    }

    std::unique_ptr<docmap::cursor> find(const std::string& collection,
                                         const document_t& filter,
                                         const docmap::find_options& options = {}) override {
        return inner_.find(collection, filter, options);
    }

    std::string connection_name() const override { return inner_.connection_name(); }
    std::string database_name() const override { return inner_.database_name(); }

    /// Commands named `name` ("insert", "update", ...), oldest first.
    std::vector<document_t> named(const std::string& name) const {
        std::vector<document_t> out;
        for (const auto& c : commands) {
            if (c.contains(name)) out.push_back(c);
        }
        return out;
    }

    std::vector<document_t> commands;

    /// Makes every update command throw db_error (after it is recorded).
    bool fail_updates = false;

private:
    docmap::sqlite_transport inner_;
};

} // namespace models
