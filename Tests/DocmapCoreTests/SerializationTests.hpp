#pragma once

#include "TestModels.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <limits>
#include <memory>

namespace serialization_tests {

using docmap::document_t;
using docmap::value;

/// Mapping engine without a transport.
struct engine {
    docmap::metadata_cache cache;
    docmap::metadata_registry registry{models::catalog(), cache};
    docmap::serializer serializer{registry, docmap::validator_registry::instance()};
    docmap::event_dispatcher events{registry};
    docmap::diff_engine diff{serializer, events, registry};
    docmap::hydrator hydrator{registry, diff, events};
};

// ============================================================================
// test_object_id
// ============================================================================

void test_object_id() {
    std::cout << "  test_object_id..." << std::flush;

    auto a = docmap::object_id::generate();
    auto b = docmap::object_id::generate();
    assert(a != b);
    assert(!a.is_nil());
    assert(a.to_string().size() == 24);
    assert(docmap::object_id::from_string(a.to_string()) == a);
    assert(docmap::object_id::from_string("not-an-id").is_nil());

    auto now = std::chrono::system_clock::now();
    auto age = now - a.generation_time();
    assert(age < std::chrono::minutes(1));

    auto marker = docmap::detail::object_id_to_document(a);
    assert(docmap::detail::is_native_marker(marker));
    assert(docmap::detail::value_from_document(marker).get<docmap::object_id>() == a);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_serialize_properties
// ============================================================================

void test_serialize_properties() {
    std::cout << "  test_serialize_properties..." << std::flush;

    engine e;
    auto user = std::make_shared<models::User>();
    user->set("name", "Ana");
    user->set("email", "ana@example.com");
    user->set("age", 30);
    user->set("nickname", "a");          // not declared
    user->set_password("secret");

    auto doc = e.serializer.to_document(*user);
    assert(doc["name"] == "Ana");
    assert(doc["email"] == "ana@example.com");
    assert(doc["age"] == 30);
    assert(doc["password"] == "secret");
    assert(doc["nickname"] == "a");
    assert(!doc.contains("_id"));
    assert(!doc.contains("id"));
    assert(!doc.contains("__token"));
    assert(!doc.contains("__type"));

    // Identifier generated on request and written back
    auto created = e.serializer.to_document(*user, true, true);
    assert(created["_id"].is_object());
    auto oid = created["_id"]["$oid"].get<std::string>();
    assert(user->get("id").is<docmap::object_id>());
    assert(user->get("id").get<docmap::object_id>().to_string() == oid);

    // An existing identifier is kept
    auto again = e.serializer.to_document(*user, true, true);
    assert(again["_id"]["$oid"] == oid);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_serialize_ignored_and_native_values
// ============================================================================

void test_serialize_ignored_and_native_values() {
    std::cout << "  test_serialize_ignored_and_native_values..." << std::flush;

    engine e;
    auto person = std::make_shared<models::Person>();
    person->set("name", "Bo");
    person->set("__scratch", 1);
    person->set("handle", docmap::resource_handle{std::make_shared<int>(3), "file"});
    person->set("when", docmap::timestamp_t(std::chrono::milliseconds(1500)));
    person->set("raw", value::native({{"$oid", "0123456789abcdef01234567"}}));
    person->set("list", value::array_t{value(1), value("two"), value()});
    person->set("dict", value::map_t{{"k", value(true)}, {"__hidden", value(1)}});

    auto doc = e.serializer.to_document(*person);
    assert(!doc.contains("__scratch"));
    assert(!doc.contains("handle"));
    assert(doc["when"] == document_t({{"$date", 1500}}));
    assert(doc["raw"]["$oid"] == "0123456789abcdef01234567");
    assert(doc["list"] == document_t::array({1, "two", nullptr}));
    assert(doc["dict"] == document_t({{"k", true}}));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_coercion
// ============================================================================

void test_coercion() {
    std::cout << "  test_coercion..." << std::flush;

    engine e;
    auto gauge = std::make_shared<docmap::object>("models::Gauge");
    gauge->set("count", "42");
    gauge->set("ratio", 1);
    gauge->set("flag", "0");
    gauge->set("label", 7);
    gauge->set("items", "solo");
    gauge->set("meta", value());

    auto doc = e.serializer.to_document(*gauge);
    assert(doc["count"] == 42);
    assert(doc["count"].is_number_integer());
    assert(doc["ratio"].is_number_float());
    assert(doc["ratio"] == 1.0);
    assert(doc["flag"] == false);
    assert(doc["label"] == "7");
    assert(doc["items"] == document_t::array({"solo"}));
    assert(doc["meta"] == document_t::object());

    // Null declared scalars take their type's zero value, unset ones are left out
    auto blank = std::make_shared<docmap::object>("models::Gauge");
    blank->set("count", value());
    blank->set("label", value());
    blank->set("items", value());
    auto zero = e.serializer.to_document(*blank);
    assert(zero["count"] == 0);
    assert(zero["label"] == "");
    assert(zero["items"] == document_t::array());
    assert(!zero.contains("flag"));
    assert(!zero.contains("ratio"));

    auto as_object = docmap::serializer::coerce(value(value::array_t{value(1), value(2)}),
                                                docmap::type_descriptor::scalar(docmap::scalar_kind::object));
    const auto& fields = as_object.get<value::map_t>();
    assert(fields.size() == 2);
    assert(fields.at("1").as_int() == 2);

    auto wrapped = docmap::serializer::coerce(value("x"),
                                              docmap::type_descriptor::scalar(docmap::scalar_kind::object));
    assert(wrapped.get<value::map_t>().at("scalar").as_string() == "x");

    // Class and identifier types are never coerced
    assert(docmap::serializer::coerce(value("abc"), docmap::type_descriptor::id()).as_string() == "abc");

    std::cout << " OK" << std::endl;
}

void test_int_coercion_saturates() {
    std::cout << "  test_int_coercion_saturates..." << std::flush;

    engine e;
    auto gauge = std::make_shared<docmap::object>("models::Gauge");
    gauge->set("count", 1e300);
    assert(e.serializer.to_document(*gauge)["count"] == std::numeric_limits<int64_t>::max());

    gauge->set("count", -std::numeric_limits<double>::infinity());
    assert(e.serializer.to_document(*gauge)["count"] == std::numeric_limits<int64_t>::min());

    gauge->set("count", std::numeric_limits<double>::quiet_NaN());
    assert(e.serializer.to_document(*gauge)["count"] == 0);

    gauge->set("count", -12.9);
    assert(e.serializer.to_document(*gauge)["count"] == -12);

    assert(value(9.3e18).as_int() == std::numeric_limits<int64_t>::max());
    assert(value("99999999999999999999").as_int() == 0);

    // Stored unsigned values past int64 come back as reals, not negative
    auto big = docmap::detail::value_from_document(document_t(std::numeric_limits<uint64_t>::max()));
    assert(big.is<double>());
    assert(big.as_int() == std::numeric_limits<int64_t>::max());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_embedded_objects
// ============================================================================

void test_embedded_objects() {
    std::cout << "  test_embedded_objects..." << std::flush;

    engine e;
    auto post = std::make_shared<models::Post>();
    post->set("title", "Hello");
    post->set("address", std::make_shared<models::Address>("Main St", "Springfield"));
    post->set("extra", std::make_shared<models::Address>("Elm St", "Shelbyville"));
    post->set("tags", value::array_t{value("a"), value(1)});

    auto doc = e.serializer.to_document(*post);

    // Declared class: no discriminator
    assert(doc["address"] == document_t({{"street", "Main St"}, {"city", "Springfield"}}));

    // Untyped field holding an object: discriminator attached
    assert(doc["extra"]["__type"]["class"] == "models::Address");
    assert(doc["extra"]["city"] == "Shelbyville");

    // Array elements follow the element type
    assert(doc["tags"] == document_t::array({"a", "1"}));
    assert(!doc.contains("author"));

    // Shared collection subclasses always carry their type
    auto admin = std::make_shared<models::Admin>();
    admin->set("login", "root");
    admin->set("level", "3");
    auto admin_doc = e.serializer.to_document(*admin);
    assert(admin_doc["__type"]["class"] == "models::Admin");
    assert(admin_doc["level"] == 3);
    assert(admin_doc["login"] == "root");

    auto account = std::make_shared<models::Account>();
    account->set("login", "guest");
    assert(!e.serializer.to_document(*account).contains("__type"));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_reference_projection
// ============================================================================

void test_reference_projection() {
    std::cout << "  test_reference_projection..." << std::flush;

    engine e;
    auto user = std::make_shared<models::User>();
    user->set("id", 5);
    user->set("email", "x@y");
    user->set("name", "Not cached");

    auto post = std::make_shared<models::Post>();
    post->set("title", "Linked");
    post->set("author", user);

    auto expected = document_t{
        {"$ref", "users"},
        {"$id", 5},
        {"__cache", {{"email", "x@y"}}},
    };
    assert(e.serializer.to_document(*post)["author"] == expected);

    // A resolved reference is re-projected from its target
    user->set("email", "new@y");
    post->set("author", docmap::reference::to(user, "users", 5));
    assert(e.serializer.to_document(*post)["author"]["__cache"]["email"] == "new@y");

    // An unresolved reference keeps its stored projection
    auto stored = docmap::reference::from_document({{"$ref", "users"}, {"$id", 9}});
    post->set("author", stored);
    assert(e.serializer.to_document(*post)["author"] == document_t({{"$ref", "users"}, {"$id", 9}}));

    assert(docmap::reference::is_reference_document(expected));
    assert(!docmap::reference::is_reference_document({{"$ref", "users"}}));
    assert(!docmap::reference::is_reference_document({{"$ref", ""}, {"$id", 1}}));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_validation_on_serialize
// ============================================================================

void test_validation_on_serialize() {
    std::cout << "  test_validation_on_serialize..." << std::flush;

    engine e;
    auto user = std::make_shared<models::User>();
    user->set("email", "nope");

    bool threw = false;
    try {
        e.serializer.to_document(*user);
    } catch (const docmap::validation_error& err) {
        threw = true;
        assert(err.kind() == docmap::validation_failure::predicate_failed);
        assert(err.field() == "email");
        assert(err.value() == "nope");
        assert(err.predicate() == "is_email");
    }
    assert(threw);

    // No validation for snapshots
    assert(e.serializer.to_document(*user, false)["email"] == "nope");
    assert(e.serializer.snapshot_document(*user)["email"] == "nope");

    user->set("email", "ok@example.com");
    user->set("age", 200);
    threw = false;
    try {
        e.serializer.to_document(*user);
    } catch (const docmap::validation_error& err) {
        threw = err.field() == "age" && err.predicate() == "between";
    }
    assert(threw);

    auto post = std::make_shared<models::Post>();
    threw = false;
    try {
        e.serializer.to_document(*post);
    } catch (const docmap::validation_error& err) {
        threw = err.kind() == docmap::validation_failure::missing_required && err.field() == "title";
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_cyclic_graph
// ============================================================================

void test_cyclic_graph() {
    std::cout << "  test_cyclic_graph..." << std::flush;

    engine e;
    auto person = std::make_shared<models::Person>();
    person->set("self", person);

    bool threw = false;
    try {
        e.serializer.to_document(*person);
    } catch (const docmap::configuration_error&) {
        threw = true;
    }
    assert(threw);
    person->unset("self");

    // The same object embedded twice is not a cycle
    auto home = std::make_shared<models::Address>("Main St", "Springfield");
    person->set("home", home);
    person->set("work", home);
    auto doc = e.serializer.to_document(*person);
    assert(doc["home"] == doc["work"]);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_hydrate_round_trip
// ============================================================================

void test_hydrate_round_trip() {
    std::cout << "  test_hydrate_round_trip..." << std::flush;

    engine e;
    models::event_log().clear();

    auto user = std::make_shared<models::User>();
    user->set("name", "Ana");
    user->set("email", "ana@example.com");
    user->set("age", 30);
    user->set_password("secret");
    auto doc = e.serializer.to_document(*user, true, true);

    auto loaded = e.hydrator.new_instance("models::User", doc);
    assert(loaded->type_name() == "models::User");
    auto typed = std::dynamic_pointer_cast<models::User>(loaded);
    assert(typed != nullptr);
    assert(typed->get("name").as_string() == "Ana");
    assert(typed->get("email").as_string() == "ana@example.com");
    assert(typed->get("age").as_int() == 30);
    assert(typed->password() == "secret");
    assert(typed->get("id").get<docmap::object_id>() == user->get("id").get<docmap::object_id>());

    // Top-level instances are snapshotted and announced
    assert(typed->is_persisted());
    assert(*typed->last_persisted_document() == e.serializer.snapshot_document(*typed));
    assert(models::logged("User.retrieved"));
    assert(!e.diff.is_dirty(*typed));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_hydrate_nested
// ============================================================================

void test_hydrate_nested() {
    std::cout << "  test_hydrate_nested..." << std::flush;

    engine e;
    document_t doc = {
        {"_id", 7},
        {"title", "Stored"},
        {"author", {{"$ref", "users"}, {"$id", 5}, {"__cache", {{"email", "x@y"}}}}},
        {"tags", {"a", "b"}},
        {"address", {{"street", "Main St"}, {"city", "Springfield"}}},
        {"extra", {{"__type", {{"class", "models::Address"}}}, {"city", "Shelbyville"}}},
        {"plain", {{"k", 1}}},
        {"when", {{"$date", 1500}}},
    };

    auto post = e.hydrator.new_instance("models::Post", doc);
    assert(post->get("id").as_int() == 7);

    // References stay lazy
    auto author = post->get("author").as_reference();
    assert(author != nullptr);
    assert(!author->is_resolved());
    assert(author->collection() == "users");
    assert(author->id() == 5);
    assert(author->cached("email") == "x@y");
    bool threw = false;
    try {
        author->get_object();
    } catch (const docmap::reference_resolution_error&) {
        threw = true;
    }
    assert(threw);

    auto address = post->get("address").as_object();
    assert(address != nullptr);
    assert(address->type_name() == "models::Address");
    assert(address->get("city").as_string() == "Springfield");
    assert(!address->is_persisted());

    auto extra = post->get("extra").as_object();
    assert(extra && extra->type_name() == "models::Address");

    const auto& tags = post->get("tags").get<value::array_t>();
    assert(tags.size() == 2 && tags[1].as_string() == "b");
    assert(post->get("plain").get<value::map_t>().at("k").as_int() == 1);
    assert(post->get("when").is<docmap::timestamp_t>());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_hydrate_subclass - concrete type from the discriminator
// ============================================================================

void test_hydrate_subclass() {
    std::cout << "  test_hydrate_subclass..." << std::flush;

    engine e;
    models::event_log().clear();

    document_t doc = {
        {"_id", 1},
        {"login", "root"},
        {"level", 2},
        {"__type", {{"class", "models::Admin"}}},
    };
    auto admin = e.hydrator.new_instance("models::Account", doc);
    assert(admin->type_name() == "models::Admin");
    assert(std::dynamic_pointer_cast<models::Admin>(admin) != nullptr);
    assert(admin->get("level").as_int() == 2);
    assert(!admin->has("__type"));

    // Admin overrides describe() without the hook
    assert(!models::logged("Account.retrieved"));

    e.hydrator.new_instance("models::Account", document_t{{"_id", 2}, {"login", "guest"}});
    assert(models::logged("Account.retrieved"));

    std::cout << " OK" << std::endl;
}

} // namespace serialization_tests
