#pragma once

#include "TestModels.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <thread>
#include <vector>

namespace schema_tests {

using docmap::document_t;

// ============================================================================
// test_collection_naming - explicit names verbatim, else lower-cased plural
// ============================================================================

void test_collection_naming() {
    std::cout << "  test_collection_naming..." << std::flush;

    docmap::metadata_cache cache;
    docmap::metadata_registry registry(models::catalog(), cache);

    assert(registry.of("models::Post")->collection_name() == "articles");
    assert(registry.of("models::User")->collection_name() == "users");
    assert(registry.of("models::Person")->collection_name() == "people");
    assert(registry.of("models::Address")->collection_name() == "addresses");

    // Subclasses of a single collection root share its storage
    auto admin = registry.of("models::Admin");
    assert(admin->collection_name() == "accounts");
    assert(!admin->has_own_collection());
    assert(registry.of("models::Account")->has_own_collection());
    assert(registry.of("models::Account")->single_collection_root());
    assert(admin->is_a("models::Account"));
    assert(!registry.of("models::Account")->is_a("models::Admin"));

    // Collections map back to their type
    assert(registry.collection_type("articles") == std::optional<std::string>("models::Post"));
    assert(registry.of_collection("people")->type_name() == "models::Person");
    assert(registry.of_collection("nothing") == nullptr);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_identifier_resolution
// ============================================================================

void test_identifier_resolution() {
    std::cout << "  test_identifier_resolution..." << std::flush;

    docmap::metadata_cache cache;
    docmap::metadata_registry registry(models::catalog(), cache);

    // No declared id: synthesized "id" stored as "_id"
    auto person = registry.of("models::Person");
    assert(person->id_property_key() == "id");
    assert(person->id_property().stored_name == "_id");
    assert(person->id_property().type.category == docmap::value_category::id);

    // Declared id
    auto user = registry.of("models::User");
    assert(user->id_property_key() == "id");
    assert(user->property_by_field("id")->stored_name == "_id");

    // Adopted from the ancestor, not synthesized again
    auto admin = registry.of("models::Admin");
    assert(admin->id_property_key() == "id");
    assert(admin->property_by_field("id") == nullptr);
    assert(admin->id_property().stored_name == "_id");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_property_extraction
// ============================================================================

void test_property_extraction() {
    std::cout << "  test_property_extraction..." << std::flush;

    docmap::metadata_cache cache;
    docmap::metadata_registry registry(models::catalog(), cache);

    auto user = registry.of("models::User");
    auto* age = user->property_by_field("age");
    assert(age != nullptr);
    assert(age->type.category == docmap::value_category::scalar);
    assert(age->type.kind == docmap::scalar_kind::integer);
    assert(age->validations.size() == 1);
    assert(age->validations[0].predicate == "between");
    assert(age->validations[0].args == document_t::array({0, 150}));

    auto* password = user->property_by_field("password");
    assert(password != nullptr);
    assert(!password->is_public());

    // Internal non-public members are never mapped
    assert(user->property_by_field("__token") == nullptr);

    auto post = registry.of("models::Post");
    assert(post->property_by_field("title")->required);
    auto* author = post->property_by_field("author");
    assert(author->is_reference());
    assert(author->reference->with_fields == std::set<std::string>{"email"});
    auto* tags = post->property_by_field("tags");
    assert(tags->type.is_array());
    assert(tags->type.element && tags->type.element->kind == docmap::scalar_kind::string);
    auto* address = post->property_by_field("address");
    assert(address->type.is_class());
    assert(address->type.class_name == "models::Address");

    // Lineage: own properties after the ancestor's
    auto admin = registry.of("models::Admin");
    auto all = admin->lineage_properties();
    std::vector<std::string> names;
    for (auto* p : all) names.push_back(p->field_name);
    assert((names == std::vector<std::string>{"id", "login", "level"}));
    assert(admin->find_property("login") != nullptr);
    assert(admin->find_property("_id")->field_name == "id");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_index_extraction
// ============================================================================

void test_index_extraction() {
    std::cout << "  test_index_extraction..." << std::flush;

    docmap::metadata_cache cache;
    docmap::metadata_registry registry(models::catalog(), cache);

    auto user = registry.of("models::User");
    assert(user->indexes().size() == 1);
    const auto& email = user->indexes()[0];
    assert(email.name == "unique_email_asc");
    assert(email.unique);
    assert(!email.sparse);
    assert(email.key.size() == 1);
    assert(email.key[0].field == "email");
    assert(email.key[0].direction == docmap::sort_direction::asc);

    auto post = registry.of("models::Post");
    assert(post->indexes().size() == 1);
    assert(post->indexes()[0].name == "index_views_desc");
    assert(post->indexes()[0].to_document()["key"] == document_t({{"views", -1}}));

    // Same key, same name
    auto a = docmap::make_index({{"email", docmap::sort_direction::asc}}, true);
    auto b = docmap::make_index({{"email", docmap::sort_direction::asc}}, true);
    assert(a.name == b.name);
    assert(docmap::make_index({{"email", docmap::sort_direction::asc}}, false).name == "index_email_asc");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_events_and_scopes_extraction
// ============================================================================

void test_events_and_scopes_extraction() {
    std::cout << "  test_events_and_scopes_extraction..." << std::flush;

    docmap::metadata_cache cache;
    docmap::metadata_registry registry(models::catalog(), cache);

    auto user = registry.of("models::User");
    assert(user->hooks(docmap::event_kind::saving).size() == 1);
    assert(user->hooks(docmap::event_kind::saving)[0].method == "touch");
    const auto& creating = user->hooks(docmap::event_kind::creating);
    assert(creating.size() == 1);
    assert(creating[0].args.size() == 1);
    assert(creating[0].args[0].as_string() == "created_by_hook");
    assert(user->hooks(docmap::event_kind::created).size() == 1);
    assert(user->hooks(docmap::event_kind::deleted).empty());

    auto* scope = user->find_scope("adults");
    assert(scope != nullptr);
    assert(scope->method == "scopeAdults");
    assert(scope->arity == 1);
    assert(user->find_scope("ADULTS") != nullptr);

    assert(docmap::event_from_alias("beforeSave") == docmap::event_kind::saving);
    assert(docmap::event_from_alias("after_delete") == docmap::event_kind::deleted);
    assert(!docmap::event_from_alias("touch").has_value());

    // Abstract types have no prototype and no scopes
    auto shape = registry.of("models::Shape");
    assert(shape->is_abstract());
    assert(shape->prototype() == nullptr);
    assert(registry.of("models::Person")->prototype() != nullptr);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_configuration_errors
// ============================================================================

void test_configuration_errors() {
    std::cout << "  test_configuration_errors..." << std::flush;

    docmap::type_catalog local;
    docmap::type_builder("cyc::A").extends("cyc::B")
        .factory([] { return std::make_shared<docmap::object>("cyc::A"); }).declare(local);
    docmap::type_builder("cyc::B").extends("cyc::A")
        .factory([] { return std::make_shared<docmap::object>("cyc::B"); }).declare(local);
    docmap::type_builder("cyc::Orphan").extends("cyc::Missing")
        .factory([] { return std::make_shared<docmap::object>("cyc::Orphan"); }).declare(local);
    docmap::type_builder("cyc::Twice")
        .property("a", {{"field", {"x"}}})
        .property("b", {{"field", {"x"}}})
        .factory([] { return std::make_shared<docmap::object>("cyc::Twice"); }).declare(local);

    docmap::metadata_cache cache;
    docmap::metadata_registry registry(local, cache);

    bool threw = false;
    try {
        registry.of("cyc::A");
    } catch (const docmap::configuration_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        registry.of("nope::Unknown");
    } catch (const docmap::type_not_found& e) {
        threw = e.type_name() == "nope::Unknown";
    }
    assert(threw);

    threw = false;
    try {
        registry.of("cyc::Orphan");
    } catch (const docmap::type_not_found& e) {
        threw = e.type_name() == "cyc::Missing";
    }
    assert(threw);

    threw = false;
    try {
        registry.of("cyc::Twice");
    } catch (const docmap::configuration_error&) {
        threw = true;
    }
    assert(threw);
    assert(!registry.is_loaded("cyc::Twice"));

    // Concrete types need a factory
    threw = false;
    try {
        docmap::type_builder("cyc::NoFactory").declare(local);
    } catch (const docmap::configuration_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_single_flight - concurrent first callers share one build
// ============================================================================

void test_single_flight() {
    std::cout << "  test_single_flight..." << std::flush;

    docmap::metadata_cache cache;
    docmap::metadata_registry registry(models::catalog(), cache);
    int calls_before = models::slow_factory_calls().load();

    std::vector<std::thread> threads;
    std::vector<docmap::schema_ptr> results(8);
    for (size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&, i] { results[i] = registry.of("models::Slow"); });
    }
    for (auto& t : threads) t.join();

    for (const auto& r : results) {
        assert(r != nullptr);
        assert(r == results[0]);
    }
    assert(registry.build_count() == 1);
    assert(models::slow_factory_calls().load() == calls_before + 1);

    // Cached from now on
    assert(registry.of("models::Slow") == results[0]);
    assert(registry.build_count() == 1);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_registry_invalidation
// ============================================================================

void test_registry_invalidation() {
    std::cout << "  test_registry_invalidation..." << std::flush;

    docmap::metadata_cache cache;
    docmap::metadata_registry registry(models::catalog(), cache);

    auto first = registry.of("models::User");
    assert(registry.is_loaded("models::User"));
    assert(cache.contains(docmap::metadata_registry::cache_key("models::User")));
    assert(first->watched_sources().count(models::models_source()) == 1);

    // Source change signal drops the definition
    cache.notify_changed(models::models_source());
    assert(!registry.is_loaded("models::User"));
    auto second = registry.of("models::User");
    assert(second != first);
    assert(registry.build_count() == 2);

    registry.invalidate("models::User");
    assert(!registry.is_loaded("models::User"));
    assert(!cache.contains(docmap::metadata_registry::cache_key("models::User")));
    registry.of("models::User");
    assert(registry.build_count() == 3);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_metadata_cache
// ============================================================================

void test_metadata_cache() {
    std::cout << "  test_metadata_cache..." << std::flush;

    auto path = std::filesystem::temp_directory_path() / "docmap_cache_source.txt";
    {
        std::ofstream out(path);
        out << "v1";
    }

    docmap::metadata_cache cache;
    std::vector<std::string> invalidated;
    auto listener = cache.on_invalidate([&](const std::string& key) { invalidated.push_back(key); });

    int produced = 0;
    auto producer = [&](docmap::watch_list& sources) {
        ++produced;
        sources.insert(path.string());
        return std::make_shared<int>(42);
    };

    auto a = cache.cached<int>("answer", producer);
    auto b = cache.cached<int>("answer", producer);
    assert(*a == 42);
    assert(a == b);
    assert(produced == 1);

    // Unchanged sources keep the entry
    assert(cache.check_sources() == 0);
    assert(cache.contains("answer"));

    // Touch the source
    auto stamp = std::filesystem::last_write_time(path);
    std::filesystem::last_write_time(path, stamp + std::chrono::seconds(5));
    assert(cache.check_sources() == 1);
    assert(!cache.contains("answer"));
    assert(invalidated.size() == 1 && invalidated[0] == "answer");

    cache.cached<int>("answer", producer);
    assert(produced == 2);

    cache.remove_listener(listener);
    cache.clear();
    assert(!cache.contains("answer"));
    assert(invalidated.size() == 1);

    std::filesystem::remove(path);
    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_pluralize
// ============================================================================

void test_pluralize() {
    std::cout << "  test_pluralize..." << std::flush;

    using docmap::inflector::pluralize;
    assert(pluralize("User") == "Users");
    assert(pluralize("person") == "people");
    assert(pluralize("Person") == "People");
    assert(pluralize("Salesperson") == "Salespeople");
    assert(pluralize("child") == "children");
    assert(pluralize("Address") == "Addresses");
    assert(pluralize("box") == "boxes");
    assert(pluralize("category") == "categories");
    assert(pluralize("day") == "days");
    assert(pluralize("knife") == "knives");
    assert(pluralize("status") == "statuses");
    assert(pluralize("sheep") == "sheep");
    assert(pluralize("news") == "news");
    assert(pluralize("analysis") == "analyses");
    assert(pluralize("") == "");

    std::cout << " OK" << std::endl;
}

} // namespace schema_tests
