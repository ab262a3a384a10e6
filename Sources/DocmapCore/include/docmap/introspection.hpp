#pragma once

#ifdef __cplusplus

#include "types.hpp"

#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace docmap {

// ============================================================================
// Declarative annotations
//
//   property "email":  unique, validate(is_email)
//   property "age":    validate(is_integer, between(0, 99))
//   property "owner":  reference(with=["email"])
// ============================================================================

struct annotation;

/// A positional annotation argument: a JSON literal or a nested annotation.
struct annotation_arg {
    document_t literal;
    std::shared_ptr<const annotation> nested;

    annotation_arg(const char* lit) : literal(lit) {}

    template<typename T, std::enable_if_t<std::conjunction_v<
                 std::negation<std::is_same<std::decay_t<T>, annotation>>,
                 std::negation<std::is_same<std::decay_t<T>, annotation_arg>>,
                 std::is_constructible<document_t, T>>,
             int> = 0>
    annotation_arg(T&& lit) : literal(std::forward<T>(lit)) {}

    annotation_arg(annotation nested_annotation);

    bool is_annotation() const { return nested != nullptr; }
};

struct annotation {
    std::string name;                          // lower-cased on construction
    std::vector<annotation_arg> args;
    std::map<std::string, document_t> kwargs;

    annotation() = default;
    annotation(std::string n,
               std::vector<annotation_arg> positional = {},
               std::map<std::string, document_t> keyword = {});

    bool has_arg(size_t index) const { return index < args.size(); }
    /// Positional literal, or null when absent or nested.
    document_t arg(size_t index = 0) const;
    /// Positional literals and nested annotation names, flattened.
    bool has_flag(std::string_view flag) const;
    std::optional<document_t> kwarg(const std::string& key) const;

    /// Arguments as passed to hooks and validators: literals as-is, nested
    /// annotations as {"name": [args...]}.
    document_t args_document() const;
};

/// Ordered annotation list with case-insensitive name lookup.
class annotation_set {
public:
    annotation_set() = default;
    annotation_set(std::initializer_list<annotation> items) : items_(items) {}
    explicit annotation_set(std::vector<annotation> items) : items_(std::move(items)) {}

    bool has(std::string_view name) const;
    bool has_any(std::initializer_list<std::string_view> names) const;
    const annotation* get_one(std::string_view name) const;
    const annotation* get_one(std::initializer_list<std::string_view> names) const;
    std::vector<const annotation*> get(std::string_view name) const;

    void add(annotation a) { items_.push_back(std::move(a)); }
    const std::vector<annotation>& items() const { return items_; }
    bool empty() const { return items_.empty(); }

    auto begin() const { return items_.begin(); }
    auto end() const { return items_.end(); }

private:
    std::vector<annotation> items_;
};

// ============================================================================
// Type declarations (what the introspector knows about a type)
// ============================================================================

enum class visibility {
    public_member,
    protected_member,
    private_member
};

struct property_decl {
    std::string name;
    visibility access = visibility::public_member;
    annotation_set annotations;
};

/// Invokes a declared method on a receiver.
using method_invoker = std::function<value(object& self, const std::vector<value>& args)>;

struct method_decl {
    std::string name;
    visibility access = visibility::public_member;
    size_t parameter_count = 0;
    annotation_set annotations;
    method_invoker invoke;
};

/// Builds a blank instance without running user initialization.
using object_factory = std::function<std::shared_ptr<object>()>;

struct type_decl {
    std::string name;       // fully qualified, e.g. "app::User"
    std::string parent;     // empty for root types
    std::string source;     // artifact that declares the type (watched for invalidation)
    bool is_abstract = false;
    annotation_set annotations;
    std::vector<property_decl> properties;   // own declared properties only
    std::vector<method_decl> methods;        // own declared methods only
    object_factory factory;

    const method_decl* find_method(std::string_view method_name) const;
    std::string simple_name() const;
};

// ============================================================================
// type_introspector - read-only reflection capability
// ============================================================================

class type_introspector {
public:
    virtual ~type_introspector() = default;

    /// nullptr if the type is unknown
    virtual const type_decl* find(const std::string& type_name) const = 0;

    /// Every declared type name. Introspectors that cannot enumerate return none.
    virtual std::vector<std::string> type_names() const { return {}; }

    /// Walks `type_name` and its ancestors looking for a method.
    const method_decl* find_method(const std::string& type_name, std::string_view method_name) const;

    /// Constructs a blank instance through the declared factory.
    std::shared_ptr<object> instantiate(const std::string& type_name) const;
};

// ============================================================================
// type_catalog - process-wide declared types
// ============================================================================

class type_catalog : public type_introspector {
public:
    static type_catalog& instance();

    type_catalog() = default;

    /// Registers (or replaces) a declaration. Concrete types need a factory.
    void declare(type_decl decl);
    const type_decl* find(const std::string& type_name) const override;
    bool contains(const std::string& type_name) const;
    std::vector<std::string> type_names() const override;

private:
    mutable std::mutex mutex_;
    // Declarations are never erased, pointers handed out stay valid
    std::unordered_map<std::string, std::unique_ptr<type_decl>> types_;
};

/// Fluent declaration helper:
///
///   type_builder("app::User")
///       .source(__FILE__)
///       .annotate({"collection", {"people"}})
///       .property("email", {{"unique"}, {"validate", {"is_email"}}})
///       .method("touch", 0, {{"before_save"}}, [](object& self, auto&) { ...; return value(); })
///       .factory<User>()
///       .declare();
class type_builder {
public:
    explicit type_builder(std::string name);

    type_builder& extends(std::string parent);
    type_builder& source(std::string path);
    type_builder& abstract(bool is_abstract = true);
    type_builder& annotate(annotation a);
    type_builder& property(std::string name, annotation_set annotations = {},
                           visibility access = visibility::public_member);
    type_builder& method(std::string name, size_t parameter_count, annotation_set annotations,
                         method_invoker invoke, visibility access = visibility::public_member);
    type_builder& factory(object_factory f);

    template<typename T>
    type_builder& factory() {
        decl_.factory = [] { return std::static_pointer_cast<object>(std::make_shared<T>()); };
        return *this;
    }

    const type_decl& peek() const { return decl_; }
    void declare(type_catalog& catalog = type_catalog::instance());

private:
    type_decl decl_;
};

namespace detail {
    std::string to_lower(std::string_view s);
    bool iequals(std::string_view a, std::string_view b);
}

} // namespace docmap

#endif // __cplusplus
