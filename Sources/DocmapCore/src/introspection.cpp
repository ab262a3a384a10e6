#include "docmap/introspection.hpp"
#include "docmap/object.hpp"
#include "docmap/errors.hpp"
#include "docmap/log.hpp"

#include <algorithm>
#include <cctype>

namespace docmap {

namespace detail {

std::string to_lower(std::string_view s) {
    std::string out(s);
    for (char& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace detail

// ============================================================================
// annotation
// ============================================================================

annotation_arg::annotation_arg(annotation nested_annotation)
    : nested(std::make_shared<const annotation>(std::move(nested_annotation))) {}

annotation::annotation(std::string n,
                       std::vector<annotation_arg> positional,
                       std::map<std::string, document_t> keyword)
    : name(detail::to_lower(n)), args(std::move(positional)), kwargs(std::move(keyword)) {}

document_t annotation::arg(size_t index) const {
    if (index >= args.size() || args[index].is_annotation()) {
        return nullptr;
    }
    return args[index].literal;
}

bool annotation::has_flag(std::string_view flag) const {
    for (const auto& a : args) {
        if (a.is_annotation()) {
            if (detail::iequals(a.nested->name, flag)) return true;
        } else if (a.literal.is_string() &&
                   detail::iequals(a.literal.get_ref<const std::string&>(), flag)) {
            return true;
        }
    }
    return false;
}

std::optional<document_t> annotation::kwarg(const std::string& key) const {
    auto it = kwargs.find(key);
    if (it == kwargs.end()) return std::nullopt;
    return it->second;
}

document_t annotation::args_document() const {
    document_t out = document_t::array();
    for (const auto& a : args) {
        if (a.is_annotation()) {
            out.push_back(document_t{{a.nested->name, a.nested->args_document()}});
        } else {
            out.push_back(a.literal);
        }
    }
    return out;
}

bool annotation_set::has(std::string_view name) const {
    return get_one(name) != nullptr;
}

bool annotation_set::has_any(std::initializer_list<std::string_view> names) const {
    return get_one(names) != nullptr;
}

const annotation* annotation_set::get_one(std::string_view name) const {
    for (const auto& a : items_) {
        if (detail::iequals(a.name, name)) return &a;
    }
    return nullptr;
}

const annotation* annotation_set::get_one(std::initializer_list<std::string_view> names) const {
    // First annotation (in declaration order) matching any of the names
    for (const auto& a : items_) {
        for (auto n : names) {
            if (detail::iequals(a.name, n)) return &a;
        }
    }
    return nullptr;
}

std::vector<const annotation*> annotation_set::get(std::string_view name) const {
    std::vector<const annotation*> out;
    for (const auto& a : items_) {
        if (detail::iequals(a.name, name)) out.push_back(&a);
    }
    return out;
}

// ============================================================================
// type_decl
// ============================================================================

const method_decl* type_decl::find_method(std::string_view method_name) const {
    for (const auto& m : methods) {
        if (detail::iequals(m.name, method_name)) return &m;
    }
    return nullptr;
}

std::string type_decl::simple_name() const {
    auto pos = name.rfind("::");
    if (pos != std::string::npos) return name.substr(pos + 2);
    pos = name.find_last_of("\\.");
    if (pos != std::string::npos) return name.substr(pos + 1);
    return name;
}

// ============================================================================
// type_introspector
// ============================================================================

const method_decl* type_introspector::find_method(const std::string& type_name,
                                                  std::string_view method_name) const {
    std::string current = type_name;
    size_t depth = 0;
    while (!current.empty()) {
        const type_decl* decl = find(current);
        if (!decl) return nullptr;
        if (auto* m = decl->find_method(method_name)) return m;
        current = decl->parent;
        if (++depth > 256) {
            throw configuration_error("Inheritance chain of " + type_name + " is cyclic");
        }
    }
    return nullptr;
}

std::shared_ptr<object> type_introspector::instantiate(const std::string& type_name) const {
    const type_decl* decl = find(type_name);
    if (!decl) {
        throw type_not_found(type_name);
    }
    if (decl->is_abstract || !decl->factory) {
        throw configuration_error("Cannot instantiate abstract type " + type_name);
    }
    auto obj = decl->factory();
    if (!obj) {
        throw configuration_error("Factory of " + type_name + " returned no instance");
    }
    return obj;
}

// ============================================================================
// type_catalog
// ============================================================================

type_catalog& type_catalog::instance() {
    static type_catalog catalog;
    return catalog;
}

void type_catalog::declare(type_decl decl) {
    if (decl.name.empty()) {
        throw configuration_error("Cannot declare a type without a name");
    }
    if (!decl.is_abstract && !decl.factory) {
        throw configuration_error("Concrete type " + decl.name + " has no factory");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = types_.find(decl.name);
    if (it != types_.end()) {
        // Replace in place so previously handed out pointers see the new declaration
        LOG_DEBUG("catalog", "Redeclaring type %s", decl.name.c_str());
        *it->second = std::move(decl);
        return;
    }
    auto name = decl.name;
    types_.emplace(std::move(name), std::make_unique<type_decl>(std::move(decl)));
}

const type_decl* type_catalog::find(const std::string& type_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = types_.find(type_name);
    return it != types_.end() ? it->second.get() : nullptr;
}

bool type_catalog::contains(const std::string& type_name) const {
    return find(type_name) != nullptr;
}

std::vector<std::string> type_catalog::type_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(types_.size());
    for (const auto& [name, _] : types_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

// ============================================================================
// type_builder
// ============================================================================

type_builder::type_builder(std::string name) {
    decl_.name = std::move(name);
}

type_builder& type_builder::extends(std::string parent) {
    decl_.parent = std::move(parent);
    return *this;
}

type_builder& type_builder::source(std::string path) {
    decl_.source = std::move(path);
    return *this;
}

type_builder& type_builder::abstract(bool is_abstract) {
    decl_.is_abstract = is_abstract;
    return *this;
}

type_builder& type_builder::annotate(annotation a) {
    decl_.annotations.add(std::move(a));
    return *this;
}

type_builder& type_builder::property(std::string name, annotation_set annotations,
                                     visibility access) {
    decl_.properties.push_back(property_decl{std::move(name), access, std::move(annotations)});
    return *this;
}

type_builder& type_builder::method(std::string name, size_t parameter_count,
                                   annotation_set annotations, method_invoker invoke,
                                   visibility access) {
    method_decl m;
    m.name = std::move(name);
    m.access = access;
    m.parameter_count = parameter_count;
    m.annotations = std::move(annotations);
    m.invoke = std::move(invoke);
    decl_.methods.push_back(std::move(m));
    return *this;
}

type_builder& type_builder::factory(object_factory f) {
    decl_.factory = std::move(f);
    return *this;
}

void type_builder::declare(type_catalog& catalog) {
    catalog.declare(decl_);
}

} // namespace docmap
