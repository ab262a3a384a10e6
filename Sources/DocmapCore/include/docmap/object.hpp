#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "introspection.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>

namespace docmap {

class diff_engine;
class member_access;

// ============================================================================
// object - base of every mapped instance
//
// Public fields are plain runtime fields, addressable by name (declared or
// not). Private fields are only reachable by the type itself and by the
// mapping engine through member_access. Instances are owned by shared_ptr.
// ============================================================================

class object : public std::enable_shared_from_this<object> {
public:
    explicit object(std::string type_name) : type_name_(std::move(type_name)) {}
    virtual ~object() = default;

    object(const object&) = default;
    object& operator=(const object&) = default;

    /// Concrete runtime type
    const std::string& type_name() const { return type_name_; }

    // Public runtime fields
    bool has(const std::string& name) const { return fields_.count(name) != 0; }
    const value& get(const std::string& name) const;
    void set(const std::string& name, value v) { fields_[name] = std::move(v); }
    void unset(const std::string& name) { fields_.erase(name); }
    const std::map<std::string, value>& fields() const { return fields_; }

    /// Last document persisted or loaded; absent for never-persisted objects
    const std::optional<document_t>& last_persisted_document() const { return last_persisted_; }
    bool is_persisted() const { return last_persisted_.has_value(); }

protected:
    const value& get_private(const std::string& name) const;
    void set_private(const std::string& name, value v) { private_fields_[name] = std::move(v); }
    bool has_private(const std::string& name) const { return private_fields_.count(name) != 0; }

private:
    friend class diff_engine;
    friend class member_access;

    std::string type_name_;
    std::map<std::string, value> fields_;
    std::map<std::string, value> private_fields_;
    std::optional<document_t> last_persisted_;
};

/// Reads and writes members honoring their declared visibility
/// (public field assignment vs. private-field injection).
class member_access {
public:
    static const value& read(const object& obj, const std::string& name, visibility access);
    static void write(object& obj, const std::string& name, value v, visibility access);

    /// Shares ownership when the object is managed by a shared_ptr, otherwise
    /// returns a non-owning alias.
    static std::shared_ptr<object> share(object& obj);
};

} // namespace docmap

#endif // __cplusplus
