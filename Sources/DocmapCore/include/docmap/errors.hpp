#pragma once

#ifdef __cplusplus

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace docmap {

/// Base of every exception raised by the mapping engine.
class error : public std::runtime_error {
public:
    explicit error(const std::string& msg) : std::runtime_error(msg) {}
};

/// Fatal misconfiguration: unknown type, hook on a non-invocable method,
/// unknown observer type, cyclic object graph. Never retried.
class configuration_error : public error {
public:
    explicit configuration_error(const std::string& msg) : error(msg) {}
};

class type_not_found : public configuration_error {
public:
    explicit type_not_found(const std::string& type_name)
        : configuration_error("Cannot find the type " + type_name), type_name_(type_name) {}

    const std::string& type_name() const { return type_name_; }

private:
    std::string type_name_;
};

enum class validation_failure {
    missing_required,
    predicate_failed
};

/// Raised before anything reaches the transport.
class validation_error : public error {
public:
    validation_error(validation_failure kind, std::string field, nlohmann::json value,
                     std::string predicate = {})
        : error(describe(kind, field, value)),
          kind_(kind), field_(std::move(field)), value_(std::move(value)),
          predicate_(std::move(predicate)) {}

    validation_failure kind() const { return kind_; }
    const std::string& field() const { return field_; }
    const nlohmann::json& value() const { return value_; }
    const std::string& predicate() const { return predicate_; }

private:
    static std::string describe(validation_failure kind, const std::string& field,
                                const nlohmann::json& value) {
        if (kind == validation_failure::missing_required) {
            return "Unexpected empty value for property " + field;
        }
        return "Invalid value for " + field + " (" + value.dump() + ")";
    }

    validation_failure kind_;
    std::string field_;
    nlohmann::json value_;
    std::string predicate_;
};

/// The referenced document no longer exists. Raised on first dereference.
class reference_resolution_error : public error {
public:
    reference_resolution_error(const std::string& collection, const nlohmann::json& id)
        : error("Cannot find object " + id.dump() + " in collection " + collection) {}
};

class not_found_error : public error {
public:
    explicit not_found_error(const std::string& msg) : error(msg) {}
};

/// Storage failure reported by the SQLite transport. `code` is the SQLite
/// extended result code, 0 for failures detected before reaching SQLite.
class db_error : public error {
public:
    explicit db_error(const std::string& msg, int code = 0) : error(msg), code_(code) {}

    int code() const { return code_; }

    /// A unique index rejected the write (SQLITE_CONSTRAINT_UNIQUE / _PRIMARYKEY).
    bool is_duplicate_key() const { return code_ == 2067 || code_ == 1555; }

private:
    int code_;
};

} // namespace docmap

#endif // __cplusplus
