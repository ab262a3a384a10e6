#pragma once

#ifdef __cplusplus

#include "types.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace docmap {

struct property_def;

/// A named check over a serialized value. `args` is a JSON array.
using predicate_fn = std::function<bool(const document_t& value, const document_t& args)>;

// ============================================================================
// validator_registry - named validation predicates
// ============================================================================

class validator_registry {
public:
    /// Process-wide registry, pre-populated with the built-in predicates.
    static validator_registry& instance();

    validator_registry();

    /// Registers or replaces a predicate. Names are case-insensitive.
    void add(const std::string& name, predicate_fn predicate);
    bool contains(const std::string& name) const;
    std::vector<std::string> names() const;

    /// Throws configuration_error for unknown predicates.
    bool check(const std::string& name, const document_t& value, const document_t& args) const;

private:
    void add_builtins();

    mutable std::mutex mutex_;
    std::map<std::string, predicate_fn> predicates_;
};

/// Throws validation_error if `value` violates `prop`:
///   - required and empty -> missing_required
///   - any predicate returning false (non-empty values only) -> predicate_failed
void validate_property(const std::string& field, const document_t& value,
                       const property_def& prop, const validator_registry& validators);

} // namespace docmap

#endif // __cplusplus
