#include "docmap/validation.hpp"
#include "docmap/schema.hpp"
#include "docmap/errors.hpp"
#include "docmap/log.hpp"

#include <cctype>
#include <regex>

namespace docmap {

namespace {

bool is_integer_string(const std::string& s) {
    size_t i = 0;
    if (!s.empty() && (s[0] == '-' || s[0] == '+')) i = 1;
    if (i >= s.size()) return false;
    for (; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

bool is_numeric_string(const std::string& s) {
    static const std::regex numeric(R"(^\s*[-+]?(\d+\.?\d*|\.\d+)([eE][-+]?\d+)?\s*$)");
    return std::regex_match(s, numeric);
}

/// Numeric view of a value, for range predicates.
bool as_number(const document_t& v, double& out) {
    if (v.is_number()) {
        out = v.get<double>();
        return true;
    }
    if (v.is_string() && is_numeric_string(v.get_ref<const std::string&>())) {
        out = std::stod(v.get<std::string>());
        return true;
    }
    return false;
}

double number_arg(const document_t& args, size_t index, const char* predicate) {
    double out = 0;
    if (!args.is_array() || index >= args.size() || !as_number(args[index], out)) {
        throw configuration_error(std::string(predicate) + " needs a numeric argument #" +
                                  std::to_string(index + 1));
    }
    return out;
}

size_t length_of(const document_t& v) {
    if (v.is_string()) return v.get_ref<const std::string&>().size();
    if (v.is_array() || v.is_object()) return v.size();
    return 0;
}

} // namespace

validator_registry& validator_registry::instance() {
    static validator_registry registry;
    return registry;
}

validator_registry::validator_registry() {
    add_builtins();
}

void validator_registry::add_builtins() {
    add("is_email", [](const document_t& v, const document_t&) {
        static const std::regex email(R"(^[A-Za-z0-9._%+\-]+@[A-Za-z0-9\-]+(\.[A-Za-z0-9\-]+)*$)");
        return v.is_string() && std::regex_match(v.get_ref<const std::string&>(), email);
    });

    auto is_integer = [](const document_t& v, const document_t&) {
        return v.is_number_integer() ||
               (v.is_string() && is_integer_string(v.get_ref<const std::string&>()));
    };
    add("is_integer", is_integer);
    add("is_int", is_integer);

    add("is_numeric", [](const document_t& v, const document_t&) {
        double ignored;
        return as_number(v, ignored);
    });
    add("is_string", [](const document_t& v, const document_t&) { return v.is_string(); });
    add("is_bool", [](const document_t& v, const document_t&) { return v.is_boolean(); });
    add("is_array", [](const document_t& v, const document_t&) { return v.is_array(); });

    add("between", [](const document_t& v, const document_t& args) {
        double n;
        if (!as_number(v, n)) return false;
        return n >= number_arg(args, 0, "between") && n <= number_arg(args, 1, "between");
    });
    add("min", [](const document_t& v, const document_t& args) {
        double n;
        return as_number(v, n) && n >= number_arg(args, 0, "min");
    });
    add("max", [](const document_t& v, const document_t& args) {
        double n;
        return as_number(v, n) && n <= number_arg(args, 0, "max");
    });
    add("min_length", [](const document_t& v, const document_t& args) {
        return static_cast<double>(length_of(v)) >= number_arg(args, 0, "min_length");
    });
    add("max_length", [](const document_t& v, const document_t& args) {
        return static_cast<double>(length_of(v)) <= number_arg(args, 0, "max_length");
    });
    add("in", [](const document_t& v, const document_t& args) {
        if (!args.is_array()) return false;
        // in(["a", "b"]) and in("a", "b") are both accepted
        const document_t& choices = (args.size() == 1 && args[0].is_array()) ? args[0] : args;
        for (const auto& c : choices) {
            if (c == v) return true;
        }
        return false;
    });
    add("regex", [](const document_t& v, const document_t& args) {
        if (!args.is_array() || args.empty() || !args[0].is_string()) {
            throw configuration_error("regex needs a pattern argument");
        }
        if (!v.is_string()) return false;
        std::regex pattern(args[0].get<std::string>());
        return std::regex_search(v.get_ref<const std::string&>(), pattern);
    });
}

void validator_registry::add(const std::string& name, predicate_fn predicate) {
    std::lock_guard<std::mutex> lock(mutex_);
    predicates_[detail::to_lower(name)] = std::move(predicate);
}

bool validator_registry::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return predicates_.count(detail::to_lower(name)) != 0;
}

std::vector<std::string> validator_registry::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    for (const auto& [name, _] : predicates_) {
        out.push_back(name);
    }
    return out;
}

bool validator_registry::check(const std::string& name, const document_t& value,
                               const document_t& args) const {
    predicate_fn predicate;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = predicates_.find(detail::to_lower(name));
        if (it == predicates_.end()) {
            throw configuration_error("Unknown validation predicate " + name);
        }
        predicate = it->second;
    }
    return predicate(value, args.is_array() ? args : document_t::array());
}

void validate_property(const std::string& field, const document_t& value,
                       const property_def& prop, const validator_registry& validators) {
    bool empty = detail::is_empty(value);
    if (empty) {
        if (prop.required) {
            LOG_DEBUG("validation", "Required property %s is empty", field.c_str());
            throw validation_error(validation_failure::missing_required, field, value);
        }
        return;
    }

    for (const auto& rule : prop.validations) {
        if (!validators.check(rule.predicate, value, rule.args)) {
            LOG_DEBUG("validation", "%s rejected %s", rule.predicate.c_str(), field.c_str());
            throw validation_error(validation_failure::predicate_failed, field, value, rule.predicate);
        }
    }
}

} // namespace docmap
