#pragma once

#ifdef __cplusplus

#include <nlohmann/json.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace docmap {

class object;
class reference;

/// Stored documents and store-native values.
using document_t = nlohmann::json;

/// Timestamp type (stored as {"$date": milliseconds since Unix epoch})
using timestamp_t = std::chrono::system_clock::time_point;

// ============================================================================
// object_id - 12-byte document identifier (stored as {"$oid": "<24 hex>"})
// ============================================================================

struct object_id {
    std::array<uint8_t, 12> bytes{};

    object_id() = default;

    explicit object_id(const std::array<uint8_t, 12>& b) : bytes(b) {}

    // Lowercase hex, 24 characters
    std::string to_string() const;

    // Parse from 24 hex characters. Anything else yields a nil id.
    static object_id from_string(const std::string& s);

    // 4-byte seconds, 5-byte per-process random, 3-byte counter
    static object_id generate();

    // Seconds since epoch encoded in the first four bytes
    timestamp_t generation_time() const;

    bool operator==(const object_id& other) const { return bytes == other.bytes; }
    bool operator!=(const object_id& other) const { return bytes != other.bytes; }
    bool operator<(const object_id& other) const { return bytes < other.bytes; }

    bool is_nil() const {
        for (auto b : bytes) if (b != 0) return false;
        return true;
    }
};

/// A live runtime resource (file handle, socket, ...). Never serialized.
struct resource_handle {
    std::shared_ptr<void> handle;
    std::string kind;

    bool operator==(const resource_handle& other) const { return handle == other.handle; }
};

// ============================================================================
// value - an in-memory property value
// ============================================================================

class value {
public:
    using array_t = std::vector<value>;
    using map_t = std::map<std::string, value>;
    using object_ptr = std::shared_ptr<object>;
    using reference_ptr = std::shared_ptr<reference>;

    using storage_t = std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        timestamp_t,
        object_id,
        array_t,
        map_t,
        object_ptr,
        reference_ptr,
        resource_handle,
        document_t      // already store-native, kept unchanged
    >;

    value() : data_(nullptr) {}
    value(std::nullptr_t) : data_(nullptr) {}
    value(bool v) : data_(v) {}

    template<typename T,
             std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
    value(T v) : data_(static_cast<int64_t>(v)) {}

    template<typename T, std::enable_if_t<std::is_floating_point_v<T>, int> = 0>
    value(T v) : data_(static_cast<double>(v)) {}

    value(const char* v) : data_(std::string(v)) {}
    value(std::string v) : data_(std::move(v)) {}
    value(timestamp_t v) : data_(v) {}
    value(object_id v) : data_(v) {}
    value(array_t v) : data_(std::move(v)) {}
    value(map_t v) : data_(std::move(v)) {}
    value(reference_ptr v) : data_(std::move(v)) {}
    value(resource_handle v) : data_(std::move(v)) {}

    // Short-circuits so that is_base_of never sees an incomplete `reference`
    template<typename T, std::enable_if_t<std::disjunction_v<
                 std::is_same<T, object>,
                 std::conjunction<std::negation<std::is_same<T, reference>>, std::is_base_of<object, T>>>,
             int> = 0>
    value(std::shared_ptr<T> v) : data_(object_ptr(std::move(v))) {}

    /// Wraps a value that already has a store-native representation.
    static value native(document_t doc) {
        value v;
        v.data_ = std::move(doc);
        return v;
    }

    template<typename T> bool is() const { return std::holds_alternative<T>(data_); }
    template<typename T> const T& get() const { return std::get<T>(data_); }
    template<typename T> T& get() { return std::get<T>(data_); }
    template<typename T> const T* get_if() const { return std::get_if<T>(&data_); }
    template<typename T> T* get_if() { return std::get_if<T>(&data_); }

    bool is_null() const { return is<std::nullptr_t>(); }
    bool is_scalar() const {
        return is<bool>() || is<int64_t>() || is<double>() || is<std::string>();
    }

    // Lenient accessors, used by typed model wrappers
    std::string as_string() const;
    int64_t as_int() const;
    double as_double() const;
    bool as_bool() const;
    object_ptr as_object() const;
    reference_ptr as_reference() const;

    const storage_t& storage() const { return data_; }

    friend bool operator==(const value& a, const value& b) { return a.data_ == b.data_; }
    friend bool operator!=(const value& a, const value& b) { return !(a == b); }

private:
    storage_t data_;
};

namespace detail {
    document_t timestamp_to_document(timestamp_t t);
    document_t object_id_to_document(const object_id& id);

    /// {"$oid": ...} and {"$date": ...} markers
    bool is_native_marker(const document_t& doc);

    /// Decodes a store-native marker or a plain JSON literal into a value.
    /// Arrays and objects decode recursively into array_t/map_t.
    value value_from_document(const document_t& doc);

    /// Encodes scalars and store-native values. Objects, references and
    /// resources are not representable here and encode as null.
    document_t scalar_to_document(const value& v);

    /// Empty in the sense of a required-field check:
    /// null, false, 0, 0.0, "" and empty arrays/objects.
    bool is_empty(const document_t& doc);
} // namespace detail

} // namespace docmap

#endif // __cplusplus
