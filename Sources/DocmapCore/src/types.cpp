#include "docmap/types.hpp"
#include "docmap/object.hpp"
#include "docmap/reference.hpp"

#include <atomic>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <limits>
#include <random>
#include <sstream>

namespace docmap {

// ============================================================================
// object_id
// ============================================================================

std::string object_id::to_string() const {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (auto b : bytes) {
        ss << std::setw(2) << static_cast<int>(b);
    }
    return ss.str();
}

object_id object_id::from_string(const std::string& s) {
    object_id result;
    if (s.size() != 24) return result;  // Invalid, return nil
    for (char c : s) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return result;
    }
    for (size_t i = 0; i < 12; ++i) {
        result.bytes[i] = static_cast<uint8_t>(std::stoi(s.substr(i * 2, 2), nullptr, 16));
    }
    return result;
}

object_id object_id::generate() {
    // Per-process random part and counter seed
    static const std::array<uint8_t, 5> process_unique = [] {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        std::uniform_int_distribution<uint64_t> dis;
        uint64_t r = dis(gen);
        std::array<uint8_t, 5> out{};
        for (int i = 0; i < 5; ++i) {
            out[i] = static_cast<uint8_t>((r >> (i * 8)) & 0xFF);
        }
        return out;
    }();
    static std::atomic<uint32_t> counter{static_cast<uint32_t>(std::random_device{}())};

    auto seconds = static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
    uint32_t count = counter.fetch_add(1, std::memory_order_relaxed) & 0xFFFFFF;

    object_id result;
    result.bytes[0] = static_cast<uint8_t>((seconds >> 24) & 0xFF);
    result.bytes[1] = static_cast<uint8_t>((seconds >> 16) & 0xFF);
    result.bytes[2] = static_cast<uint8_t>((seconds >> 8) & 0xFF);
    result.bytes[3] = static_cast<uint8_t>(seconds & 0xFF);
    for (int i = 0; i < 5; ++i) {
        result.bytes[4 + i] = process_unique[i];
    }
    result.bytes[9] = static_cast<uint8_t>((count >> 16) & 0xFF);
    result.bytes[10] = static_cast<uint8_t>((count >> 8) & 0xFF);
    result.bytes[11] = static_cast<uint8_t>(count & 0xFF);
    return result;
}

timestamp_t object_id::generation_time() const {
    uint32_t seconds = (static_cast<uint32_t>(bytes[0]) << 24) |
                       (static_cast<uint32_t>(bytes[1]) << 16) |
                       (static_cast<uint32_t>(bytes[2]) << 8) |
                       static_cast<uint32_t>(bytes[3]);
    return timestamp_t(std::chrono::seconds(seconds));
}

// ============================================================================
// value accessors
// ============================================================================

std::string value::as_string() const {
    if (auto* s = get_if<std::string>()) return *s;
    if (auto* i = get_if<int64_t>()) return std::to_string(*i);
    if (auto* d = get_if<double>()) {
        std::ostringstream ss;
        ss << *d;
        return ss.str();
    }
    if (auto* b = get_if<bool>()) return *b ? "1" : "";
    if (auto* id = get_if<object_id>()) return id->to_string();
    return "";
}

int64_t value::as_int() const {
    if (auto* i = get_if<int64_t>()) return *i;
    if (auto* d = get_if<double>()) {
        // Saturate; the cast alone is undefined outside the int64 range
        if (std::isnan(*d)) return 0;
        if (*d >= 9223372036854775808.0) return std::numeric_limits<int64_t>::max();
        if (*d < -9223372036854775808.0) return std::numeric_limits<int64_t>::min();
        return static_cast<int64_t>(*d);
    }
    if (auto* b = get_if<bool>()) return *b ? 1 : 0;
    if (auto* s = get_if<std::string>()) {
        try {
            return std::stoll(*s);
        } catch (const std::exception&) {
            return 0;
        }
    }
    return 0;
}

double value::as_double() const {
    if (auto* d = get_if<double>()) return *d;
    if (auto* i = get_if<int64_t>()) return static_cast<double>(*i);
    if (auto* b = get_if<bool>()) return *b ? 1.0 : 0.0;
    if (auto* s = get_if<std::string>()) {
        try {
            return std::stod(*s);
        } catch (const std::exception&) {
            return 0.0;
        }
    }
    return 0.0;
}

bool value::as_bool() const {
    if (auto* b = get_if<bool>()) return *b;
    if (auto* i = get_if<int64_t>()) return *i != 0;
    if (auto* d = get_if<double>()) return *d != 0.0;
    if (auto* s = get_if<std::string>()) return !s->empty() && *s != "0";
    if (auto* a = get_if<array_t>()) return !a->empty();
    if (auto* m = get_if<map_t>()) return !m->empty();
    return !is_null();
}

value::object_ptr value::as_object() const {
    if (auto* o = get_if<object_ptr>()) return *o;
    return nullptr;
}

value::reference_ptr value::as_reference() const {
    if (auto* r = get_if<reference_ptr>()) return *r;
    return nullptr;
}

// ============================================================================
// Store-native encoding
// ============================================================================

namespace detail {

document_t timestamp_to_document(timestamp_t t) {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
    return document_t{{"$date", static_cast<int64_t>(millis)}};
}

document_t object_id_to_document(const object_id& id) {
    return document_t{{"$oid", id.to_string()}};
}

bool is_native_marker(const document_t& doc) {
    if (!doc.is_object() || doc.size() != 1) return false;
    auto oid = doc.find("$oid");
    if (oid != doc.end()) return oid->is_string();
    auto date = doc.find("$date");
    if (date != doc.end()) return date->is_number();
    return false;
}

value value_from_document(const document_t& doc) {
    switch (doc.type()) {
        case document_t::value_t::null:
        case document_t::value_t::discarded:
            return value();
        case document_t::value_t::boolean:
            return value(doc.get<bool>());
        case document_t::value_t::number_integer:
            return value(doc.get<int64_t>());
        case document_t::value_t::number_unsigned: {
            auto u = doc.get<uint64_t>();
            if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return value(static_cast<double>(u));
            }
            return value(static_cast<int64_t>(u));
        }
        case document_t::value_t::number_float:
            return value(doc.get<double>());
        case document_t::value_t::string:
            return value(doc.get<std::string>());
        case document_t::value_t::binary:
            return value::native(doc);
        case document_t::value_t::array: {
            value::array_t items;
            items.reserve(doc.size());
            for (const auto& item : doc) {
                items.push_back(value_from_document(item));
            }
            return value(std::move(items));
        }
        case document_t::value_t::object: {
            if (is_native_marker(doc)) {
                if (doc.contains("$oid")) {
                    return value(object_id::from_string(doc["$oid"].get<std::string>()));
                }
                auto millis = doc["$date"].get<int64_t>();
                return value(timestamp_t(std::chrono::milliseconds(millis)));
            }
            value::map_t fields;
            for (auto it = doc.begin(); it != doc.end(); ++it) {
                fields.emplace(it.key(), value_from_document(it.value()));
            }
            return value(std::move(fields));
        }
    }
    return value();
}

document_t scalar_to_document(const value& v) {
    return std::visit([](auto&& x) -> document_t {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return nullptr;
        } else if constexpr (std::is_same_v<T, bool> || std::is_same_v<T, int64_t> ||
                             std::is_same_v<T, double> || std::is_same_v<T, std::string>) {
            return x;
        } else if constexpr (std::is_same_v<T, timestamp_t>) {
            return timestamp_to_document(x);
        } else if constexpr (std::is_same_v<T, object_id>) {
            return object_id_to_document(x);
        } else if constexpr (std::is_same_v<T, document_t>) {
            return x;
        } else if constexpr (std::is_same_v<T, value::array_t>) {
            document_t out = document_t::array();
            for (const auto& item : x) out.push_back(scalar_to_document(item));
            return out;
        } else if constexpr (std::is_same_v<T, value::map_t>) {
            document_t out = document_t::object();
            for (const auto& [k, item] : x) out[k] = scalar_to_document(item);
            return out;
        } else {
            return nullptr;
        }
    }, v.storage());
}

bool is_empty(const document_t& doc) {
    switch (doc.type()) {
        case document_t::value_t::null:
        case document_t::value_t::discarded:
            return true;
        case document_t::value_t::boolean:
            return !doc.get<bool>();
        case document_t::value_t::number_integer:
            return doc.get<int64_t>() == 0;
        case document_t::value_t::number_unsigned:
            return doc.get<uint64_t>() == 0;
        case document_t::value_t::number_float:
            return doc.get<double>() == 0.0;
        case document_t::value_t::string:
            return doc.get_ref<const std::string&>().empty();
        case document_t::value_t::array:
        case document_t::value_t::object:
            return doc.empty();
        case document_t::value_t::binary:
            return doc.get_binary().empty();
    }
    return false;
}

} // namespace detail

} // namespace docmap
