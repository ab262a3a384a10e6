#include "docmap/object.hpp"

namespace docmap {

namespace {
const value& null_value() {
    static const value v;
    return v;
}
}

const value& object::get(const std::string& name) const {
    auto it = fields_.find(name);
    return it != fields_.end() ? it->second : null_value();
}

const value& object::get_private(const std::string& name) const {
    auto it = private_fields_.find(name);
    return it != private_fields_.end() ? it->second : null_value();
}

const value& member_access::read(const object& obj, const std::string& name, visibility access) {
    if (access == visibility::public_member) {
        return obj.get(name);
    }
    return obj.get_private(name);
}

void member_access::write(object& obj, const std::string& name, value v, visibility access) {
    if (access == visibility::public_member) {
        obj.fields_[name] = std::move(v);
    } else {
        obj.private_fields_[name] = std::move(v);
    }
}

std::shared_ptr<object> member_access::share(object& obj) {
    if (auto owned = obj.weak_from_this().lock()) {
        return owned;
    }
    return std::shared_ptr<object>(std::shared_ptr<object>(), &obj);
}

} // namespace docmap
