#include "docmap/reference.hpp"
#include "docmap/object.hpp"
#include "docmap/errors.hpp"
#include "docmap/log.hpp"

namespace docmap {

reference::reference(std::string collection, document_t id, document_t cache,
                     std::weak_ptr<reference_resolver> resolver)
    : collection_(std::move(collection)), id_(std::move(id)),
      cache_(cache.is_object() ? std::move(cache) : document_t::object()),
      resolver_(std::move(resolver)) {}

std::shared_ptr<reference> reference::to(std::shared_ptr<object> target, std::string collection,
                                         document_t id, document_t cache) {
    auto ref = std::make_shared<reference>(std::move(collection), std::move(id), std::move(cache));
    ref->target_ = std::move(target);
    return ref;
}

bool reference::is_reference_document(const document_t& doc) {
    if (!doc.is_object()) return false;
    auto ref = doc.find("$ref");
    auto id = doc.find("$id");
    return ref != doc.end() && id != doc.end() && !detail::is_empty(*ref) && !detail::is_empty(*id);
}

std::shared_ptr<reference> reference::from_document(const document_t& doc,
                                                    std::weak_ptr<reference_resolver> resolver) {
    if (!is_reference_document(doc) || !doc["$ref"].is_string()) {
        throw error("Not a reference document: " + doc.dump());
    }
    return std::make_shared<reference>(doc["$ref"].get<std::string>(), doc["$id"],
                                       doc.value("__cache", document_t::object()), std::move(resolver));
}

document_t reference::make_document(const std::string& collection, const document_t& id,
                                    const document_t& cache) {
    document_t doc{{"$ref", collection}, {"$id", id}};
    if (cache.is_object() && !cache.empty()) {
        doc["__cache"] = cache;
    }
    return doc;
}

std::shared_ptr<object> reference::get_object() {
    if (!target_) {
        auto resolver = resolver_.lock();
        if (!resolver) {
            LOG_WARN("reference", "No resolver for %s in %s", id_.dump().c_str(), collection_.c_str());
            throw reference_resolution_error(collection_, id_);
        }
        LOG_DEBUG("reference", "Resolving %s in %s", id_.dump().c_str(), collection_.c_str());
        target_ = resolver->resolve(collection_, id_);
        if (!target_) {
            throw reference_resolution_error(collection_, id_);
        }
    }
    return target_;
}

value reference::get(const std::string& field) {
    return get_object()->get(field);
}

void reference::set(const std::string& field, value v) {
    get_object()->set(field, std::move(v));
}

document_t reference::cached(const std::string& field) const {
    auto it = cache_.find(field);
    return it != cache_.end() ? *it : document_t();
}

void reference::save() {
    if (!target_) {
        return;
    }
    auto resolver = resolver_.lock();
    if (!resolver) {
        throw reference_resolution_error(collection_, id_);
    }
    resolver->persist(*target_);
}

} // namespace docmap
