#include <ydoc-cpp/base_doc.hpp>

#include <ydoc-cpp/error.hpp>

#include <fmt/format.h>

namespace ydoc_cpp {

BaseDoc::BaseDoc(std::shared_ptr<Document> doc) : doc_{std::move(doc)} {
    if (!doc_) {
        throw Error{ErrorKind::invalid_operation, "a document needs a shared tree"};
    }
    state_ = root_object("state", ObjType::map);
}

BaseDoc::~BaseDoc() {
    unobserve();
}

auto BaseDoc::root_object(std::string_view key, ObjType type) -> ObjId {
    if (auto existing = doc_->get_obj_id(root, key)) {
        if (doc_->object_type(*existing) != type) {
            throw Error{ErrorKind::invalid_obj_id,
                        fmt::format("root key '{}' does not hold a {}", key, to_string_view(type))};
        }
        return *existing;
    }
    if (doc_->get(root, key)) {
        throw Error{ErrorKind::invalid_obj_id,
                    fmt::format("root key '{}' holds a scalar", key)};
    }
    return doc_->transact([&](Transaction& tx) { return tx.put_object(root, key, type); });
}

auto BaseDoc::dirty() const -> std::optional<bool> {
    return doc_->get<bool>(state_, "dirty");
}

void BaseDoc::set_dirty(bool dirty) {
    doc_->transact([&](Transaction& tx) { tx.put(state_, "dirty", dirty); });
}

auto BaseDoc::hash() const -> std::optional<std::string> {
    return doc_->get<std::string>(state_, "hash");
}

void BaseDoc::set_hash(std::string_view hash) {
    doc_->transact([&](Transaction& tx) { tx.put(state_, "hash", hash); });
}

auto BaseDoc::path() const -> std::optional<std::string> {
    return doc_->get<std::string>(state_, "path");
}

void BaseDoc::set_path(std::string_view path) {
    doc_->transact([&](Transaction& tx) { tx.put(state_, "path", path); });
}

void BaseDoc::observe(DocCallback callback) {
    unobserve();
    auto shared = std::make_shared<DocCallback>(std::move(callback));

    subscriptions_.push_back(doc_->observe(state_, [shared](const Event& event) {
        (*shared)("state", std::vector<Event>{event});
    }));
    for (auto& topic : topics()) {
        if (topic.deep) {
            subscriptions_.push_back(doc_->observe_deep(
                topic.obj, [shared, name = topic.name](const std::vector<Event>& events) {
                    (*shared)(name, events);
                }));
        } else {
            subscriptions_.push_back(doc_->observe(
                topic.obj, [shared, name = topic.name](const Event& event) {
                    (*shared)(name, std::vector<Event>{event});
                }));
        }
    }
}

void BaseDoc::unobserve() {
    for (auto subscription : subscriptions_) {
        doc_->unobserve(subscription);
    }
    subscriptions_.clear();
}

}  // namespace ydoc_cpp
