/// @file base_doc.hpp
/// @brief The part every document kind shares: the shared tree, the state map
/// and change subscription.

#pragma once

#include <ydoc-cpp/document.hpp>
#include <ydoc-cpp/event.hpp>
#include <ydoc-cpp/types.hpp>
#include <ydoc-cpp/value.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ydoc_cpp {

/// Receives the changes of one topic (`"state"`, `"source"`, `"meta"`,
/// `"cells"`) committed by one transaction.
using DocCallback = std::function<void(std::string_view topic, const std::vector<Event>& events)>;

/// Base class of UnicodeDoc, BlobDoc and NotebookDoc.
///
/// A document lives in a Document, either its own or one shared with other
/// parties. Its root keys are created on construction when missing, and
/// reused when the shared tree already has them. The `state` map carries
/// host bookkeeping (`dirty`, `hash`, `path`); setting content never
/// touches it.
class BaseDoc {
public:
    virtual ~BaseDoc();

    BaseDoc(const BaseDoc&) = delete;
    auto operator=(const BaseDoc&) -> BaseDoc& = delete;
    BaseDoc(BaseDoc&&) = delete;
    auto operator=(BaseDoc&&) -> BaseDoc& = delete;

    /// Version of the document schema.
    virtual auto version() const -> std::string_view = 0;

    /// The shared tree holding the document.
    auto document() -> Document& { return *doc_; }
    auto document() const -> const Document& { return *doc_; }

    /// The shared tree, for handing to another party.
    auto shared_document() const -> std::shared_ptr<Document> { return doc_; }

    /// The `state` map.
    auto state() const -> const ObjId& { return state_; }

    /// Whether the content has unsaved changes, if known.
    auto dirty() const -> std::optional<bool>;
    void set_dirty(bool dirty);

    /// Content hash computed by the host's contents manager, if known.
    auto hash() const -> std::optional<std::string>;
    void set_hash(std::string_view hash);

    /// Path of the document, if known.
    auto path() const -> std::optional<std::string>;
    void set_path(std::string_view path);

    /// Subscribe to every topic of the document, replacing any previous
    /// subscription.
    void observe(DocCallback callback);

    /// Remove the subscriptions made by observe(). Calling it again is a no-op.
    void unobserve();

protected:
    /// An object observed under a topic name.
    struct Topic {
        std::string name;
        ObjId obj;
        bool deep{false};  ///< Include events of descendants.
    };

    explicit BaseDoc(std::shared_ptr<Document> doc);

    /// The root object stored under `key`, created if missing.
    /// @throws Error{ErrorKind::invalid_obj_id} if `key` holds something else.
    auto root_object(std::string_view key, ObjType type) -> ObjId;

    /// Topics subscribed by observe(), in addition to `state`.
    virtual auto topics() const -> std::vector<Topic> = 0;

private:
    std::shared_ptr<Document> doc_;
    ObjId state_;
    std::vector<Subscription> subscriptions_;
};

}  // namespace ydoc_cpp
