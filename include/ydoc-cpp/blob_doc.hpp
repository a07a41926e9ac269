/// @file blob_doc.hpp
/// @brief A binary document: one byte string under `source.bytes`.

#pragma once

#include <ydoc-cpp/base_doc.hpp>
#include <ydoc-cpp/value.hpp>

#include <memory>
#include <string_view>

namespace ydoc_cpp {

/// An opaque byte blob stored in the root map `source` under the key `bytes`.
class BlobDoc : public BaseDoc {
public:
    explicit BlobDoc(std::shared_ptr<Document> doc = std::make_shared<Document>());

    auto version() const -> std::string_view override { return "2.0.0"; }

    /// The root map.
    auto source() const -> const ObjId& { return source_; }

    /// The current content, empty if none was ever set.
    auto get() const -> Bytes;

    /// Store `value`. Nothing is written if get() already returns it.
    void set(const Bytes& value);

protected:
    auto topics() const -> std::vector<Topic> override;

private:
    ObjId source_;
};

}  // namespace ydoc_cpp
