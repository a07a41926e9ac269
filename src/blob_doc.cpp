#include <ydoc-cpp/blob_doc.hpp>

namespace ydoc_cpp {

BlobDoc::BlobDoc(std::shared_ptr<Document> doc)
    : BaseDoc{std::move(doc)}, source_{root_object("source", ObjType::map)} {}

auto BlobDoc::get() const -> Bytes {
    return document().get<Bytes>(source_, "bytes").value_or(Bytes{});
}

void BlobDoc::set(const Bytes& value) {
    if (get() == value) return;
    document().transact([&](Transaction& tx) { tx.put(source_, "bytes", ScalarValue{value}); });
}

auto BlobDoc::topics() const -> std::vector<Topic> {
    return {Topic{.name = "source", .obj = source_}};
}

}  // namespace ydoc_cpp
