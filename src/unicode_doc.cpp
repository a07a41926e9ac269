#include <ydoc-cpp/unicode_doc.hpp>

#include <ydoc-cpp/text_reconciler.hpp>

namespace ydoc_cpp {

UnicodeDoc::UnicodeDoc(std::shared_ptr<Document> doc)
    : BaseDoc{std::move(doc)}, source_{root_object("source", ObjType::text)} {}

auto UnicodeDoc::get() const -> std::string {
    return document().text(source_);
}

void UnicodeDoc::set(std::string_view value) {
    reconcile_text(document(), source_, value);
}

auto UnicodeDoc::aset(RunLoop& loop, std::string value, std::stop_token stop)
    -> std::future<void> {
    auto job = std::make_shared<TextReconciliation>(shared_document(), source_,
                                                    std::move(value));
    return run_async(loop, std::move(job), std::move(stop));
}

auto UnicodeDoc::topics() const -> std::vector<Topic> {
    return {Topic{.name = "source", .obj = source_}};
}

}  // namespace ydoc_cpp
