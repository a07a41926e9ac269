/// @file unicode_doc.hpp
/// @brief A plain text document: one Text holding the whole content.

#pragma once

#include <ydoc-cpp/base_doc.hpp>
#include <ydoc-cpp/scheduler.hpp>

#include <future>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>

namespace ydoc_cpp {

/// Plain UTF-8 text stored in the root Text `source`.
///
/// set() rewrites the text through the text reconciler, so a small edit of
/// a large file broadcasts a small change and keeps remote cursors where
/// they were.
///
/// @code
/// auto doc = UnicodeDoc{};
/// doc.set("hello world");
/// doc.set("hello brave world");   // one insert of "brave "
/// @endcode
class UnicodeDoc : public BaseDoc {
public:
    explicit UnicodeDoc(std::shared_ptr<Document> doc = std::make_shared<Document>());

    auto version() const -> std::string_view override { return "1.0.0"; }

    /// The root Text.
    auto source() const -> const ObjId& { return source_; }

    /// The current content.
    auto get() const -> std::string;

    /// Make the content equal to `value`.
    void set(std::string_view value);

    /// set() on `loop`, one edit per task.
    auto aset(RunLoop& loop, std::string value, std::stop_token stop = {}) -> std::future<void>;

protected:
    auto topics() const -> std::vector<Topic> override;

private:
    ObjId source_;
};

/// A plain text file. Same schema and version as UnicodeDoc, under the name
/// hosts that open files by kind still look up.
using FileDoc = UnicodeDoc;

}  // namespace ydoc_cpp
