#include <ydoc-cpp/blob_doc.hpp>

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

using namespace ydoc_cpp;

namespace {

auto bytes(std::string_view s) -> Bytes {
    auto result = Bytes{};
    for (auto c : s) result.push_back(static_cast<std::byte>(c));
    return result;
}

}  // namespace

TEST(BlobDoc, absent_content_reads_as_empty) {
    auto doc = BlobDoc{};
    EXPECT_TRUE(doc.get().empty());
    EXPECT_EQ(doc.version(), "2.0.0");
    EXPECT_EQ(doc.document().object_type(doc.source()), ObjType::map);
}

TEST(BlobDoc, set_then_get) {
    auto doc = BlobDoc{};
    doc.set(bytes("\x89PNG\r\n"));
    EXPECT_EQ(doc.get(), bytes("\x89PNG\r\n"));
}

TEST(BlobDoc, stores_under_source_bytes) {
    auto doc = BlobDoc{};
    doc.set(bytes("abc"));
    EXPECT_EQ(doc.document().get<Bytes>(doc.source(), "bytes"), bytes("abc"));
}

TEST(BlobDoc, new_content_emits_one_map_event) {
    auto doc = BlobDoc{};
    doc.set(bytes("v1"));

    auto topics = std::vector<std::string>{};
    auto received = std::vector<Event>{};
    doc.observe([&](std::string_view topic, const std::vector<Event>& events) {
        topics.emplace_back(topic);
        received = events;
    });
    doc.set(bytes("v2"));

    EXPECT_EQ(topics, (std::vector<std::string>{"source"}));
    ASSERT_EQ(received.size(), 1u);
    const auto& change = std::get<MapEvent>(received[0]).keys.at("bytes");
    EXPECT_EQ(change.action, KeyAction::update);
    EXPECT_EQ(get_scalar<Bytes>(change.new_value), bytes("v2"));
}

TEST(BlobDoc, same_content_is_not_rewritten) {
    auto doc = BlobDoc{};
    doc.set(bytes("same"));
    auto fired = 0;
    doc.observe([&](std::string_view, const std::vector<Event>&) { ++fired; });
    doc.set(bytes("same"));
    EXPECT_EQ(fired, 0);
}

TEST(BlobDoc, empty_content_on_a_fresh_document_writes_nothing) {
    auto doc = BlobDoc{};
    auto fired = 0;
    doc.observe([&](std::string_view, const std::vector<Event>&) { ++fired; });
    doc.set(Bytes{});
    EXPECT_EQ(fired, 0);
    EXPECT_FALSE(doc.document().get(doc.source(), "bytes").has_value());
}

TEST(BlobDoc, shares_a_tree_with_a_second_view) {
    auto writer = BlobDoc{};
    writer.set(bytes("payload"));
    auto reader = BlobDoc{writer.shared_document()};
    EXPECT_EQ(reader.get(), bytes("payload"));
}
