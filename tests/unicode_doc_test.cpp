#include <ydoc-cpp/unicode_doc.hpp>
#include <ydoc-cpp/error.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace ydoc_cpp;

namespace {

struct Recorded {
    std::string topic;
    std::vector<Event> events;
};

auto utf8(char32_t c) -> std::string {
    auto out = std::string{};
    if (c < 0x80) {
        out += static_cast<char>(c);
    } else if (c < 0x800) {
        out += static_cast<char>(0xC0 | (c >> 6));
        out += static_cast<char>(0x80 | (c & 0x3F));
    } else if (c < 0x10000) {
        out += static_cast<char>(0xE0 | (c >> 12));
        out += static_cast<char>(0x80 | ((c >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (c & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (c >> 18));
        out += static_cast<char>(0x80 | ((c >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((c >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (c & 0x3F));
    }
    return out;
}

// `length` CJK ideographs; with `edit_every` set, every that many scalars one
// ideograph is swapped for one from Extension A.
auto cjk_text(std::size_t length, std::size_t edit_every = 0) -> std::string {
    auto text = std::string{};
    for (std::size_t i = 0; i < length; ++i) {
        if (edit_every > 0 && i % edit_every == edit_every / 2) {
            text += utf8(static_cast<char32_t>(0x3400 + i / edit_every));
        } else {
            text += utf8(static_cast<char32_t>(0x4E00 + (i * 7919) % 20000));
        }
    }
    return text;
}

}  // namespace

TEST(UnicodeDoc, starts_empty) {
    auto doc = UnicodeDoc{};
    EXPECT_EQ(doc.get(), "");
    EXPECT_EQ(doc.version(), "1.0.0");
    EXPECT_EQ(doc.document().object_type(doc.source()), ObjType::text);
}

TEST(UnicodeDoc, set_then_get) {
    auto doc = UnicodeDoc{};
    doc.set("hello \xF0\x9F\x8C\x8D");
    EXPECT_EQ(doc.get(), "hello \xF0\x9F\x8C\x8D");
}

TEST(UnicodeDoc, small_edit_broadcasts_a_small_delta) {
    auto doc = UnicodeDoc{};
    doc.set("hello world");

    auto recorded = std::vector<Recorded>{};
    doc.observe([&](std::string_view topic, const std::vector<Event>& events) {
        recorded.push_back({std::string{topic}, events});
    });
    doc.set("hello brave world");

    ASSERT_EQ(recorded.size(), 1u);
    EXPECT_EQ(recorded[0].topic, "source");
    ASSERT_EQ(recorded[0].events.size(), 1u);
    EXPECT_EQ(std::get<TextEvent>(recorded[0].events[0]).delta,
              (TextDelta{Retain{6}, InsertText{"brave "}}));
}

TEST(UnicodeDoc, setting_the_same_content_is_silent) {
    auto doc = UnicodeDoc{};
    doc.set("same");
    auto fired = 0;
    doc.observe([&](std::string_view, const std::vector<Event>&) { ++fired; });
    doc.set("same");
    EXPECT_EQ(fired, 0);
}

TEST(UnicodeDoc, state_changes_arrive_under_their_own_topic) {
    auto doc = UnicodeDoc{};
    auto topics = std::vector<std::string>{};
    doc.observe([&](std::string_view topic, const std::vector<Event>&) {
        topics.emplace_back(topic);
    });

    doc.set_dirty(true);
    doc.set_path("notes.txt");
    doc.set_hash("abc123");
    doc.set("content");

    EXPECT_EQ(topics, (std::vector<std::string>{"state", "state", "state", "source"}));
    EXPECT_EQ(doc.dirty(), true);
    EXPECT_EQ(doc.path(), "notes.txt");
    EXPECT_EQ(doc.hash(), "abc123");
}

TEST(UnicodeDoc, setting_content_leaves_state_alone) {
    auto doc = UnicodeDoc{};
    doc.set_dirty(false);
    doc.set("x");
    EXPECT_EQ(doc.dirty(), false);
    EXPECT_FALSE(doc.path().has_value());
}

TEST(UnicodeDoc, unobserve_stops_callbacks) {
    auto doc = UnicodeDoc{};
    auto fired = 0;
    doc.observe([&](std::string_view, const std::vector<Event>&) { ++fired; });
    doc.unobserve();
    doc.unobserve();
    doc.set("quiet");
    EXPECT_EQ(fired, 0);
}

TEST(UnicodeDoc, observe_replaces_the_previous_callback) {
    auto doc = UnicodeDoc{};
    auto first = 0;
    auto second = 0;
    doc.observe([&](std::string_view, const std::vector<Event>&) { ++first; });
    doc.observe([&](std::string_view, const std::vector<Event>&) { ++second; });
    doc.set("x");
    EXPECT_EQ(first, 0);
    EXPECT_EQ(second, 1);
}

TEST(FileDoc, is_a_unicode_doc_over_the_same_tree) {
    auto text = UnicodeDoc{};
    text.set("print('hi')\n");

    auto file = FileDoc{text.shared_document()};
    EXPECT_EQ(file.version(), text.version());
    EXPECT_EQ(file.source(), text.source());
    EXPECT_EQ(file.get(), "print('hi')\n");
}

TEST(UnicodeDoc, two_views_share_one_tree) {
    auto shared = std::make_shared<Document>();
    auto writer = UnicodeDoc{shared};
    writer.set("shared text");

    auto reader = UnicodeDoc{writer.shared_document()};
    EXPECT_EQ(reader.source(), writer.source());
    EXPECT_EQ(reader.get(), "shared text");
}

TEST(UnicodeDoc, conflicting_root_key_throws) {
    auto shared = std::make_shared<Document>();
    shared->transact([](Transaction& tx) { tx.put_object(root, "source", ObjType::map); });
    try {
        auto doc = UnicodeDoc{shared};
        FAIL() << "expected an exception";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind, ErrorKind::invalid_obj_id);
    }
}

TEST(UnicodeDoc, null_tree_throws) {
    EXPECT_THROW(UnicodeDoc{nullptr}, Error);
}

// -- Cooperative set ----------------------------------------------------------

TEST(UnicodeDoc, aset_matches_set) {
    const auto initial = std::string{"line one\nline two\nline three\n"};
    const auto desired = std::string{"line one\nline 2\nline three\nline four\n"};

    auto sync_doc = UnicodeDoc{};
    sync_doc.set(initial);
    auto sync_events = std::vector<Event>{};
    sync_doc.observe([&](std::string_view, const std::vector<Event>& events) { sync_events = events; });
    sync_doc.set(desired);

    auto async_doc = UnicodeDoc{};
    async_doc.set(initial);
    auto async_events = std::vector<Event>{};
    async_doc.observe([&](std::string_view, const std::vector<Event>& events) { async_events = events; });
    auto loop = RunLoop{};
    auto done = async_doc.aset(loop, desired);
    loop.run_until_idle();
    done.get();

    EXPECT_EQ(async_doc.get(), desired);
    EXPECT_EQ(async_events, sync_events);
    EXPECT_GT(loop.tasks_run(), 2u);
}

TEST(UnicodeDoc, stopped_aset_keeps_partial_content_committed) {
    auto doc = UnicodeDoc{};
    doc.set("abc");
    auto loop = RunLoop{};
    auto source = std::stop_source{};
    auto done = doc.aset(loop, "xyz", source.get_token());

    // planning steps, then the step that clears the text
    while (doc.get() == "abc" && loop.run_one()) {
    }
    source.request_stop();
    loop.run_until_idle();

    EXPECT_THROW(done.get(), Error);
    EXPECT_EQ(doc.get(), "");
    EXPECT_NO_THROW(doc.document().begin_transaction()->commit());
}

TEST(UnicodeDoc, aset_outlives_the_doc_that_queued_it) {
    auto loop = RunLoop{};
    auto done = std::future<void>{};
    auto tree = std::weak_ptr<Document>{};
    auto received = std::vector<Event>{};
    {
        auto doc = UnicodeDoc{};
        doc.set("hello");
        tree = doc.shared_document();
        doc.document().observe(doc.source(), [&](const Event& e) { received.push_back(e); });
        done = doc.aset(loop, "hello world");
    }
    ASSERT_FALSE(tree.expired());

    loop.run_until_idle();
    EXPECT_NO_THROW(done.get());
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(std::get<TextEvent>(received[0]).delta, (TextDelta{Retain{5}, InsertText{" world"}}));
    EXPECT_TRUE(tree.expired());
}

TEST(UnicodeDoc, state_written_between_aset_steps_commits_with_it) {
    auto doc = UnicodeDoc{};
    doc.set("hello");
    auto topics = std::vector<std::string>{};
    doc.observe([&](std::string_view topic, const std::vector<Event>&) {
        topics.emplace_back(topic);
    });

    auto loop = RunLoop{};
    auto done = doc.aset(loop, "hello world");
    // stop once the insert is written but not yet committed
    while (doc.get() == "hello" && loop.run_one()) {
    }
    ASSERT_GT(loop.pending(), 0u);

    EXPECT_NO_THROW(doc.set_dirty(true));
    EXPECT_NO_THROW(doc.set_path("notes.txt"));
    EXPECT_EQ(doc.dirty(), true);
    EXPECT_TRUE(topics.empty());

    loop.run_until_idle();
    EXPECT_NO_THROW(done.get());
    EXPECT_EQ(topics, (std::vector<std::string>{"state", "source"}));
    EXPECT_EQ(doc.path(), "notes.txt");
    EXPECT_NO_THROW(doc.document().begin_transaction()->commit());
}

TEST(UnicodeDoc, aset_keeps_every_step_short_on_large_text) {
    const auto initial = cjk_text(40000);
    const auto desired = cjk_text(40000, 400);

    auto sync_doc = UnicodeDoc{};
    sync_doc.set(initial);
    const auto start = std::chrono::steady_clock::now();
    sync_doc.set(desired);
    const auto sync_total = std::chrono::steady_clock::now() - start;

    auto async_doc = UnicodeDoc{};
    async_doc.set(initial);
    auto loop = RunLoop{};
    auto done = async_doc.aset(loop, desired);
    loop.run_until_idle();
    done.get();

    EXPECT_EQ(async_doc.get(), desired);
    EXPECT_GT(loop.tasks_run(), 100u);
    EXPECT_LT(loop.longest_task() * 4, sync_total);
}
