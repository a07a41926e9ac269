#include <ydoc-cpp/document.hpp>
#include <ydoc-cpp/error.hpp>

#include <gtest/gtest.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace ydoc_cpp;

namespace {

auto text_delta(const Event& event) -> TextDelta {
    return std::get<TextEvent>(event).delta;
}

auto array_delta(const Event& event) -> ArrayDelta {
    return std::get<ArrayEvent>(event).delta;
}

}  // namespace

// -- Construction -------------------------------------------------------------

TEST(Document, root_is_an_empty_map) {
    const auto doc = Document{};
    EXPECT_EQ(doc.object_type(root), ObjType::map);
    EXPECT_EQ(doc.length(root), 0u);
}

// -- Maps ---------------------------------------------------------------------

TEST(Document, put_and_get_scalars) {
    auto doc = Document{};
    doc.transact([](auto& tx) {
        tx.put(root, "nbformat", 4);
        tx.put(root, "path", "a.ipynb");
        tx.put(root, "dirty", true);
        tx.put(root, "count", Null{});
    });

    EXPECT_EQ(doc.get<std::int64_t>(root, "nbformat"), 4);
    EXPECT_EQ(doc.get<std::string>(root, "path"), "a.ipynb");
    EXPECT_EQ(doc.get<bool>(root, "dirty"), true);
    EXPECT_TRUE(doc.get<Null>(root, "count").has_value());
    EXPECT_FALSE(doc.get(root, "missing").has_value());
    EXPECT_EQ(doc.keys(root), (std::vector<std::string>{"count", "dirty", "nbformat", "path"}));
}

TEST(Document, nested_objects_are_reachable_by_key) {
    auto doc = Document{};
    auto meta = doc.transact([](Transaction& tx) {
        auto m = tx.put_object(root, "meta", ObjType::map);
        tx.put(m, "nbformat_minor", 5);
        return m;
    });

    EXPECT_EQ(doc.get_obj_id(root, "meta"), meta);
    EXPECT_EQ(doc.object_type(meta), ObjType::map);
    EXPECT_EQ(doc.get<std::int64_t>(meta, "nbformat_minor"), 5);
    EXPECT_FALSE(doc.get_obj_id(meta, "nbformat_minor").has_value());
}

TEST(Document, delete_key_of_absent_key_is_a_noop) {
    auto doc = Document{};
    doc.transact([](Transaction& tx) {
        tx.delete_key(root, "nothing");
        EXPECT_FALSE(tx.has_changes());
    });
}

TEST(Document, writing_a_map_op_on_a_list_throws) {
    auto doc = Document{};
    auto list = doc.transact([](Transaction& tx) {
        return tx.put_object(root, "cells", ObjType::list);
    });
    EXPECT_THROW(doc.transact([&](Transaction& tx) { tx.put(list, "k", 1); }), Error);
}

// -- Lists --------------------------------------------------------------------

TEST(Document, list_insert_and_delete) {
    auto doc = Document{};
    auto list = doc.transact([](Transaction& tx) {
        auto l = tx.put_object(root, "items", ObjType::list);
        tx.insert(l, 0, "b");
        tx.insert(l, 0, "a");
        tx.insert(l, 2, "c");
        tx.delete_index(l, 1);
        return l;
    });

    EXPECT_EQ(doc.length(list), 2u);
    EXPECT_EQ(doc.get<std::string>(list, std::size_t{0}), "a");
    EXPECT_EQ(doc.get<std::string>(list, std::size_t{1}), "c");
}

TEST(Document, list_out_of_range_throws_invalid_operation) {
    auto doc = Document{};
    auto list = doc.transact([](Transaction& tx) {
        return tx.put_object(root, "items", ObjType::list);
    });
    try {
        doc.transact([&](Transaction& tx) { tx.insert(list, 1, "x"); });
        FAIL() << "expected an exception";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind, ErrorKind::invalid_operation);
    }
    EXPECT_THROW(doc.transact([&](Transaction& tx) { tx.delete_index(list, 0); }), Error);
}

// -- Text ---------------------------------------------------------------------

TEST(Document, text_positions_count_unicode_scalars) {
    auto doc = Document{};
    auto text = doc.transact([](Transaction& tx) {
        auto t = tx.put_object(root, "source", ObjType::text);
        tx.splice_text(t, 0, 0, "caf\xC3\xA9 \xF0\x9F\x91\x8D!");  // "café 👍!"
        return t;
    });
    EXPECT_EQ(doc.length(text), 7u);

    doc.transact([&](Transaction& tx) { tx.splice_text(text, 5, 1, "ok"); });
    EXPECT_EQ(doc.text(text), "caf\xC3\xA9 ok!");
}

TEST(Document, splice_past_the_end_throws) {
    auto doc = Document{};
    auto text = doc.transact([](Transaction& tx) {
        auto t = tx.put_object(root, "source", ObjType::text);
        tx.splice_text(t, 0, 0, "abc");
        return t;
    });
    EXPECT_THROW(doc.transact([&](Transaction& tx) { tx.splice_text(text, 2, 2, ""); }), Error);
    EXPECT_EQ(doc.text(text), "abc");
}

TEST(Document, clear_empties_every_kind) {
    auto doc = Document{};
    auto map = ObjId{};
    auto list = ObjId{};
    auto text = ObjId{};
    doc.transact([&](Transaction& tx) {
        map = tx.put_object(root, "m", ObjType::map);
        tx.put(map, "a", 1);
        tx.put(map, "b", 2);
        list = tx.put_object(root, "l", ObjType::list);
        tx.insert(list, 0, 1);
        text = tx.put_object(root, "t", ObjType::text);
        tx.splice_text(text, 0, 0, "xyz");
    });

    doc.transact([&](Transaction& tx) {
        tx.clear(map);
        tx.clear(list);
        tx.clear(text);
    });
    EXPECT_EQ(doc.length(map), 0u);
    EXPECT_EQ(doc.length(list), 0u);
    EXPECT_EQ(doc.text(text), "");
}

// -- Transactions -------------------------------------------------------------

TEST(Document, second_open_transaction_is_rejected) {
    auto doc = Document{};
    auto tx = doc.begin_transaction();
    try {
        auto other = doc.begin_transaction();
        FAIL() << "expected an exception";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind, ErrorKind::invalid_operation);
    }
    tx->commit();
    EXPECT_NO_THROW(doc.begin_transaction()->commit());
}

TEST(Document, throwing_callback_still_commits_applied_writes) {
    auto doc = Document{};
    auto fired = 0;
    auto sub = doc.observe(root, [&](const Event&) { ++fired; });

    EXPECT_THROW(doc.transact([](Transaction& tx) {
        tx.put(root, "a", 1);
        throw std::runtime_error{"boom"};
    }), std::runtime_error);

    EXPECT_EQ(doc.get<std::int64_t>(root, "a"), 1);
    EXPECT_EQ(fired, 1);
    EXPECT_NO_THROW(doc.transact([](Transaction& tx) { tx.put(root, "b", 2); }));
    doc.unobserve(sub);
}

TEST(Document, op_count_counts_primitive_writes) {
    auto doc = Document{};
    auto text = doc.transact([](Transaction& tx) {
        return tx.put_object(root, "t", ObjType::text);
    });
    auto tx = doc.begin_transaction();
    {
        auto lock = tx->lock();
        tx->splice_text(text, 0, 0, "four");
    }
    EXPECT_EQ(tx->op_count(), 4u);
    tx->commit();
    EXPECT_TRUE(tx->committed());
}

TEST(Document, transact_joins_an_open_transaction) {
    auto doc = Document{};
    auto received = std::vector<Event>{};
    doc.observe(root, [&](const Event& e) { received.push_back(e); });

    auto tx = doc.begin_transaction();
    {
        auto lock = tx->lock();
        tx->put(root, "a", 1);
    }
    doc.transact([](Transaction& joined) { joined.put(root, "b", 2); });

    EXPECT_EQ(doc.get<std::int64_t>(root, "b"), 2);
    EXPECT_TRUE(received.empty());
    EXPECT_EQ(tx->op_count(), 2u);

    tx->commit();
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(std::get<MapEvent>(received[0]).keys.size(), 2u);
    EXPECT_NO_THROW(doc.begin_transaction()->commit());
}

TEST(Document, joined_transact_returns_its_result) {
    auto doc = Document{};
    auto tx = doc.begin_transaction();
    auto list = doc.transact([](Transaction& joined) {
        return joined.put_object(root, "cells", ObjType::list);
    });
    EXPECT_EQ(doc.object_type(list), ObjType::list);
    tx->commit();
    EXPECT_EQ(doc.get_obj_id(root, "cells"), list);
}

TEST(Document, transact_inside_a_callback_is_rejected) {
    auto doc = Document{};
    auto expect_nested_rejected = [&](Transaction&) {
        try {
            doc.transact([](Transaction& inner) { inner.put(root, "x", 1); });
            FAIL() << "expected an exception";
        } catch (const Error& e) {
            EXPECT_EQ(e.kind, ErrorKind::invalid_operation);
        }
    };
    doc.transact(expect_nested_rejected);

    auto tx = doc.begin_transaction();
    doc.transact(expect_nested_rejected);
    tx->commit();
    EXPECT_FALSE(doc.get(root, "x").has_value());
}

// -- Compaction ---------------------------------------------------------------

TEST(Document, commit_drops_deleted_subtrees) {
    auto doc = Document{};
    auto list = doc.transact([](Transaction& tx) {
        auto cells = tx.put_object(root, "cells", ObjType::list);
        for (std::size_t i = 0; i < 3; ++i) {
            auto cell = tx.insert_object(cells, i, ObjType::map);
            auto source = tx.put_object(cell, "source", ObjType::text);
            tx.splice_text(source, 0, 0, "x = 1");
        }
        return cells;
    });
    EXPECT_EQ(doc.object_count(), 8u);

    doc.transact([&](Transaction& tx) { tx.delete_index(list, 1); });
    EXPECT_EQ(doc.object_count(), 6u);

    doc.transact([&](Transaction& tx) { tx.clear(list); });
    EXPECT_EQ(doc.object_count(), 2u);
}

TEST(Document, commit_drops_overwritten_map_values) {
    auto doc = Document{};
    doc.transact([](Transaction& tx) {
        auto meta = tx.put_object(root, "meta", ObjType::map);
        tx.put_object(meta, "kernelspec", ObjType::map);
    });
    EXPECT_EQ(doc.object_count(), 3u);

    // replaced twice in one transaction: both earlier maps go
    doc.transact([](Transaction& tx) {
        tx.put_object(root, "meta", ObjType::map);
        tx.put_object(root, "meta", ObjType::map);
    });
    EXPECT_EQ(doc.object_count(), 2u);

    doc.transact([](Transaction& tx) { tx.put(root, "meta", Null{}); });
    EXPECT_EQ(doc.object_count(), 1u);
}

TEST(Document, repeated_replacement_keeps_the_tree_bounded) {
    auto doc = Document{};
    auto text = doc.transact([](Transaction& tx) {
        return tx.put_object(root, "source", ObjType::text);
    });
    auto received = std::vector<Event>{};
    doc.observe(text, [&](const Event& e) { received.push_back(e); });

    const auto first = std::string(500, 'a');
    const auto second = std::string(500, 'b');
    for (auto round = 0; round < 50; ++round) {
        doc.transact([&](Transaction& tx) {
            tx.splice_text(text, 0, tx.length(text), round % 2 == 0 ? first : second);
        });
    }

    EXPECT_EQ(doc.text(text), second);
    EXPECT_EQ(doc.object_count(), 2u);
    ASSERT_EQ(received.size(), 50u);
    // the delta still sees exactly the previous content, not earlier rounds
    EXPECT_EQ(text_delta(received.back()), (TextDelta{Delete{500}, InsertText{second}}));
}

// -- Events -------------------------------------------------------------------

TEST(Events, no_callback_without_changes) {
    auto doc = Document{};
    auto fired = 0;
    doc.observe_deep(root, [&](const std::vector<Event>&) { ++fired; });
    doc.transact([](Transaction&) {});
    EXPECT_EQ(fired, 0);
}

TEST(Events, map_event_reports_add_update_remove) {
    auto doc = Document{};
    doc.transact([](Transaction& tx) {
        tx.put(root, "kept", 1);
        tx.put(root, "gone", 2);
    });

    auto received = std::vector<Event>{};
    doc.observe(root, [&](const Event& e) { received.push_back(e); });
    doc.transact([](Transaction& tx) {
        tx.put(root, "kept", 10);
        tx.delete_key(root, "gone");
        tx.put(root, "new", 3);
    });

    ASSERT_EQ(received.size(), 1u);
    const auto& keys = std::get<MapEvent>(received[0]).keys;
    ASSERT_EQ(keys.size(), 3u);
    EXPECT_EQ(keys.at("kept").action, KeyAction::update);
    EXPECT_EQ(get_scalar<std::int64_t>(keys.at("kept").old_value), 1);
    EXPECT_EQ(get_scalar<std::int64_t>(keys.at("kept").new_value), 10);
    EXPECT_EQ(keys.at("gone").action, KeyAction::remove);
    EXPECT_FALSE(keys.at("gone").new_value.has_value());
    EXPECT_EQ(keys.at("new").action, KeyAction::add);
}

TEST(Events, key_added_and_removed_in_one_transaction_is_silent) {
    auto doc = Document{};
    auto fired = 0;
    doc.observe(root, [&](const Event&) { ++fired; });
    doc.transact([](Transaction& tx) {
        tx.put(root, "tmp", 1);
        tx.delete_key(root, "tmp");
    });
    EXPECT_EQ(fired, 0);
}

TEST(Events, text_delta_retains_then_inserts) {
    auto doc = Document{};
    auto text = doc.transact([](Transaction& tx) {
        auto t = tx.put_object(root, "source", ObjType::text);
        tx.splice_text(t, 0, 0, "hello world");
        return t;
    });

    auto received = std::vector<Event>{};
    doc.observe(text, [&](const Event& e) { received.push_back(e); });
    doc.transact([&](Transaction& tx) { tx.splice_text(text, 6, 0, "brave "); });

    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(text_delta(received[0]), (TextDelta{Retain{6}, InsertText{"brave "}}));
}

TEST(Events, text_replacement_deletes_then_inserts) {
    auto doc = Document{};
    auto text = doc.transact([](Transaction& tx) {
        auto t = tx.put_object(root, "source", ObjType::text);
        tx.splice_text(t, 0, 0, "abcdef");
        return t;
    });

    auto received = std::vector<Event>{};
    doc.observe(text, [&](const Event& e) { received.push_back(e); });
    doc.transact([&](Transaction& tx) { tx.splice_text(text, 2, 2, "XY"); });

    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(text_delta(received[0]), (TextDelta{Retain{2}, Delete{2}, InsertText{"XY"}}));
}

TEST(Events, replacing_an_element_between_two_others) {
    auto doc = Document{};
    auto list = doc.transact([](Transaction& tx) {
        auto l = tx.put_object(root, "cells", ObjType::list);
        tx.insert(l, 0, "a");
        tx.insert(l, 1, "b");
        tx.insert(l, 2, "c");
        return l;
    });

    auto received = std::vector<Event>{};
    doc.observe(list, [&](const Event& e) { received.push_back(e); });
    doc.transact([&](Transaction& tx) {
        tx.delete_index(list, 1);
        tx.insert(list, 1, "x");
    });

    ASSERT_EQ(received.size(), 1u);
    auto expected = ArrayDelta{Retain{1}, Delete{1},
                               InsertValues{{Value{ScalarValue{std::string{"x"}}}}}};
    EXPECT_EQ(array_delta(received[0]), expected);
}

TEST(Events, objects_created_in_the_transaction_emit_nothing) {
    auto doc = Document{};
    auto list = doc.transact([](Transaction& tx) {
        return tx.put_object(root, "cells", ObjType::list);
    });

    auto received = std::vector<Event>{};
    doc.observe_deep(list, [&](const std::vector<Event>& events) { received = events; });
    doc.transact([&](Transaction& tx) {
        auto cell = tx.insert_object(list, 0, ObjType::map);
        auto source = tx.put_object(cell, "source", ObjType::text);
        tx.splice_text(source, 0, 0, "print(1)");
    });

    ASSERT_EQ(received.size(), 1u);
    const auto& delta = array_delta(received[0]);
    ASSERT_EQ(delta.size(), 1u);
    EXPECT_EQ(std::get<InsertValues>(delta[0]).values, (std::vector<Value>{ObjType::map}));
}

TEST(Events, deep_observer_sees_relative_paths_shallowest_first) {
    auto doc = Document{};
    auto list = ObjId{};
    auto cell = ObjId{};
    auto source = ObjId{};
    doc.transact([&](Transaction& tx) {
        list = tx.put_object(root, "cells", ObjType::list);
        tx.insert(list, 0, "placeholder");
        cell = tx.insert_object(list, 1, ObjType::map);
        source = tx.put_object(cell, "source", ObjType::text);
        tx.splice_text(source, 0, 0, "x = 1");
    });

    auto received = std::vector<Event>{};
    doc.observe_deep(list, [&](const std::vector<Event>& events) { received = events; });
    doc.transact([&](Transaction& tx) {
        tx.splice_text(source, 4, 1, "2");
        tx.put(cell, "execution_count", 3);
    });

    ASSERT_EQ(received.size(), 2u);
    EXPECT_EQ(event_target(received[0]), cell);
    EXPECT_EQ(event_path(received[0]), (Path{std::size_t{1}}));
    EXPECT_EQ(event_target(received[1]), source);
    EXPECT_EQ(event_path(received[1]), (Path{std::size_t{1}, std::string{"source"}}));
}

TEST(Events, shallow_observer_ignores_descendants) {
    auto doc = Document{};
    auto list = ObjId{};
    auto source = ObjId{};
    doc.transact([&](Transaction& tx) {
        list = tx.put_object(root, "cells", ObjType::list);
        auto cell = tx.insert_object(list, 0, ObjType::map);
        source = tx.put_object(cell, "source", ObjType::text);
    });

    auto fired = 0;
    doc.observe(list, [&](const Event&) { ++fired; });
    doc.transact([&](Transaction& tx) { tx.splice_text(source, 0, 0, "x"); });
    EXPECT_EQ(fired, 0);
}

TEST(Events, unreachable_objects_emit_nothing) {
    auto doc = Document{};
    auto list = ObjId{};
    auto source = ObjId{};
    doc.transact([&](Transaction& tx) {
        list = tx.put_object(root, "cells", ObjType::list);
        auto cell = tx.insert_object(list, 0, ObjType::map);
        source = tx.put_object(cell, "source", ObjType::text);
        tx.splice_text(source, 0, 0, "old");
    });

    auto received = std::vector<Event>{};
    doc.observe_deep(root, [&](const std::vector<Event>& events) { received = events; });
    doc.transact([&](Transaction& tx) {
        tx.splice_text(source, 0, 3, "new");
        tx.delete_index(list, 0);
    });

    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(event_target(received[0]), list);
    EXPECT_EQ(array_delta(received[0]), (ArrayDelta{Delete{1}}));
}

TEST(Events, unobserve_is_idempotent) {
    auto doc = Document{};
    auto fired = 0;
    auto sub = doc.observe(root, [&](const Event&) { ++fired; });
    doc.unobserve(sub);
    doc.unobserve(sub);
    doc.unobserve(Subscription{});
    doc.transact([](Transaction& tx) { tx.put(root, "a", 1); });
    EXPECT_EQ(fired, 0);
}

TEST(Events, observers_may_read_the_document) {
    auto doc = Document{};
    auto seen = std::optional<std::int64_t>{};
    doc.observe(root, [&](const Event&) { seen = doc.get<std::int64_t>(root, "n"); });
    doc.transact([](Transaction& tx) { tx.put(root, "n", 7); });
    EXPECT_EQ(seen, 7);
}
