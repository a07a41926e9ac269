#include <ydoc-cpp/json.hpp>
#include <ydoc-cpp/document.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

using namespace ydoc_cpp;
using json = nlohmann::json;

// =============================================================================
// ADL serialization
// =============================================================================

TEST(JsonScalar, scalars_map_to_native_json) {
    EXPECT_EQ(json(ScalarValue{Null{}}), json(nullptr));
    EXPECT_EQ(json(ScalarValue{true}), json(true));
    EXPECT_EQ(json(ScalarValue{std::int64_t{-3}}), json(-3));
    EXPECT_EQ(json(ScalarValue{1.5}), json(1.5));
    EXPECT_EQ(json(ScalarValue{std::string{"hi"}}), json("hi"));
}

TEST(JsonScalar, bytes_use_a_tagged_base64_object) {
    auto j = json(ScalarValue{Bytes{std::byte{'M'}, std::byte{'a'}}});
    EXPECT_EQ(j, (json{{"__type", "bytes"}, {"value", "TWE="}}));
    EXPECT_EQ(j.get<ScalarValue>(), (ScalarValue{Bytes{std::byte{'M'}, std::byte{'a'}}}));
}

TEST(JsonScalar, small_unsigned_numbers_read_back_as_int64) {
    auto small = json(std::uint64_t{7}).get<ScalarValue>();
    EXPECT_TRUE(std::holds_alternative<std::int64_t>(small));
    auto large = json(std::numeric_limits<std::uint64_t>::max()).get<ScalarValue>();
    EXPECT_TRUE(std::holds_alternative<std::uint64_t>(large));
}

TEST(JsonScalar, structured_values_are_rejected) {
    EXPECT_THROW(json::array({1, 2}).get<ScalarValue>(), std::runtime_error);
}

TEST(JsonValue, objects_serialize_as_type_tags) {
    EXPECT_EQ(json(Value{ObjType::text}), (json{{"__type", "text"}}));
    EXPECT_EQ(json(Value{ScalarValue{std::int64_t{1}}}), json(1));
}

TEST(JsonObjId, root_is_a_string) {
    EXPECT_EQ(json(root), "root");
    EXPECT_EQ(json(ObjId{OpId{3, ActorId{}}}), (json{{"counter", 3}}));
}

// =============================================================================
// Events
// =============================================================================

TEST(JsonEvent, text_event_uses_delta_form) {
    auto event = Event{TextEvent{
        .target = root,
        .path = {std::size_t{0}, std::string{"source"}},
        .delta = {Retain{3}, Delete{1}, InsertText{"x"}},
    }};
    EXPECT_EQ(json(event), json::parse(R"({
        "type": "text",
        "path": [0, "source"],
        "delta": [{"retain": 3}, {"delete": 1}, {"insert": "x"}]
    })"));
}

TEST(JsonEvent, array_event_lists_inserted_values) {
    auto event = Event{ArrayEvent{
        .target = root,
        .path = {},
        .delta = {Retain{1}, InsertValues{{Value{ObjType::map}, Value{ScalarValue{std::int64_t{2}}}}}},
    }};
    EXPECT_EQ(json(event), json::parse(R"({
        "type": "array",
        "path": [],
        "delta": [{"retain": 1}, {"insert": [{"__type": "map"}, 2]}]
    })"));
}

TEST(JsonEvent, map_event_names_the_action) {
    auto event = MapEvent{.target = root, .path = {}, .keys = {}};
    event.keys["dirty"] = KeyChange{.action = KeyAction::update,
                                    .old_value = Value{ScalarValue{false}},
                                    .new_value = Value{ScalarValue{true}}};
    event.keys["path"] = KeyChange{.action = KeyAction::remove,
                                   .old_value = Value{ScalarValue{std::string{"a"}}},
                                   .new_value = std::nullopt};
    auto j = json(Event{event});
    EXPECT_EQ(j["type"], "map");
    EXPECT_EQ(j["keys"]["dirty"], (json{{"action", "update"}, {"oldValue", false}, {"newValue", true}}));
    EXPECT_EQ(j["keys"]["path"], (json{{"action", "delete"}, {"oldValue", "a"}}));
}

// =============================================================================
// Export / import
// =============================================================================

TEST(JsonExport, texts_export_as_strings) {
    auto doc = Document{};
    doc.transact([](Transaction& tx) {
        auto cells = tx.put_object(root, "cells", ObjType::list);
        auto cell = tx.insert_object(cells, 0, ObjType::map);
        tx.put(cell, "cell_type", "code");
        auto source = tx.put_object(cell, "source", ObjType::text);
        tx.splice_text(source, 0, 0, "print(1)");
    });

    EXPECT_EQ(export_json(doc), json::parse(R"json({
        "cells": [{"cell_type": "code", "source": "print(1)"}]
    })json"));
}

TEST(JsonExport, subtree_and_missing_object) {
    auto doc = Document{};
    auto meta = doc.transact([](Transaction& tx) {
        auto m = tx.put_object(root, "meta", ObjType::map);
        tx.put(m, "nbformat", 4);
        return m;
    });
    EXPECT_EQ(export_json(doc, meta), (json{{"nbformat", 4}}));
    EXPECT_TRUE(export_json(doc, ObjId{OpId{999, ActorId{}}}).is_null());
}

TEST(JsonExport, reads_inside_an_open_transaction) {
    auto doc = Document{};
    auto tx = doc.begin_transaction();
    {
        auto lock = tx->lock();
        tx->put(root, "pending", true);
        EXPECT_EQ(export_json(*tx), (json{{"pending", true}}));
    }
    tx->commit();
}

TEST(JsonImport, objects_and_arrays_nest) {
    auto doc = Document{};
    auto input = json::parse(R"({
        "metadata": {"kernelspec": {"name": "python3"}, "tags": ["a", "b"]},
        "nbformat": 4
    })");
    import_json(doc, input);

    EXPECT_EQ(export_json(doc), input);
    auto metadata = doc.get_obj_id(root, "metadata");
    ASSERT_TRUE(metadata.has_value());
    EXPECT_EQ(doc.object_type(*metadata), ObjType::map);
}

TEST(JsonImport, strings_stay_scalar) {
    auto doc = Document{};
    import_json(doc, json{{"name", "nb"}});
    EXPECT_EQ(doc.get<std::string>(root, "name"), "nb");
    EXPECT_FALSE(doc.get_obj_id(root, "name").has_value());
}

TEST(JsonImport, arrays_append_to_lists) {
    auto doc = Document{};
    auto list = doc.transact([](Transaction& tx) {
        auto l = tx.put_object(root, "outputs", ObjType::list);
        tx.insert(l, 0, "first");
        return l;
    });
    import_json(doc, json::array({"second", 3}), list);
    EXPECT_EQ(export_json(doc, list), json::array({"first", "second", 3}));
}

TEST(JsonImport, mismatched_target_throws) {
    auto doc = Document{};
    EXPECT_THROW(import_json(doc, json::array({1})), std::runtime_error);
    EXPECT_THROW(import_json(doc, json{{"a", 1}}, ObjId{OpId{42, ActorId{}}}), std::runtime_error);
}

TEST(JsonImport, put_json_and_insert_json_build_subtrees) {
    auto doc = Document{};
    doc.transact([](Transaction& tx) {
        put_json(tx, root, "outputs", json::array({json{{"output_type", "error"}}}));
        auto outputs = *tx.get_obj_id(root, "outputs");
        insert_json(tx, outputs, 0, json{{"output_type", "display_data"}, {"data", json::object()}});
    });
    EXPECT_EQ(export_json(doc), json::parse(R"({
        "outputs": [
            {"output_type": "display_data", "data": {}},
            {"output_type": "error"}
        ]
    })"));
}

// =============================================================================
// Numeric coercion
// =============================================================================

TEST(CastIntegralFloats, integral_floats_become_integers) {
    auto j = json::parse(R"({"execution_count": 3.0, "scale": 1.5, "nested": [2.0, -0.0, "4.0"]})");
    cast_integral_floats(j);

    EXPECT_TRUE(j["execution_count"].is_number_integer());
    EXPECT_EQ(j["execution_count"], 3);
    EXPECT_TRUE(j["scale"].is_number_float());
    EXPECT_TRUE(j["nested"][0].is_number_integer());
    EXPECT_TRUE(j["nested"][1].is_number_integer());
    EXPECT_TRUE(j["nested"][2].is_string());
}

TEST(CastIntegralFloats, out_of_range_and_non_finite_values_stay_floats) {
    auto j = json::array({1e300, std::numeric_limits<double>::infinity()});
    cast_integral_floats(j);
    EXPECT_TRUE(j[0].is_number_float());
    EXPECT_TRUE(j[1].is_number_float());
}
