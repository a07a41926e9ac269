#include <ydoc-cpp/json.hpp>

#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace ydoc_cpp {

namespace {

auto base64_encode(const Bytes& data) -> std::string {
    static constexpr char table[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    auto result = std::string{};
    auto n = data.size();
    result.reserve(((n + 2) / 3) * 4);
    for (std::size_t i = 0; i < n; i += 3) {
        auto b0 = static_cast<unsigned char>(data[i]);
        auto b1 = (i + 1 < n) ? static_cast<unsigned char>(data[i + 1]) : 0u;
        auto b2 = (i + 2 < n) ? static_cast<unsigned char>(data[i + 2]) : 0u;
        result.push_back(table[b0 >> 2]);
        result.push_back(table[((b0 & 0x03) << 4) | (b1 >> 4)]);
        result.push_back((i + 1 < n) ? table[((b1 & 0x0F) << 2) | (b2 >> 6)] : '=');
        result.push_back((i + 2 < n) ? table[b2 & 0x3F] : '=');
    }
    return result;
}

auto base64_decode(std::string_view encoded) -> Bytes {
    static const auto decode_table = []() {
        std::array<unsigned char, 256> t{};
        t.fill(0);
        constexpr std::string_view chars =
            "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
        for (unsigned char i = 0; i < chars.size(); ++i) {
            t[static_cast<unsigned char>(chars[i])] = i;
        }
        return t;
    }();
    auto result = Bytes{};
    result.reserve((encoded.size() / 4) * 3);
    for (std::size_t i = 0; i + 3 < encoded.size(); i += 4) {
        auto a = decode_table[static_cast<unsigned char>(encoded[i])];
        auto b = decode_table[static_cast<unsigned char>(encoded[i + 1])];
        auto c = decode_table[static_cast<unsigned char>(encoded[i + 2])];
        auto d = decode_table[static_cast<unsigned char>(encoded[i + 3])];
        result.push_back(std::byte((a << 2) | (b >> 4)));
        if (encoded[i + 2] != '=')
            result.push_back(std::byte(((b & 0x0F) << 4) | (c >> 2)));
        if (encoded[i + 3] != '=')
            result.push_back(std::byte(((c & 0x03) << 6) | d));
    }
    return result;
}

void to_json(nlohmann::json& j, const Path& path) {
    j = nlohmann::json::array();
    for (const auto& elem : path) {
        std::visit([&](const auto& v) { j.push_back(v); }, elem);
    }
}

}  // anonymous namespace

// =============================================================================
// ADL serialization
// =============================================================================

void to_json(nlohmann::json& j, Null) {
    j = nullptr;
}

void to_json(nlohmann::json& j, const ScalarValue& sv) {
    std::visit(overload{
        [&](Null) { j = nullptr; },
        [&](bool b) { j = b; },
        [&](std::int64_t i) { j = i; },
        [&](std::uint64_t u) { j = u; },
        [&](double d) { j = d; },
        [&](const std::string& s) { j = s; },
        [&](const Bytes& b) {
            j = nlohmann::json{{"__type", "bytes"}, {"value", base64_encode(b)}};
        },
    }, sv);
}

void from_json(const nlohmann::json& j, ScalarValue& sv) {
    if (j.is_object() && j.contains("__type") && j["__type"] == "bytes") {
        sv = base64_decode(j["value"].get<std::string>());
        return;
    }
    if (j.is_null()) {
        sv = Null{};
    } else if (j.is_boolean()) {
        sv = j.get<bool>();
    } else if (j.is_number_unsigned()) {
        auto val = j.get<std::uint64_t>();
        // If it fits in int64, prefer int64 for consistency
        if (val <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            sv = static_cast<std::int64_t>(val);
        } else {
            sv = val;
        }
    } else if (j.is_number_integer()) {
        sv = j.get<std::int64_t>();
    } else if (j.is_number_float()) {
        sv = j.get<double>();
    } else if (j.is_string()) {
        sv = j.get<std::string>();
    } else {
        throw std::runtime_error{"cannot convert JSON to ScalarValue"};
    }
}

void to_json(nlohmann::json& j, const OpId& id) {
    j = nlohmann::json{{"counter", id.counter}};
}

void to_json(nlohmann::json& j, const ObjId& id) {
    std::visit(overload{
        [&](Root) { j = "root"; },
        [&](const OpId& op) { to_json(j, op); },
    }, id.inner);
}

void to_json(nlohmann::json& j, const Value& v) {
    std::visit(overload{
        [&](ObjType type) { j = nlohmann::json{{"__type", std::string{to_string_view(type)}}}; },
        [&](const ScalarValue& sv) { to_json(j, sv); },
    }, v);
}

void to_json(nlohmann::json& j, const TextEvent& e) {
    auto delta = nlohmann::json::array();
    for (const auto& op : e.delta) {
        std::visit(overload{
            [&](const Retain& r) { delta.push_back(nlohmann::json{{"retain", r.count}}); },
            [&](const Delete& d) { delta.push_back(nlohmann::json{{"delete", d.count}}); },
            [&](const InsertText& ins) { delta.push_back(nlohmann::json{{"insert", ins.text}}); },
        }, op);
    }
    auto path = nlohmann::json{};
    to_json(path, e.path);
    j = nlohmann::json{{"type", "text"}, {"path", std::move(path)}, {"delta", std::move(delta)}};
}

void to_json(nlohmann::json& j, const ArrayEvent& e) {
    auto delta = nlohmann::json::array();
    for (const auto& op : e.delta) {
        std::visit(overload{
            [&](const Retain& r) { delta.push_back(nlohmann::json{{"retain", r.count}}); },
            [&](const Delete& d) { delta.push_back(nlohmann::json{{"delete", d.count}}); },
            [&](const InsertValues& ins) {
                auto values = nlohmann::json::array();
                for (const auto& v : ins.values) {
                    auto item = nlohmann::json{};
                    to_json(item, v);
                    values.push_back(std::move(item));
                }
                delta.push_back(nlohmann::json{{"insert", std::move(values)}});
            },
        }, op);
    }
    auto path = nlohmann::json{};
    to_json(path, e.path);
    j = nlohmann::json{{"type", "array"}, {"path", std::move(path)}, {"delta", std::move(delta)}};
}

void to_json(nlohmann::json& j, const MapEvent& e) {
    auto keys = nlohmann::json::object();
    for (const auto& [key, change] : e.keys) {
        auto entry = nlohmann::json{{"action", std::string{to_string_view(change.action)}}};
        if (change.old_value) {
            auto old_value = nlohmann::json{};
            to_json(old_value, *change.old_value);
            entry["oldValue"] = std::move(old_value);
        }
        if (change.new_value) {
            auto new_value = nlohmann::json{};
            to_json(new_value, *change.new_value);
            entry["newValue"] = std::move(new_value);
        }
        keys[key] = std::move(entry);
    }
    auto path = nlohmann::json{};
    to_json(path, e.path);
    j = nlohmann::json{{"type", "map"}, {"path", std::move(path)}, {"keys", std::move(keys)}};
}

void to_json(nlohmann::json& j, const Event& e) {
    std::visit([&](const auto& event) { to_json(j, event); }, e);
}

// =============================================================================
// Subtree export
// =============================================================================

namespace {

// Templated export helpers: work with both Document and Transaction
template<typename Reader>
auto export_object_impl(const Reader& reader, const ObjId& obj) -> nlohmann::json;

template<typename Reader>
auto export_value_impl(const Reader& reader, const Value& val,
                       const ObjId& parent, const Prop& prop) -> nlohmann::json {
    return std::visit(overload{
        [&](ObjType) -> nlohmann::json {
            auto child = std::visit(overload{
                [&](const std::string& key) { return reader.get_obj_id(parent, key); },
                [&](std::size_t index) { return reader.get_obj_id(parent, index); },
            }, prop);
            if (child) return export_object_impl(reader, *child);
            return nlohmann::json{};
        },
        [](const ScalarValue& sv) -> nlohmann::json {
            return std::visit(overload{
                [](Null) -> nlohmann::json { return nullptr; },
                [](bool b) -> nlohmann::json { return b; },
                [](std::int64_t i) -> nlohmann::json { return i; },
                [](std::uint64_t u) -> nlohmann::json { return u; },
                [](double d) -> nlohmann::json { return d; },
                [](const std::string& s) -> nlohmann::json { return s; },
                [](const Bytes& b) -> nlohmann::json { return base64_encode(b); },
            }, sv);
        },
    }, val);
}

template<typename Reader>
auto export_object_impl(const Reader& reader, const ObjId& obj) -> nlohmann::json {
    auto type = reader.object_type(obj);
    if (!type) return nlohmann::json{};

    if (*type == ObjType::text) {
        return nlohmann::json(reader.text(obj));
    }

    if (*type == ObjType::map) {
        auto result = nlohmann::json::object();
        for (const auto& key : reader.keys(obj)) {
            if (auto val = reader.get(obj, key)) {
                result[key] = export_value_impl(reader, *val, obj, Prop{key});
            }
        }
        return result;
    }

    auto result = nlohmann::json::array();
    auto len = reader.length(obj);
    for (std::size_t i = 0; i < len; ++i) {
        if (auto val = reader.get(obj, i)) {
            result.push_back(export_value_impl(reader, *val, obj, Prop{i}));
        }
    }
    return result;
}

}  // anonymous namespace

auto export_json(const Document& doc, const ObjId& obj) -> nlohmann::json {
    return export_object_impl(doc, obj);
}

auto export_json(const Transaction& tx, const ObjId& obj) -> nlohmann::json {
    return export_object_impl(tx, obj);
}

// =============================================================================
// Subtree import
// =============================================================================

void put_json(Transaction& tx, const ObjId& obj, std::string_view key,
              const nlohmann::json& val) {
    if (val.is_object()) {
        auto child = tx.put_object(obj, key, ObjType::map);
        for (auto& [k, v] : val.items()) {
            put_json(tx, child, k, v);
        }
    } else if (val.is_array()) {
        auto child = tx.put_object(obj, key, ObjType::list);
        for (std::size_t i = 0; i < val.size(); ++i) {
            insert_json(tx, child, i, val[i]);
        }
    } else {
        tx.put(obj, key, val.get<ScalarValue>());
    }
}

void insert_json(Transaction& tx, const ObjId& obj, std::size_t index,
                 const nlohmann::json& val) {
    if (val.is_object()) {
        auto child = tx.insert_object(obj, index, ObjType::map);
        for (auto& [k, v] : val.items()) {
            put_json(tx, child, k, v);
        }
    } else if (val.is_array()) {
        auto child = tx.insert_object(obj, index, ObjType::list);
        for (std::size_t i = 0; i < val.size(); ++i) {
            insert_json(tx, child, i, val[i]);
        }
    } else {
        tx.insert(obj, index, val.get<ScalarValue>());
    }
}

void import_json(Document& doc, const nlohmann::json& j, const ObjId& target) {
    doc.transact([&](Transaction& tx) {
        import_json(tx, j, target);
    });
}

void import_json(Transaction& tx, const nlohmann::json& j, const ObjId& target) {
    auto type = tx.object_type(target);
    if (!type) {
        throw std::runtime_error{"import target does not exist"};
    }
    if (j.is_object() && *type == ObjType::map) {
        for (auto& [key, val] : j.items()) {
            put_json(tx, target, key, val);
        }
    } else if (j.is_array() && *type == ObjType::list) {
        auto start = tx.length(target);
        for (std::size_t i = 0; i < j.size(); ++i) {
            insert_json(tx, target, start + i, j[i]);
        }
    } else {
        throw std::runtime_error{"JSON value does not match the import target"};
    }
}

// =============================================================================
// Numeric coercion
// =============================================================================

void cast_integral_floats(nlohmann::json& j) {
    if (j.is_object() || j.is_array()) {
        for (auto& child : j) cast_integral_floats(child);
        return;
    }
    if (!j.is_number_float()) return;

    auto d = j.get<double>();
    if (!std::isfinite(d) || std::trunc(d) != d) return;
    if (d < static_cast<double>(std::numeric_limits<std::int64_t>::min()) ||
        d >= static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
        return;
    }
    auto i = static_cast<std::int64_t>(d);
    if (static_cast<double>(i) == d) j = i;
}

}  // namespace ydoc_cpp
