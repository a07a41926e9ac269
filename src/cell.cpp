#include <ydoc-cpp/cell.hpp>

#include <ydoc-cpp/error.hpp>
#include <ydoc-cpp/json.hpp>
#include <ydoc-cpp/text_reconciler.hpp>

#include <fmt/format.h>

#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace ydoc_cpp {

namespace {

using nlohmann::json;

auto join_lines(const json& value, std::string_view field) -> std::string {
    if (value.is_string()) return value.get<std::string>();
    if (!value.is_array()) {
        throw Error{ErrorKind::invalid_cell,
                    fmt::format("cell field '{}' must be a string or a list of strings", field)};
    }
    auto joined = std::string{};
    for (const auto& line : value) {
        if (!line.is_string()) {
            throw Error{ErrorKind::invalid_cell,
                        fmt::format("cell field '{}' contains a non-string line", field)};
        }
        joined += line.get_ref<const std::string&>();
    }
    return joined;
}

auto is_stream(const json& output) -> bool {
    if (!output.is_object()) return false;
    auto type = output.find("output_type");
    return type != output.end() && type->is_string() && *type == "stream";
}

auto has_stream_output(const json& outputs) -> bool {
    for (const auto& output : outputs) {
        if (is_stream(output)) return true;
    }
    return false;
}

auto put_text(Transaction& tx, const ObjId& map, std::string_view key, std::string_view content)
    -> ObjId {
    auto text = tx.put_object(map, key, ObjType::text);
    if (!content.empty()) tx.splice_text(text, 0, 0, content);
    return text;
}

// Stream outputs keep their text as a Text, everything else is plain JSON
void append_outputs(Transaction& tx, const ObjId& outputs, const json& values) {
    for (const auto& output : values) {
        const auto index = tx.length(outputs);
        if (!is_stream(output)) {
            insert_json(tx, outputs, index, output);
            continue;
        }
        auto entry = tx.insert_object(outputs, index, ObjType::map);
        for (const auto& [key, value] : output.items()) {
            if (key == "text") {
                put_text(tx, entry, key, value.get_ref<const std::string&>());
            } else {
                put_json(tx, entry, key, value);
            }
        }
    }
}

void write_field(Transaction& tx, const ObjId& cell, const std::string& key, const json& value) {
    if (key == "source") {
        put_text(tx, cell, key, value.get_ref<const std::string&>());
    } else if (key == "outputs" && value.is_array()) {
        auto outputs = tx.put_object(cell, key, ObjType::list);
        append_outputs(tx, outputs, value);
    } else {
        put_json(tx, cell, key, value);
    }
}

auto expected_type(FieldKind kind) -> ObjType {
    switch (kind) {
        case FieldKind::text: return ObjType::text;
        case FieldKind::map:  return ObjType::map;
        default:              return ObjType::list;
    }
}

auto value_fits(FieldKind kind, const json& value) -> bool {
    switch (kind) {
        case FieldKind::scalar: return true;
        case FieldKind::text:   return value.is_string();
        case FieldKind::map:    return value.is_object();
        case FieldKind::list:   return value.is_array() && !has_stream_output(value);
    }
    return false;
}

template <typename Reader>
auto read_cell_impl(const Reader& reader, const ObjId& cell) -> json {
    auto view = export_json(reader, cell);
    if (!view.is_object()) return view;
    view.erase("execution_state");
    cast_integral_floats(view);
    auto type = view.find("cell_type");
    if (type != view.end() && type->is_string() && (*type == "raw" || *type == "markdown")) {
        auto attachments = view.find("attachments");
        if (attachments != view.end() && (attachments->is_null() || attachments->empty())) {
            view.erase(attachments);
        }
    }
    return view;
}

auto generator_mutex() -> std::mutex& {
    static auto mutex = std::mutex{};
    return mutex;
}

auto installed_generator() -> CellIdGenerator& {
    static auto generator = CellIdGenerator{};
    return generator;
}

auto random_cell_id() -> std::string {
    thread_local auto engine = std::mt19937_64{std::random_device{}()};
    auto high = engine();
    auto low = engine();
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // version 4
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;    // RFC 4122 variant
    return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                       high >> 32, (high >> 16) & 0xFFFF, high & 0xFFFF,
                       low >> 48, low & 0xFFFFFFFFFFFFULL);
}

}  // namespace

auto parse_cell_type(std::string_view name) -> std::optional<CellType> {
    if (name == "code") return CellType::code;
    if (name == "markdown") return CellType::markdown;
    if (name == "raw") return CellType::raw;
    return std::nullopt;
}

auto generate_cell_id() -> std::string {
    auto generator = CellIdGenerator{};
    {
        auto lock = std::scoped_lock{generator_mutex()};
        generator = installed_generator();
    }
    if (generator) return generator();
    return random_cell_id();
}

auto set_cell_id_generator(CellIdGenerator generator) -> CellIdGenerator {
    auto lock = std::scoped_lock{generator_mutex()};
    return std::exchange(installed_generator(), std::move(generator));
}

auto make_cell_spec(const nlohmann::json& cell) -> CellSpec {
    if (!cell.is_object()) {
        throw Error{ErrorKind::invalid_cell, "cell snapshot must be an object"};
    }
    auto type_field = cell.find("cell_type");
    if (type_field == cell.end() || !type_field->is_string()) {
        throw Error{ErrorKind::invalid_cell, "cell snapshot has no cell_type"};
    }
    auto type = parse_cell_type(type_field->get_ref<const std::string&>());
    if (!type) {
        throw Error{ErrorKind::invalid_cell,
                    fmt::format("unknown cell_type '{}'", type_field->get_ref<const std::string&>())};
    }
    if (!cell.contains("source")) {
        throw Error{ErrorKind::invalid_cell, "cell snapshot has no source"};
    }

    auto spec = CellSpec{.type = *type, .fields = cell};
    auto& fields = spec.fields;
    fields.erase("execution_state");
    fields["source"] = join_lines(fields["source"], "source");
    if (!fields.contains("metadata")) fields["metadata"] = json::object();

    if (spec.type == CellType::code) {
        if (!fields.contains("outputs")) fields["outputs"] = json::array();
        if (fields["outputs"].is_array()) {
            for (auto& output : fields["outputs"]) {
                if (!is_stream(output)) continue;
                output["text"] = output.contains("text") ? join_lines(output["text"], "text")
                                                         : std::string{};
            }
        }
    } else {
        auto attachments = fields.find("attachments");
        if (attachments != fields.end() && (attachments->is_null() || attachments->empty())) {
            fields.erase(attachments);
        }
    }
    cast_integral_floats(fields);

    auto id = fields.find("id");
    if (id != fields.end() && id->is_string() && !id->get_ref<const std::string&>().empty()) {
        spec.id = id->get<std::string>();
    } else {
        spec.id = generate_cell_id();
        spec.minted_id = true;
        fields["id"] = spec.id;
    }
    return spec;
}

auto read_cell(const Document& doc, const ObjId& cell) -> nlohmann::json {
    return read_cell_impl(doc, cell);
}

auto read_cell(const Transaction& tx, const ObjId& cell) -> nlohmann::json {
    return read_cell_impl(tx, cell);
}

auto create_cell(Transaction& tx, const ObjId& cells, std::size_t index,
                 const CellSpec& spec) -> ObjId {
    auto cell = tx.insert_object(cells, index, ObjType::map);
    for (const auto& [key, value] : spec.fields.items()) {
        write_field(tx, cell, key, value);
    }
    if (spec.type == CellType::code) {
        tx.put(cell, "execution_state", "idle");
    }
    return cell;
}

auto update_cell(Transaction& tx, const nlohmann::json& current,
                 const CellSpec& desired, const ObjId& live) -> bool {
    if (current == desired.fields) return true;

    struct FieldWrite {
        std::string key;
        const json* value;
        FieldKind kind;
        ObjId handle;
    };
    auto writes = std::vector<FieldWrite>{};
    auto removed = std::vector<std::string>{};

    // Decide everything before the first write so a refusal leaves no trace
    for (const auto& [key, value] : desired.fields.items()) {
        const auto kind = field_kind(key);
        auto old = current.find(key);
        if (old == current.end()) {
            if (kind != FieldKind::scalar) return false;
            writes.push_back({key, &value, kind, ObjId{}});
            continue;
        }
        if (*old == value) continue;
        if (kind == FieldKind::scalar) {
            writes.push_back({key, &value, kind, ObjId{}});
            continue;
        }
        auto handle = tx.get_obj_id(live, key);
        if (!handle || tx.object_type(*handle) != expected_type(kind)) return false;
        if (!value_fits(kind, value)) return false;
        writes.push_back({key, &value, kind, *handle});
    }
    for (const auto& [key, value] : current.items()) {
        if (!desired.fields.contains(key)) removed.push_back(key);
    }

    for (const auto& write : writes) {
        switch (write.kind) {
            case FieldKind::scalar:
                put_json(tx, live, write.key, *write.value);
                break;
            case FieldKind::text:
                reconcile_text(tx, write.handle, tx.text(write.handle),
                               write.value->get_ref<const std::string&>());
                break;
            case FieldKind::map:
                tx.clear(write.handle);
                import_json(tx, *write.value, write.handle);
                break;
            case FieldKind::list:
                tx.clear(write.handle);
                append_outputs(tx, write.handle, *write.value);
                break;
        }
    }
    for (const auto& key : removed) {
        tx.delete_key(live, key);
    }
    // Hidden from `current`, so the removal set never lists it
    if (desired.type != CellType::code) tx.delete_key(live, "execution_state");
    return true;
}

auto add_stdin_output(Transaction& tx, const ObjId& outputs,
                      std::string_view prompt, bool password) -> std::size_t {
    const auto index = tx.length(outputs);
    auto output = tx.insert_object(outputs, index, ObjType::map);
    tx.put(output, "output_type", "stdin");
    tx.put(output, "submitted", false);
    tx.put(output, "password", password);
    tx.put(output, "prompt", prompt);
    tx.put_object(output, "value", ObjType::text);
    return index;
}

}  // namespace ydoc_cpp
