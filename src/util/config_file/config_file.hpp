#pragma once

/*
    Configuration file reader and writer.

    The format is a small subset of TOML, enough for a handful of settings:

        # comment
        [general]
            dry_run = false         # booleans
            context = 3             # integers
            root_directory = 'src'  # quoted or bare strings

    Files are parsed into a tree of `Value`s. The root value is a table of
    sections, each section is a table of key/value pairs. Keys keep their
    insertion order so that a loaded file can be written back without
    reshuffling it.
*/

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mender {

struct Value;

// Table of values that iterates in insertion order.
struct ValueTable {
    std::vector<std::string> keys;
    std::vector<Value> values;

    bool
    contains(const std::string& key) const;

    std::size_t
    size() const {
        return keys.size();
    }

    // Inserts a default constructed value when the key is missing.
    Value&
    operator[](const std::string& key);

    Value*
    find(const std::string& key);
};

struct Value {
    using Table = ValueTable;
    using Int = int64_t;
    using Bool = bool;
    using String = std::string;

    std::variant<Table, Int, Bool, String> v;

    // Comment lines written above the key this value is assigned to.
    std::vector<std::string> key_comments;

    Value&
    operator[](const std::string& key);

    bool
    contains(const std::string& key);

    // Find a nested value using e.g. "general.dry_run"
    std::optional<std::reference_wrapper<Value>>
    lookup_value_by_path(std::string_view dotted_path);

    // Sets a nested value using e.g. set_value_at("general.dry_run", {true}).
    // Intermediate tables are created as needed.
    bool
    set_value_at(std::string_view dotted_path, Value value);

    // clang-format off
    bool is_table() const { return std::holds_alternative<Value::Table>(v); }
    bool is_int() const { return std::holds_alternative<Value::Int>(v); }
    bool is_bool() const { return std::holds_alternative<Value::Bool>(v); }
    bool is_string() const { return std::holds_alternative<Value::String>(v); }

    Table& as_table() { return std::get<Value::Table>(v); }
    Int& as_int() { return std::get<Value::Int>(v); }
    Bool& as_bool() { return std::get<Value::Bool>(v); }
    String& as_string() { return std::get<Value::String>(v); }
    // clang-format on
};

// clang-format off
enum class ParseErrorKind {
    None    = 1 << 0,
    File    = 1 << 1,
    Parsing = 1 << 2,
};
// clang-format on

struct ParseResult {
    ParseErrorKind kind = ParseErrorKind::None;
    std::string error;

    bool
    is_ok() const {
        return kind == ParseErrorKind::None;
    }

    void
    set_error(std::size_t line, const std::string& error_message);
};

// Parse configuration text into a table of sections.
bool
cfg_parse_value_tree(const std::string& input_data, ParseResult& result, Value& result_obj);

// Load a file and construct a value tree based on the contents
bool
cfg_load_file(const std::string& file_path, ParseResult& result, Value& result_obj);

// Serialize all entries in the given Value. Keys of the root table become
// [section] headers. The input Value must hold a Value::Table.
std::string
cfg_serialize(Value& value);

// Serialize a single non-table value.
std::string
cfg_serialize_obj(Value& value);

std::string
repr(Value& value);

}  // namespace mender
