#include "config_file.hpp"

#include "util/readlines.hpp"

#include <fmt/format.h>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <tuple>

#define TRACE_ENABLE 0
#define TRACE(...)               \
    if (TRACE_ENABLE) {          \
        fmt::print(__VA_ARGS__); \
    }

using namespace mender;

namespace internal {

std::tuple<std::string_view, std::string_view>
str_split2(const std::string_view s, char delimiter) {
    auto pos = s.find(delimiter);
    if (pos == std::string::npos) {
        return std::make_tuple(s, "");
    }

    return std::make_tuple(s.substr(0, pos), s.substr(pos + 1, std::string::npos));
}

bool
is_identifier(std::string_view s) {
    if (s.empty()) {
        return false;
    }
    for (char c : s) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-')) {
            return false;
        }
    }
    return true;
}

bool
is_integer(std::string_view s) {
    std::size_t i = (!s.empty() && (s[0] == '-' || s[0] == '+')) ? 1 : 0;
    if (i >= s.size()) {
        return false;
    }
    for (; i < s.size(); i++) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
            return false;
        }
    }
    return true;
}

// Drop a trailing '# comment' that is not inside a quoted string.
std::string_view
strip_comment(std::string_view s) {
    char quote = 0;
    for (std::size_t i = 0; i < s.size(); i++) {
        char c = s[i];
        if (quote) {
            if (c == quote) {
                quote = 0;
            }
        } else if (c == '\'' || c == '"') {
            quote = c;
        } else if (c == '#') {
            return s.substr(0, i);
        }
    }
    return s;
}

bool
parse_scalar(std::string_view text, Value& out, std::string& error) {
    if (text.empty()) {
        error = "Expected a value";
        return false;
    }

    char first = text.front();
    if (first == '\'' || first == '"') {
        if (text.size() < 2 || text.back() != first) {
            error = "Unterminated string";
            return false;
        }
        out = Value{Value::String{text.substr(1, text.size() - 2)}};
        return true;
    }

    if (text == "true" || text == "false") {
        out = Value{Value::Bool{text == "true"}};
        return true;
    }

    if (is_integer(text)) {
        std::string digits{text};
        errno = 0;
        long long number = std::strtoll(digits.c_str(), nullptr, 10);
        if (errno == ERANGE) {
            error = fmt::format("Integer out of range: {}", digits);
            return false;
        }
        out = Value{static_cast<Value::Int>(number)};
        return true;
    }

    out = Value{Value::String{text}};
    return true;
}

}  // namespace internal

bool
ValueTable::contains(const std::string& key) const {
    for (const auto& k : keys) {
        if (k == key) {
            return true;
        }
    }
    return false;
}

Value*
ValueTable::find(const std::string& key) {
    for (std::size_t i = 0; i < keys.size(); i++) {
        if (keys[i] == key) {
            return &values[i];
        }
    }
    return nullptr;
}

Value&
ValueTable::operator[](const std::string& key) {
    if (auto* existing = find(key); existing) {
        return *existing;
    }
    keys.push_back(key);
    values.emplace_back();
    return values.back();
}

Value&
Value::operator[](const std::string& key) {
    return as_table()[key];
}

bool
Value::contains(const std::string& key) {
    if (is_table()) {
        return as_table().contains(key);
    }
    return false;
}

std::optional<std::reference_wrapper<Value>>
Value::lookup_value_by_path(std::string_view dotted_path) {
    Value* result_value = this;
    std::string_view remaining{dotted_path};
    while (!remaining.empty()) {
        auto [head, rest] = internal::str_split2(remaining, '.');
        std::string key{head};
        if (!result_value->contains(key)) {
            return std::nullopt;
        }
        result_value = &(*result_value)[key];
        remaining = rest;
    }
    return std::reference_wrapper(*result_value);
}

bool
Value::set_value_at(std::string_view dotted_path, Value value) {
    Value* iter = this;
    std::string_view remaining{dotted_path};
    while (!remaining.empty()) {
        if (!iter->is_table()) {
            return false;
        }

        auto [head, rest] = internal::str_split2(remaining, '.');
        std::string key{head};
        if (rest.empty()) {
            (*iter)[key] = std::move(value);
            return true;
        }

        if (!iter->contains(key)) {
            (*iter)[key] = Value{Value::Table{}};
        }
        iter = &(*iter)[key];
        remaining = rest;
    }
    return false;
}

void
ParseResult::set_error(std::size_t line, const std::string& error_message) {
    this->kind = ParseErrorKind::Parsing;
    this->error = fmt::format("'{}' at line {}", error_message, line);
}

bool
mender::cfg_parse_value_tree(const std::string& input_data, ParseResult& result, Value& result_obj) {
    result_obj = Value{Value::Table{}};
    result.kind = ParseErrorKind::None;
    result.error.clear();

    Value* section = &result_obj;
    std::vector<std::string> pending_comments;

    std::size_t line_number = 0;
    for (auto raw_line : splitlines(input_data)) {
        line_number++;
        auto line = trim(raw_line);
        TRACE("config line {}: '{}'\n", line_number, line);

        if (line.empty()) {
            continue;
        }

        if (line.front() == '#') {
            pending_comments.emplace_back(line);
            continue;
        }

        line = trim(internal::strip_comment(line));

        if (line.front() == '[') {
            if (line.back() != ']') {
                result.set_error(line_number, "Expected ']' after section name");
                return false;
            }
            auto name = trim(line.substr(1, line.size() - 2));
            if (!internal::is_identifier(name)) {
                result.set_error(line_number, fmt::format("Invalid section name '{}'", name));
                return false;
            }
            std::string key{name};
            if (!result_obj.contains(key)) {
                result_obj[key] = Value{Value::Table{}};
            }
            section = &result_obj[key];
            if (!section->is_table()) {
                result.set_error(line_number, fmt::format("'{}' is not a section", key));
                return false;
            }
            section->key_comments.insert(section->key_comments.end(), pending_comments.begin(),
                                         pending_comments.end());
            pending_comments.clear();
            continue;
        }

        auto [key_part, value_part] = internal::str_split2(line, '=');
        auto key = trim(key_part);
        if (line.find('=') == std::string_view::npos) {
            result.set_error(line_number, fmt::format("Expected '=' after '{}'", key));
            return false;
        }
        if (!internal::is_identifier(key)) {
            result.set_error(line_number, fmt::format("Invalid key '{}'", key));
            return false;
        }

        Value value;
        std::string error;
        if (!internal::parse_scalar(trim(value_part), value, error)) {
            result.set_error(line_number, error);
            return false;
        }
        value.key_comments = std::move(pending_comments);
        pending_comments.clear();
        (*section)[std::string(key)] = std::move(value);
    }

    return true;
}

bool
mender::cfg_load_file(const std::string& file_path, ParseResult& result, Value& result_obj) {
    std::string content;
    std::string error;
    if (!readfile(file_path, content, error)) {
        result.kind = ParseErrorKind::File;
        result.error = error;
        return false;
    }
    return cfg_parse_value_tree(content, result, result_obj);
}

std::string
mender::cfg_serialize_obj(Value& value) {
    if (value.is_bool()) {
        return value.as_bool() ? "true" : "false";
    } else if (value.is_int()) {
        return fmt::format("{}", value.as_int());
    } else if (value.is_string()) {
        return fmt::format("'{}'", value.as_string());
    }
    return "";
}

std::string
mender::cfg_serialize(Value& value) {
    std::string output;
    if (!value.is_table()) {
        return output;
    }

    auto& root = value.as_table();
    auto write_comments = [&](const Value& v, const std::string& indent) {
        for (const auto& comment : v.key_comments) {
            for (auto comment_line : splitlines(comment)) {
                output += indent;
                output += comment_line;
                output += "\n";
            }
        }
    };

    // Plain keys before the first section header
    for (std::size_t i = 0; i < root.size(); i++) {
        auto& v = root.values[i];
        if (!v.is_table()) {
            write_comments(v, "");
            output += fmt::format("{} = {}\n", root.keys[i], cfg_serialize_obj(v));
        }
    }

    for (std::size_t i = 0; i < root.size(); i++) {
        auto& section = root.values[i];
        if (!section.is_table()) {
            continue;
        }
        if (!output.empty()) {
            output += "\n";
        }
        write_comments(section, "");
        output += fmt::format("[{}]\n", root.keys[i]);

        auto& table = section.as_table();
        for (std::size_t j = 0; j < table.size(); j++) {
            auto& v = table.values[j];
            if (v.is_table()) {
                continue;
            }
            write_comments(v, "    ");
            output += fmt::format("    {} = {}\n", table.keys[j], cfg_serialize_obj(v));
        }
    }

    return output;
}

std::string
mender::repr(Value& value) {
    if (value.is_table()) {
        std::string result = "{";
        auto& table = value.as_table();
        for (std::size_t i = 0; i < table.size(); i++) {
            if (i > 0) {
                result += ", ";
            }
            result += fmt::format("{}: {}", table.keys[i], repr(table.values[i]));
        }
        return result + "}";
    }
    return cfg_serialize_obj(value);
}
