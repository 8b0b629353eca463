#include "readlines.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

using namespace mender;

namespace internal {

bool
read_stream(FILE* stream, std::string& content) {
    char buffer[4096];
    content.clear();
    while (true) {
        auto n = fread(buffer, 1, sizeof(buffer), stream);
        if (n > 0) {
            content.append(buffer, n);
        }
        if (n < sizeof(buffer)) {
            break;
        }
    }
    return ferror(stream) == 0;
}

}  // namespace internal

std::vector<std::string>
mender::parselines(std::string_view input_text) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < input_text.size()) {
        auto end = input_text.find('\n', start);
        if (end == std::string_view::npos) {
            lines.emplace_back(input_text.substr(start));
            break;
        }
        lines.emplace_back(input_text.substr(start, end - start + 1));
        start = end + 1;
    }
    return lines;
}

std::vector<std::string_view>
mender::splitlines(std::string_view input_text) {
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (start < input_text.size()) {
        auto end = input_text.find('\n', start);
        if (end == std::string_view::npos) {
            lines.push_back(input_text.substr(start));
            break;
        }
        lines.push_back(input_text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

std::string
mender::joinlines(const std::vector<std::string>& lines) {
    std::size_t size = 0;
    for (const auto& line : lines) {
        size += line.size();
    }
    std::string result;
    result.reserve(size);
    for (const auto& line : lines) {
        result += line;
    }
    return result;
}

bool
mender::readfile(const std::string& path, std::string& content, std::string& error) {
    FILE* stream = fopen(path.c_str(), "rb");
    if (!stream) {
        error = fmt::format("Failed to open file '{}': {}", path, strerror(errno));
        return false;
    }

    bool ok = internal::read_stream(stream, content);
    if (!ok) {
        error = fmt::format("Failed to read file '{}': {}", path, strerror(errno));
    }
    fclose(stream);
    return ok;
}

bool
mender::readstdin(std::string& content, std::string& error) {
    if (!internal::read_stream(stdin, content)) {
        error = fmt::format("Failed to read from stdin: {}", strerror(errno));
        return false;
    }
    return true;
}

bool
mender::is_whitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool
mender::is_blank(std::string_view s) {
    for (char c : s) {
        if (!is_whitespace(c)) {
            return false;
        }
    }
    return true;
}

std::string_view
mender::left_trim(std::string_view s) {
    std::size_t i = 0;
    while (i < s.size() && is_whitespace(s[i])) {
        i++;
    }
    return s.substr(i);
}

std::string_view
mender::right_trim(std::string_view s) {
    std::size_t n = s.size();
    while (n > 0 && is_whitespace(s[n - 1])) {
        n--;
    }
    return s.substr(0, n);
}

std::string_view
mender::trim(std::string_view s) {
    return right_trim(left_trim(s));
}

bool
mender::starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool
mender::ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}
