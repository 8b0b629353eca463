#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace mender {

// Split text into physical lines. Every line keeps its terminator, so
// concatenating the result reproduces the input exactly. A trailing
// terminator does not produce an extra empty line.
std::vector<std::string>
parselines(std::string_view input_text);

// Split text on '\n' without keeping terminators. A trailing '\n' does not
// produce an extra empty line.
std::vector<std::string_view>
splitlines(std::string_view input_text);

std::string
joinlines(const std::vector<std::string>& lines);

// Read a whole file into `content`.
bool
readfile(const std::string& path, std::string& content, std::string& error);

// Read all of stdin into `content`.
bool
readstdin(std::string& content, std::string& error);

//
// Whitespace helpers
//

bool
is_whitespace(char c);

bool
is_blank(std::string_view s);

std::string_view
left_trim(std::string_view s);

std::string_view
right_trim(std::string_view s);

std::string_view
trim(std::string_view s);

bool
starts_with(std::string_view s, std::string_view prefix);

bool
ends_with(std::string_view s, std::string_view suffix);

}  // namespace mender
