#pragma once

/*
    Single line file commands:

        path/to/file <<<<<<< DELETE
        old/path <<<<<<< MOVE >>>>>>> new/path
*/

#include "patch/patch.hpp"

#include <optional>
#include <string_view>

namespace mender {

constexpr std::string_view kMarkerDelete = "<<<<<<< DELETE";
constexpr std::string_view kMarkerMove = "<<<<<<< MOVE >>>>>>>";

std::optional<Patch>
parse_line_command(std::string_view line);

}  // namespace mender
