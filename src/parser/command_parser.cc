#include "command_parser.hpp"

#include "util/readlines.hpp"

using namespace mender;

std::optional<Patch>
mender::parse_line_command(std::string_view line) {
    const auto stripped = trim(line);

    if (ends_with(stripped, kMarkerDelete)) {
        auto path = trim(stripped.substr(0, stripped.find(kMarkerDelete)));
        if (!path.empty()) {
            return Patch::Delete(std::string(path));
        }
    }

    if (auto pos = stripped.find(kMarkerMove); pos != std::string_view::npos) {
        // Exactly one marker, with a path on each side.
        auto rest = stripped.substr(pos + kMarkerMove.size());
        if (rest.find(kMarkerMove) == std::string_view::npos) {
            auto source = trim(stripped.substr(0, pos));
            auto destination = trim(rest);
            if (!source.empty() && !destination.empty()) {
                return Patch::Move(std::string(source), std::string(destination));
            }
        }
    }

    return std::nullopt;
}
