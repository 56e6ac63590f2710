#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace flipbook::base64 {

// Standard alphabet with '=' padding. Whitespace is skipped; padding may be omitted.
// Returns nullopt on any other character or a truncated final group.
std::optional<std::vector<std::uint8_t>> decode(std::string_view text);

}
