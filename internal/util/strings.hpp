#pragma once

#include <string>
#include <string_view>

namespace stash::util {

std::string ToLower(std::string_view value);

// Strips leading and trailing whitespace.
std::string_view Trim(std::string_view value);

} // namespace stash::util
