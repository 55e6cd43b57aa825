#pragma once

#include <string>
#include <string_view>

namespace relay::util {

// Strips leading and trailing ASCII whitespace.
std::string_view Trim(std::string_view text);

std::string Quote(std::string_view text);

} // namespace relay::util
