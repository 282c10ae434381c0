#pragma once

#include <string>
#include <string_view>

namespace gaitrank::util {

// Trims, collapses inner whitespace runs to one space and lower-cases ASCII letters.
// Identity of every rated entity is its normalized name.
std::string NormalizeName(std::string_view raw);

std::string ToLower(std::string_view raw);

} // namespace gaitrank::util
