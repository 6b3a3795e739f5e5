#pragma once

#include <string>
#include <string_view>

namespace tablemap {

// Normalizes a column name before it is spliced into generated SQL:
// drops every run of '*', escapes U+2153 with a backslash and trims
// surrounding whitespace and NUL bytes. Idempotent.
//
// Values never go through here; they are always bound as parameters.
std::string sanitizeIdentifier(std::string_view name);

}  // namespace tablemap
