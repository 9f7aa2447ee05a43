#pragma once

#include "duckdb.hpp"

namespace duckdb {

// Plain text of the first level-1 heading in a markdown body, with inline markup
// (emphasis, code spans, links) reduced to its text. Empty when there is none.
string FirstHeadingText(const char *body, size_t body_size);

} // namespace duckdb
