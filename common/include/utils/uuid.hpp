#pragma once

#include <string>

namespace parley {

// Random (version 4) UUID in canonical 8-4-4-4-12 lowercase form
std::string generate_uuid();

// True for a canonical 8-4-4-4-12 hex UUID (either case)
bool is_canonical_uuid(const std::string& value);

} // namespace parley
