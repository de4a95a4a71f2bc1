#pragma once
#include <cstddef>
#include <string>

namespace codebox::util {

// Lowercase hex string of `length` random characters.
std::string random_hex(size_t length);

// RFC 4122 version 4 UUID, e.g. "3f2b8c1e-9d4a-4c7b-8e21-0a6f5d3c9b70".
std::string uuid4();

} // namespace codebox::util
