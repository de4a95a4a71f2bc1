#pragma once
#include <istream>
#include <optional>
#include <ostream>
#include <string>

namespace codebox::rpc {

// Read a header block up to its blank line and return the Content-Length.
// Header names are case-insensitive; lines may end in CRLF or LF.
// nullopt on EOF, a missing length, or an unparsable/oversized one.
std::optional<size_t> read_header(std::istream& in);

// Read exactly `length` bytes; nullopt on a short read
std::optional<std::string> read_body(std::istream& in, size_t length);

// Header and body together, as one frame
std::optional<std::string> read_frame(std::istream& in);

// Write one frame and flush; false if the stream failed
bool write_frame(std::ostream& out, const std::string& body);

} // namespace codebox::rpc
